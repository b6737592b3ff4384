#ifndef TYCOON_BOARD_HPP
#define TYCOON_BOARD_HPP

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "Types.hpp"

namespace tycoon::core
{
    struct GoSpace {};

    struct StreetSpace
    {
        ColorGroup group{ColorGroup::None};
        MoneyT price{};
        MoneyT house_cost{};
        // indexed by building count, 5 = hotel
        std::array<MoneyT, 6> rent{};
    };

    struct RailroadSpace
    {
        MoneyT price{};
    };

    struct UtilitySpace
    {
        MoneyT price{};
    };

    struct TaxSpace
    {
        MoneyT amount{};
    };

    struct ChanceSpace         {};
    struct CommunityChestSpace {};
    struct JailSpace           {};
    struct GoToJailSpace       {};
    struct FreeParkingSpace    {};

    using SpaceDetail = std::variant<
        GoSpace, StreetSpace, RailroadSpace, UtilitySpace, TaxSpace,
        ChanceSpace, CommunityChestSpace, JailSpace, GoToJailSpace, FreeParkingSpace>;

    struct Space
    {
        SpaceIdxT        index{};
        std::string_view name;
        SpaceDetail      detail;

        [[nodiscard]] auto Kind() const noexcept -> SpaceKind;
        [[nodiscard]] auto IsOwnable() const noexcept -> bool;
        // 0 for non-ownable spaces
        [[nodiscard]] auto Price() const noexcept -> MoneyT;
        [[nodiscard]] auto MortgageValue() const noexcept -> MoneyT { return Price() / 2; }
        [[nodiscard]] auto Group() const noexcept -> ColorGroup;
        [[nodiscard]] auto Street() const noexcept -> StreetSpace const*
        {
            return std::get_if<StreetSpace>(&detail);
        }
    };

    // Static catalog of the 40 spaces. One instance is shared read-only by every session.
    class Board
    {
    public:
        static auto Classic() -> Board const&;

        [[nodiscard]]
        auto At(SpaceIdxT idx) const -> Space const&;
        [[nodiscard]]
        auto Spaces() const noexcept -> std::span<Space const> { return spaces_; }

        [[nodiscard]]
        auto GroupMembers(ColorGroup g) const -> std::span<SpaceIdxT const>;
        [[nodiscard]]
        auto Railroads() const noexcept -> std::span<SpaceIdxT const> { return railroads_; }
        [[nodiscard]]
        auto Utilities() const noexcept -> std::span<SpaceIdxT const> { return utilities_; }
        [[nodiscard]]
        auto Ownables() const noexcept -> std::span<SpaceIdxT const> { return ownables_; }

        // Case-insensitive lookup; only ownable spaces are named uniquely.
        [[nodiscard]]
        auto FindByName(std::string_view name) const -> std::optional<SpaceIdxT>;

        // Forward scan with wraparound, never returns `from` itself.
        [[nodiscard]]
        auto NextOfKind(SpaceIdxT from, SpaceKind kind) const -> SpaceIdxT;

    private:
        Board();

        std::array<Space, constants::BoardSize> spaces_;
        std::array<std::vector<SpaceIdxT>, 9> groups_;
        std::vector<SpaceIdxT> railroads_;
        std::vector<SpaceIdxT> utilities_;
        std::vector<SpaceIdxT> ownables_;
    };

    auto to_string(SpaceKind k) -> std::string_view;
    auto to_string(ColorGroup g) -> std::string_view;
}

#endif //TYCOON_BOARD_HPP
