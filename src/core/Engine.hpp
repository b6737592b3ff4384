#ifndef TYCOON_ENGINE_HPP
#define TYCOON_ENGINE_HPP

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Session.hpp"

namespace tycoon::core
{
    // One row of board-catalog()
    struct SpaceInfo
    {
        SpaceIdxT index{};
        std::string name;
        SpaceKind kind{};
        ColorGroup group{ColorGroup::None};
        MoneyT price{};
        MoneyT mortgage_value{};
        MoneyT house_cost{};
        std::array<MoneyT, 6> rent{}; // streets only
        MoneyT tax{};
    };

    struct NamedBid
    {
        std::string bidder;
        MoneyT amount{};
    };

    // Trade offer as the caller names it
    struct NamedBundle
    {
        std::vector<std::string> properties;
        MoneyT cash{};
        std::uint8_t jail_cards{};
    };

    // Session operations addressed by id and player/property names.
    class Engine
    {
    public:
        explicit Engine(Config defaults = {});

        auto CreateSession(std::vector<std::string> names) -> error::Result<std::string>;
        auto CreateSession(std::vector<std::string> names, Config const& cfg,
                           std::unique_ptr<DiceSource> dice) -> error::Result<std::string>;
        auto ListSessions() const -> std::vector<SessionSummary>;

        auto GetState(std::string_view session) const -> error::Result<std::shared_ptr<GameSnapshot const>>;
        auto GetPlayerProperties(std::string_view session, std::string_view player) const
            -> error::Result<std::vector<PropertyDetail>>;

        auto Roll(std::string_view session, std::string_view player) -> error::Result<ActionReport>;
        auto PayJail(std::string_view session, std::string_view player) -> error::Result<ActionReport>;
        auto UseJailCard(std::string_view session, std::string_view player) -> error::Result<ActionReport>;

        auto Buy(std::string_view session, std::string_view player, std::string_view property)
            -> error::Result<ActionReport>;
        auto Decline(std::string_view session, std::string_view player, std::string_view property,
                     std::vector<NamedBid> const& bids = {}) -> error::Result<ActionReport>;

        auto Mortgage(std::string_view session, std::string_view player, std::string_view property)
            -> error::Result<ActionReport>;
        auto Unmortgage(std::string_view session, std::string_view player, std::string_view property)
            -> error::Result<ActionReport>;
        auto Build(std::string_view session, std::string_view player, std::string_view property)
            -> error::Result<ActionReport>;
        auto SellBuilding(std::string_view session, std::string_view player, std::string_view property)
            -> error::Result<ActionReport>;

        auto ProposeTrade(std::string_view session, std::string_view player, std::string_view counterparty,
                          NamedBundle const& give, NamedBundle const& take) -> error::Result<ActionReport>;
        auto RespondTrade(std::string_view session, std::string_view player, bool accept)
            -> error::Result<ActionReport>;

        auto PayDebt(std::string_view session, std::string_view player) -> error::Result<ActionReport>;
        auto DeclareBankruptcy(std::string_view session, std::string_view player) -> error::Result<ActionReport>;
        auto EndTurn(std::string_view session, std::string_view player) -> error::Result<ActionReport>;

        // Index-addressed entry point, used by the codec and self-play.
        auto Submit(std::string_view session, ActionRequest const& req) -> error::Result<ActionReport>;

        static auto BoardCatalog() -> std::vector<SpaceInfo>;

        auto Registry() noexcept -> SessionRegistry& { return registry_; }

    private:
        // Builds the action once the player name is resolved; runs under the session lock.
        template <typename MakeAction>
        auto Act(std::string_view session, std::string_view player, MakeAction&& make)
            -> error::Result<ActionReport>;

        SessionRegistry registry_;
    };

    auto ResolveProperty(Board const& board, std::string_view name) -> error::Result<SpaceIdxT>;
    auto ResolvePlayer(GameImpl const& game, std::string_view name) -> error::Result<PlyrIdxT>;
}

#endif //TYCOON_ENGINE_HPP
