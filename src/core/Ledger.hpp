#ifndef TYCOON_LEDGER_HPP
#define TYCOON_LEDGER_HPP

#include <array>
#include <optional>
#include <vector>

#include "Board.hpp"
#include "Exception.hpp"
#include "Types.hpp"

namespace tycoon::core::debug {struct Inspector;}
namespace tycoon::core
{
    struct PropertyRecord
    {
        std::optional<PlyrIdxT> owner{};
        bool mortgaged{false};
        // 0-4 houses, 5 = hotel
        std::uint8_t buildings{0};
    };

    // Money, ownership and buildings of one session. Every mutator asserts the
    // bookkeeping invariants; rule checks are separate and return violations.
    class Ledger
    {
    public:
        using CheckResult = error::ValidateResult;

        Ledger(Board const& board, std::size_t n_players, MoneyT starting_cash);

        // ---- cash ----
        [[nodiscard]]
        auto Cash(PlyrIdxT p) const -> MoneyT { return cash_.at(p); }
        auto Credit(PlyrIdxT p, MoneyT amount) -> void;
        // Throws if the player cannot cover it; callers check first.
        auto Debit(PlyrIdxT p, MoneyT amount) -> void;
        auto Transfer(PlyrIdxT from, PlyrIdxT to, MoneyT amount) -> void;

        // ---- ownership ----
        [[nodiscard]]
        auto Record(SpaceIdxT s) const -> PropertyRecord const&;
        [[nodiscard]]
        auto OwnerOf(SpaceIdxT s) const -> std::optional<PlyrIdxT> { return Record(s).owner; }
        [[nodiscard]]
        auto PropertiesOf(PlyrIdxT p) const -> std::vector<SpaceIdxT>;

        auto Assign(SpaceIdxT s, PlyrIdxT owner) -> void;
        // Buildings and mortgage travel with the deed.
        auto TransferProperty(SpaceIdxT s, PlyrIdxT to) -> void;
        // Back to the bank: buildings return to the pools, mortgage cleared.
        auto Release(SpaceIdxT s) -> void;

        [[nodiscard]] auto OwnsGroup(PlyrIdxT p, ColorGroup g) const -> bool;
        [[nodiscard]] auto RailroadsOwned(PlyrIdxT p) const -> int;
        [[nodiscard]] auto UtilitiesOwned(PlyrIdxT p) const -> int;
        [[nodiscard]] auto GroupHasBuildings(ColorGroup g) const -> bool;
        [[nodiscard]] auto GroupHasMortgage(ColorGroup g) const -> bool;
        [[nodiscard]] auto HousesOwnedBy(PlyrIdxT p) const -> int;
        [[nodiscard]] auto HotelsOwnedBy(PlyrIdxT p) const -> int;

        // ---- valuation ----
        // What selling buildings and mortgaging deeds can raise, given the houses left in the bank.
        [[nodiscard]] auto LiquidationValue(PlyrIdxT p) const -> MoneyT;
        // Cash + purchase price of deeds + cost of buildings.
        [[nodiscard]] auto NetWorth(PlyrIdxT p) const -> MoneyT;

        // Pure function of ledger state and the dice sum (utilities only).
        [[nodiscard]] auto RentFor(SpaceIdxT s, int dice_sum) const -> MoneyT;

        // ---- buildings ----
        [[nodiscard]] auto BuildCost(SpaceIdxT s) const -> MoneyT;
        [[nodiscard]] auto SaleRefund(SpaceIdxT s) const -> MoneyT;
        [[nodiscard]] auto CheckBuild(PlyrIdxT p, SpaceIdxT s) const -> CheckResult;
        [[nodiscard]] auto CheckSell(PlyrIdxT p, SpaceIdxT s) const -> CheckResult;
        // Return the amount debited/credited.
        auto Build(PlyrIdxT p, SpaceIdxT s) -> MoneyT;
        auto SellBuilding(PlyrIdxT p, SpaceIdxT s) -> MoneyT;

        // ---- mortgages ----
        [[nodiscard]] auto UnmortgageCost(SpaceIdxT s) const -> MoneyT;
        [[nodiscard]] auto CheckMortgage(PlyrIdxT p, SpaceIdxT s) const -> CheckResult;
        [[nodiscard]] auto CheckUnmortgage(PlyrIdxT p, SpaceIdxT s) const -> CheckResult;
        auto Mortgage(PlyrIdxT p, SpaceIdxT s) -> MoneyT;
        auto Unmortgage(PlyrIdxT p, SpaceIdxT s) -> MoneyT;

        [[nodiscard]] auto HousePool() const noexcept -> int { return house_pool_; }
        [[nodiscard]] auto HotelPool() const noexcept -> int { return hotel_pool_; }
        [[nodiscard]] auto PlayerCount() const noexcept -> std::size_t { return cash_.size(); }
        [[nodiscard]] auto BoardRef() const noexcept -> Board const& { return *board_; }

        auto SetUnmortgageRate(MoneyT pct) noexcept -> void { unmortgage_rate_pct_ = pct; }

        // Throws AssertionError on any broken bookkeeping invariant.
        auto CheckInvariants() const -> void;

        friend struct debug::Inspector;

    private:
        auto MutableRecord(SpaceIdxT s) -> PropertyRecord&;
        auto GroupLevels(ColorGroup g) const -> std::pair<int, int>;

        Board const* board_;
        std::vector<MoneyT> cash_;
        std::array<PropertyRecord, constants::BoardSize> records_{};
        int house_pool_{constants::TotalHouses};
        int hotel_pool_{constants::TotalHotels};
        MoneyT unmortgage_rate_pct_{110};
    };
}

#endif //TYCOON_LEDGER_HPP
