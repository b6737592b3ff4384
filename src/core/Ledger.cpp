#include "Ledger.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <vector>

namespace tycoon::core
{
    using error::ViolationCode;
    using error::Viol;

    Ledger::Ledger(Board const& board, std::size_t const n_players, MoneyT const starting_cash) :
        board_(&board),
        cash_(n_players, starting_cash)
    {
        TYC_ASSERT(starting_cash >= 0, "Negative starting cash");
    }

    auto Ledger::Credit(PlyrIdxT const p, MoneyT const amount) -> void
    {
        TYC_ASSERT(amount >= 0, "Negative credit");
        cash_.at(p) += amount;
    }

    auto Ledger::Debit(PlyrIdxT const p, MoneyT const amount) -> void
    {
        TYC_ASSERT(amount >= 0, "Negative debit");
        if (cash_.at(p) < amount)
            TYC_THROW(error::Code::Ledger,
                      std::format("Debit of {} exceeds P{} cash {}", amount, static_cast<int>(p), cash_[p]));
        cash_[p] -= amount;
    }

    auto Ledger::Transfer(PlyrIdxT const from, PlyrIdxT const to, MoneyT const amount) -> void
    {
        Debit(from, amount);
        Credit(to, amount);
    }

    auto Ledger::Record(SpaceIdxT const s) const -> PropertyRecord const&
    {
        TYC_ASSERT(s < constants::BoardSize, "Space index off the board");
        return records_[s];
    }

    auto Ledger::MutableRecord(SpaceIdxT const s) -> PropertyRecord&
    {
        TYC_ASSERT(s < constants::BoardSize, "Space index off the board");
        if (!board_->At(s).IsOwnable())
            TYC_THROW(error::Code::Ledger, std::format("Space {} cannot carry a deed", static_cast<int>(s)));
        return records_[s];
    }

    auto Ledger::PropertiesOf(PlyrIdxT const p) const -> std::vector<SpaceIdxT>
    {
        std::vector<SpaceIdxT> out;
        for (SpaceIdxT const s : board_->Ownables())
        {
            if (records_[s].owner == p) out.push_back(s);
        }
        return out;
    }

    auto Ledger::Assign(SpaceIdxT const s, PlyrIdxT const owner) -> void
    {
        PropertyRecord& r = MutableRecord(s);
        TYC_ASSERT(!r.owner.has_value(), "Assigning an owned property");
        TYC_ASSERT(owner < cash_.size(), "Owner out of range");
        r = PropertyRecord{.owner = owner};
    }

    auto Ledger::TransferProperty(SpaceIdxT const s, PlyrIdxT const to) -> void
    {
        PropertyRecord& r = MutableRecord(s);
        TYC_ASSERT(r.owner.has_value(), "Transferring an unowned property");
        TYC_ASSERT(to < cash_.size(), "Recipient out of range");
        r.owner = to;
    }

    auto Ledger::Release(SpaceIdxT const s) -> void
    {
        PropertyRecord& r = MutableRecord(s);
        if (r.buildings == constants::HotelLevel)
        {
            ++hotel_pool_;
        }
        else
        {
            house_pool_ += r.buildings;
        }
        r = PropertyRecord{};
    }

    auto Ledger::OwnsGroup(PlyrIdxT const p, ColorGroup const g) const -> bool
    {
        if (g == ColorGroup::None) return false;
        auto const members = board_->GroupMembers(g);
        return std::ranges::all_of(members, [&](SpaceIdxT const s) { return records_[s].owner == p; });
    }

    auto Ledger::RailroadsOwned(PlyrIdxT const p) const -> int
    {
        return static_cast<int>(std::ranges::count_if(board_->Railroads(),
                                                       [&](SpaceIdxT const s) { return records_[s].owner == p; }));
    }

    auto Ledger::UtilitiesOwned(PlyrIdxT const p) const -> int
    {
        return static_cast<int>(std::ranges::count_if(board_->Utilities(),
                                                      [&](SpaceIdxT const s) { return records_[s].owner == p; }));
    }

    auto Ledger::GroupHasBuildings(ColorGroup const g) const -> bool
    {
        if (g == ColorGroup::None) return false;
        return std::ranges::any_of(board_->GroupMembers(g),
                                   [&](SpaceIdxT const s) { return records_[s].buildings > 0; });
    }

    auto Ledger::GroupHasMortgage(ColorGroup const g) const -> bool
    {
        if (g == ColorGroup::None) return false;
        return std::ranges::any_of(board_->GroupMembers(g),
                                   [&](SpaceIdxT const s) { return records_[s].mortgaged; });
    }

    auto Ledger::HousesOwnedBy(PlyrIdxT const p) const -> int
    {
        int n{};
        for (SpaceIdxT const s : board_->Ownables())
        {
            PropertyRecord const& r = records_[s];
            if (r.owner == p && r.buildings < constants::HotelLevel) n += r.buildings;
        }
        return n;
    }

    auto Ledger::HotelsOwnedBy(PlyrIdxT const p) const -> int
    {
        int n{};
        for (SpaceIdxT const s : board_->Ownables())
        {
            PropertyRecord const& r = records_[s];
            n += (r.owner == p && r.buildings == constants::HotelLevel);
        }
        return n;
    }

    // min/max building level across a group
    auto Ledger::GroupLevels(ColorGroup const g) const -> std::pair<int, int>
    {
        int lo = constants::HotelLevel, hi = 0;
        for (SpaceIdxT const s : board_->GroupMembers(g))
        {
            lo = std::min<int>(lo, records_[s].buildings);
            hi = std::max<int>(hi, records_[s].buildings);
        }
        return {lo, hi};
    }

    static auto BuildingValue(StreetSpace const& st, std::uint8_t const level) -> MoneyT
    {
        // four houses, then the hotel conversion at four times the house cost
        if (level == constants::HotelLevel)
            return st.house_cost * constants::HousesPerHotel * 2;
        return st.house_cost * level;
    }

    auto Ledger::LiquidationValue(PlyrIdxT const p) const -> MoneyT
    {
        std::vector<ColorGroup> built;
        for (SpaceIdxT const s : board_->Ownables())
        {
            PropertyRecord const& r = records_[s];
            if (r.owner != p || r.buildings == 0) continue;
            ColorGroup const g = board_->At(s).Group();
            if (std::ranges::find(built, g) == built.end()) built.push_back(g);
        }

        // A group clears only if the pool can take back four houses per hotel first.
        // Each cleared group returns its houses, which may unblock another.
        MoneyT total{};
        int pool = house_pool_;
        for (bool progress = true; progress;)
        {
            progress = false;
            for (auto it = built.begin(); it != built.end();)
            {
                int hotels{}, houses{};
                MoneyT value{};
                for (SpaceIdxT const s : board_->GroupMembers(*it))
                {
                    std::uint8_t const level = records_[s].buildings;
                    if (level == constants::HotelLevel) ++hotels;
                    else houses += level;
                    value += BuildingValue(*board_->At(s).Street(), level);
                }
                if (pool < hotels * constants::HousesPerHotel)
                {
                    ++it;
                    continue;
                }
                pool += houses;
                total += value;
                it = built.erase(it);
                progress = true;
            }
        }

        // deeds in a group that still carries buildings cannot be mortgaged
        for (SpaceIdxT const s : board_->Ownables())
        {
            PropertyRecord const& r = records_[s];
            if (r.owner != p || r.mortgaged) continue;
            Space const& sp = board_->At(s);
            if (std::ranges::find(built, sp.Group()) != built.end()) continue;
            total += sp.MortgageValue();
        }
        return total;
    }

    auto Ledger::NetWorth(PlyrIdxT const p) const -> MoneyT
    {
        MoneyT total = cash_.at(p);
        for (SpaceIdxT const s : board_->Ownables())
        {
            PropertyRecord const& r = records_[s];
            if (r.owner != p) continue;
            Space const& sp = board_->At(s);
            total += sp.Price();
            if (StreetSpace const* st = sp.Street()) total += BuildingValue(*st, r.buildings);
        }
        return total;
    }

    auto Ledger::RentFor(SpaceIdxT const s, int const dice_sum) const -> MoneyT
    {
        PropertyRecord const& r = Record(s);
        if (!r.owner || r.mortgaged) return 0;
        PlyrIdxT const owner = *r.owner;

        return std::visit([&]<typename T0>(T0 const& d) -> MoneyT
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, StreetSpace>)
            {
                if (r.buildings == 0)
                    return OwnsGroup(owner, d.group) ? d.rent[0] * 2 : d.rent[0];
                return d.rent[r.buildings];
            }
            else if constexpr (std::is_same_v<T, RailroadSpace>)
            {
                int const n = RailroadsOwned(owner);
                return constants::RailroadBaseRent << (n - 1);
            }
            else if constexpr (std::is_same_v<T, UtilitySpace>)
            {
                int const mult = UtilitiesOwned(owner) >= 2 ? constants::BothUtilitiesMultiplier
                                                            : constants::SingleUtilityMultiplier;
                return dice_sum * mult;
            }
            else
            {
                TYC_THROW(error::Code::Ledger, "Owned record on a non-ownable space");
            }
        }, board_->At(s).detail);
    }

    auto Ledger::BuildCost(SpaceIdxT const s) const -> MoneyT
    {
        StreetSpace const* st = board_->At(s).Street();
        TYC_ASSERT(st != nullptr, "Build cost of a non-street");
        return records_[s].buildings == constants::HousesPerHotel
                   ? st->house_cost * constants::HousesPerHotel
                   : st->house_cost;
    }

    auto Ledger::SaleRefund(SpaceIdxT const s) const -> MoneyT
    {
        StreetSpace const* st = board_->At(s).Street();
        TYC_ASSERT(st != nullptr, "Sale refund of a non-street");
        return records_[s].buildings == constants::HotelLevel
                   ? st->house_cost * constants::HousesPerHotel
                   : st->house_cost;
    }

    auto Ledger::CheckBuild(PlyrIdxT const p, SpaceIdxT const s) const -> CheckResult
    {
        using E = ViolationCode;
        Space const& sp = board_->At(s);
        StreetSpace const* st = sp.Street();
        if (!st)
            return std::unexpected(Viol(E::Build_NotAStreet).with_actor(p).with_space(s));

        PropertyRecord const& r = records_[s];
        if (r.owner != p)
            return std::unexpected(Viol(E::Build_NotOwner).with_actor(p).with_space(s));
        if (!OwnsGroup(p, st->group))
            return std::unexpected(Viol(E::Build_NoMonopoly).with_actor(p).with_space(s));
        if (GroupHasMortgage(st->group))
            return std::unexpected(Viol(E::Build_GroupMortgaged).with_actor(p).with_space(s));
        if (r.buildings >= constants::HotelLevel)
            return std::unexpected(Viol(E::Build_AtMaximum).with_actor(p).with_space(s));

        if (r.buildings != GroupLevels(st->group).first)
            return std::unexpected(Viol(E::Build_Uneven).with_actor(p).with_space(s));

        if (r.buildings == constants::HousesPerHotel)
        {
            if (hotel_pool_ <= 0)
                return std::unexpected(Viol(E::Build_HotelPoolEmpty).with_actor(p).with_space(s));
        }
        else if (house_pool_ <= 0)
        {
            return std::unexpected(Viol(E::Build_HousePoolEmpty).with_actor(p).with_space(s));
        }

        MoneyT const cost = BuildCost(s);
        if (cash_[p] < cost)
            return std::unexpected(Viol(E::Build_CannotAfford).with_actor(p).with_space(s)
                                   .with_amount(cost).with_available(cash_[p]));
        return {};
    }

    auto Ledger::CheckSell(PlyrIdxT const p, SpaceIdxT const s) const -> CheckResult
    {
        using E = ViolationCode;
        StreetSpace const* st = board_->At(s).Street();
        if (!st)
            return std::unexpected(Viol(E::Build_NotAStreet).with_actor(p).with_space(s));

        PropertyRecord const& r = records_[s];
        if (r.owner != p)
            return std::unexpected(Viol(E::Build_NotOwner).with_actor(p).with_space(s));
        if (r.buildings == 0)
            return std::unexpected(Viol(E::Sell_NoBuildings).with_actor(p).with_space(s));

        if (r.buildings != GroupLevels(st->group).second)
            return std::unexpected(Viol(E::Sell_Uneven).with_actor(p).with_space(s));

        if (r.buildings == constants::HotelLevel && house_pool_ < constants::HousesPerHotel)
            return std::unexpected(Viol(E::Sell_HousePoolShort).with_actor(p).with_space(s));
        return {};
    }

    auto Ledger::Build(PlyrIdxT const p, SpaceIdxT const s) -> MoneyT
    {
        if (auto const ok = CheckBuild(p, s); !ok)
            TYC_THROW(error::Code::Ledger, error::describe(ok.error()));

        MoneyT const cost = BuildCost(s);
        Debit(p, cost);
        PropertyRecord& r = MutableRecord(s);
        if (r.buildings == constants::HousesPerHotel)
        {
            --hotel_pool_;
            house_pool_ += constants::HousesPerHotel;
            r.buildings = constants::HotelLevel;
        }
        else
        {
            --house_pool_;
            ++r.buildings;
        }
        TYC_ASSERT(house_pool_ >= 0 && hotel_pool_ >= 0, "Building pool went negative");
        return cost;
    }

    auto Ledger::SellBuilding(PlyrIdxT const p, SpaceIdxT const s) -> MoneyT
    {
        if (auto const ok = CheckSell(p, s); !ok)
            TYC_THROW(error::Code::Ledger, error::describe(ok.error()));

        MoneyT const refund = SaleRefund(s);
        PropertyRecord& r = MutableRecord(s);
        if (r.buildings == constants::HotelLevel)
        {
            ++hotel_pool_;
            house_pool_ -= constants::HousesPerHotel;
            r.buildings = constants::HousesPerHotel;
        }
        else
        {
            ++house_pool_;
            --r.buildings;
        }
        Credit(p, refund);
        TYC_ASSERT(house_pool_ <= constants::TotalHouses && hotel_pool_ <= constants::TotalHotels,
                   "Building pool overflow");
        return refund;
    }

    auto Ledger::UnmortgageCost(SpaceIdxT const s) const -> MoneyT
    {
        return board_->At(s).MortgageValue() * unmortgage_rate_pct_ / 100;
    }

    auto Ledger::CheckMortgage(PlyrIdxT const p, SpaceIdxT const s) const -> CheckResult
    {
        using E = ViolationCode;
        Space const& sp = board_->At(s);
        if (!sp.IsOwnable())
            return std::unexpected(Viol(E::Purchase_NotOwnable).with_actor(p).with_space(s));

        PropertyRecord const& r = records_[s];
        if (r.owner != p)
            return std::unexpected(Viol(E::Mortgage_NotOwner).with_actor(p).with_space(s));
        if (r.mortgaged)
            return std::unexpected(Viol(E::Mortgage_AlreadyMortgaged).with_actor(p).with_space(s));
        if (GroupHasBuildings(sp.Group()))
            return std::unexpected(Viol(E::Mortgage_BuildingsInGroup).with_actor(p).with_space(s));
        return {};
    }

    auto Ledger::CheckUnmortgage(PlyrIdxT const p, SpaceIdxT const s) const -> CheckResult
    {
        using E = ViolationCode;
        if (!board_->At(s).IsOwnable())
            return std::unexpected(Viol(E::Purchase_NotOwnable).with_actor(p).with_space(s));

        PropertyRecord const& r = records_[s];
        if (r.owner != p)
            return std::unexpected(Viol(E::Mortgage_NotOwner).with_actor(p).with_space(s));
        if (!r.mortgaged)
            return std::unexpected(Viol(E::Mortgage_NotMortgaged).with_actor(p).with_space(s));

        MoneyT const cost = UnmortgageCost(s);
        if (cash_[p] < cost)
            return std::unexpected(Viol(E::Mortgage_CannotAffordPayoff).with_actor(p).with_space(s)
                                   .with_amount(cost).with_available(cash_[p]));
        return {};
    }

    auto Ledger::Mortgage(PlyrIdxT const p, SpaceIdxT const s) -> MoneyT
    {
        if (auto const ok = CheckMortgage(p, s); !ok)
            TYC_THROW(error::Code::Ledger, error::describe(ok.error()));

        MoneyT const value = board_->At(s).MortgageValue();
        MutableRecord(s).mortgaged = true;
        Credit(p, value);
        return value;
    }

    auto Ledger::Unmortgage(PlyrIdxT const p, SpaceIdxT const s) -> MoneyT
    {
        if (auto const ok = CheckUnmortgage(p, s); !ok)
            TYC_THROW(error::Code::Ledger, error::describe(ok.error()));

        MoneyT const cost = UnmortgageCost(s);
        Debit(p, cost);
        MutableRecord(s).mortgaged = false;
        return cost;
    }

    auto Ledger::CheckInvariants() const -> void
    {
        int houses_in_play{}, hotels_in_play{};
        for (SpaceIdxT s{}; s < constants::BoardSize; ++s)
        {
            PropertyRecord const& r = records_[s];
            Space const& sp = board_->At(s);
            if (!sp.IsOwnable())
            {
                TYC_ASSERT(!r.owner && !r.mortgaged && r.buildings == 0, "Record on a non-ownable space");
                continue;
            }
            TYC_ASSERT(r.buildings <= constants::HotelLevel, "Building count above hotel");
            if (!r.owner)
            {
                TYC_ASSERT(!r.mortgaged && r.buildings == 0, "Unowned property carries state");
                continue;
            }
            TYC_ASSERT(*r.owner < cash_.size(), "Owner index out of range");
            if (r.buildings > 0)
            {
                TYC_ASSERT(sp.Kind() == SpaceKind::Property, "Buildings on a non-street");
                TYC_ASSERT(OwnsGroup(*r.owner, sp.Group()), "Buildings without a monopoly");
                TYC_ASSERT(!r.mortgaged, "Buildings on a mortgaged property");
            }
            if (r.buildings == constants::HotelLevel) ++hotels_in_play;
            else houses_in_play += r.buildings;
        }

        for (auto g = static_cast<int>(ColorGroup::Brown); g <= static_cast<int>(ColorGroup::DarkBlue); ++g)
        {
            auto const [lo, hi] = GroupLevels(static_cast<ColorGroup>(g));
            TYC_ASSERT(hi - lo <= 1, std::format("Uneven buildings in group {}", g));
        }

        TYC_ASSERT(houses_in_play + house_pool_ == constants::TotalHouses, "House count drifted");
        TYC_ASSERT(hotels_in_play + hotel_pool_ == constants::TotalHotels, "Hotel count drifted");
    }
}
