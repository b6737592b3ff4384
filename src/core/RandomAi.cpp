#include "RandomAi.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

#include "Exception.hpp"

namespace tycoon::core
{
    namespace
    {
        auto ViewOf(GameSnapshot const& s, SpaceIdxT const space) -> PropertyView const&
        {
            auto const it = std::ranges::find(s.properties, space, &PropertyView::space);
            TYC_ASSERT(it != s.properties.end(), "Snapshot lacks an ownable space");
            return *it;
        }

        auto GroupLevels(GameSnapshot const& s, Board const& board, ColorGroup const g) -> std::pair<int, int>
        {
            int lo = constants::HotelLevel;
            int hi = 0;
            for (SpaceIdxT const m : board.GroupMembers(g))
            {
                int const b = ViewOf(s, m).buildings;
                lo = std::min(lo, b);
                hi = std::max(hi, b);
            }
            return {lo, hi};
        }

        auto GroupClear(GameSnapshot const& s, Board const& board, SpaceIdxT const space) -> bool
        {
            ColorGroup const g = board.At(space).Group();
            if (g == ColorGroup::None) return true;
            return GroupLevels(s, board, g).second == 0;
        }
    }

    RandomAI::RandomAI(std::uint64_t const rng_seed) :
        rng_(static_cast<std::mt19937::result_type>(rng_seed)),
        board_(Board::Classic())
    {
    }

    auto RandomAI::Play(std::shared_ptr<GameSnapshot const> snapshot, PlyrIdxT const seat) -> PlayerAction
    {
        GameSnapshot const& s = *snapshot;
        switch (s.phase)
        {
        case Phase::AwaitingRoll: return RollMove(s, seat);
        case Phase::AwaitingPurchaseDecision: return PurchaseMove(s, seat);
        case Phase::AwaitingDebtSettlement: return DebtMove(s, seat);
        case Phase::AwaitingTradeResponse: return RespondTradeAction{.accept = chance(0.5)};
        case Phase::TurnOver: return TurnOverMove(s, seat);
        case Phase::GameOver: break;
        }
        return EndTurnAction{};
    }

    auto RandomAI::RollMove(GameSnapshot const& s, PlyrIdxT const seat) -> PlayerAction
    {
        PlayerView const& me = s.players[seat];
        if (!me.in_jail) return RollAction{};

        std::vector<PlayerAction> options{RollAction{}};
        if (me.cash >= s.jail_fine) options.emplace_back(PayJailFineAction{});
        if (me.jail_cards > 0) options.emplace_back(UseJailCardAction{});
        return options[pick(options)];
    }

    auto RandomAI::PurchaseMove(GameSnapshot const& s, PlyrIdxT const seat) -> PlayerAction
    {
        TYC_ASSERT(s.pending_purchase.has_value(), "Purchase phase without a pending property");
        SpaceIdxT const space = *s.pending_purchase;
        MoneyT const price = board_.At(space).Price();

        if (s.players[seat].cash >= price && chance(0.8)) return BuyAction{.property = space};

        DeclineAction d{.property = space};
        for (std::size_t i{}; i < s.players.size(); ++i)
        {
            PlayerView const& pv = s.players[i];
            if (pv.bankrupt || pv.cash < s.auction_min_bid || !chance(0.5)) continue;
            MoneyT const cap = std::min(pv.cash, price);
            if (cap < s.auction_min_bid) continue;
            MoneyT const amount = std::uniform_int_distribution<MoneyT>{s.auction_min_bid, cap}(rng_);
            d.bids.push_back(Bid{.bidder = static_cast<PlyrIdxT>(i), .amount = amount});
        }
        return d;
    }

    auto RandomAI::DebtMove(GameSnapshot const& s, PlyrIdxT const seat) -> PlayerAction
    {
        TYC_ASSERT(!s.debts.empty(), "Debt phase without debts");
        PendingDebt const& d = s.debts.front();
        if (s.players[seat].cash >= d.amount) return PayDebtAction{};

        std::vector<SpaceIdxT> sell;
        std::vector<SpaceIdxT> mortgage;
        for (SpaceIdxT const space : s.players[seat].properties)
        {
            PropertyView const& pv = ViewOf(s, space);
            if (pv.buildings > 0)
            {
                // sell from the tallest building in the group
                if (pv.buildings == GroupLevels(s, board_, board_.At(space).Group()).second)
                    sell.push_back(space);
            }
            else if (!pv.mortgaged && GroupClear(s, board_, space))
            {
                mortgage.push_back(space);
            }
        }

        if (!sell.empty()) return SellBuildingAction{.property = sell[pick(sell)]};
        if (!mortgage.empty()) return MortgageAction{.property = mortgage[pick(mortgage)]};
        return DeclareBankruptcyAction{};
    }

    auto RandomAI::TurnOverMove(GameSnapshot const& s, PlyrIdxT const seat) -> PlayerAction
    {
        if (chance(0.7)) return EndTurnAction{};

        switch (std::uniform_int_distribution<int>{0, 2}(rng_))
        {
        case 0:
            if (auto const t = BuildTargets(s, seat); !t.empty()) return BuildAction{.property = t[pick(t)]};
            break;
        case 1:
            if (auto const t = UnmortgageTargets(s, seat); !t.empty())
                return UnmortgageAction{.property = t[pick(t)]};
            break;
        default:
            if (auto offer = TradeOffer(s, seat)) return std::move(*offer);
            break;
        }
        return EndTurnAction{};
    }

    auto RandomAI::BuildTargets(GameSnapshot const& s, PlyrIdxT const seat) const -> std::vector<SpaceIdxT>
    {
        std::vector<SpaceIdxT> out;
        MoneyT const cash = s.players[seat].cash;
        for (SpaceIdxT const space : s.players[seat].properties)
        {
            StreetSpace const* st = board_.At(space).Street();
            if (!st) continue;

            auto const members = board_.GroupMembers(st->group);
            bool const monopoly = std::ranges::all_of(members, [&](SpaceIdxT m)
            {
                PropertyView const& v = ViewOf(s, m);
                return v.owner == seat && !v.mortgaged;
            });
            if (!monopoly) continue;

            int const lo = GroupLevels(s, board_, st->group).first;
            int const level = ViewOf(s, space).buildings;
            if (level != lo || level >= constants::HotelLevel) continue;

            bool const hotel_step = level == constants::HotelLevel - 1;
            MoneyT const cost = hotel_step ? st->house_cost * constants::HousesPerHotel : st->house_cost;
            bool const stock = hotel_step ? s.hotel_pool > 0 : s.house_pool > 0;
            if (stock && cash >= cost) out.push_back(space);
        }
        return out;
    }

    auto RandomAI::UnmortgageTargets(GameSnapshot const& s, PlyrIdxT const seat) const -> std::vector<SpaceIdxT>
    {
        std::vector<SpaceIdxT> out;
        for (SpaceIdxT const space : s.players[seat].properties)
        {
            MoneyT const mv = board_.At(space).MortgageValue();
            if (ViewOf(s, space).mortgaged && s.players[seat].cash >= mv + mv / 10) out.push_back(space);
        }
        return out;
    }

    auto RandomAI::TradeOffer(GameSnapshot const& s, PlyrIdxT const seat) -> std::optional<ProposeTradeAction>
    {
        std::vector<PlyrIdxT> others;
        for (std::size_t i{}; i < s.players.size(); ++i)
        {
            if (i != seat && !s.players[i].bankrupt && !s.players[i].properties.empty())
                others.push_back(static_cast<PlyrIdxT>(i));
        }
        if (others.empty()) return std::nullopt;

        PlyrIdxT const other = others[pick(others)];
        auto wanted = std::ranges::to<std::vector<SpaceIdxT>>(
            s.players[other].properties |
            std::views::filter([&](SpaceIdxT sp) { return GroupClear(s, board_, sp); }));
        if (wanted.empty()) return std::nullopt;

        SpaceIdxT const target = wanted[pick(wanted)];
        MoneyT const price = board_.At(target).Price();
        if (s.players[seat].cash < price) return std::nullopt;

        return ProposeTradeAction{
            .counterparty = other,
            .give = TradeBundle{.cash = price},
            .take = TradeBundle{.properties = {target}},
        };
    }
}
