#include "Game.hpp"

#include <format>

namespace tycoon::core
{
    auto GameImpl::RollDice() -> DiceRoll
    {
        DiceRoll const r = dice_->Roll();
        TYC_ASSERT(r.d1 >= 1 && r.d1 <= 6 && r.d2 >= 1 && r.d2 <= 6, "Die value outside 1-6");
        return r;
    }

    auto GameImpl::MoveBy(PlyrIdxT const p, int const steps) -> void
    {
        TYC_ASSERT(steps > 0 && steps < static_cast<int>(constants::BoardSize), "Forward move out of range");
        PlayerState& ps = players_[p];
        int const raw = ps.position + steps;
        ps.position = static_cast<SpaceIdxT>(raw % constants::BoardSize);
        if (raw >= static_cast<int>(constants::BoardSize))
        {
            ledger_.Credit(p, cfg_.go_salary);
            if (report_ && report_->actor == p) report_->passed_go = true;
            Note(std::format("{} passes GO and collects ${}", ps.name, cfg_.go_salary));
        }
        Note(std::format("{} moves to {}", ps.name, board_->At(ps.position).name));
    }

    auto GameImpl::MoveTo(PlyrIdxT const p, SpaceIdxT const target, bool const collect_go) -> void
    {
        PlayerState& ps = players_[p];
        bool const wraps = target <= ps.position;
        ps.position = target;
        if (collect_go && wraps)
        {
            ledger_.Credit(p, cfg_.go_salary);
            if (report_ && report_->actor == p) report_->passed_go = true;
            Note(std::format("{} passes GO and collects ${}", ps.name, cfg_.go_salary));
        }
        Note(std::format("{} advances to {}", ps.name, board_->At(target).name));
    }

    auto GameImpl::MoveBack(PlyrIdxT const p, int const steps) -> void
    {
        PlayerState& ps = players_[p];
        int const n = static_cast<int>(constants::BoardSize);
        ps.position = static_cast<SpaceIdxT>(((ps.position - steps) % n + n) % n);
        Note(std::format("{} goes back to {}", ps.name, board_->At(ps.position).name));
    }

    auto GameImpl::SendToJail(PlyrIdxT const p) -> void
    {
        PlayerState& ps = players_[p];
        ps.position = constants::JailPosition;
        ps.in_jail = true;
        ps.jail_turns = 0;
        if (p == current_)
        {
            doubles_streak_ = 0;
            phase_ = Phase::TurnOver;
        }
        Note(std::format("{} goes to jail", ps.name));
    }

    auto GameImpl::ReleaseFromJail(PlyrIdxT const p) -> void
    {
        PlayerState& ps = players_[p];
        ps.in_jail = false;
        ps.jail_turns = 0;
    }

    auto GameImpl::SpendJailCard(PlyrIdxT const p) -> void
    {
        PlayerState& ps = players_[p];
        TYC_ASSERT(!ps.jail_cards.empty(), "Spending a jail card the player does not hold");
        DeckKind const from = ps.jail_cards.back();
        ps.jail_cards.pop_back();
        decks_[static_cast<std::size_t>(from)].ReturnJailCard();
    }

    auto GameImpl::ResolveLanding(PlyrIdxT const p, int const dice_sum, RentMode const mode) -> void
    {
        PlayerState const& ps = players_[p];
        SpaceIdxT const s = ps.position;
        Space const& sp = board_->At(s);
        if (report_ && report_->actor == p && !report_->landed_on) report_->landed_on = s;

        std::visit([&]<typename T0>(T0 const& d)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, StreetSpace> ||
                          std::is_same_v<T, RailroadSpace> ||
                          std::is_same_v<T, UtilitySpace>)
            {
                PropertyRecord const& r = ledger_.Record(s);
                if (!r.owner)
                {
                    pending_purchase_ = s;
                    Note(std::format("{} is unowned (${})", sp.name, d.price));
                    return;
                }
                if (*r.owner == p || r.mortgaged) return;

                MoneyT rent{};
                if constexpr (std::is_same_v<T, RailroadSpace>)
                {
                    rent = ledger_.RentFor(s, dice_sum);
                    if (mode == RentMode::DoubleRailroad) rent *= 2;
                }
                else if constexpr (std::is_same_v<T, UtilitySpace>)
                {
                    if (mode == RentMode::TenTimesDice)
                    {
                        DiceRoll const fresh = RollDice();
                        Note(std::format("{} throws {}+{} for the utility", ps.name, int{fresh.d1}, int{fresh.d2}));
                        rent = fresh.Sum() * constants::BothUtilitiesMultiplier;
                    }
                    else
                    {
                        rent = ledger_.RentFor(s, dice_sum);
                    }
                }
                else
                {
                    rent = ledger_.RentFor(s, dice_sum);
                }
                Charge(p, *r.owner, rent, std::format("rent on {}", sp.name));
            }
            else if constexpr (std::is_same_v<T, TaxSpace>)
            {
                Charge(p, std::nullopt, d.amount, sp.name);
            }
            else if constexpr (std::is_same_v<T, ChanceSpace>)
            {
                DrawCard(p, DeckKind::Chance, dice_sum);
            }
            else if constexpr (std::is_same_v<T, CommunityChestSpace>)
            {
                DrawCard(p, DeckKind::CommunityChest, dice_sum);
            }
            else if constexpr (std::is_same_v<T, GoToJailSpace>)
            {
                SendToJail(p);
            }
            else
            {
                // GO, Jail (just visiting), Free Parking
            }
        }, sp.detail);
    }

    auto GameImpl::DrawCard(PlyrIdxT const p, DeckKind const deck, int const dice_sum) -> void
    {
        CardDef const& c = decks_[static_cast<std::size_t>(deck)].Draw();
        Note(std::format("{} draws {}: {}", players_[p].name, to_string(deck), c.text));
        if (report_) report_->cards.push_back(CardDrawn{.deck = deck, .text = std::string{c.text}});
        ApplyCard(p, deck, c.effect, dice_sum);
    }

    auto GameImpl::ApplyCard(PlyrIdxT const p, DeckKind const deck, CardEffect const& effect, int const dice_sum) -> void
    {
        std::visit([&]<typename T0>(T0 const& e)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, card::AdvanceTo>)
            {
                MoveTo(p, e.target, e.collect_go);
                ResolveLanding(p, dice_sum);
            }
            else if constexpr (std::is_same_v<T, card::AdvanceToNearest>)
            {
                SpaceIdxT const target = board_->NextOfKind(players_[p].position, e.kind);
                MoveTo(p, target, true);
                ResolveLanding(p, dice_sum,
                               e.kind == SpaceKind::Railroad ? RentMode::DoubleRailroad : RentMode::TenTimesDice);
            }
            else if constexpr (std::is_same_v<T, card::MoveBack>)
            {
                MoveBack(p, e.spaces);
                ResolveLanding(p, dice_sum);
            }
            else if constexpr (std::is_same_v<T, card::Collect>)
            {
                ledger_.Credit(p, e.amount);
                Note(std::format("{} collects ${}", players_[p].name, e.amount));
            }
            else if constexpr (std::is_same_v<T, card::Pay>)
            {
                Charge(p, std::nullopt, e.amount, "card");
            }
            else if constexpr (std::is_same_v<T, card::PayEachPlayer>)
            {
                for (PlyrIdxT o = NextSeat(p); o != p; o = NextSeat(o))
                {
                    if (players_[o].bankrupt) continue;
                    Charge(p, o, e.amount, "card");
                }
            }
            else if constexpr (std::is_same_v<T, card::CollectFromEachPlayer>)
            {
                for (PlyrIdxT o = NextSeat(p); o != p; o = NextSeat(o))
                {
                    if (players_[o].bankrupt) continue;
                    Charge(o, p, e.amount, "card");
                }
            }
            else if constexpr (std::is_same_v<T, card::GetOutOfJailFree>)
            {
                players_[p].jail_cards.push_back(deck);
                Note(std::format("{} keeps the Get Out of Jail Free card", players_[p].name));
            }
            else if constexpr (std::is_same_v<T, card::GoToJail>)
            {
                SendToJail(p);
            }
            else if constexpr (std::is_same_v<T, card::RepairAssessment>)
            {
                MoneyT const bill = ledger_.HousesOwnedBy(p) * e.per_house + ledger_.HotelsOwnedBy(p) * e.per_hotel;
                if (bill > 0) Charge(p, std::nullopt, bill, "repairs");
            }
            else
            {
                TYC_THROW(error::Code::Unknown, "Unreachable card effect");
            }
        }, effect);
    }
}
