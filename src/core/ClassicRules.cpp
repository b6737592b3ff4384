#include "ClassicRules.hpp"

#include "Game.hpp"
#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace tycoon::core
{
    using RVC = ::tycoon::core::error::ViolationCode;
    using error::Viol;

    static auto ActorIs(PlyrIdxT const actor, PlyrIdxT const expected, Phase const ph) -> Rules::CheckResult
    {
        if (actor != expected)
            return std::unexpected(Viol(RVC::Flow_WrongActor).with_actor(actor).with_expected(expected).with_phase(ph));
        return {};
    }

    static auto PhaseIs(Phase const ph, Phase const required, PlyrIdxT const actor) -> Rules::CheckResult
    {
        if (ph != required)
            return std::unexpected(Viol(RVC::Flow_WrongPhase).with_phase(ph).with_actor(actor));
        return {};
    }

    // Shared gate for build/sell/mortgage/unmortgage/trade outside the blocking phases.
    static auto FreeActionGate(GameImpl const& game, PlyrIdxT const actor, Phase const ph) -> Rules::CheckResult
    {
        if (ph != Phase::AwaitingRoll && ph != Phase::TurnOver)
            return std::unexpected(Viol(RVC::Flow_WrongPhase).with_phase(ph).with_actor(actor));
        if (auto ok = ActorIs(actor, game.Current(), ph); !ok) return ok;
        if (ph == Phase::AwaitingRoll && game.PlayerAt(actor).in_jail)
            return std::unexpected(Viol(RVC::Flow_JailRestricted).with_phase(ph).with_actor(actor));
        return {};
    }

    auto ClassicRules::ValidateBundle(GameImpl const& game, PlyrIdxT const giver, TradeBundle const& b) -> CheckResult
    {
        Ledger const& ledger = game.ledger_;
        Board const& board = *game.board_;

        if (b.cash < 0)
            return std::unexpected(Viol(RVC::Trade_NegativeCash).with_actor(giver).with_amount(b.cash));
        if (b.cash > ledger.Cash(giver))
            return std::unexpected(Viol(RVC::Trade_CashNotCovered).with_actor(giver)
                                   .with_amount(b.cash).with_available(ledger.Cash(giver)));
        if (b.jail_cards > game.players_[giver].jail_cards.size())
            return std::unexpected(Viol(RVC::Trade_NotEnoughJailCards).with_actor(giver));

        for (std::size_t i{}; i < b.properties.size(); ++i)
        {
            SpaceIdxT const s = b.properties[i];
            if (s >= constants::BoardSize || !board.At(s).IsOwnable())
                return std::unexpected(Viol(RVC::Trade_NotOwnable).with_actor(giver).with_space(s));
            if (ledger.OwnerOf(s) != giver)
                return std::unexpected(Viol(RVC::Trade_NotOwner).with_actor(giver).with_space(s));
            if (ledger.GroupHasBuildings(board.At(s).Group()))
                return std::unexpected(Viol(RVC::Trade_BuildingsInGroup).with_actor(giver).with_space(s));
            if (std::ranges::find(b.properties.begin() + static_cast<std::ptrdiff_t>(i) + 1, b.properties.end(), s)
                != b.properties.end())
                return std::unexpected(Viol(RVC::Trade_DuplicateProperty).with_actor(giver).with_space(s));
        }
        return {};
    }

    auto ClassicRules::ValidateTrade(GameImpl const& game, PlyrIdxT const proposer, ProposeTradeAction const& t)
        -> CheckResult
    {
        if (t.counterparty >= game.PlayerCount())
            return std::unexpected(Viol(RVC::Trade_UnknownCounterparty).with_actor(proposer));
        if (t.counterparty == proposer)
            return std::unexpected(Viol(RVC::Trade_WithSelf).with_actor(proposer));
        if (game.players_[t.counterparty].bankrupt)
            return std::unexpected(Viol(RVC::Trade_CounterpartyBankrupt).with_actor(proposer)
                                   .with_expected(t.counterparty));
        if (t.give.Empty() && t.take.Empty())
            return std::unexpected(Viol(RVC::Trade_Empty).with_actor(proposer));

        if (auto ok = ValidateBundle(game, proposer, t.give); !ok) return ok;
        return ValidateBundle(game, t.counterparty, t.take);
    }

    auto ClassicRules::ValidateBids(GameImpl const& game, DeclineAction const& d) -> CheckResult
    {
        for (Bid const& b : d.bids)
        {
            if (b.bidder >= game.PlayerCount())
                return std::unexpected(Viol(RVC::Auction_UnknownBidder).with_actor(b.bidder));
        }
        return {};
    }

    auto ClassicRules::Validate(GameImpl const& game, ActionRequest const& req) const -> CheckResult
    {
        PlyrIdxT const actor = req.actor;
        if (game.game_over_)
            return std::unexpected(Viol(RVC::Flow_GameOver).with_actor(actor).with_phase(Phase::GameOver));
        if (actor >= game.PlayerCount())
            return std::unexpected(Viol(RVC::Player_NotFound).with_actor(actor));
        if (game.players_[actor].bankrupt)
            return std::unexpected(Viol(RVC::Flow_WrongActor).with_actor(actor).with_expected(game.ExpectedActor()));

        Phase const ph = game.PhaseNow();
        PlayerState const& ps = game.players_[actor];
        Ledger const& ledger = game.ledger_;

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollAction>)
            {
                if (auto ok = ActorIs(actor, game.current_, ph); !ok) return ok;
                return PhaseIs(ph, Phase::AwaitingRoll, actor);
            }
            else if constexpr (std::is_same_v<T, PayJailFineAction>)
            {
                if (auto ok = ActorIs(actor, game.current_, ph); !ok) return ok;
                if (auto ok = PhaseIs(ph, Phase::AwaitingRoll, actor); !ok) return ok;
                if (!ps.in_jail)
                    return std::unexpected(Viol(RVC::Jail_NotInJail).with_actor(actor));
                if (ledger.Cash(actor) < game.cfg_.jail_fine)
                    return std::unexpected(Viol(RVC::Jail_CannotAffordFine).with_actor(actor)
                                           .with_amount(game.cfg_.jail_fine).with_available(ledger.Cash(actor)));
                return {};
            }
            else if constexpr (std::is_same_v<T, UseJailCardAction>)
            {
                if (auto ok = ActorIs(actor, game.current_, ph); !ok) return ok;
                if (auto ok = PhaseIs(ph, Phase::AwaitingRoll, actor); !ok) return ok;
                if (!ps.in_jail)
                    return std::unexpected(Viol(RVC::Jail_NotInJail).with_actor(actor));
                if (ps.jail_cards.empty())
                    return std::unexpected(Viol(RVC::Jail_NoCard).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, BuyAction> || std::is_same_v<T, DeclineAction>)
            {
                if (auto ok = ActorIs(actor, game.current_, ph); !ok) return ok;
                if (act.property >= constants::BoardSize || !game.board_->At(act.property).IsOwnable())
                    return std::unexpected(Viol(RVC::Purchase_NotOwnable).with_actor(actor).with_space(act.property));
                if (ledger.OwnerOf(act.property))
                    return std::unexpected(Viol(RVC::Purchase_AlreadyOwned).with_actor(actor).with_space(act.property));
                if (auto ok = PhaseIs(ph, Phase::AwaitingPurchaseDecision, actor); !ok) return ok;
                if (game.pending_purchase_ != act.property)
                    return std::unexpected(Viol(RVC::Purchase_NotOnProperty).with_actor(actor)
                                           .with_space(act.property));
                if constexpr (std::is_same_v<T, BuyAction>)
                {
                    MoneyT const price = game.board_->At(act.property).Price();
                    if (ledger.Cash(actor) < price)
                        return std::unexpected(Viol(RVC::Purchase_CannotAfford).with_actor(actor)
                                               .with_space(act.property).with_amount(price)
                                               .with_available(ledger.Cash(actor)));
                    return {};
                }
                else
                {
                    return ValidateBids(game, act);
                }
            }
            else if constexpr (std::is_same_v<T, MortgageAction> || std::is_same_v<T, SellBuildingAction>)
            {
                if (act.property >= constants::BoardSize)
                    return std::unexpected(Viol(RVC::Purchase_NotOwnable).with_actor(actor).with_space(act.property));
                if (ph == Phase::AwaitingDebtSettlement)
                {
                    if (auto ok = ActorIs(actor, game.ExpectedActor(), ph); !ok) return ok;
                }
                else if (auto ok = FreeActionGate(game, actor, ph); !ok)
                {
                    return ok;
                }
                if constexpr (std::is_same_v<T, MortgageAction>)
                    return ledger.CheckMortgage(actor, act.property);
                else
                    return ledger.CheckSell(actor, act.property);
            }
            else if constexpr (std::is_same_v<T, UnmortgageAction> || std::is_same_v<T, BuildAction>)
            {
                if (act.property >= constants::BoardSize)
                    return std::unexpected(Viol(RVC::Purchase_NotOwnable).with_actor(actor).with_space(act.property));
                if (auto ok = FreeActionGate(game, actor, ph); !ok) return ok;
                if constexpr (std::is_same_v<T, UnmortgageAction>)
                    return ledger.CheckUnmortgage(actor, act.property);
                else
                    return ledger.CheckBuild(actor, act.property);
            }
            else if constexpr (std::is_same_v<T, ProposeTradeAction>)
            {
                if (auto ok = FreeActionGate(game, actor, ph); !ok) return ok;
                return ValidateTrade(game, actor, act);
            }
            else if constexpr (std::is_same_v<T, RespondTradeAction>)
            {
                if (auto ok = PhaseIs(ph, Phase::AwaitingTradeResponse, actor); !ok) return ok;
                if (auto ok = ActorIs(actor, game.ExpectedActor(), ph); !ok) return ok;
                if (!act.accept) return {};
                PendingTrade const& t = *game.pending_trade_;
                return ValidateTrade(game, t.proposer,
                                     ProposeTradeAction{.counterparty = t.counterparty, .give = t.give, .take = t.take});
            }
            else if constexpr (std::is_same_v<T, PayDebtAction>)
            {
                if (auto ok = PhaseIs(ph, Phase::AwaitingDebtSettlement, actor); !ok) return ok;
                if (auto ok = ActorIs(actor, game.ExpectedActor(), ph); !ok) return ok;
                PendingDebt const& d = game.debts_.front();
                if (ledger.Cash(actor) < d.amount)
                    return std::unexpected(Viol(RVC::Debt_NotCovered).with_actor(actor)
                                           .with_amount(d.amount).with_available(ledger.Cash(actor)));
                return {};
            }
            else if constexpr (std::is_same_v<T, DeclareBankruptcyAction>)
            {
                if (auto ok = PhaseIs(ph, Phase::AwaitingDebtSettlement, actor); !ok) return ok;
                return ActorIs(actor, game.ExpectedActor(), ph);
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                if (auto ok = ActorIs(actor, game.current_, ph); !ok) return ok;
                if (ph == Phase::AwaitingRoll && game.doubles_streak_ > 0)
                    return std::unexpected(Viol(RVC::Flow_ExtraRollPending).with_phase(ph).with_actor(actor));
                return PhaseIs(ph, Phase::TurnOver, actor);
            }
            else
            {
                TYC_THROW(error::Code::Unknown, "Unreachable variant in Validate");
            }
        }, req.action);
    }

    auto ClassicRules::Apply(GameImpl& game, ActionRequest const& req) -> void
    {
        PlyrIdxT const actor = req.actor;
        PlayerState& ps = game.players_[actor];

        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, RollAction>)
            {
                DiceRoll const dice = game.RollDice();
                game.last_dice_ = dice;
                if (game.report_)
                {
                    game.report_->dice = dice;
                    game.report_->doubles = dice.IsDoubles();
                }
                game.Note(std::format("{} rolls {}+{}", ps.name, int{dice.d1}, int{dice.d2}));

                if (ps.in_jail)
                {
                    if (dice.IsDoubles())
                    {
                        game.ReleaseFromJail(actor);
                        game.Note(std::format("{} rolls doubles and leaves jail", ps.name));
                    }
                    else if (++ps.jail_turns < constants::MaxJailAttempts)
                    {
                        game.Note(std::format("{} stays in jail", ps.name));
                        game.phase_ = Phase::TurnOver;
                        return;
                    }
                    else
                    {
                        game.ReleaseFromJail(actor);
                        game.Charge(actor, std::nullopt, game.cfg_.jail_fine, "jail fine");
                        // the move is forfeited when the fine has to be raised first
                        if (ps.bankrupt || !game.debts_.empty())
                        {
                            game.phase_ = Phase::TurnOver;
                            return;
                        }
                    }
                    // released players move but never earn another roll
                    game.doubles_streak_ = 0;
                    game.MoveBy(actor, dice.Sum());
                    game.ResolveLanding(actor, dice.Sum());
                    game.phase_ = Phase::TurnOver;
                    return;
                }

                if (dice.IsDoubles() && ++game.doubles_streak_ >= constants::SpeedingDoubles)
                {
                    game.Note(std::format("{} rolls doubles three times: speeding", ps.name));
                    game.SendToJail(actor);
                    return;
                }
                if (!dice.IsDoubles()) game.doubles_streak_ = 0;

                game.MoveBy(actor, dice.Sum());
                game.ResolveLanding(actor, dice.Sum());

                bool const again = dice.IsDoubles() && !ps.in_jail && !ps.bankrupt;
                game.phase_ = again ? Phase::AwaitingRoll : Phase::TurnOver;
                if (!again) game.doubles_streak_ = 0;
            }
            else if constexpr (std::is_same_v<T, PayJailFineAction>)
            {
                game.ledger_.Debit(actor, game.cfg_.jail_fine);
                game.ReleaseFromJail(actor);
                game.Note(std::format("{} pays ${} to leave jail", ps.name, game.cfg_.jail_fine));
            }
            else if constexpr (std::is_same_v<T, UseJailCardAction>)
            {
                game.SpendJailCard(actor);
                game.ReleaseFromJail(actor);
                game.Note(std::format("{} uses a Get Out of Jail Free card", ps.name));
            }
            else if constexpr (std::is_same_v<T, BuyAction>)
            {
                game.BuyPending(actor);
            }
            else if constexpr (std::is_same_v<T, DeclineAction>)
            {
                game.Note(std::format("{} declines {}", ps.name, game.board_->At(act.property).name));
                game.RunAuction(actor, act);
            }
            else if constexpr (std::is_same_v<T, MortgageAction>)
            {
                MoneyT const v = game.ledger_.Mortgage(actor, act.property);
                game.Note(std::format("{} mortgages {} for ${}", ps.name, game.board_->At(act.property).name, v));
            }
            else if constexpr (std::is_same_v<T, UnmortgageAction>)
            {
                MoneyT const v = game.ledger_.Unmortgage(actor, act.property);
                game.Note(std::format("{} lifts the mortgage on {} for ${}", ps.name,
                                      game.board_->At(act.property).name, v));
            }
            else if constexpr (std::is_same_v<T, BuildAction>)
            {
                MoneyT const v = game.ledger_.Build(actor, act.property);
                game.Note(std::format("{} builds on {} for ${}", ps.name, game.board_->At(act.property).name, v));
            }
            else if constexpr (std::is_same_v<T, SellBuildingAction>)
            {
                MoneyT const v = game.ledger_.SellBuilding(actor, act.property);
                game.Note(std::format("{} sells a building on {} for ${}", ps.name,
                                      game.board_->At(act.property).name, v));
            }
            else if constexpr (std::is_same_v<T, ProposeTradeAction>)
            {
                game.pending_trade_ = PendingTrade{
                    .proposer = actor, .counterparty = act.counterparty, .give = act.give, .take = act.take};
                game.Note(std::format("{} offers a trade to {}", ps.name, game.players_[act.counterparty].name));
            }
            else if constexpr (std::is_same_v<T, RespondTradeAction>)
            {
                if (act.accept)
                {
                    game.ExecuteTrade();
                }
                else
                {
                    game.pending_trade_.reset();
                    game.Note(std::format("{} rejects the trade", ps.name));
                }
            }
            else if constexpr (std::is_same_v<T, PayDebtAction>)
            {
                game.PayFrontDebt();
            }
            else if constexpr (std::is_same_v<T, DeclareBankruptcyAction>)
            {
                std::optional<PlyrIdxT> const creditor = game.debts_.front().creditor;
                game.Bankrupt(actor, creditor);
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                game.turn_ended_ = true;
            }
        }, req.action);
    }

    auto ClassicRules::Advance(GameImpl& game) -> MoveOutcome
    {
        bool const ended = std::exchange(game.turn_ended_, false);
        if (game.CheckGameOver()) return MoveOutcome::GameEnded;

        // other players' queued debts survive the rotation; PhaseNow still reports them
        if (game.players_[game.current_].bankrupt)
        {
            game.EndTurn();
            return MoveOutcome::TurnEnded;
        }

        // blocking decisions keep the turn where it is
        if (!game.debts_.empty() || game.pending_trade_ || game.pending_purchase_)
            return MoveOutcome::Applied;

        if (ended)
        {
            game.EndTurn();
            return MoveOutcome::TurnEnded;
        }
        return MoveOutcome::Applied;
    }
}
