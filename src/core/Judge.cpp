#include "Judge.hpp"

#include <format>
#include <utility>

#include "Game.hpp"
#include "Player.hpp"

namespace tycoon::core
{
    auto Judge::DefaultAction(GameSnapshot const& s) -> PlayerAction
    {
        switch (s.phase)
        {
        case Phase::AwaitingRoll: return RollAction{};
        case Phase::AwaitingPurchaseDecision:
            TYC_ASSERT(s.pending_purchase.has_value(), "Purchase phase without a pending property");
            return DeclineAction{.property = *s.pending_purchase};
        case Phase::AwaitingDebtSettlement:
        {
            TYC_ASSERT(!s.debts.empty(), "Debt phase without debts");
            PendingDebt const& d = s.debts.front();
            if (s.players[d.debtor].cash >= d.amount) return PayDebtAction{};
            return DeclareBankruptcyAction{};
        }
        case Phase::AwaitingTradeResponse: return RespondTradeAction{.accept = false};
        case Phase::TurnOver: return EndTurnAction{};
        case Phase::GameOver: break;
        }
        TYC_THROW(error::Code::State, "No default action once the game is over");
    }

    auto Judge::Step(GameImpl& game, std::span<std::unique_ptr<Player> const> players) const -> Decision
    {
        if (game.IsOver()) TYC_THROW(error::Code::State, "Step on a finished game");
        TYC_ASSERT(players.size() == game.PlayerCount(), "One player per seat");

        auto const snap = game.Snapshot();
        PlyrIdxT const actor = snap->expected_actor;

        Decision d{.actor = actor};
        d.action = players[actor]->Play(snap, actor);

        auto result = game.Submit(ActionRequest{.actor = actor, .action = d.action});
        if (!result)
        {
            d.rejected = result.error();
            d.result = DecisionResult::Defaulted;
            d.action = DefaultAction(*snap);
            result = game.Submit(ActionRequest{.actor = actor, .action = d.action});
            if (!result)
                TYC_THROW(error::Code::Rules,
                          std::format("Default action rejected: {}", error::describe(result.error())));
        }
        d.report = std::move(*result);
        return d;
    }
}
