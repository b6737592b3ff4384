#ifndef TYCOON_INVARIANTS_HPP
#define TYCOON_INVARIANTS_HPP

#include <algorithm>
#include <format>
#include <ranges>

#include "../core/Game.hpp"
#include "Inspector.hpp"

namespace tycoon::core::debug
{
    // Whole-session consistency check, run by the tests after every action.
    // Throws AssertionError on the first broken invariant.
    inline auto CheckInvariants(GameImpl const& g) -> void
    {
#if TYC_ENABLE_TEST_HOOKS == false
        (void)g;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(g);

        // 1) Bookkeeping: building range, monopoly, even rule, house/hotel totals
        g.LedgerRef().CheckInvariants();

        // 2) Players: board range, settled cash, bankrupt players hold nothing
        std::size_t live{};
        for (std::size_t i{}; i < s.players.size(); ++i)
        {
            PlayerState const& ps = s.players[i];
            auto const p = static_cast<PlyrIdxT>(i);
            TYC_ASSERT(ps.position < constants::BoardSize, std::format("{} off the board", ps.name));
            TYC_ASSERT(ps.jail_turns < constants::MaxJailAttempts, std::format("{} jail counter", ps.name));
            TYC_ASSERT(!ps.in_jail || ps.position == constants::JailPosition,
                       std::format("{} jailed away from the jail", ps.name));
            TYC_ASSERT(s.cash[i] >= 0, std::format("{} has negative cash", ps.name));
            if (ps.bankrupt)
            {
                TYC_ASSERT(s.cash[i] == 0, std::format("Bankrupt {} still has cash", ps.name));
                TYC_ASSERT(ps.jail_cards.empty(), std::format("Bankrupt {} holds jail cards", ps.name));
                TYC_ASSERT(g.LedgerRef().PropertiesOf(p).empty(), std::format("Bankrupt {} owns deeds", ps.name));
                continue;
            }
            ++live;
        }

        // 3) Each Get Out of Jail Free card is in exactly one place
        for (DeckKind const k : {DeckKind::Chance, DeckKind::CommunityChest})
        {
            std::size_t held{};
            for (PlayerState const& ps : s.players) held += std::ranges::count(ps.jail_cards, k);
            TYC_ASSERT(held <= 1, "Jail card duplicated");
            TYC_ASSERT(s.decks[static_cast<std::size_t>(k)].size() + held == constants::DeckSize,
                       "Deck lost or gained a card");
        }

        // 4) Game over exactly when at most one player is left
        TYC_ASSERT(s.game_over == (live <= 1), "Game-over flag disagrees with live players");
        if (s.game_over)
        {
            TYC_ASSERT(s.winner && !s.players[*s.winner].bankrupt, "Finished game without a live winner");
            TYC_ASSERT(s.debts.empty() && !s.pending_trade && !s.pending_purchase, "Finished game has open business");
            return;
        }

        // 5) Turn state
        TYC_ASSERT(!s.players[s.current].bankrupt, "Bankrupt player holds the turn");
        TYC_ASSERT(s.phase == Phase::AwaitingRoll || s.phase == Phase::TurnOver, "Stored phase is a derived one");
        TYC_ASSERT(s.doubles_streak < constants::SpeedingDoubles, "Doubles streak past the speeding limit");
        if (s.pending_purchase)
        {
            TYC_ASSERT(s.players[s.current].position == *s.pending_purchase, "Pending purchase away from the buyer");
            TYC_ASSERT(!s.records[*s.pending_purchase].owner, "Pending purchase already owned");
        }
        for (PendingDebt const& d : s.debts)
        {
            TYC_ASSERT(!s.players[d.debtor].bankrupt, "Debt owed by a bankrupt player");
            TYC_ASSERT(d.amount > 0, "Empty debt queued");
            TYC_ASSERT(!d.creditor || !s.players[*d.creditor].bankrupt, "Debt owed to a bankrupt player");
        }
#endif // TYC_ENABLE_TEST_HOOKS == true
    }
}
#endif //TYCOON_INVARIANTS_HPP
