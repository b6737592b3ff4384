#ifndef TYCOON_INSPECTOR_HPP
#define TYCOON_INSPECTOR_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <format>
#include <optional>
#include <string_view>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace tycoon::core::debug
{
    // Friend access for tests and invariant checks. Arranging helpers bypass the
    // rules on purpose but keep the ledger's pool accounting consistent.
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<PlayerState> players;
            std::vector<MoneyT> cash;
            std::vector<PropertyRecord> records; // full board, index = space
            int house_pool{};
            int hotel_pool{};
            std::array<std::deque<CardIdT>, 2> decks{};
            std::vector<PendingDebt> debts;
            std::optional<PendingTrade> pending_trade{};
            std::optional<SpaceIdxT> pending_purchase{};
            PlyrIdxT current{};
            Phase phase{};
            std::uint8_t doubles_streak{};
            bool game_over{false};
            std::optional<PlyrIdxT> winner{};
        };

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.players = g.players_;
            ret.cash = g.ledger_.cash_;
            ret.records.assign(g.ledger_.records_.begin(), g.ledger_.records_.end());
            ret.house_pool = g.ledger_.house_pool_;
            ret.hotel_pool = g.ledger_.hotel_pool_;
            for (std::size_t i{}; i < g.decks_.size(); ++i) ret.decks[i] = g.decks_[i].order_;
            ret.debts.assign(g.debts_.begin(), g.debts_.end());
            ret.pending_trade = g.pending_trade_;
            ret.pending_purchase = g.pending_purchase_;
            ret.current = g.current_;
            ret.phase = g.phase_;
            ret.doubles_streak = g.doubles_streak_;
            ret.game_over = g.game_over_;
            ret.winner = g.winner_;
            return ret;
        }

        static inline auto SetCash(GameImpl& g, PlyrIdxT const p, MoneyT const amount) -> void
        {
            g.ledger_.cash_.at(p) = amount;
        }

        static inline auto SetPosition(GameImpl& g, PlyrIdxT const p, SpaceIdxT const pos) -> void
        {
            g.players_.at(p).position = pos;
        }

        static inline auto SetCurrent(GameImpl& g, PlyrIdxT const p) -> void
        {
            g.current_ = p;
        }

        static inline auto Jail(GameImpl& g, PlyrIdxT const p, std::uint8_t const turns = 0) -> void
        {
            PlayerState& ps = g.players_.at(p);
            ps.position = constants::JailPosition;
            ps.in_jail = true;
            ps.jail_turns = turns;
        }

        // Takes the deck's Get Out of Jail Free card out of circulation and hands it to p.
        static inline auto GiveJailCard(GameImpl& g, PlyrIdxT const p, DeckKind const deck) -> void
        {
            Deck& d = g.decks_[static_cast<std::size_t>(deck)];
            auto const it = std::ranges::find(d.order_, d.jail_card_id_);
            TYC_ASSERT(it != d.order_.end(), "Jail card already held");
            d.order_.erase(it);
            g.players_.at(p).jail_cards.push_back(deck);
        }

        // Index of the first card in the catalog whose text starts with `prefix`.
        static inline auto CardId(DeckKind const deck, std::string_view const prefix) -> CardIdT
        {
            auto const cards = CardCatalog(deck);
            for (std::size_t i{}; i < cards.size(); ++i)
            {
                if (cards[i].text.starts_with(prefix)) return static_cast<CardIdT>(i);
            }
            TYC_THROW(error::Code::State, std::format("No card starting with '{}'", prefix));
        }

        // Puts the named card on top of its deck.
        static inline auto StackCard(GameImpl& g, DeckKind const deck, std::string_view const prefix) -> void
        {
            Deck& d = g.decks_[static_cast<std::size_t>(deck)];
            CardIdT const id = CardId(deck, prefix);
            auto const it = std::ranges::find(d.order_, id);
            TYC_ASSERT(it != d.order_.end(), "Card not in deck");
            d.order_.erase(it);
            d.order_.push_front(id);
        }

        static inline auto SetOwner(GameImpl& g, SpaceIdxT const s, std::optional<PlyrIdxT> const owner) -> void
        {
            PropertyRecord& r = g.ledger_.MutableRecord(s);
            TYC_ASSERT(r.buildings == 0, "Clear buildings before changing owner");
            r.owner = owner;
            if (!owner) r.mortgaged = false;
        }

        static inline auto GiveGroup(GameImpl& g, ColorGroup const group, PlyrIdxT const owner) -> void
        {
            for (SpaceIdxT const s : g.board_->GroupMembers(group)) SetOwner(g, s, owner);
        }

        static inline auto SetMortgaged(GameImpl& g, SpaceIdxT const s, bool const mortgaged) -> void
        {
            g.ledger_.MutableRecord(s).mortgaged = mortgaged;
        }

        // Sets the building level and moves the matching stock to or from the bank pools.
        static inline auto SetBuildings(GameImpl& g, SpaceIdxT const s, std::uint8_t const level) -> void
        {
            Ledger& l = g.ledger_;
            PropertyRecord& r = l.MutableRecord(s);
            auto stock = [](std::uint8_t b) -> std::pair<int, int>
            {
                return b == constants::HotelLevel ? std::pair{0, 1} : std::pair{static_cast<int>(b), 0};
            };
            auto const [old_h, old_ht] = stock(r.buildings);
            auto const [new_h, new_ht] = stock(level);
            l.house_pool_ += old_h - new_h;
            l.hotel_pool_ += old_ht - new_ht;
            r.buildings = level;
        }

        static inline auto SetPools(GameImpl& g, int const houses, int const hotels) -> void
        {
            g.ledger_.house_pool_ = houses;
            g.ledger_.hotel_pool_ = hotels;
        }

        static inline auto Debts(GameImpl const& g) -> std::vector<PendingDebt>
        {
            return {g.debts_.begin(), g.debts_.end()};
        }

        static inline auto DoublesStreak(GameImpl const& g) -> std::uint8_t
        {
            return g.doubles_streak_;
        }

        static inline auto DeckOrder(GameImpl const& g, DeckKind const deck) -> std::deque<CardIdT> const&
        {
            return g.decks_[static_cast<std::size_t>(deck)].order_;
        }
    };
}

#endif //TYCOON_INSPECTOR_HPP
