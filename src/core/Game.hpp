#ifndef TYCOON_GAME_HPP
#define TYCOON_GAME_HPP

#include <array>
#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "Board.hpp"
#include "Cards.hpp"
#include "Dice.hpp"
#include "Ledger.hpp"
#include "State.hpp"
#include "Rules.hpp"

namespace tycoon::core::debug {struct Inspector;}
namespace tycoon::core
{
    struct PlayerState
    {
        std::string name;
        SpaceIdxT position{constants::GoPosition};
        bool in_jail{false};
        std::uint8_t jail_turns{0};
        // deck each held Get Out of Jail Free card came from
        std::vector<DeckKind> jail_cards;
        bool bankrupt{false};
    };

    // How rent is charged when a card moved the player.
    enum class RentMode : std::uint8_t
    {
        Normal,
        DoubleRailroad,
        TenTimesDice
    };

    // One game session. Single-threaded: callers serialise access (see Session).
    class GameImpl
    {
    public:
        GameImpl() = delete;
        GameImpl(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::string> player_names,
                 std::unique_ptr<DiceSource> dice = nullptr);

        // Validate, apply, advance. A rejected request leaves the session untouched.
        auto Submit(ActionRequest const& req) -> error::Result<ActionReport>;

        auto Snapshot() const -> std::shared_ptr<GameSnapshot const>;
        auto PropertyDetailsFor(PlyrIdxT p) const -> std::vector<PropertyDetail>;
        auto FindPlayer(std::string_view name) const -> std::optional<PlyrIdxT>;
        auto PlayerName(PlyrIdxT p) const -> std::string const& { return players_.at(p).name; }

        auto Current() const noexcept        -> PlyrIdxT { return current_; }
        auto PhaseNow() const noexcept       -> Phase;
        auto ExpectedActor() const noexcept  -> PlyrIdxT;
        auto IsOver() const noexcept         -> bool { return game_over_; }
        auto Winner() const noexcept         -> std::optional<PlyrIdxT> { return winner_; }
        auto PlayerCount() const noexcept    -> std::size_t { return players_.size(); }
        auto GetConfig() const noexcept      -> Config const& { return cfg_; }
        auto LedgerRef() const noexcept      -> Ledger const& { return ledger_; }
        auto BoardRef() const noexcept       -> Board const& { return *board_; }
        auto PlayerAt(PlyrIdxT p) const      -> PlayerState const& { return players_.at(p); }

        //allows class to directly access private data on an instance
        friend class ClassicRules;
        friend struct debug::Inspector;

        // ---- movement & landing (Turn.cpp) ----
        auto RollDice() -> DiceRoll;
        // Forward move; credits GO salary when the move passes or lands on GO.
        auto MoveBy(PlyrIdxT p, int steps) -> void;
        // Card jump. GO salary only when collect_go is set.
        auto MoveTo(PlyrIdxT p, SpaceIdxT target, bool collect_go) -> void;
        auto MoveBack(PlyrIdxT p, int steps) -> void;
        auto ResolveLanding(PlyrIdxT p, int dice_sum, RentMode mode = RentMode::Normal) -> void;
        auto DrawCard(PlyrIdxT p, DeckKind deck, int dice_sum) -> void;
        auto ApplyCard(PlyrIdxT p, DeckKind deck, CardEffect const& effect, int dice_sum) -> void;
        auto SendToJail(PlyrIdxT p) -> void;
        auto ReleaseFromJail(PlyrIdxT p) -> void;
        // Spends one held card and puts it back under its deck.
        auto SpendJailCard(PlyrIdxT p) -> void;

        // ---- payments, debts, bankruptcy (Bankruptcy.cpp) ----
        // Mandatory payment. Pays at once, queues a debt, or bankrupts the debtor.
        auto Charge(PlyrIdxT debtor, std::optional<PlyrIdxT> creditor, MoneyT amount,
                    std::string_view reason) -> void;
        auto OwedBy(PlyrIdxT p) const -> MoneyT;
        auto PayFrontDebt() -> void;
        auto Bankrupt(PlyrIdxT p, std::optional<PlyrIdxT> creditor) -> void;
        auto CheckGameOver() -> bool;

        // ---- transactions (Transactions.cpp) ----
        auto BuyPending(PlyrIdxT p) -> void;
        auto RunAuction(PlyrIdxT decliner, DeclineAction const& d) -> void;
        auto ExecuteTrade() -> void;

        // ---- rotation ----
        auto NextLivePlayer(PlyrIdxT from) const -> PlyrIdxT;
        inline auto NextSeat(PlyrIdxT const idx) const -> PlyrIdxT { return static_cast<PlyrIdxT>((idx + 1) % players_.size()); }
        auto LiveCount() const -> std::size_t;
        auto EndTurn() -> void;

        // Appends to the report of the action being applied.
        auto Note(std::string line) -> void;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::unique_ptr<DiceSource> dice_;
        std::mt19937_64 rng_;
        Board const* board_;

        // Authoritative state
        Ledger ledger_;
        std::array<Deck, 2> decks_;
        std::vector<PlayerState> players_;

        // Turn state
        PlyrIdxT current_{0};
        Phase    phase_{Phase::AwaitingRoll}; // AwaitingRoll or TurnOver; blocking states are derived
        std::uint8_t doubles_streak_{0};
        bool     turn_ended_{false};          // set by Apply(EndTurn), consumed by Advance
        std::optional<SpaceIdxT> pending_purchase_{};
        std::deque<PendingDebt> debts_;
        std::optional<PendingTrade> pending_trade_{};
        std::optional<DiceRoll> last_dice_{};

        bool game_over_{false};
        std::optional<PlyrIdxT> winner_{};

        ActionReport* report_{nullptr};
    };
}
#endif //TYCOON_GAME_HPP
