#ifndef TYCOON_STATE_HPP
#define TYCOON_STATE_HPP

#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "Exception.hpp"

namespace tycoon::core
{
    struct PendingDebt
    {
        PlyrIdxT debtor{};
        std::optional<PlyrIdxT> creditor{}; // nullopt = bank
        MoneyT amount{};
    };

    struct PendingTrade
    {
        PlyrIdxT    proposer{};
        PlyrIdxT    counterparty{};
        TradeBundle give;
        TradeBundle take;
    };

    struct PlayerView
    {
        std::string name;
        MoneyT cash{};
        SpaceIdxT position{};
        bool in_jail{false};
        std::uint8_t jail_turns{};
        std::uint8_t jail_cards{};
        bool bankrupt{false};
        std::vector<SpaceIdxT> properties;
        MoneyT net_worth{};
    };

    struct PropertyView
    {
        SpaceIdxT space{};
        std::optional<PlyrIdxT> owner{};
        bool mortgaged{false};
        std::uint8_t buildings{};
    };

    // Immutable copy of a session handed to callers (UI, codec, AI)
    struct GameSnapshot
    {
        std::vector<PlayerView> players;
        std::vector<PropertyView> properties; // ownable spaces in board order

        PlyrIdxT current{};
        PlyrIdxT expected_actor{};
        Phase phase{Phase::AwaitingRoll};
        bool game_over{false};
        std::optional<PlyrIdxT> winner{};

        int house_pool{};
        int hotel_pool{};

        std::optional<SpaceIdxT> pending_purchase{};
        std::vector<PendingDebt> debts;
        std::optional<PendingTrade> pending_trade{};

        std::optional<DiceRoll> last_dice{};
        std::uint8_t doubles_streak{};
        MoneyT jail_fine{};
        MoneyT auction_min_bid{};
    };

    // Per-property answer for get-player-properties
    struct PropertyDetail
    {
        SpaceIdxT space{};
        std::string name;
        SpaceKind kind{};
        ColorGroup group{};
        MoneyT price{};
        std::uint8_t buildings{};
        bool mortgaged{false};
        MoneyT mortgage_value{};
        MoneyT current_rent{};
        bool monopoly{false};
    };

    struct PurchaseResult
    {
        SpaceIdxT property{};
        PlyrIdxT buyer{};
        MoneyT price{};
    };

    struct RejectedBid
    {
        Bid bid;
        error::ViolationCode reason{};
    };

    struct AuctionResult
    {
        SpaceIdxT property{};
        std::optional<PlyrIdxT> winner{};
        MoneyT price{};
        std::vector<RejectedBid> rejected;
    };

    struct CardDrawn
    {
        DeckKind deck{};
        std::string text;
    };

    struct Bankruptcy
    {
        PlyrIdxT player{};
        std::optional<PlyrIdxT> creditor{};
    };

    // Result of one applied action
    struct ActionReport
    {
        PlyrIdxT actor{};
        MoveOutcome outcome{MoveOutcome::Applied};
        Phase phase_after{Phase::AwaitingRoll};

        std::optional<DiceRoll> dice{};
        bool doubles{false};
        std::optional<SpaceIdxT> landed_on{};
        bool passed_go{false};
        MoneyT cash_delta{};     // actor's cash after minus before
        int position_delta{};    // new position minus old

        std::optional<PurchaseResult> purchase{};
        std::optional<AuctionResult> auction{};
        std::vector<CardDrawn> cards;
        std::vector<Bankruptcy> bankruptcies;
        std::vector<std::string> events;

        bool game_over{false};
        std::optional<PlyrIdxT> winner{};
    };
}

#endif //TYCOON_STATE_HPP
