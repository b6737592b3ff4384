#ifndef TYCOON_ACTIONS_HPP
#define TYCOON_ACTIONS_HPP

#include <variant>
#include <vector>

#include "Types.hpp"

namespace tycoon::core
{
    struct RollAction        {};
    struct PayJailFineAction {};
    struct UseJailCardAction {};

    struct BuyAction
    {
        SpaceIdxT property{};
    };

    struct Bid
    {
        PlyrIdxT bidder{};
        MoneyT   amount{};
    };

    // Declining a purchase runs a one-shot sealed auction over the supplied bids.
    struct DeclineAction
    {
        SpaceIdxT        property{};
        std::vector<Bid> bids;
    };

    struct MortgageAction     { SpaceIdxT property{}; };
    struct UnmortgageAction   { SpaceIdxT property{}; };
    struct BuildAction        { SpaceIdxT property{}; };
    struct SellBuildingAction { SpaceIdxT property{}; };

    // What one side of a trade hands over.
    struct TradeBundle
    {
        std::vector<SpaceIdxT> properties;
        MoneyT                 cash{};
        std::uint8_t           jail_cards{};

        [[nodiscard]]
        auto Empty() const noexcept -> bool
        {
            return properties.empty() && cash == 0 && jail_cards == 0;
        }
    };

    struct ProposeTradeAction
    {
        PlyrIdxT    counterparty{};
        TradeBundle give;
        TradeBundle take;
    };

    struct RespondTradeAction
    {
        bool accept{false};
    };

    struct PayDebtAction           {};
    struct DeclareBankruptcyAction {};
    struct EndTurnAction           {};

    using PlayerAction = std::variant<
        RollAction, PayJailFineAction, UseJailCardAction,
        BuyAction, DeclineAction,
        MortgageAction, UnmortgageAction, BuildAction, SellBuildingAction,
        ProposeTradeAction, RespondTradeAction,
        PayDebtAction, DeclareBankruptcyAction, EndTurnAction>;

    struct ActionRequest
    {
        PlyrIdxT     actor{};
        PlayerAction action{RollAction{}};
    };

    enum class MoveOutcome : std::uint8_t
    {
        Invalid,
        Applied,
        TurnEnded,
        GameEnded
    };

    enum class Phase : std::uint8_t
    {
        AwaitingRoll = 0,
        AwaitingPurchaseDecision,
        AwaitingDebtSettlement,
        AwaitingTradeResponse,
        TurnOver,
        GameOver
    };
} // namespace tycoon::core

#endif //TYCOON_ACTIONS_HPP
