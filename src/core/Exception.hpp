#ifndef TYCOON_EXCEPTION_HPP
#define TYCOON_EXCEPTION_HPP

#include "EngineException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "Actions.hpp"
#include "Types.hpp"

namespace tycoon::core::error
{
    enum class Code : unsigned
    {
        Unknown,   // unknown error
        Rules,     // rules engine misuse (not a rejected player action)
        State,     // state engine misuse (not a rejected player action)
        Ledger,    // money/ownership bookkeeping broken
        Assertion  // internal assertion failed
    };

    struct UnknownError : public EngineException<Code>
    {
        using EngineException<Code>::EngineException;
    };

    struct RulesError : public EngineException<Code>
    {
        using EngineException<Code>::EngineException;
    };

    struct StateError : public EngineException<Code>
    {
        using EngineException<Code>::EngineException;
    };

    struct LedgerError : public EngineException<Code>
    {
        using EngineException<Code>::EngineException;
    };

    struct AssertionError : public EngineException<Code>
    {
        using EngineException<Code>::EngineException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Ledger: throw LedgerError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define TYC_THROW(code_enum, msg) ::tycoon::core::error::fail((code_enum), (msg))
#define TYC_ASSERT(cond, msg) do { if(!(cond)) ::tycoon::core::error::fail(::tycoon::core::error::Code::Assertion, (msg)); } while(0)

    // Coarse categories surfaced to callers.
    enum class ErrorKind : std::uint8_t
    {
        SessionNotFound,
        SessionBusy,
        PlayerNotFound,
        NotCurrentPlayer,
        InvalidPhase,
        InsufficientFunds,
        PropertyNotOwnable,
        PropertyAlreadyOwned,
        NotOwner,
        BuildingRuleViolation,
        InvalidTrade,
        InvalidBid,
        InvalidPlayerCount
    };

    // Fine-grained reasons; grouped by concern.
    enum class ViolationCode : std::uint16_t
    {
        // Registry / lookup
        Session_NotFound,
        Session_Busy,
        Player_NotFound,
        Player_CountOutOfRange,
        Player_EmptyName,
        Player_DuplicateName,
        Property_UnknownName,

        // Generic flow
        Flow_GameOver,
        Flow_WrongActor,
        Flow_WrongPhase,
        Flow_JailRestricted,
        Flow_ExtraRollPending,

        // Jail
        Jail_NotInJail,
        Jail_NoCard,
        Jail_CannotAffordFine,

        // Purchase / auction
        Purchase_NotOwnable,
        Purchase_AlreadyOwned,
        Purchase_NotOnProperty,
        Purchase_CannotAfford,
        Auction_UnknownBidder,
        Auction_BelowMinimum,
        Auction_ExceedsCash,
        Auction_DuplicateBidder,
        Auction_BidderBankrupt,

        // Mortgage
        Mortgage_NotOwner,
        Mortgage_AlreadyMortgaged,
        Mortgage_NotMortgaged,
        Mortgage_BuildingsInGroup,
        Mortgage_CannotAffordPayoff,

        // Building
        Build_NotAStreet,
        Build_NotOwner,
        Build_NoMonopoly,
        Build_GroupMortgaged,
        Build_AtMaximum,
        Build_Uneven,
        Build_HousePoolEmpty,
        Build_HotelPoolEmpty,
        Build_CannotAfford,
        Sell_NoBuildings,
        Sell_Uneven,
        Sell_HousePoolShort,

        // Trade
        Trade_WithSelf,
        Trade_UnknownCounterparty,
        Trade_CounterpartyBankrupt,
        Trade_Empty,
        Trade_NotOwnable,
        Trade_NotOwner,
        Trade_DuplicateProperty,
        Trade_BuildingsInGroup,
        Trade_NegativeCash,
        Trade_CashNotCovered,
        Trade_NotEnoughJailCards,

        // Debt
        Debt_NotCovered
    };

    [[nodiscard]]
    inline auto KindOf(ViolationCode c) noexcept -> ErrorKind
    {
        using E = ViolationCode;
        using K = ErrorKind;
        switch (c)
        {
        case E::Session_NotFound: return K::SessionNotFound;
        case E::Session_Busy: return K::SessionBusy;
        case E::Player_NotFound:
        case E::Auction_UnknownBidder:
        case E::Trade_UnknownCounterparty: return K::PlayerNotFound;
        case E::Player_CountOutOfRange:
        case E::Player_EmptyName:
        case E::Player_DuplicateName: return K::InvalidPlayerCount;
        case E::Flow_WrongActor: return K::NotCurrentPlayer;
        case E::Flow_GameOver:
        case E::Flow_WrongPhase:
        case E::Flow_JailRestricted:
        case E::Flow_ExtraRollPending:
        case E::Jail_NotInJail:
        case E::Jail_NoCard:
        case E::Purchase_NotOnProperty: return K::InvalidPhase;
        case E::Jail_CannotAffordFine:
        case E::Purchase_CannotAfford:
        case E::Mortgage_CannotAffordPayoff:
        case E::Build_CannotAfford:
        case E::Debt_NotCovered: return K::InsufficientFunds;
        case E::Property_UnknownName:
        case E::Purchase_NotOwnable:
        case E::Build_NotAStreet: return K::PropertyNotOwnable;
        case E::Purchase_AlreadyOwned: return K::PropertyAlreadyOwned;
        case E::Mortgage_NotOwner:
        case E::Build_NotOwner:
        case E::Mortgage_AlreadyMortgaged:
        case E::Mortgage_NotMortgaged: return K::NotOwner;
        case E::Mortgage_BuildingsInGroup:
        case E::Build_NoMonopoly:
        case E::Build_GroupMortgaged:
        case E::Build_AtMaximum:
        case E::Build_Uneven:
        case E::Build_HousePoolEmpty:
        case E::Build_HotelPoolEmpty:
        case E::Sell_NoBuildings:
        case E::Sell_Uneven:
        case E::Sell_HousePoolShort: return K::BuildingRuleViolation;
        case E::Trade_WithSelf:
        case E::Trade_CounterpartyBankrupt:
        case E::Trade_Empty:
        case E::Trade_NotOwnable:
        case E::Trade_NotOwner:
        case E::Trade_DuplicateProperty:
        case E::Trade_BuildingsInGroup:
        case E::Trade_NegativeCash:
        case E::Trade_CashNotCovered:
        case E::Trade_NotEnoughJailCards: return K::InvalidTrade;
        case E::Auction_BelowMinimum:
        case E::Auction_ExceedsCash:
        case E::Auction_DuplicateBidder:
        case E::Auction_BidderBankrupt: return K::InvalidBid;
        }
        return K::InvalidPhase;
    }

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        ViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlyrIdxT> actor{};
        std::optional<PlyrIdxT> expected_actor{};
        std::optional<SpaceIdxT> space{};
        std::optional<MoneyT> amount{};
        std::optional<MoneyT> available{};
        std::optional<std::string> subject{}; // session id / player or property name

        [[nodiscard]]
        auto kind() const noexcept -> ErrorKind { return KindOf(code); }

        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_expected(PlyrIdxT s) -> RuleViolation&
        {
            expected_actor = s;
            return *this;
        }

        auto with_space(SpaceIdxT s) -> RuleViolation&
        {
            space = s;
            return *this;
        }

        auto with_amount(MoneyT v) -> RuleViolation&
        {
            amount = v;
            return *this;
        }

        auto with_available(MoneyT v) -> RuleViolation&
        {
            available = v;
            return *this;
        }

        auto with_subject(std::string s) -> RuleViolation&
        {
            subject = std::move(s);
            return *this;
        }
    };

    [[nodiscard]]
    inline auto Viol(ViolationCode code) -> RuleViolation
    {
        return RuleViolation{ .code = code };
    }

    inline auto to_string(ErrorKind k) -> std::string_view
    {
        using K = ErrorKind;
        switch (k)
        {
        case K::SessionNotFound: return "SessionNotFound";
        case K::SessionBusy: return "SessionBusy";
        case K::PlayerNotFound: return "PlayerNotFound";
        case K::NotCurrentPlayer: return "NotCurrentPlayer";
        case K::InvalidPhase: return "InvalidPhase";
        case K::InsufficientFunds: return "InsufficientFunds";
        case K::PropertyNotOwnable: return "PropertyNotOwnable";
        case K::PropertyAlreadyOwned: return "PropertyAlreadyOwned";
        case K::NotOwner: return "NotOwner";
        case K::BuildingRuleViolation: return "BuildingRuleViolation";
        case K::InvalidTrade: return "InvalidTrade";
        case K::InvalidBid: return "InvalidBid";
        case K::InvalidPlayerCount: return "InvalidPlayerCount";
        }
        return "Unknown";
    }

    inline auto to_string(ViolationCode c) -> std::string_view
    {
        using E = ViolationCode;
        switch (c)
        {
        case E::Session_NotFound: return "Session not found";
        case E::Session_Busy: return "Session busy (another action in flight)";
        case E::Player_NotFound: return "Player not found";
        case E::Player_CountOutOfRange: return "Player count must be 2-8";
        case E::Player_EmptyName: return "Player name is empty";
        case E::Player_DuplicateName: return "Player names must be unique";
        case E::Property_UnknownName: return "No such property";

        case E::Flow_GameOver: return "Game is over";
        case E::Flow_WrongActor: return "Not your turn";
        case E::Flow_WrongPhase: return "Action not legal in this phase";
        case E::Flow_JailRestricted: return "In jail: only roll, pay fine or use card";
        case E::Flow_ExtraRollPending: return "Doubles: extra roll pending";

        case E::Jail_NotInJail: return "Jail: player is not in jail";
        case E::Jail_NoCard: return "Jail: no Get Out of Jail Free card";
        case E::Jail_CannotAffordFine: return "Jail: cannot afford fine";

        case E::Purchase_NotOwnable: return "Purchase: space cannot be owned";
        case E::Purchase_AlreadyOwned: return "Purchase: property already owned";
        case E::Purchase_NotOnProperty: return "Purchase: not the pending property";
        case E::Purchase_CannotAfford: return "Purchase: cannot afford price";
        case E::Auction_UnknownBidder: return "Auction: unknown bidder";
        case E::Auction_BelowMinimum: return "Auction: bid below minimum";
        case E::Auction_ExceedsCash: return "Auction: bid exceeds bidder cash";
        case E::Auction_DuplicateBidder: return "Auction: bidder already bid";
        case E::Auction_BidderBankrupt: return "Auction: bidder is bankrupt";

        case E::Mortgage_NotOwner: return "Mortgage: not the owner";
        case E::Mortgage_AlreadyMortgaged: return "Mortgage: already mortgaged";
        case E::Mortgage_NotMortgaged: return "Mortgage: not mortgaged";
        case E::Mortgage_BuildingsInGroup: return "Mortgage: sell buildings in group first";
        case E::Mortgage_CannotAffordPayoff: return "Mortgage: cannot afford payoff";

        case E::Build_NotAStreet: return "Build: not a street";
        case E::Build_NotOwner: return "Build: not the owner";
        case E::Build_NoMonopoly: return "Build: color group not fully owned";
        case E::Build_GroupMortgaged: return "Build: group has a mortgaged property";
        case E::Build_AtMaximum: return "Build: hotel already built";
        case E::Build_Uneven: return "Build: would break even-building rule";
        case E::Build_HousePoolEmpty: return "Build: no houses left in bank";
        case E::Build_HotelPoolEmpty: return "Build: no hotels left in bank";
        case E::Build_CannotAfford: return "Build: cannot afford";
        case E::Sell_NoBuildings: return "Sell: no buildings";
        case E::Sell_Uneven: return "Sell: would break even-building rule";
        case E::Sell_HousePoolShort: return "Sell: not enough houses to break hotel";

        case E::Trade_WithSelf: return "Trade: cannot trade with yourself";
        case E::Trade_UnknownCounterparty: return "Trade: unknown counterparty";
        case E::Trade_CounterpartyBankrupt: return "Trade: counterparty is bankrupt";
        case E::Trade_Empty: return "Trade: nothing offered or requested";
        case E::Trade_NotOwnable: return "Trade: space cannot be owned";
        case E::Trade_NotOwner: return "Trade: property not held by giver";
        case E::Trade_DuplicateProperty: return "Trade: property listed twice";
        case E::Trade_BuildingsInGroup: return "Trade: group carries buildings";
        case E::Trade_NegativeCash: return "Trade: negative cash";
        case E::Trade_CashNotCovered: return "Trade: giver lacks cash";
        case E::Trade_NotEnoughJailCards: return "Trade: giver lacks jail cards";

        case E::Debt_NotCovered: return "Debt: cash does not cover debt";
        }
        return "Unknown";
    }

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::AwaitingRoll: return "AwaitingRoll";
        case Phase::AwaitingPurchaseDecision: return "AwaitingPurchaseDecision";
        case Phase::AwaitingDebtSettlement: return "AwaitingDebtSettlement";
        case Phase::AwaitingTradeResponse: return "AwaitingTradeResponse";
        case Phase::TurnOver: return "TurnOver";
        case Phase::GameOver: return "GameOver";
        }
        return "?";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // compact, reproducible message for logs/tests
        auto s = std::format("{}: {}", to_string(v.kind()), to_string(v.code));
        if (v.subject) s += std::format(" | '{}'", *v.subject);
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.expected_actor) s += std::format(" | expected=P{}", static_cast<int>(*v.expected_actor));
        if (v.space) s += std::format(" | space={}", static_cast<int>(*v.space));
        if (v.amount) s += std::format(" | amount={}", *v.amount);
        if (v.available) s += std::format(" | available={}", *v.available);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;

    template <typename T>
    using Result = std::expected<T, RuleViolation>;
}

#endif //TYCOON_EXCEPTION_HPP
