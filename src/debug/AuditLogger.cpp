#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <type_traits>
#include <vector>

using namespace tycoon::core;

namespace
{

auto s_space(Board const& board, SpaceIdxT const s) -> std::string_view
{
    return s < constants::BoardSize ? board.At(s).name : std::string_view{"?"};
}

auto s_bundle(Board const& board, TradeBundle const& b) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < b.properties.size(); ++i)
    {
        body += (i ? "," : "");
        body += s_space(board, b.properties[i]);
    }
    return std::format("[{}] ${} cards={}", body, b.cash, static_cast<int>(b.jail_cards));
}

} // anonymous namespace

namespace tycoon::core::debug
{

auto DescribeAction(Board const& board, PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollAction>) return "Roll";
            else if constexpr (std::is_same_v<T, PayJailFineAction>) return "PayJailFine";
            else if constexpr (std::is_same_v<T, UseJailCardAction>) return "UseJailCard";
            else if constexpr (std::is_same_v<T, BuyAction>)
                return std::format("Buy({})", s_space(board, act.property));
            else if constexpr (std::is_same_v<T, DeclineAction>)
            {
                std::string bids;
                for (std::size_t i{}; i < act.bids.size(); ++i)
                {
                    bids += std::format("{}P{}:${}", i ? "," : "", static_cast<int>(act.bids[i].bidder),
                                        act.bids[i].amount);
                }
                return std::format("Decline({}) bids=[{}]", s_space(board, act.property), bids);
            }
            else if constexpr (std::is_same_v<T, MortgageAction>)
                return std::format("Mortgage({})", s_space(board, act.property));
            else if constexpr (std::is_same_v<T, UnmortgageAction>)
                return std::format("Unmortgage({})", s_space(board, act.property));
            else if constexpr (std::is_same_v<T, BuildAction>)
                return std::format("Build({})", s_space(board, act.property));
            else if constexpr (std::is_same_v<T, SellBuildingAction>)
                return std::format("SellBuilding({})", s_space(board, act.property));
            else if constexpr (std::is_same_v<T, ProposeTradeAction>)
                return std::format("ProposeTrade(P{} give={} take={})", static_cast<int>(act.counterparty),
                                   s_bundle(board, act.give), s_bundle(board, act.take));
            else if constexpr (std::is_same_v<T, RespondTradeAction>)
                return act.accept ? "AcceptTrade" : "RejectTrade";
            else if constexpr (std::is_same_v<T, PayDebtAction>) return "PayDebt";
            else if constexpr (std::is_same_v<T, DeclareBankruptcyAction>) return "DeclareBankruptcy";
            else return "EndTurn";
        },
        a
    );
}

auto to_string(MoveOutcome const m) -> std::string_view
{
    switch (m)
    {
    case MoveOutcome::Invalid: return "Invalid";
    case MoveOutcome::Applied: return "Applied";
    case MoveOutcome::TurnEnded: return "TurnEnded";
    case MoveOutcome::GameEnded: return "GameEnded";
    }
    return "?";
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game, std::uint64_t const seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={}\n", game.PlayerCount());
    for (PlyrIdxT i{}; i < game.PlayerCount(); ++i)
    {
        out_ << std::format("  P{} {} ${}\n", static_cast<int>(i), game.PlayerName(i), game.LedgerRef().Cash(i));
    }
    out_.flush();
}

auto AuditLogger::action(GameSnapshot const& before, Board const& board, PlyrIdxT const actor,
                         PlayerAction const& a) -> void
{
    PlayerView const& pv = before.players.at(actor);
    out_ << std::format(
        "Action actor=P{} phase={} pos={} cash={}{}: {}\n",
        static_cast<int>(actor),
        error::to_string(before.phase),
        static_cast<int>(pv.position),
        pv.cash,
        pv.in_jail ? " jailed" : "",
        DescribeAction(board, a)
    );
}

auto AuditLogger::rejected(error::RuleViolation const& v) -> void
{
    out_ << std::format("  Rejected: {}\n", error::describe(v));
}

auto AuditLogger::report(ActionReport const& r) -> void
{
    if (r.dice)
    {
        out_ << std::format("  Dice: {}+{}{}\n", static_cast<int>(r.dice->d1), static_cast<int>(r.dice->d2),
                            r.doubles ? " (doubles)" : "");
    }
    for (std::string const& e : r.events)
    {
        out_ << std::format("  | {}\n", e);
    }
    out_ << std::format("  Outcome: {} next={}\n", to_string(r.outcome), error::to_string(r.phase_after));
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    if (auto const w = game.Winner())
    {
        out_ << std::format("Winner=P{} {}\n", static_cast<int>(*w), game.PlayerName(*w));
    }
    else
    {
        out_ << "Winner=none (turn cap)\n";
    }
    for (PlyrIdxT i{}; i < game.PlayerCount(); ++i)
    {
        out_ << std::format("  P{} {} cash={} worth={}{}\n", static_cast<int>(i), game.PlayerName(i),
                            game.LedgerRef().Cash(i), game.LedgerRef().NetWorth(i),
                            game.PlayerAt(i).bankrupt ? " bankrupt" : "");
    }
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace tycoon::core::debug
