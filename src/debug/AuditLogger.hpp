#ifndef TYCOON_AUDITLOGGER_HPP
#define TYCOON_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace tycoon::core::debug
{
    // Plain-text transcript of one session: header, one block per action, footer.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, players, starting cash)
        auto start(GameImpl const& game, std::uint64_t seed) -> void;

        // The state the actor saw, and the action that was applied
        auto action(GameSnapshot const& before, Board const& board, PlyrIdxT actor, PlayerAction const& a) -> void;

        // Engine refused the player's own choice; the logged action is the default
        auto rejected(error::RuleViolation const& v) -> void;

        // After Submit: report events and outcome
        auto report(ActionReport const& r) -> void;

        // Footer with winner (or the turn cap) and final standings
        auto end(GameImpl const& game) -> void;

        auto flush() -> void;

        [[nodiscard]]
        auto good() const -> bool { return out_.good(); }

    private:
        std::ofstream out_;
    };

    auto DescribeAction(Board const& board, PlayerAction const& a) -> std::string;
    auto to_string(MoveOutcome m) -> std::string_view;
}

#endif //TYCOON_AUDITLOGGER_HPP
