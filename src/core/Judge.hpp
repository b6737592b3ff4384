#ifndef TYCOON_JUDGE_HPP
#define TYCOON_JUDGE_HPP

#include <memory>
#include <optional>
#include <span>

#include "Actions.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace tycoon::core
{
    class GameImpl;
    class Player;

    enum class DecisionResult : std::uint8_t
    {
        OK,
        Defaulted // player's choice was rejected; the default action was applied instead
    };

    struct Decision
    {
        PlyrIdxT actor{};
        PlayerAction action{};
        DecisionResult result{};
        std::optional<error::RuleViolation> rejected{};
        ActionReport report{};
    };

    // Drives one action of a game from a table of seated players.
    class Judge
    {
    public:
        Judge() = default;

        auto Step(GameImpl& game, std::span<std::unique_ptr<Player> const> players) const -> Decision;

        // An action the engine always accepts from the expected actor in the snapshot's phase.
        static auto DefaultAction(GameSnapshot const& s) -> PlayerAction;
    };
}
#endif //TYCOON_JUDGE_HPP
