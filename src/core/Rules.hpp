#ifndef TYCOON_RULES_HPP
#define TYCOON_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace tycoon::core
{
    //forward declaration
    class GameImpl;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameImpl const& game, ActionRequest const& req) const -> CheckResult = 0;

        // Mutate authoritative state. Only called after Validate succeeded.
        virtual auto Apply(GameImpl& game, ActionRequest const& req) -> void = 0;

        // Settle turn bookkeeping (rotation, game over) after Apply.
        virtual auto Advance(GameImpl& game) -> MoveOutcome = 0;
    };
}

#endif //TYCOON_RULES_HPP
