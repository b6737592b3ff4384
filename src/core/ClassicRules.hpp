#ifndef TYCOON_CLASSICRULES_HPP
#define TYCOON_CLASSICRULES_HPP
#include "Rules.hpp"

namespace tycoon::core
{
    class ClassicRules final : public Rules
    {
    public:
        auto Validate(GameImpl const& game, ActionRequest const& req) const -> CheckResult override;
        auto Apply(GameImpl& game, ActionRequest const& req) -> void override;
        auto Advance(GameImpl& game) -> MoveOutcome override;

    private:
        static auto ValidateTrade(GameImpl const& game, PlyrIdxT proposer, ProposeTradeAction const& t) -> CheckResult;
        static auto ValidateBundle(GameImpl const& game, PlyrIdxT giver, TradeBundle const& b) -> CheckResult;
        static auto ValidateBids(GameImpl const& game, DeclineAction const& d) -> CheckResult;
    };
}

#endif //TYCOON_CLASSICRULES_HPP
