#ifndef TYCOON_SCRIPTEDDICE_HPP
#define TYCOON_SCRIPTEDDICE_HPP

#include <deque>
#include <initializer_list>
#include <utility>

#include "../core/Dice.hpp"
#include "../core/Exception.hpp"

namespace tycoon::core::debug
{
    // Replays queued rolls in order. Running dry is a test bug.
    class ScriptedDice final : public DiceSource
    {
    public:
        ScriptedDice() = default;
        ScriptedDice(std::initializer_list<std::pair<int, int>> rolls)
        {
            for (auto const& [a, b] : rolls) Push(a, b);
        }

        auto Push(int const d1, int const d2) -> ScriptedDice&
        {
            TYC_ASSERT(d1 >= 1 && d1 <= 6 && d2 >= 1 && d2 <= 6, "Die face out of range");
            rolls_.push_back(DiceRoll{static_cast<std::uint8_t>(d1), static_cast<std::uint8_t>(d2)});
            return *this;
        }

        auto Roll() -> DiceRoll override
        {
            TYC_ASSERT(!rolls_.empty(), "Scripted dice ran out of rolls");
            DiceRoll const r = rolls_.front();
            rolls_.pop_front();
            return r;
        }

        [[nodiscard]]
        auto Remaining() const noexcept -> std::size_t { return rolls_.size(); }

    private:
        std::deque<DiceRoll> rolls_;
    };
}

#endif //TYCOON_SCRIPTEDDICE_HPP
