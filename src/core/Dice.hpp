#ifndef TYCOON_DICE_HPP
#define TYCOON_DICE_HPP

#include <random>

#include "Types.hpp"

namespace tycoon::core
{
    class DiceSource
    {
    public:
        virtual ~DiceSource() = default;

        // Two independent values in [1, 6].
        virtual auto Roll() -> DiceRoll = 0;
    };

    class RandomDice final : public DiceSource
    {
    public:
        explicit RandomDice(std::uint64_t seed) :
            rng_(seed) {}

        auto Roll() -> DiceRoll override
        {
            return DiceRoll{static_cast<std::uint8_t>(die_(rng_)), static_cast<std::uint8_t>(die_(rng_))};
        }

    private:
        std::mt19937_64 rng_;
        std::uniform_int_distribution<int> die_{1, 6};
    };
}

#endif //TYCOON_DICE_HPP
