#ifndef TYCOON_RANDOMAI_HPP
#define TYCOON_RANDOMAI_HPP

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "Board.hpp"
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace tycoon::core
{
    // Picks among plausible actions for the current phase. Not every pick is legal;
    // the driver falls back to Judge::DefaultAction when the engine rejects one.
    class RandomAI final : public Player
    {
    public:
        explicit RandomAI(std::uint64_t rng_seed);

        auto Play(std::shared_ptr<GameSnapshot const> snapshot, PlyrIdxT seat) -> PlayerAction override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>{0, v.size() - 1}(rng_);
        }

        auto chance(double p) -> bool { return std::bernoulli_distribution{p}(rng_); }

        auto RollMove(GameSnapshot const& s, PlyrIdxT seat) -> PlayerAction;
        auto PurchaseMove(GameSnapshot const& s, PlyrIdxT seat) -> PlayerAction;
        auto DebtMove(GameSnapshot const& s, PlyrIdxT seat) -> PlayerAction;
        auto TurnOverMove(GameSnapshot const& s, PlyrIdxT seat) -> PlayerAction;

        // Free-action candidates for a seat at the end of its turn
        auto BuildTargets(GameSnapshot const& s, PlyrIdxT seat) const -> std::vector<SpaceIdxT>;
        auto UnmortgageTargets(GameSnapshot const& s, PlyrIdxT seat) const -> std::vector<SpaceIdxT>;
        auto TradeOffer(GameSnapshot const& s, PlyrIdxT seat) -> std::optional<ProposeTradeAction>;

    private:
        std::mt19937 rng_;
        Board const& board_;
    };
}

#endif //TYCOON_RANDOMAI_HPP
