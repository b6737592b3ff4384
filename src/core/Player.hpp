#ifndef TYCOON_PLAYER_HPP
#define TYCOON_PLAYER_HPP

#include <memory>

#include "Actions.hpp"
#include "State.hpp"

namespace tycoon::core
{
    // Decision maker for one seat. The engine never calls this; drivers such as Judge do.
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called whenever `seat` is the snapshot's expected actor.
        virtual auto Play(std::shared_ptr<GameSnapshot const> snapshot, PlyrIdxT seat) -> PlayerAction = 0;
    };
}
#endif //TYCOON_PLAYER_HPP
