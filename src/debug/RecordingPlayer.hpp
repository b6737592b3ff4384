#ifndef TYCOON_RECORDINGPLAYER_HPP
#define TYCOON_RECORDINGPLAYER_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/Player.hpp"

namespace tycoon::core::debug
{
    // Wraps a player and remembers every action it chose.
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Play(std::shared_ptr<GameSnapshot const> s, PlyrIdxT const seat) -> PlayerAction override
        {
            history_.push_back(inner_->Play(std::move(s), seat));
            return history_.back();
        }

        auto HasLast() const -> bool
        {
            return !history_.empty();
        }

        auto Last() const -> PlayerAction const&
        {
            return history_.back();
        }

        auto History() const -> std::vector<PlayerAction> const&
        {
            return history_;
        }

    private:
        std::unique_ptr<Player> inner_;
        std::vector<PlayerAction> history_;
    };

    inline auto WrapRecording(std::vector<std::unique_ptr<Player>>& players)
        -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> out;
        out.reserve(players.size());

        for (auto& p : players)
        {
            out.emplace_back(std::make_unique<RecordingPlayer>(std::move(p)));
        }

        return out;
    }

    // Only valid for players built through WrapRecording
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
}

#endif //TYCOON_RECORDINGPLAYER_HPP
