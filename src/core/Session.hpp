#ifndef TYCOON_SESSION_HPP
#define TYCOON_SESSION_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <unordered_map>
#include <vector>

#include "Exception.hpp"
#include "Game.hpp"

namespace tycoon::core
{
    struct SessionSummary
    {
        std::string id;
        std::vector<std::string> players;
        std::string current_player;
        Phase phase{Phase::AwaitingRoll};
        bool game_over{false};
        std::optional<std::string> winner{};
    };

    // A game plus the lock that serialises its actions.
    class Session
    {
    public:
        Session(std::string id, std::unique_ptr<GameImpl> game);

        [[nodiscard]]
        auto Id() const noexcept -> std::string const& { return id_; }

        // Runs fn(GameImpl&) if no other action is in flight, otherwise SessionBusy.
        template <typename Fn>
        auto TryMutate(Fn&& fn) -> std::invoke_result_t<Fn, GameImpl&>
        {
            std::unique_lock lock{mtx_, std::try_to_lock};
            if (!lock.owns_lock())
                return std::unexpected(error::Viol(error::ViolationCode::Session_Busy).with_subject(id_));
            return std::forward<Fn>(fn)(*game_);
        }

        // Reads wait for an in-flight action to finish.
        template <typename Fn>
        auto Read(Fn&& fn) const -> std::invoke_result_t<Fn, GameImpl const&>
        {
            std::lock_guard lock{mtx_};
            return std::forward<Fn>(fn)(std::as_const(*game_));
        }

        auto Summary() const -> SessionSummary;

    private:
        std::string id_;
        mutable std::mutex mtx_;
        std::unique_ptr<GameImpl> game_;
    };

    // Process-wide map of session id -> session. Safe for concurrent create/find/list.
    class SessionRegistry
    {
    public:
        explicit SessionRegistry(Config defaults = {});

        // 2-8 non-empty, unique (case-insensitive) names. Returns the new id ("game_N").
        auto Create(std::vector<std::string> names) -> error::Result<std::string>;
        auto Create(std::vector<std::string> names, Config const& cfg,
                    std::unique_ptr<DiceSource> dice = nullptr) -> error::Result<std::string>;

        [[nodiscard]]
        auto Find(std::string_view id) const -> error::Result<std::shared_ptr<Session>>;
        [[nodiscard]]
        auto List() const -> std::vector<SessionSummary>;
        [[nodiscard]]
        auto Size() const -> std::size_t;

        static auto ValidateNames(std::vector<std::string> const& names) -> error::ValidateResult;

    private:
        // Reserves the next id; without an explicit config the seed is offset by that id.
        auto Admit(std::vector<std::string> names, Config const* cfg,
                   std::unique_ptr<DiceSource> dice) -> error::Result<std::string>;

        mutable std::mutex mtx_;
        std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
        std::vector<std::string> order_; // creation order for List
        std::uint64_t next_id_{1};
        Config defaults_;
    };
}

#endif //TYCOON_SESSION_HPP
