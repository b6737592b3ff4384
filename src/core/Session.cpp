#include "Session.hpp"

#include <algorithm>
#include <format>
#include <ranges>

#include "ClassicRules.hpp"
#include "Util.hpp"

namespace tycoon::core
{
    using error::ViolationCode;
    using error::Viol;

    Session::Session(std::string id, std::unique_ptr<GameImpl> game) :
        id_(std::move(id)),
        game_(std::move(game))
    {
        TYC_ASSERT(game_ != nullptr, "Session without a game");
    }

    auto Session::Summary() const -> SessionSummary
    {
        return Read([this](GameImpl const& g)
        {
            SessionSummary s{.id = id_};
            for (std::size_t i{}; i < g.PlayerCount(); ++i)
                s.players.push_back(g.PlayerName(static_cast<PlyrIdxT>(i)));
            s.current_player = g.PlayerName(g.Current());
            s.phase = g.PhaseNow();
            s.game_over = g.IsOver();
            if (auto const w = g.Winner()) s.winner = g.PlayerName(*w);
            return s;
        });
    }

    SessionRegistry::SessionRegistry(Config defaults) :
        defaults_(std::move(defaults))
    {
    }

    auto SessionRegistry::ValidateNames(std::vector<std::string> const& names) -> error::ValidateResult
    {
        if (names.size() < constants::MinPlayers || names.size() > constants::MaxPlayers)
            return std::unexpected(Viol(ViolationCode::Player_CountOutOfRange)
                                   .with_amount(static_cast<MoneyT>(names.size())));

        std::vector<std::string> seen;
        for (std::string const& n : names)
        {
            if (n.empty() || util::IsBlank(n))
                return std::unexpected(Viol(ViolationCode::Player_EmptyName));
            std::string key = util::Lowered(n);
            if (std::ranges::find(seen, key) != seen.end())
                return std::unexpected(Viol(ViolationCode::Player_DuplicateName).with_subject(n));
            seen.push_back(std::move(key));
        }
        return {};
    }

    auto SessionRegistry::Create(std::vector<std::string> names) -> error::Result<std::string>
    {
        return Admit(std::move(names), nullptr, nullptr);
    }

    auto SessionRegistry::Create(std::vector<std::string> names, Config const& cfg,
                                 std::unique_ptr<DiceSource> dice) -> error::Result<std::string>
    {
        return Admit(std::move(names), &cfg, std::move(dice));
    }

    auto SessionRegistry::Admit(std::vector<std::string> names, Config const* cfg,
                                std::unique_ptr<DiceSource> dice) -> error::Result<std::string>
    {
        if (auto const ok = ValidateNames(names); !ok)
            return std::unexpected(ok.error());

        std::uint64_t n{};
        {
            std::lock_guard lock{mtx_};
            n = next_id_++;
        }

        // distinct sessions get distinct dice/deck streams
        Config game_cfg = cfg ? *cfg : defaults_;
        if (!cfg) game_cfg.seed = defaults_.seed + n;

        // build outside the lock; the id was reserved above
        auto game = std::make_unique<GameImpl>(game_cfg, std::make_unique<ClassicRules>(), std::move(names),
                                               std::move(dice));

        std::string id = std::format("game_{}", n);
        std::lock_guard lock{mtx_};
        sessions_.emplace(id, std::make_shared<Session>(id, std::move(game)));
        order_.push_back(id);
        return id;
    }

    auto SessionRegistry::Find(std::string_view const id) const -> error::Result<std::shared_ptr<Session>>
    {
        std::lock_guard lock{mtx_};
        auto const it = sessions_.find(std::string{id});
        if (it == sessions_.end())
            return std::unexpected(Viol(ViolationCode::Session_NotFound).with_subject(std::string{id}));
        return it->second;
    }

    auto SessionRegistry::List() const -> std::vector<SessionSummary>
    {
        std::vector<std::shared_ptr<Session>> sessions;
        {
            std::lock_guard lock{mtx_};
            sessions.reserve(order_.size());
            for (std::string const& id : order_) sessions.push_back(sessions_.at(id));
        }
        std::vector<SessionSummary> out;
        out.reserve(sessions.size());
        for (auto const& s : sessions) out.push_back(s->Summary());
        return out;
    }

    auto SessionRegistry::Size() const -> std::size_t
    {
        std::lock_guard lock{mtx_};
        return sessions_.size();
    }
}
