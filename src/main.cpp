//
// main.cpp: RandomAI seats play seeded games and leave audit transcripts
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <memory>
#include <print>
#include <string>
#include <vector>

#include "core/ClassicRules.hpp"
#include "core/Exception.hpp"
#include "core/Game.hpp"
#include "core/Judge.hpp"
#include "core/RandomAi.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"

namespace
{
    struct SelfPlayConfig
    {
        std::uint32_t games{1};
        std::uint32_t n_players{4};
        std::uint64_t seed{123456789ULL};
        std::uint64_t max_actions{20000};
        std::string   out_dir{"_artifacts"};
        bool          check_invariants{true};
    };

    auto ParseArgs(int argc, char** argv) -> SelfPlayConfig
    {
        SelfPlayConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            std::uint64_t v{};
            if (arg == "--games")
            {
                if (next_uint(v)) { cfg.games = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--players")
            {
                if (next_uint(v)) { cfg.n_players = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--max-actions")
            {
                if (next_uint(v)) { cfg.max_actions = v; }
            }
            else if (arg == "--out" && i + 1 < argc)
            {
                cfg.out_dir = argv[++i];
            }
            else if (arg == "--no-invariants")
            {
                cfg.check_invariants = false;
            }
            else
            {
                std::print("[tycoon] ignoring unknown argument '{}'\n", arg);
            }
        }
        return cfg;
    }

    auto PlayOne(SelfPlayConfig const& sc, std::uint64_t const seed) -> void
    {
        using namespace tycoon::core;

        std::vector<std::string> names;
        std::vector<std::unique_ptr<Player>> players;
        for (std::uint32_t i = 0; i < sc.n_players; ++i)
        {
            names.push_back(std::format("P{}", i));
            players.emplace_back(std::make_unique<RandomAI>(seed + static_cast<std::uint64_t>(i * 1337u)));
        }

        Config const cfg{.seed = seed};
        GameImpl game(cfg, std::make_unique<ClassicRules>(), std::move(names));

        std::string const path = std::format("{}/game_{}.log", sc.out_dir, seed);
        debug::AuditLogger log(path);
        log.start(game, seed);

        Judge const judge;
        std::uint64_t actions{};
        while (!game.IsOver() && actions++ < sc.max_actions)
        {
            auto const before = game.Snapshot();
            Decision const d = judge.Step(game, players);
            log.action(*before, game.BoardRef(), d.actor, d.action);
            if (d.rejected)
            {
                log.rejected(*d.rejected);
            }
            log.report(d.report);
            if (sc.check_invariants) debug::CheckInvariants(game);
        }
        log.end(game);

        if (auto const w = game.Winner())
            std::print("[tycoon] seed {}: {} wins after {} actions -> {}\n", seed, game.PlayerName(*w), actions, path);
        else
            std::print("[tycoon] seed {}: stopped at the action cap -> {}\n", seed, path);
    }
}

int main(int argc, char** argv)
{
    SelfPlayConfig const sc = ParseArgs(argc, argv);

    if (sc.n_players < tycoon::core::constants::MinPlayers || sc.n_players > tycoon::core::constants::MaxPlayers)
    {
        std::print("[tycoon] --players must be between {} and {}\n",
                   tycoon::core::constants::MinPlayers, tycoon::core::constants::MaxPlayers);
        return 2;
    }

    std::filesystem::create_directories(sc.out_dir);
    std::print("[tycoon] {} game(s), {} player(s), base seed {}\n", sc.games, sc.n_players, sc.seed);

    try
    {
        for (std::uint32_t g = 0; g < sc.games; ++g)
        {
            PlayOne(sc, sc.seed + g);
        }
    }
    catch (tycoon::core::EngineException<tycoon::core::error::Code> const& e)
    {
        std::print("{}", e);
        return 1;
    }
    return 0;
}
