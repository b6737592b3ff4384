#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <format>
#include <memory>
#include <string>
#include <vector>

#include "../core/ClassicRules.hpp"
#include "../core/Game.hpp"
#include "../core/Judge.hpp"
#include "../core/RandomAi.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingPlayer.hpp"

using namespace tycoon::core;

namespace
{
    constexpr std::uint64_t ActionCap = 20000;

    auto MakePlayers(std::uint64_t const seed, std::size_t const n) -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> ps;
        for (std::size_t i = 0; i < n; ++i)
        {
            ps.emplace_back(std::make_unique<RandomAI>(seed + 1 + i));
        }
        return debug::WrapRecording(ps);
    }

    auto MakeNames(std::size_t const n) -> std::vector<std::string>
    {
        std::vector<std::string> names;
        for (std::size_t i = 0; i < n; ++i) names.push_back(std::format("P{}", i));
        return names;
    }

    // Plays one seeded game to the end (or the cap) and returns the action count.
    auto PlayLogged(std::uint64_t const seed, std::size_t const n, std::filesystem::path const& path) -> std::uint64_t
    {
        GameImpl game(Config{.seed = seed}, std::make_unique<ClassicRules>(), MakeNames(n));
        auto players = MakePlayers(seed, n);

        debug::AuditLogger log(path.string());
        log.start(game, seed);

        Judge const judge;
        std::uint64_t actions{};
        while (!game.IsOver() && actions < ActionCap)
        {
            auto const before = game.Snapshot();
            Decision const d = judge.Step(game, players);
            ++actions;

            // the seat's own choice stands unless the engine refused it
            auto const* rec = debug::AsRecording(players[d.actor].get());
            EXPECT_TRUE(rec != nullptr && rec->HasLast());
            EXPECT_EQ(d.rejected.has_value(), d.result == DecisionResult::Defaulted);
            if (rec && rec->HasLast() && !d.rejected) EXPECT_EQ(rec->Last().index(), d.action.index());

            log.action(*before, game.BoardRef(), d.actor, d.action);
            if (d.rejected) log.rejected(*d.rejected);
            log.report(d.report);
            debug::CheckInvariants(game);
        }
        log.end(game);
        log.flush();

        // every Judge step asked exactly one seat
        std::size_t asked{};
        for (auto const& p : players)
        {
            if (auto const* rec = debug::AsRecording(p.get())) asked += rec->History().size();
        }
        EXPECT_EQ(asked, actions);
        return actions;
    }
}

TEST(SelfPlay, TranscriptsAndEnd)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");

    for (std::size_t const n : {2u, 4u, 6u})
    {
        for (std::uint64_t const seed : {111ull, 222ull, 333ull})
        {
            auto const path = fs::path(std::format("_artifacts/selfplay_{}p_{}.log", n, seed));
            try
            {
                std::uint64_t const actions = PlayLogged(seed, n, path);
                EXPECT_GT(actions, 0u);
                EXPECT_LE(actions, ActionCap);
            }
            catch (EngineException<error::Code> const& e)
            {
                FAIL() << std::format("{}", e);
            }

            ASSERT_TRUE(fs::exists(path));
            EXPECT_GT(fs::file_size(path), 0u);
        }
    }
}

TEST(SelfPlay, SameSeedSameGame)
{
    auto play = [](std::uint64_t const seed)
    {
        GameImpl game(Config{.seed = seed}, std::make_unique<ClassicRules>(), MakeNames(3));
        auto players = MakePlayers(seed, 3);
        Judge const judge;
        for (int i = 0; i < 300 && !game.IsOver(); ++i) (void)judge.Step(game, players);
        return game.Snapshot();
    };

    auto const a = play(2024);
    auto const b = play(2024);
    ASSERT_EQ(a->players.size(), b->players.size());
    for (std::size_t i = 0; i < a->players.size(); ++i)
    {
        EXPECT_EQ(a->players[i].cash, b->players[i].cash);
        EXPECT_EQ(a->players[i].position, b->players[i].position);
        EXPECT_EQ(a->players[i].properties, b->players[i].properties);
    }
    EXPECT_EQ(a->current, b->current);
    EXPECT_EQ(a->phase, b->phase);
}

TEST(SelfPlay, DefaultActionFollowsThePhase)
{
    GameSnapshot s{};
    s.players.resize(2);

    s.phase = Phase::AwaitingRoll;
    EXPECT_TRUE(std::holds_alternative<RollAction>(Judge::DefaultAction(s)));

    s.phase = Phase::AwaitingPurchaseDecision;
    s.pending_purchase = 6;
    auto const decline = Judge::DefaultAction(s);
    ASSERT_TRUE(std::holds_alternative<DeclineAction>(decline));
    EXPECT_EQ(std::get<DeclineAction>(decline).property, 6);
    EXPECT_TRUE(std::get<DeclineAction>(decline).bids.empty());

    s.phase = Phase::AwaitingDebtSettlement;
    s.debts = {PendingDebt{.debtor = 1, .creditor = 0, .amount = 200}};
    s.players[1].cash = 250;
    EXPECT_TRUE(std::holds_alternative<PayDebtAction>(Judge::DefaultAction(s)));
    s.players[1].cash = 150;
    EXPECT_TRUE(std::holds_alternative<DeclareBankruptcyAction>(Judge::DefaultAction(s)));

    s.phase = Phase::AwaitingTradeResponse;
    auto const respond = Judge::DefaultAction(s);
    ASSERT_TRUE(std::holds_alternative<RespondTradeAction>(respond));
    EXPECT_FALSE(std::get<RespondTradeAction>(respond).accept);

    s.phase = Phase::TurnOver;
    EXPECT_TRUE(std::holds_alternative<EndTurnAction>(Judge::DefaultAction(s)));

    s.phase = Phase::GameOver;
    EXPECT_THROW((void)Judge::DefaultAction(s), EngineException<error::Code>);
}
