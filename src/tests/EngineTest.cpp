#include <gtest/gtest.h>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../core/Engine.hpp"
#include "../core/Judge.hpp"
#include "../debug/ScriptedDice.hpp"

using namespace tycoon::core;
using RVC = error::ViolationCode;

namespace
{
    auto QuietConfig() -> Config
    {
        return Config{.shuffle_decks = false, .seed = 7};
    }

    // Engine with one Alice/Bob session on scripted dice.
    struct ScriptedSession
    {
        Engine engine{QuietConfig()};
        debug::ScriptedDice* dice{nullptr};
        std::string id;

        ScriptedSession()
        {
            auto d = std::make_unique<debug::ScriptedDice>();
            dice = d.get();
            auto const r = engine.CreateSession({"Alice", "Bob"}, QuietConfig(), std::move(d));
            EXPECT_TRUE(r.has_value());
            id = r.value_or("");
        }
    };
}

TEST(Registry, IdsAreSequentialAndListedInOrder)
{
    Engine e{QuietConfig()};
    EXPECT_EQ(e.CreateSession({"Alice", "Bob"}).value_or(""), "game_1");
    EXPECT_EQ(e.CreateSession({"Cara", "Dan", "Eve"}).value_or(""), "game_2");

    auto const list = e.ListSessions();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].id, "game_1");
    EXPECT_EQ(list[1].id, "game_2");
    EXPECT_EQ(list[1].players, (std::vector<std::string>{"Cara", "Dan", "Eve"}));
    EXPECT_EQ(list[1].current_player, "Cara");
    EXPECT_EQ(list[1].phase, Phase::AwaitingRoll);
    EXPECT_FALSE(list[1].game_over);
    EXPECT_FALSE(list[1].winner.has_value());
}

TEST(Registry, RejectsBadRosters)
{
    Engine e{QuietConfig()};
    auto expect_code = [&](std::vector<std::string> names, RVC const code)
    {
        auto const r = e.CreateSession(std::move(names));
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, code);
        EXPECT_EQ(r.error().kind(), error::ErrorKind::InvalidPlayerCount);
    };

    expect_code({"Solo"}, RVC::Player_CountOutOfRange);
    expect_code({"a", "b", "c", "d", "e", "f", "g", "h", "i"}, RVC::Player_CountOutOfRange);
    expect_code({"Alice", ""}, RVC::Player_EmptyName);
    expect_code({"Alice", "   "}, RVC::Player_EmptyName);
    expect_code({"Alice", "ALICE"}, RVC::Player_DuplicateName);

    EXPECT_EQ(e.Registry().Size(), 0u);
    EXPECT_EQ(e.CreateSession({"a", "b", "c", "d", "e", "f", "g", "h"}).value_or(""), "game_1");
}

TEST(Registry, UnknownSessionIsReported)
{
    Engine e{QuietConfig()};
    auto const state = e.GetState("game_404");
    ASSERT_FALSE(state.has_value());
    EXPECT_EQ(state.error().code, RVC::Session_NotFound);
    EXPECT_EQ(state.error().kind(), error::ErrorKind::SessionNotFound);
    EXPECT_EQ(state.error().subject, "game_404");

    EXPECT_EQ(e.Roll("game_404", "Alice").error().code, RVC::Session_NotFound);
    EXPECT_EQ(e.GetPlayerProperties("game_404", "Alice").error().code, RVC::Session_NotFound);
}

TEST(Registry, ConcurrentCreatesGetDistinctIds)
{
    Engine e{QuietConfig()};
    constexpr int Threads = 8;
    constexpr int PerThread = 25;

    std::mutex mtx;
    std::set<std::string> ids;
    std::vector<std::thread> pool;
    for (int t = 0; t < Threads; ++t)
    {
        pool.emplace_back([&]
        {
            for (int i = 0; i < PerThread; ++i)
            {
                auto const r = e.CreateSession({"Alice", "Bob"});
                ASSERT_TRUE(r.has_value());
                std::lock_guard lock{mtx};
                ids.insert(*r);
            }
        });
    }
    for (std::thread& th : pool) th.join();

    EXPECT_EQ(ids.size(), static_cast<std::size_t>(Threads * PerThread));
    EXPECT_EQ(e.Registry().Size(), ids.size());
    EXPECT_EQ(e.ListSessions().size(), ids.size());

    // each session's seed follows from its own id
    for (std::string const& id : ids)
    {
        auto const session = e.Registry().Find(id);
        ASSERT_TRUE(session.has_value());
        std::uint64_t const n = std::stoull(id.substr(std::string_view{"game_"}.size()));
        EXPECT_EQ((*session)->Read([](GameImpl const& g) { return g.GetConfig().seed; }), QuietConfig().seed + n)
            << id;
    }
}

TEST(Registry, ActionOnABusySessionIsRefused)
{
    ScriptedSession s;
    auto const session = s.engine.Registry().Find(s.id);
    ASSERT_TRUE(session.has_value());

    std::promise<void> entered;
    std::future<void> entered_f = entered.get_future();
    std::promise<void> release;
    std::shared_future<void> release_f = release.get_future().share();

    std::thread holder([&]
    {
        auto const r = (*session)->TryMutate([&](GameImpl&) -> error::Result<int>
        {
            entered.set_value();
            release_f.wait();
            return 1;
        });
        EXPECT_TRUE(r.has_value());
    });

    entered_f.wait();
    auto const busy = s.engine.Roll(s.id, "Alice");
    release.set_value();
    holder.join();

    ASSERT_FALSE(busy.has_value());
    EXPECT_EQ(busy.error().code, RVC::Session_Busy);
    EXPECT_EQ(busy.error().kind(), error::ErrorKind::SessionBusy);
    EXPECT_EQ(s.dice->Remaining(), 0u);
}

TEST(Registry, SessionsPlayInParallel)
{
    Engine e{};
    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) ids.push_back(e.CreateSession({"Alice", "Bob", "Cara"}).value_or(""));

    std::vector<std::thread> pool;
    for (std::string const& id : ids)
    {
        pool.emplace_back([&e, id]
        {
            for (int i = 0; i < 300; ++i)
            {
                auto const snap = e.GetState(id);
                ASSERT_TRUE(snap.has_value());
                if ((*snap)->game_over) break;
                ActionRequest const req{.actor = (*snap)->expected_actor, .action = Judge::DefaultAction(**snap)};
                auto const r = e.Submit(id, req);
                ASSERT_TRUE(r.has_value()) << error::describe(r.error());
            }
        });
    }
    for (std::thread& th : pool) th.join();
}

TEST(Engine, NamedActionsResolvePlayersAndProperties)
{
    ScriptedSession s;
    s.dice->Push(1, 2);

    EXPECT_EQ(s.engine.Roll(s.id, "Zed").error().code, RVC::Player_NotFound);
    auto const rolled = s.engine.Roll(s.id, "alice");
    ASSERT_TRUE(rolled.has_value());
    EXPECT_EQ(rolled->landed_on, SpaceIdxT{3});

    auto const unknown = s.engine.Buy(s.id, "Alice", "Narnia");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, RVC::Property_UnknownName);
    EXPECT_EQ(unknown.error().subject, "Narnia");

    ASSERT_TRUE(s.engine.Buy(s.id, "Alice", "baltic avenue").has_value());

    auto const props = s.engine.GetPlayerProperties(s.id, "Alice");
    ASSERT_TRUE(props.has_value());
    ASSERT_EQ(props->size(), 1u);
    EXPECT_EQ((*props)[0].name, "Baltic Avenue");
    EXPECT_EQ((*props)[0].current_rent, 4);
    EXPECT_EQ(s.engine.GetPlayerProperties(s.id, "Zed").error().code, RVC::Player_NotFound);

    auto const state = s.engine.GetState(s.id);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ((*state)->players[0].cash, 1440);
    EXPECT_EQ((*state)->phase, Phase::TurnOver);

    EXPECT_EQ(s.engine.Roll(s.id, "Bob").error().code, RVC::Flow_WrongActor);
    ASSERT_TRUE(s.engine.EndTurn(s.id, "Alice").has_value());
    EXPECT_EQ(s.engine.ListSessions()[0].current_player, "Bob");
}

TEST(Engine, DeclineRunsANamedAuction)
{
    ScriptedSession s;
    s.dice->Push(1, 2);
    ASSERT_TRUE(s.engine.Roll(s.id, "Alice").has_value());

    EXPECT_EQ(s.engine.Decline(s.id, "Alice", "Baltic Avenue", {{"Zed", 20}}).error().code,
              RVC::Auction_UnknownBidder);

    auto const r = s.engine.Decline(s.id, "Alice", "Baltic Avenue", {{"bob", 70}, {"Alice", 65}});
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->auction.has_value());
    EXPECT_EQ(r->auction->winner, PlyrIdxT{1});
    EXPECT_EQ(r->auction->price, 70);
}

TEST(Engine, NamedTradeRoundTrip)
{
    ScriptedSession s;
    s.dice->Push(1, 2);
    ASSERT_TRUE(s.engine.Roll(s.id, "Alice").has_value());
    ASSERT_TRUE(s.engine.Buy(s.id, "Alice", "Baltic Avenue").has_value());

    EXPECT_EQ(s.engine.ProposeTrade(s.id, "Alice", "Zed", {.cash = 10}, {}).error().code,
              RVC::Trade_UnknownCounterparty);
    EXPECT_EQ(s.engine.ProposeTrade(s.id, "Alice", "Bob", {.properties = {"Atlantis"}}, {}).error().code,
              RVC::Property_UnknownName);

    ASSERT_TRUE(s.engine.ProposeTrade(s.id, "Alice", "Bob", {.properties = {"Baltic Avenue"}}, {.cash = 90})
                    .has_value());
    ASSERT_TRUE(s.engine.RespondTrade(s.id, "Bob", true).has_value());

    auto const bob = s.engine.GetPlayerProperties(s.id, "Bob");
    ASSERT_TRUE(bob.has_value());
    ASSERT_EQ(bob->size(), 1u);
    EXPECT_EQ((*bob)[0].space, 3);
    EXPECT_EQ((*s.engine.GetState(s.id))->players[0].cash, 1440 + 90);
}

TEST(Engine, JailAndDebtCallsByName)
{
    ScriptedSession s;
    s.dice->Push(6, 4);
    ASSERT_TRUE(s.engine.Roll(s.id, "Alice").has_value());
    EXPECT_EQ(s.engine.PayJail(s.id, "Alice").error().code, RVC::Flow_WrongPhase);
    EXPECT_EQ(s.engine.UseJailCard(s.id, "Alice").error().code, RVC::Flow_WrongPhase);
    EXPECT_EQ(s.engine.PayDebt(s.id, "Alice").error().code, RVC::Flow_WrongPhase);
    EXPECT_EQ(s.engine.DeclareBankruptcy(s.id, "Alice").error().code, RVC::Flow_WrongPhase);
    EXPECT_EQ(s.engine.Mortgage(s.id, "Alice", "Boardwalk").error().code, RVC::Mortgage_NotOwner);
    EXPECT_EQ(s.engine.Unmortgage(s.id, "Alice", "Boardwalk").error().code, RVC::Mortgage_NotOwner);
    EXPECT_EQ(s.engine.Build(s.id, "Alice", "Boardwalk").error().code, RVC::Build_NotOwner);
    EXPECT_EQ(s.engine.SellBuilding(s.id, "Alice", "Boardwalk").error().code, RVC::Build_NotOwner);
}
