#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include "../core/Board.hpp"
#include "../core/Cards.hpp"
#include "../core/Engine.hpp"

using namespace tycoon::core;

TEST(Board, ClassicLayout)
{
    Board const& b = Board::Classic();
    ASSERT_EQ(b.Spaces().size(), constants::BoardSize);
    EXPECT_EQ(b.Ownables().size(), 28u);

    std::vector<SpaceIdxT> const rails(b.Railroads().begin(), b.Railroads().end());
    EXPECT_EQ(rails, (std::vector<SpaceIdxT>{5, 15, 25, 35}));
    std::vector<SpaceIdxT> const utils(b.Utilities().begin(), b.Utilities().end());
    EXPECT_EQ(utils, (std::vector<SpaceIdxT>{12, 28}));

    EXPECT_EQ(b.At(0).Kind(), SpaceKind::Go);
    EXPECT_EQ(b.At(10).Kind(), SpaceKind::Jail);
    EXPECT_EQ(b.At(20).Kind(), SpaceKind::FreeParking);
    EXPECT_EQ(b.At(30).Kind(), SpaceKind::GoToJail);
    EXPECT_EQ(b.At(4).Kind(), SpaceKind::Tax);
    EXPECT_EQ(b.At(38).Kind(), SpaceKind::Tax);
    for (SpaceIdxT const s : {7, 22, 36}) EXPECT_EQ(b.At(s).Kind(), SpaceKind::Chance);
    for (SpaceIdxT const s : {2, 17, 33}) EXPECT_EQ(b.At(s).Kind(), SpaceKind::CommunityChest);
}

TEST(Board, StreetTerms)
{
    Board const& b = Board::Classic();
    Space const& boardwalk = b.At(39);
    EXPECT_EQ(boardwalk.name, "Boardwalk");
    EXPECT_EQ(boardwalk.Price(), 400);
    EXPECT_EQ(boardwalk.MortgageValue(), 200);
    EXPECT_EQ(boardwalk.Group(), ColorGroup::DarkBlue);
    ASSERT_NE(boardwalk.Street(), nullptr);
    EXPECT_EQ(boardwalk.Street()->house_cost, 200);
    EXPECT_EQ(boardwalk.Street()->rent[0], 50);
    EXPECT_EQ(boardwalk.Street()->rent[5], 2000);

    EXPECT_EQ(b.At(5).Street(), nullptr);
    EXPECT_EQ(b.At(12).Price(), 150);
    EXPECT_FALSE(b.At(7).IsOwnable());
}

TEST(Board, GroupsHaveTwoOrThreeMembers)
{
    Board const& b = Board::Classic();
    std::size_t total{};
    for (auto g = static_cast<int>(ColorGroup::Brown); g <= static_cast<int>(ColorGroup::DarkBlue); ++g)
    {
        auto const members = b.GroupMembers(static_cast<ColorGroup>(g));
        bool const edge = g == static_cast<int>(ColorGroup::Brown) || g == static_cast<int>(ColorGroup::DarkBlue);
        EXPECT_EQ(members.size(), edge ? 2u : 3u) << to_string(static_cast<ColorGroup>(g));
        total += members.size();
    }
    EXPECT_EQ(total, 22u);
}

TEST(Board, NameLookupIgnoresCase)
{
    Board const& b = Board::Classic();
    EXPECT_EQ(b.FindByName("Boardwalk"), SpaceIdxT{39});
    EXPECT_EQ(b.FindByName("bOaRdWaLk"), SpaceIdxT{39});
    EXPECT_EQ(b.FindByName("reading railroad"), SpaceIdxT{5});
    EXPECT_FALSE(b.FindByName("Chance").has_value());
    EXPECT_FALSE(b.FindByName("Narnia").has_value());
}

TEST(Board, OffBoardIndexIsADefect)
{
    Board const& b = Board::Classic();
    try
    {
        (void)b.At(40);
        FAIL() << "index 40 resolved";
    }
    catch (EngineException<error::Code> const& e)
    {
        EXPECT_EQ(e.code(), error::Code::State);
        EXPECT_EQ(e.what(), "Space index 40 off the board");
    }
}

TEST(Board, NextOfKindWraps)
{
    Board const& b = Board::Classic();
    EXPECT_EQ(b.NextOfKind(7, SpaceKind::Railroad), 15);
    EXPECT_EQ(b.NextOfKind(36, SpaceKind::Railroad), 5);
    EXPECT_EQ(b.NextOfKind(22, SpaceKind::Utility), 28);
    EXPECT_EQ(b.NextOfKind(36, SpaceKind::Utility), 12);
}

TEST(Board, CatalogRows)
{
    std::vector<SpaceInfo> const cat = Engine::BoardCatalog();
    ASSERT_EQ(cat.size(), constants::BoardSize);
    for (std::size_t i{}; i < cat.size(); ++i) EXPECT_EQ(cat[i].index, i);

    EXPECT_EQ(cat[4].kind, SpaceKind::Tax);
    EXPECT_EQ(cat[4].tax, 200);
    EXPECT_EQ(cat[38].tax, 100);
    EXPECT_EQ(cat[1].name, "Mediterranean Avenue");
    EXPECT_EQ(cat[1].house_cost, 50);
    EXPECT_EQ(cat[1].rent[4], 160);
    EXPECT_EQ(cat[25].mortgage_value, 100);
}

TEST(Cards, EachDeckHoldsSixteenWithOneJailCard)
{
    for (DeckKind const k : {DeckKind::Chance, DeckKind::CommunityChest})
    {
        auto const cards = CardCatalog(k);
        ASSERT_EQ(cards.size(), constants::DeckSize);
        auto const jail = std::ranges::count_if(cards, [](CardDef const& c)
        {
            return std::holds_alternative<card::GetOutOfJailFree>(c.effect);
        });
        EXPECT_EQ(jail, 1) << to_string(k);
    }
}
