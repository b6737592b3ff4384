#include <gtest/gtest.h>

#include "TestTable.hpp"

using namespace tycoon::test;

TEST(Landing, RentGoesToOwner)
{
    Table t = MakeTable();
    Insp::SetOwner(*t.game, 39, Bob);
    Insp::SetPosition(*t.game, Alice, 35);

    auto const r = t.Roll(Alice, 1, 3);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(t.Cash(Alice), 1450);
    EXPECT_EQ(t.Cash(Bob), 1550);
    EXPECT_EQ(r->cash_delta, -50);
    EXPECT_EQ(r->position_delta, 4);
    EXPECT_EQ(r->phase_after, Phase::TurnOver);
}

TEST(Landing, MortgagedAndOwnPropertiesChargeNothing)
{
    Table t = MakeTable();
    Insp::SetOwner(*t.game, 39, Bob);
    Insp::SetMortgaged(*t.game, 39, true);
    Insp::SetPosition(*t.game, Alice, 35);
    ASSERT_TRUE(t.Roll(Alice, 1, 3).has_value());
    EXPECT_EQ(t.Cash(Alice), 1500);
    ASSERT_TRUE(t.Do(Alice, EndTurnAction{}).has_value());

    Insp::SetOwner(*t.game, 3, Bob);
    ASSERT_TRUE(t.Roll(Bob, 1, 2).has_value());
    EXPECT_EQ(t.Cash(Bob), 1500);
    EXPECT_EQ(t.game->PhaseNow(), Phase::TurnOver);
}

TEST(Landing, UtilityRentScalesWithRoll)
{
    Table t = MakeTable();
    Insp::SetOwner(*t.game, 12, Bob);
    Insp::SetPosition(*t.game, Alice, 8);
    ASSERT_TRUE(t.Roll(Alice, 1, 3).has_value());
    EXPECT_EQ(t.Cash(Alice), 1500 - 16);
}

TEST(Landing, MonopolyDoublesBareRent)
{
    Table t = MakeTable();
    Insp::GiveGroup(*t.game, ColorGroup::DarkBlue, Bob);
    Insp::SetPosition(*t.game, Alice, 35);
    ASSERT_TRUE(t.Roll(Alice, 1, 3).has_value());
    EXPECT_EQ(t.Cash(Bob), 1600);
}

TEST(Cards, GoBackThreeLandsOnIncomeTax)
{
    Table t = MakeTable();
    Insp::StackCard(*t.game, DeckKind::Chance, "Go Back 3");
    ASSERT_TRUE(t.Roll(Alice, 3, 4).has_value());
    EXPECT_EQ(t.Pos(Alice), 4);
    EXPECT_EQ(t.Cash(Alice), 1300);
}

TEST(Cards, GoToJailCard)
{
    Table t = MakeTable();
    Insp::StackCard(*t.game, DeckKind::Chance, "Go to Jail");
    auto const r = t.Roll(Alice, 3, 4);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(t.game->PlayerAt(Alice).in_jail);
    EXPECT_EQ(t.Pos(Alice), constants::JailPosition);
    EXPECT_EQ(t.Cash(Alice), 1500);
    EXPECT_EQ(r->phase_after, Phase::TurnOver);
}

TEST(Cards, JailCardIsKeptOutOfTheDeck)
{
    Table t = MakeTable();
    Insp::StackCard(*t.game, DeckKind::Chance, "Get Out of Jail Free");
    ASSERT_TRUE(t.Roll(Alice, 3, 4).has_value());
    ASSERT_EQ(t.game->PlayerAt(Alice).jail_cards.size(), 1u);
    EXPECT_EQ(t.game->PlayerAt(Alice).jail_cards[0], DeckKind::Chance);
    EXPECT_EQ(Insp::DeckOrder(*t.game, DeckKind::Chance).size(), constants::DeckSize - 1);
    EXPECT_EQ(t.game->Snapshot()->players[Alice].jail_cards, 1);
}

TEST(Cards, DrawnCardGoesUnderneath)
{
    Table t = MakeTable();
    Insp::StackCard(*t.game, DeckKind::Chance, "Bank pays you dividend");
    ASSERT_TRUE(t.Roll(Alice, 3, 4).has_value());
    EXPECT_EQ(t.Cash(Alice), 1550);
    auto const& order = Insp::DeckOrder(*t.game, DeckKind::Chance);
    ASSERT_EQ(order.size(), constants::DeckSize);
    EXPECT_EQ(order.back(), Insp::CardId(DeckKind::Chance, "Bank pays you dividend"));
}

TEST(Cards, ChairmanPaysEachPlayer)
{
    Table t = MakeTable();
    Insp::StackCard(*t.game, DeckKind::Chance, "You have been elected Chairman");
    ASSERT_TRUE(t.Roll(Alice, 3, 4).has_value());
    EXPECT_EQ(t.Cash(Alice), 1400);
    EXPECT_EQ(t.Cash(Bob), 1550);
    EXPECT_EQ(t.Cash(Cara), 1550);
}

TEST(Cards, BirthdayCollectsFromEveryone)
{
    Table t = MakeTable();
    Insp::SetPosition(*t.game, Alice, 10);
    Insp::StackCard(*t.game, DeckKind::CommunityChest, "It is your birthday");
    auto const r = t.Roll(Alice, 3, 4);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(t.Pos(Alice), 17);
    EXPECT_EQ(t.Cash(Alice), 1520);
    EXPECT_EQ(t.Cash(Bob), 1490);
    EXPECT_EQ(t.Cash(Cara), 1490);
    ASSERT_EQ(r->cards.size(), 1u);
    EXPECT_EQ(r->cards[0].deck, DeckKind::CommunityChest);
}

TEST(Cards, RepairsChargePerBuilding)
{
    Table t = MakeTable();
    Insp::GiveGroup(*t.game, ColorGroup::DarkBlue, Alice);
    Insp::SetBuildings(*t.game, 37, 1);
    Insp::SetBuildings(*t.game, 39, 1);
    Insp::SetPosition(*t.game, Alice, 33);
    Insp::StackCard(*t.game, DeckKind::Chance, "Make general repairs");
    ASSERT_TRUE(t.Roll(Alice, 1, 2).has_value());
    EXPECT_EQ(t.Pos(Alice), 36);
    EXPECT_EQ(t.Cash(Alice), 1450);
}

TEST(Cards, AdvancePastGoCollectsSalary)
{
    Table t = MakeTable();
    Insp::SetPosition(*t.game, Alice, 33);
    Insp::StackCard(*t.game, DeckKind::Chance, "Advance to Illinois");
    auto const r = t.Roll(Alice, 1, 2);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(t.Pos(Alice), 24);
    EXPECT_EQ(t.Cash(Alice), 1700);
    EXPECT_EQ(r->phase_after, Phase::AwaitingPurchaseDecision);
}

TEST(Cards, AdvanceWithoutPassingGo)
{
    Table t = MakeTable();
    Insp::StackCard(*t.game, DeckKind::Chance, "Advance to Boardwalk");
    ASSERT_TRUE(t.Roll(Alice, 3, 4).has_value());
    EXPECT_EQ(t.Pos(Alice), 39);
    EXPECT_EQ(t.Cash(Alice), 1500);
}

TEST(Cards, NearestRailroadChargesDouble)
{
    Table t = MakeTable();
    Insp::SetOwner(*t.game, 15, Bob);
    Insp::StackCard(*t.game, DeckKind::Chance, "Advance to the nearest Railroad");
    ASSERT_TRUE(t.Roll(Alice, 3, 4).has_value());
    EXPECT_EQ(t.Pos(Alice), 15);
    EXPECT_EQ(t.Cash(Alice), 1450);
    EXPECT_EQ(t.Cash(Bob), 1550);
}

TEST(Cards, NearestUnownedRailroadCanBeBought)
{
    Table t = MakeTable();
    Insp::StackCard(*t.game, DeckKind::Chance, "Advance to the nearest Railroad");
    auto const r = t.Roll(Alice, 3, 4);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->phase_after, Phase::AwaitingPurchaseDecision);
    ASSERT_TRUE(t.Do(Alice, BuyAction{.property = 15}).has_value());
    EXPECT_EQ(t.Owner(15), Alice);
}

TEST(Cards, NearestUtilityChargesTenTimesFreshThrow)
{
    Table t = MakeTable();
    Insp::SetOwner(*t.game, 12, Bob);
    Insp::StackCard(*t.game, DeckKind::Chance, "Advance to the nearest Utility");
    t.dice->Push(3, 4).Push(2, 3);
    ASSERT_TRUE(t.Do(Alice, RollAction{}).has_value());
    EXPECT_EQ(t.Pos(Alice), 12);
    EXPECT_EQ(t.Cash(Alice), 1450);
    EXPECT_EQ(t.Cash(Bob), 1550);
    EXPECT_EQ(t.dice->Remaining(), 0u);
}
