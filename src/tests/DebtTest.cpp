#include <gtest/gtest.h>

#include "TestTable.hpp"

using namespace tycoon::test;

namespace
{
    // Bob holds the green set with a house on each; Pennsylvania Avenue then rents for $150.
    auto GreenWithHouses(Table& t) -> void
    {
        Insp::GiveGroup(*t.game, ColorGroup::Green, Bob);
        for (SpaceIdxT const s : {31, 32, 34}) Insp::SetBuildings(*t.game, s, 1);
    }
}

TEST(Bankruptcy, ShortRentBankruptsToTheCreditor)
{
    Table t = MakeTable();
    GreenWithHouses(t);
    Insp::SetOwner(*t.game, 1, Alice);
    Insp::SetCash(*t.game, Alice, 40);
    Insp::SetPosition(*t.game, Alice, 29);

    auto const r = t.Roll(Alice, 2, 3);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(t.game->PlayerAt(Alice).bankrupt);
    ASSERT_EQ(r->bankruptcies.size(), 1u);
    EXPECT_EQ(r->bankruptcies[0].player, Alice);
    EXPECT_EQ(r->bankruptcies[0].creditor, Bob);

    EXPECT_EQ(t.Cash(Alice), 0);
    EXPECT_EQ(t.Cash(Bob), 1540);
    EXPECT_EQ(t.game->LedgerRef().PropertiesOf(Bob), (std::vector<SpaceIdxT>{1, 31, 32, 34}));
    EXPECT_TRUE(t.game->LedgerRef().PropertiesOf(Alice).empty());

    EXPECT_EQ(r->outcome, MoveOutcome::TurnEnded);
    EXPECT_FALSE(t.game->IsOver());
    EXPECT_EQ(t.game->Current(), Bob);
    EXPECT_VIOLATION(t.Do(Alice, RollAction{}), RVC::Flow_WrongActor);

    // Alice never comes round again
    ASSERT_TRUE(t.Roll(Bob, 1, 2).has_value());
    ASSERT_TRUE(t.Do(Bob, DeclineAction{.property = 3}).has_value());
    ASSERT_TRUE(t.Do(Bob, EndTurnAction{}).has_value());
    EXPECT_EQ(t.game->Current(), Cara);
    ASSERT_TRUE(t.Roll(Cara, 2, 4).has_value());
    ASSERT_TRUE(t.Do(Cara, DeclineAction{.property = 6}).has_value());
    ASSERT_TRUE(t.Do(Cara, EndTurnAction{}).has_value());
    EXPECT_EQ(t.game->Current(), Bob);
}

TEST(Bankruptcy, LastPlayerStandingWins)
{
    Table t = MakeTable({"Alice", "Bob"});
    GreenWithHouses(t);
    Insp::SetCash(*t.game, Alice, 40);
    Insp::SetPosition(*t.game, Alice, 29);

    auto const r = t.Roll(Alice, 2, 3);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, MoveOutcome::GameEnded);
    EXPECT_TRUE(r->game_over);
    EXPECT_EQ(r->winner, Bob);
    EXPECT_TRUE(t.game->IsOver());
    EXPECT_EQ(t.game->Winner(), Bob);
    EXPECT_EQ(t.game->PhaseNow(), Phase::GameOver);

    EXPECT_VIOLATION(t.Do(Bob, RollAction{}), RVC::Flow_GameOver);
    EXPECT_VIOLATION(t.Do(Bob, EndTurnAction{}), RVC::Flow_GameOver);
}

namespace
{
    // Alice holds the brown set with a hotel on each; Cara's buildings take the rest of the houses
    // except `spare`, and Kentucky Avenue carries one house per street below four.
    auto BrownHotelsAgainst(Table& t, bool const spare) -> void
    {
        Insp::GiveGroup(*t.game, ColorGroup::Brown, Alice);
        for (SpaceIdxT const s : {1, 3}) Insp::SetBuildings(*t.game, s, constants::HotelLevel);

        Insp::GiveGroup(*t.game, ColorGroup::Green, Cara);
        Insp::GiveGroup(*t.game, ColorGroup::Yellow, Cara);
        Insp::GiveGroup(*t.game, ColorGroup::Red, Cara);
        for (SpaceIdxT const s : {31, 32, 34}) Insp::SetBuildings(*t.game, s, 4);
        for (SpaceIdxT const s : {26, 27, 29}) Insp::SetBuildings(*t.game, s, spare ? 3 : 4);
        if (spare)
        {
            for (SpaceIdxT const s : {21, 23, 24}) Insp::SetBuildings(*t.game, s, 1);
        }
        else
        {
            for (SpaceIdxT const s : {21, 23}) Insp::SetBuildings(*t.game, s, 3);
            Insp::SetBuildings(*t.game, 24, 2);
        }
        Insp::SetCash(*t.game, Alice, 40);
        Insp::SetPosition(*t.game, Alice, 18);
    }
}

TEST(Debt, HotelsThatCannotBeBrokenDoNotCountTowardTheDebt)
{
    Table t = MakeTable();
    BrownHotelsAgainst(t, false);
    ASSERT_EQ(t.game->LedgerRef().HousePool(), 0);
    EXPECT_EQ(t.game->LedgerRef().LiquidationValue(Alice), 0);

    // Kentucky Avenue with three houses: $700
    auto const r = t.Roll(Alice, 1, 2);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(t.game->PlayerAt(Alice).bankrupt);
    ASSERT_EQ(r->bankruptcies.size(), 1u);
    EXPECT_EQ(r->bankruptcies[0].creditor, Cara);
    EXPECT_TRUE(Insp::Debts(*t.game).empty());
    EXPECT_EQ(t.Owner(1), Cara);
    EXPECT_EQ(t.Owner(3), Cara);
    EXPECT_EQ(t.game->Current(), Bob);
}

TEST(Debt, HotelsBreakWhenTheBankHasHouses)
{
    Table t = MakeTable();
    BrownHotelsAgainst(t, true);
    ASSERT_EQ(t.game->LedgerRef().HousePool(), 8);
    // two hotels at $400 of buildings each plus two $30 mortgages
    EXPECT_EQ(t.game->LedgerRef().LiquidationValue(Alice), 860);

    // Kentucky Avenue with one house: $90
    ASSERT_TRUE(t.Roll(Alice, 1, 2).has_value());
    EXPECT_FALSE(t.game->PlayerAt(Alice).bankrupt);
    EXPECT_EQ(t.game->PhaseNow(), Phase::AwaitingDebtSettlement);

    ASSERT_TRUE(t.Do(Alice, SellBuildingAction{.property = 1}).has_value());
    EXPECT_EQ(t.Level(1), 4);
    EXPECT_EQ(t.game->LedgerRef().HousePool(), 4);
    ASSERT_TRUE(t.Do(Alice, PayDebtAction{}).has_value());
    EXPECT_EQ(t.Cash(Alice), 40 + 200 - 90);
    EXPECT_EQ(t.game->PhaseNow(), Phase::TurnOver);
}

TEST(Debt, ShortfallCoveredByAssetsWaitsForSettlement)
{
    Table t = MakeTable();
    Insp::SetOwner(*t.game, 39, Alice);
    Insp::SetCash(*t.game, Alice, 100);

    auto const r = t.Roll(Alice, 1, 3);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->phase_after, Phase::AwaitingDebtSettlement);
    auto const debts = Insp::Debts(*t.game);
    ASSERT_EQ(debts.size(), 1u);
    EXPECT_EQ(debts[0].debtor, Alice);
    EXPECT_FALSE(debts[0].creditor.has_value());
    EXPECT_EQ(debts[0].amount, 200);

    auto const short_pay = t.Do(Alice, PayDebtAction{});
    ASSERT_FALSE(short_pay.has_value());
    EXPECT_EQ(short_pay.error().code, RVC::Debt_NotCovered);
    EXPECT_EQ(short_pay.error().kind(), error::ErrorKind::InsufficientFunds);
    EXPECT_VIOLATION(t.Do(Alice, EndTurnAction{}), RVC::Flow_WrongPhase);
    EXPECT_VIOLATION(t.Do(Alice, BuildAction{.property = 39}), RVC::Flow_WrongPhase);

    ASSERT_TRUE(t.Do(Alice, MortgageAction{.property = 39}).has_value());
    EXPECT_EQ(t.Cash(Alice), 300);
    ASSERT_TRUE(t.Do(Alice, PayDebtAction{}).has_value());
    EXPECT_EQ(t.Cash(Alice), 100);
    EXPECT_TRUE(Insp::Debts(*t.game).empty());
    EXPECT_EQ(t.game->PhaseNow(), Phase::TurnOver);
}

TEST(Debt, DeclaringBankruptcyToTheBankReleasesDeeds)
{
    Table t = MakeTable();
    Insp::SetOwner(*t.game, 39, Alice);
    Insp::SetCash(*t.game, Alice, 100);
    EXPECT_VIOLATION(t.Do(Alice, DeclareBankruptcyAction{}), RVC::Flow_WrongPhase);

    ASSERT_TRUE(t.Roll(Alice, 1, 3).has_value());
    auto const r = t.Do(Alice, DeclareBankruptcyAction{});
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->bankruptcies.size(), 1u);
    EXPECT_FALSE(r->bankruptcies[0].creditor.has_value());
    EXPECT_TRUE(t.game->PlayerAt(Alice).bankrupt);
    EXPECT_FALSE(t.Owner(39).has_value());
    EXPECT_EQ(t.Cash(Alice), 0);
    EXPECT_EQ(r->outcome, MoveOutcome::TurnEnded);
    EXPECT_EQ(t.game->Current(), Bob);
}

TEST(Debt, AnotherPlayerSettlesBeforeTheTurnGoesOn)
{
    Table t = MakeTable();
    Insp::SetOwner(*t.game, 1, Bob);
    Insp::SetCash(*t.game, Bob, 5);
    Insp::SetPosition(*t.game, Alice, 10);
    Insp::StackCard(*t.game, DeckKind::CommunityChest, "It is your birthday");

    ASSERT_TRUE(t.Roll(Alice, 3, 4).has_value());
    EXPECT_EQ(t.game->PhaseNow(), Phase::AwaitingDebtSettlement);
    EXPECT_EQ(t.game->ExpectedActor(), Bob);
    EXPECT_EQ(t.Cash(Alice), 1510);
    EXPECT_VIOLATION(t.Do(Alice, EndTurnAction{}), RVC::Flow_WrongPhase);

    ASSERT_TRUE(t.Do(Bob, MortgageAction{.property = 1}).has_value());
    ASSERT_TRUE(t.Do(Bob, PayDebtAction{}).has_value());
    EXPECT_EQ(t.Cash(Bob), 25);
    EXPECT_EQ(t.Cash(Alice), 1520);
    EXPECT_EQ(t.game->PhaseNow(), Phase::TurnOver);
    EXPECT_EQ(t.game->Current(), Alice);
}

TEST(Debt, BankruptcyToTheBankReturnsJailCards)
{
    Table t = MakeTable();
    Insp::GiveJailCard(*t.game, Alice, DeckKind::Chance);
    Insp::SetCash(*t.game, Alice, 150);
    auto const r = t.Roll(Alice, 1, 3);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(t.game->PlayerAt(Alice).bankrupt);
    EXPECT_TRUE(t.game->PlayerAt(Alice).jail_cards.empty());
    EXPECT_EQ(Insp::DeckOrder(*t.game, DeckKind::Chance).size(), constants::DeckSize);
}
