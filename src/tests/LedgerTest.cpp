#include <gtest/gtest.h>
#include <format>
#include <string>

#include "../core/Board.hpp"
#include "../core/Ledger.hpp"

using namespace tycoon::core;
using RVC = error::ViolationCode;

namespace
{
    auto Fresh() -> Ledger
    {
        return Ledger(Board::Classic(), 3, 1500);
    }
}

TEST(Ledger, StreetRentDoublesWithMonopoly)
{
    Ledger l = Fresh();
    l.Assign(1, 0);
    EXPECT_EQ(l.RentFor(1, 7), 2);
    l.Assign(3, 0);
    EXPECT_EQ(l.RentFor(1, 7), 4);
    EXPECT_EQ(l.RentFor(3, 7), 8);

    // a mortgaged deed still counts toward the monopoly but earns nothing itself
    ASSERT_EQ(l.Mortgage(0, 3), 30);
    EXPECT_EQ(l.RentFor(3, 7), 0);
    EXPECT_EQ(l.RentFor(1, 7), 4);
}

TEST(Ledger, RailroadRentByCount)
{
    Ledger l = Fresh();
    l.Assign(5, 1);
    EXPECT_EQ(l.RentFor(5, 0), 25);
    l.Assign(15, 1);
    EXPECT_EQ(l.RentFor(5, 0), 50);
    l.Assign(25, 1);
    EXPECT_EQ(l.RentFor(5, 0), 100);
    l.Assign(35, 1);
    EXPECT_EQ(l.RentFor(35, 0), 200);
}

TEST(Ledger, UtilityRentUsesDice)
{
    Ledger l = Fresh();
    l.Assign(12, 2);
    EXPECT_EQ(l.RentFor(12, 7), 28);
    l.Assign(28, 2);
    EXPECT_EQ(l.RentFor(12, 7), 70);
    EXPECT_EQ(l.RentFor(28, 0), 0);
}

TEST(Ledger, BuildingFollowsEvenRule)
{
    Ledger l = Fresh();
    EXPECT_EQ(l.CheckBuild(0, 37).error().code, RVC::Build_NotOwner);
    l.Assign(37, 0);
    EXPECT_EQ(l.CheckBuild(0, 37).error().code, RVC::Build_NoMonopoly);
    l.Assign(39, 0);

    EXPECT_EQ(l.Build(0, 37), 200);
    EXPECT_EQ(l.Record(37).buildings, 1);
    EXPECT_EQ(l.RentFor(37, 0), 175);
    EXPECT_EQ(l.HousePool(), constants::TotalHouses - 1);
    EXPECT_EQ(l.CheckBuild(0, 37).error().code, RVC::Build_Uneven);
    EXPECT_EQ(l.CheckSell(0, 39).error().code, RVC::Sell_NoBuildings);

    ASSERT_TRUE(l.CheckBuild(0, 39).has_value());
    l.Build(0, 39);
    EXPECT_EQ(l.CheckMortgage(0, 37).error().code, RVC::Mortgage_BuildingsInGroup);
    EXPECT_EQ(l.Cash(0), 1100);
    l.CheckInvariants();
}

TEST(Ledger, HotelConversionAndSale)
{
    Ledger l = Fresh();
    l.Assign(37, 0);
    l.Assign(39, 0);
    l.Credit(0, 5000);
    for (int i = 0; i < 4; ++i)
    {
        l.Build(0, 37);
        l.Build(0, 39);
    }
    EXPECT_EQ(l.HousePool(), constants::TotalHouses - 8);

    EXPECT_EQ(l.BuildCost(37), 800);
    EXPECT_EQ(l.Build(0, 37), 800);
    EXPECT_EQ(l.Record(37).buildings, constants::HotelLevel);
    EXPECT_EQ(l.HousePool(), constants::TotalHouses - 4);
    EXPECT_EQ(l.HotelPool(), constants::TotalHotels - 1);
    EXPECT_EQ(l.RentFor(37, 0), 1500);
    EXPECT_EQ(l.HotelsOwnedBy(0), 1);
    EXPECT_EQ(l.HousesOwnedBy(0), 4);
    EXPECT_EQ(l.CheckBuild(0, 37).error().code, RVC::Build_AtMaximum);

    EXPECT_EQ(l.CheckSell(0, 39).error().code, RVC::Sell_Uneven);
    EXPECT_EQ(l.SellBuilding(0, 37), 800);
    EXPECT_EQ(l.Record(37).buildings, 4);
    EXPECT_EQ(l.HotelPool(), constants::TotalHotels);
    EXPECT_EQ(l.HousePool(), constants::TotalHouses - 8);
    l.CheckInvariants();
}

TEST(Ledger, MortgageRoundTripCostsTenPercent)
{
    Ledger l = Fresh();
    l.Assign(1, 0);
    EXPECT_EQ(l.CheckUnmortgage(0, 1).error().code, RVC::Mortgage_NotMortgaged);
    EXPECT_EQ(l.Mortgage(0, 1), 30);
    EXPECT_EQ(l.Cash(0), 1530);
    EXPECT_EQ(l.CheckMortgage(0, 1).error().code, RVC::Mortgage_AlreadyMortgaged);
    EXPECT_EQ(l.UnmortgageCost(1), 33);
    EXPECT_EQ(l.Unmortgage(0, 1), 33);
    EXPECT_EQ(l.Cash(0), 1497);
    EXPECT_FALSE(l.Record(1).mortgaged);

    EXPECT_EQ(l.CheckMortgage(1, 1).error().code, RVC::Mortgage_NotOwner);
}

TEST(Ledger, GroupWithMortgageBlocksBuilding)
{
    Ledger l = Fresh();
    l.Assign(1, 0);
    l.Assign(3, 0);
    l.Mortgage(0, 1);
    EXPECT_EQ(l.CheckBuild(0, 3).error().code, RVC::Build_GroupMortgaged);
}

TEST(Ledger, ValuationCountsBuildingsAndDeeds)
{
    Ledger l = Fresh();
    l.Assign(1, 0);
    l.Assign(3, 0);
    l.Build(0, 1);
    // 1450 cash + 120 deeds + 50 house
    EXPECT_EQ(l.NetWorth(0), 1620);
    // 50 house refund + two mortgages of 30
    EXPECT_EQ(l.LiquidationValue(0), 110);
}

TEST(Ledger, DebitPastZeroThrows)
{
    Ledger l = Fresh();
    EXPECT_THROW(l.Debit(2, 1501), EngineException<error::Code>);
    EXPECT_EQ(l.Cash(2), 1500);
}

TEST(Ledger, DefectReportNamesTheCodeAndMessage)
{
    Ledger l = Fresh();
    try
    {
        l.Debit(0, 2000);
        FAIL() << "overdraft was accepted";
    }
    catch (EngineException<error::Code> const& e)
    {
        EXPECT_EQ(e.code(), error::Code::Ledger);
        std::string const report = std::format("{}", e);
        EXPECT_TRUE(report.starts_with("Engine defect (3): Debit of 2000 exceeds P0 cash 1500\n")) << report;
        EXPECT_NE(report.find(e.to_str()), std::string::npos);
    }
}

TEST(Ledger, ReleaseReturnsBuildingsToBank)
{
    Ledger l = Fresh();
    l.Assign(1, 0);
    l.Assign(3, 0);
    l.Build(0, 1);
    l.Build(0, 3);
    l.SellBuilding(0, 1);
    l.SellBuilding(0, 3);
    l.Mortgage(0, 3);
    l.Release(3);
    EXPECT_FALSE(l.OwnerOf(3).has_value());
    EXPECT_FALSE(l.Record(3).mortgaged);
    EXPECT_EQ(l.HousePool(), constants::TotalHouses);
    l.CheckInvariants();
}
