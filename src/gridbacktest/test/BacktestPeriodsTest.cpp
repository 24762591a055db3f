#include <catch2/catch_test_macros.hpp>
#include "BacktestPeriods.h"

using namespace gridbacktest;
using boost::gregorian::date;

TEST_CASE("Bull market comparison has three periods", "[BacktestPeriods]")
{
    date today(2026, 10, 18);
    std::vector<BacktestPeriod> periods = createBacktestPeriods(RunMode::BullMarketComparison, today);

    REQUIRE(periods.size() == 3);

    REQUIRE(periods[0].getLabel() == "2016-2017 Blue Chip Bull");
    REQUIRE(periods[0].getDateRange().getFirstDate() == date(2016, 1, 1));
    REQUIRE(periods[0].getDateRange().getLastDate() == date(2017, 12, 31));

    REQUIRE(periods[1].getLabel() == "2019-2021 Growth Sector Bull");
    REQUIRE(periods[1].getDateRange().getFirstDate() == date(2019, 1, 1));
    REQUIRE(periods[1].getDateRange().getLastDate() == date(2021, 2, 10));

    REQUIRE(periods[2].getLabel() == "2024-Present Policy Bull");
    REQUIRE(periods[2].getDateRange().getFirstDate() == date(2024, 9, 24));
    REQUIRE(periods[2].getDateRange().getLastDate() == today);
}

TEST_CASE("Full history runs from 2015 to today", "[BacktestPeriods]")
{
    date today(2025, 3, 31);
    std::vector<BacktestPeriod> periods = createBacktestPeriods(RunMode::FullHistory, today);

    REQUIRE(periods.size() == 1);
    REQUIRE(periods[0].getLabel() == "2015-Present Full History");
    REQUIRE(periods[0].getDateRange().getFirstDate() == date(2015, 1, 1));
    REQUIRE(periods[0].getDateRange().getLastDate() == today);
}

TEST_CASE("Periods are clipped to today", "[BacktestPeriods]")
{
    SECTION("before the policy bull started")
    {
        std::vector<BacktestPeriod> periods =
            createBacktestPeriods(RunMode::BullMarketComparison, date(2024, 9, 23));
        REQUIRE(periods.size() == 2);
        REQUIRE(periods[1].getLabel() == "2019-2021 Growth Sector Bull");
    }

    SECTION("on the first day of the policy bull")
    {
        std::vector<BacktestPeriod> periods =
            createBacktestPeriods(RunMode::BullMarketComparison, date(2024, 9, 24));
        REQUIRE(periods.size() == 3);
        REQUIRE(periods[2].getDateRange().getFirstDate() == periods[2].getDateRange().getLastDate());
    }

    SECTION("inside a closed period")
    {
        std::vector<BacktestPeriod> periods =
            createBacktestPeriods(RunMode::BullMarketComparison, date(2017, 6, 30));
        REQUIRE(periods.size() == 1);
        REQUIRE(periods[0].getDateRange().getLastDate() == date(2017, 6, 30));
    }
}

TEST_CASE("Run mode names", "[BacktestPeriods]")
{
    REQUIRE(runModeFromString("bull") == RunMode::BullMarketComparison);
    REQUIRE(runModeFromString("FULL") == RunMode::FullHistory);
    REQUIRE(runModeToString(RunMode::FullHistory) == "full");
    REQUIRE_THROWS_AS(runModeFromString("bear"), std::invalid_argument);
    REQUIRE_THROWS_AS(createBacktestPeriods(RunMode::FullHistory, date(boost::gregorian::not_a_date_time)),
                      std::invalid_argument);
}
