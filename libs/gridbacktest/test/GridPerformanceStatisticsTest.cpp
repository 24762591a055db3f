#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "TestUtils.h"
#include "GridPerformanceStatistics.h"

using namespace mkc_gridbacktest;
using Catch::Approx;

typedef GridPerformanceStatistics<DecimalType> Stats;

TEST_CASE("GridPerformanceStatistics: running peak", "[GridPerformanceStatistics]")
{
  std::vector<DecimalType> equity {0.0, 5.0, 3.0, 8.0, 8.0, -2.0, 9.0};
  std::vector<DecimalType> expected {0.0, 5.0, 5.0, 8.0, 8.0, 8.0, 9.0};

  REQUIRE (Stats::computeRunningPeak (equity) == expected);
  REQUIRE (Stats::computeRunningPeak (std::vector<DecimalType>()).empty());
}

TEST_CASE("GridPerformanceStatistics: max drawdown", "[GridPerformanceStatistics]")
{
  SECTION ("peak to trough declines")
    {
      std::vector<DecimalType> equity {0.0, 100.0, 50.0, 120.0, 60.0, 90.0};
      REQUIRE (Stats::computeMaxDrawdown (equity) == Approx (-0.5));
    }

  SECTION ("deepest decline wins")
    {
      std::vector<DecimalType> equity {0.0, 100.0, 90.0, 200.0, 50.0, 300.0};
      REQUIRE (Stats::computeMaxDrawdown (equity) == Approx (-0.75));
    }

  SECTION ("non-decreasing trajectory has no drawdown")
    {
      std::vector<DecimalType> equity {0.0, 0.0, 1.0, 1.0, 4.0, 9.5};
      REQUIRE (Stats::computeMaxDrawdown (equity) == 0.0);
    }

  SECTION ("all zero trajectory")
    {
      std::vector<DecimalType> equity (25, 0.0);
      REQUIRE (Stats::computeMaxDrawdown (equity) == 0.0);
    }

  SECTION ("equity below zero while the peak is still zero is skipped")
    {
      std::vector<DecimalType> equity {0.0, -10.0, -20.0, -5.0};
      REQUIRE (Stats::computeMaxDrawdown (equity) == 0.0);
    }

  SECTION ("equity falling below zero after a positive peak")
    {
      std::vector<DecimalType> equity {0.0, -10.0, 5.0, -5.0};
      REQUIRE (Stats::computeMaxDrawdown (equity) == Approx (-2.0));
    }

  SECTION ("empty and single element")
    {
      REQUIRE (Stats::computeMaxDrawdown (std::vector<DecimalType>()) == 0.0);
      REQUIRE (Stats::computeMaxDrawdown (std::vector<DecimalType>{42.0}) == 0.0);
    }
}

TEST_CASE("GridPerformanceStatistics: win rate", "[GridPerformanceStatistics]")
{
  SECTION ("strict increases only")
    {
      std::vector<DecimalType> equity {0.0, 1.0, 1.0, 2.0, 1.0};
      REQUIRE (Stats::computeWinRate (equity) == Approx (0.5));
    }

  SECTION ("monotonically increasing")
    {
      std::vector<DecimalType> equity {1.0, 2.0, 3.0, 4.0};
      REQUIRE (Stats::computeWinRate (equity) == 1.0);
    }

  SECTION ("flat trajectory")
    {
      std::vector<DecimalType> equity (10, 0.0);
      REQUIRE (Stats::computeWinRate (equity) == 0.0);
    }

  SECTION ("fewer than two values")
    {
      REQUIRE (Stats::computeWinRate (std::vector<DecimalType>()) == 0.0);
      REQUIRE (Stats::computeWinRate (std::vector<DecimalType>{5.0}) == 0.0);
    }
}

TEST_CASE("GridPerformanceStatistics: cumulative return", "[GridPerformanceStatistics]")
{
  REQUIRE (Stats::computeCumulativeReturn (1100.0, 1000.0) == Approx (0.1));
  REQUIRE (Stats::computeCumulativeReturn (15.45, 1000.0) == Approx (-0.98455));
  REQUIRE (Stats::computeCumulativeReturn (-500.0, 2000.0) == Approx (-1.25));

  // nothing invested: exactly zero whatever the final equity
  REQUIRE (Stats::computeCumulativeReturn (0.0, 0.0) == 0.0);
  REQUIRE (Stats::computeCumulativeReturn (123.0, 0.0) == 0.0);
}

TEST_CASE("GridPerformanceStatistics: daily change", "[GridPerformanceStatistics]")
{
  REQUIRE (Stats::computeDailyChange (100.0, 99.0) == (99.0 - 100.0) / 100.0);
  REQUIRE (Stats::computeDailyChange (99.0, 100.5) == Approx (0.0151515));
  REQUIRE (Stats::computeDailyChange (50.0, 50.0) == 0.0);
}
