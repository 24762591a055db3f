#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TestUtils.h"
#include "PortfolioState.h"

using namespace mkc_gridbacktest;
using Catch::Approx;

TEST_CASE("PortfolioState: starts flat", "[PortfolioState]")
{
  PortfolioState<DecimalType> portfolio;

  REQUIRE (portfolio.getCash() == 0.0);
  REQUIRE (portfolio.getShares() == 0.0);
  REQUIRE_FALSE (portfolio.hasShares());
  REQUIRE (portfolio.getEquity (123.45) == 0.0);
}

TEST_CASE("PortfolioState: buys deploy capital without a funding check", "[PortfolioState]")
{
  PortfolioState<DecimalType> portfolio;

  portfolio.buy (100.0, 1000.0);
  portfolio.buy (50.0, 1000.0);
  portfolio.buy (25.0, 1000.0);

  REQUIRE (portfolio.getCash() == -3000.0);
  REQUIRE (portfolio.getShares() == Approx (10.0 + 20.0 + 40.0));
  REQUIRE (portfolio.getMarketValue (25.0) == Approx (1750.0));
  REQUIRE (portfolio.getEquity (25.0) == Approx (-1250.0));
}

TEST_CASE("PortfolioState: sell of part of the holding", "[PortfolioState]")
{
  PortfolioState<DecimalType> portfolio;
  portfolio.buy (100.0, 1000.0);

  DecimalType sold = portfolio.sell (125.0, 1000.0);

  REQUIRE (sold == 1000.0);
  REQUIRE (portfolio.getShares() == Approx (2.0));
  REQUIRE (portfolio.getCash() == Approx (0.0).margin (1e-12));
  REQUIRE (portfolio.hasShares());
}

TEST_CASE("PortfolioState: sell is capped at the holding value", "[PortfolioState]")
{
  PortfolioState<DecimalType> portfolio;
  portfolio.buy (100.0, 1000.0);

  DecimalType sold = portfolio.sell (80.0, 1000.0);

  REQUIRE (sold == Approx (800.0));
  REQUIRE (portfolio.getShares() == 0.0);
  REQUIRE_FALSE (portfolio.hasShares());
  REQUIRE (portfolio.getCash() == Approx (-200.0));

  SECTION ("selling again with nothing held credits nothing")
    {
      REQUIRE (portfolio.sell (90.0, 1000.0) == 0.0);
      REQUIRE (portfolio.getShares() == 0.0);
      REQUIRE (portfolio.getCash() == Approx (-200.0));
    }
}

TEST_CASE("PortfolioState: shares never become negative over many partial sells", "[PortfolioState]")
{
  PortfolioState<DecimalType> portfolio;
  portfolio.buy (3.0, 1000.0);
  portfolio.buy (7.0, 1000.0);

  DecimalType price = 3.3;
  for (int i = 0; i < 50; ++i)
    {
      portfolio.sell (price, 137.0);
      REQUIRE (portfolio.getShares() >= 0.0);
      price *= 1.013;
    }

  REQUIRE (portfolio.getShares() == 0.0);
}

TEST_CASE("PortfolioState: full liquidation keeps the rounding residue", "[PortfolioState]")
{
  PortfolioState<DecimalType> portfolio;
  portfolio.buy (97.0, 1000.0);
  portfolio.sell (98.5, 1000.0);

  DecimalType shares = 1000.0 / 97.0;
  shares -= 1000.0 / 98.5;
  REQUIRE (portfolio.getShares() == shares);

  DecimalType holdingValue = shares * 103.0;
  DecimalType sold = portfolio.sell (103.0, 1000.0);
  shares -= holdingValue / 103.0;

  REQUIRE (sold == holdingValue);
  REQUIRE (portfolio.getShares() == shares);
  REQUIRE (portfolio.getShares() > 0.0);
  REQUIRE (portfolio.hasShares());
}
