#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "TradeAction.h"

using namespace mkc_gridbacktest;

TEST_CASE("TradeAction string conversion", "[TradeAction]")
{
  REQUIRE (tradeActionToString (TradeAction::NONE) == "NONE");
  REQUIRE (tradeActionToString (TradeAction::BUY) == "BUY");
  REQUIRE (tradeActionToString (TradeAction::SELL) == "SELL");

  REQUIRE (tradeActionFromString ("BUY") == TradeAction::BUY);
  REQUIRE (tradeActionFromString ("SELL") == TradeAction::SELL);
  REQUIRE (tradeActionFromString ("NONE") == TradeAction::NONE);

  REQUIRE_THROWS_AS (tradeActionFromString ("HOLD"), std::invalid_argument);
  REQUIRE_THROWS_AS (tradeActionFromString ("buy"), std::invalid_argument);
}
