// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __GRID_STRATEGY_PARAMS_H
#define __GRID_STRATEGY_PARAMS_H 1

#include <cmath>
#include <sstream>
#include <string>
#include <type_traits>
#include "DecimalConstants.h"
#include "GridBacktestException.h"

namespace mkc_gridbacktest
{
  /**
   * @brief Validated parameter set of the asymmetric grid strategy.
   *
   * - buyDropPct: daily decline, in percent, that triggers a buy. Must lie in (0, 100].
   * - sellRisePct: daily rise, in percent, that triggers a sell. Must lie in (0, 100].
   * - tradeAmount: notional currency amount of every triggered trade. Must be
   *   strictly positive and finite.
   *
   * Percentages are given as percent values (1.5 means 1.5%). The trigger
   * fractions used by the engine are the percentages divided by one hundred.
   *
   * @tparam Decimal numeric type used by the engine (e.g. double)
   */
  template <class Decimal> class GridStrategyParams
  {
  public:
    /**
     * @throws InvalidInputException if any field lies outside its bounds.
     */
    GridStrategyParams (const Decimal& buyDropPct,
			const Decimal& sellRisePct,
			const Decimal& tradeAmount)
      : mBuyDropPct(buyDropPct),
	mSellRisePct(sellRisePct),
	mTradeAmount(tradeAmount),
	mBuyTriggerFraction(buyDropPct / DecimalConstants<Decimal>::DecimalOneHundred),
	mSellTriggerFraction(sellRisePct / DecimalConstants<Decimal>::DecimalOneHundred)
    {
      validatePercent ("buyDropPct", buyDropPct);
      validatePercent ("sellRisePct", sellRisePct);

      if (!(tradeAmount > DecimalConstants<Decimal>::DecimalZero) || !isFinite (tradeAmount))
	throw InvalidInputException ("GridStrategyParams: tradeAmount must be a finite value greater than zero, got "
				     + toString (tradeAmount));
    }

    GridStrategyParams (const GridStrategyParams<Decimal>& rhs) = default;
    GridStrategyParams<Decimal>& operator=(const GridStrategyParams<Decimal>& rhs) = default;

    ~GridStrategyParams()
    {}

    const Decimal& getBuyDropPercent() const
    {
      return mBuyDropPct;
    }

    const Decimal& getSellRisePercent() const
    {
      return mSellRisePct;
    }

    const Decimal& getTradeAmount() const
    {
      return mTradeAmount;
    }

    // buyDropPct / 100
    const Decimal& getBuyTriggerFraction() const
    {
      return mBuyTriggerFraction;
    }

    // sellRisePct / 100
    const Decimal& getSellTriggerFraction() const
    {
      return mSellTriggerFraction;
    }

  private:
    static bool isFinite (const Decimal& value)
    {
      if constexpr (std::is_floating_point_v<Decimal>)
	return std::isfinite (value);
      else
	return true;
    }

    static std::string toString (const Decimal& value)
    {
      std::ostringstream oss;
      oss << value;
      return oss.str();
    }

    static void validatePercent (const std::string& name, const Decimal& pct)
    {
      if (!(pct > DecimalConstants<Decimal>::DecimalZero) ||
	  !(pct <= DecimalConstants<Decimal>::DecimalOneHundred))
	throw InvalidInputException ("GridStrategyParams: " + name
				     + " must lie in (0, 100], got " + toString (pct));
    }

  private:
    Decimal mBuyDropPct;
    Decimal mSellRisePct;
    Decimal mTradeAmount;
    Decimal mBuyTriggerFraction;
    Decimal mSellTriggerFraction;
  };

  template <class Decimal>
  inline bool operator==(const GridStrategyParams<Decimal>& lhs, const GridStrategyParams<Decimal>& rhs)
  {
    return (lhs.getBuyDropPercent() == rhs.getBuyDropPercent()) &&
      (lhs.getSellRisePercent() == rhs.getSellRisePercent()) &&
      (lhs.getTradeAmount() == rhs.getTradeAmount());
  }

  template <class Decimal>
  inline bool operator!=(const GridStrategyParams<Decimal>& lhs, const GridStrategyParams<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
