// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __GRID_BACKTEST_ENGINE_H
#define __GRID_BACKTEST_ENGINE_H 1

#include <cmath>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BacktestResult.h"
#include "DecimalConstants.h"
#include "EquityTrajectory.h"
#include "GridBacktestException.h"
#include "GridPerformanceStatistics.h"
#include "GridStrategyParams.h"
#include "PortfolioState.h"
#include "PriceSeries.h"
#include "TradeAction.h"

namespace mkc_gridbacktest
{
  /**
   * @class GridBacktestRun
   * @brief Output of one engine invocation: the trajectory and its statistics.
   */
  template <class Decimal> class GridBacktestRun
  {
  public:
    GridBacktestRun (EquityTrajectory<Decimal>&& trajectory,
		     const BacktestResult<Decimal>& result)
      : mTrajectory(std::move (trajectory)),
	mResult(result)
    {}

    const EquityTrajectory<Decimal>& getEquityTrajectory() const
    {
      return mTrajectory;
    }

    const BacktestResult<Decimal>& getBacktestResult() const
    {
      return mResult;
    }

  private:
    EquityTrajectory<Decimal> mTrajectory;
    BacktestResult<Decimal> mResult;
  };

  /**
   * @class GridBacktestEngine
   * @brief Replays the asymmetric grid rule over a daily price series.
   *
   * For every day, in date order, the engine compares the close with the
   * previous close:
   * - change <= -buyDropPct/100: buy tradeAmount worth of shares. Cash is
   *   debited unconditionally and may become negative.
   * - otherwise, change >= sellRisePct/100 while holding shares: sell
   *   min(tradeAmount, holding value) worth of shares.
   * - otherwise: no trade.
   * The first day has no previous close, its change is defined as zero and
   * it can never trade. Equity is recorded after the day's decision.
   *
   * Thread Safety:
   * - The engine holds no state; run() may be called concurrently from
   *   several threads on independent or shared (const) inputs.
   */
  template <class Decimal> class GridBacktestEngine
  {
  public:
    GridBacktestEngine()
    {}

    ~GridBacktestEngine()
    {}

    /**
     * @brief Run the backtest.
     *
     * @param series daily closes; at least one entry, every close strictly positive
     * @param params validated strategy parameters
     * @return trajectory with one entry per observation plus summary statistics
     * @throws InvalidInputException if the series is empty or contains a non-positive close
     */
    GridBacktestRun<Decimal> run (const PriceSeries<Decimal>& series,
				  const GridStrategyParams<Decimal>& params) const
    {
      validateSeries (series);

      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;
      const Decimal buyTrigger = -params.getBuyTriggerFraction();
      const Decimal& sellTrigger = params.getSellTriggerFraction();
      const Decimal& tradeAmount = params.getTradeAmount();

      PortfolioState<Decimal> portfolio;
      EquityTrajectory<Decimal> trajectory (series.getNumEntries());
      unsigned int buyCount = 0;
      unsigned int sellCount = 0;

      Decimal previousClose (zero);
      bool firstDay = true;

      for (auto it = series.beginPriceSeries(); it != series.endPriceSeries(); ++it)
	{
	  const Decimal& close = it->getCloseValue();
	  Decimal change (zero);

	  if (!firstDay)
	    change = GridPerformanceStatistics<Decimal>::computeDailyChange (previousClose, close);

	  TradeAction action = TradeAction::NONE;

	  if (!firstDay && change <= buyTrigger)
	    {
	      portfolio.buy (close, tradeAmount);
	      ++buyCount;
	      action = TradeAction::BUY;
	    }
	  else if (!firstDay && change >= sellTrigger && portfolio.hasShares())
	    {
	      portfolio.sell (close, tradeAmount);
	      ++sellCount;
	      action = TradeAction::SELL;
	    }

	  trajectory.addEntry (EquityTrajectoryEntry<Decimal> (it->getDate(),
							       close,
							       change,
							       action,
							       portfolio.getShares(),
							       portfolio.getCash(),
							       portfolio.getEquity (close)));
	  previousClose = close;
	  firstDay = false;
	}

      const Decimal& lastClose = series.getEntry (series.getNumEntries() - 1).getCloseValue();
      BacktestResult<Decimal> result (computeResult (trajectory.getEquityValues(),
						     portfolio,
						     buyCount,
						     sellCount,
						     tradeAmount,
						     lastClose));

      return GridBacktestRun<Decimal> (std::move (trajectory), result);
    }

  private:
    static BacktestResult<Decimal> computeResult (const std::vector<Decimal>& equity,
						  const PortfolioState<Decimal>& portfolio,
						  unsigned int buyCount,
						  unsigned int sellCount,
						  const Decimal& tradeAmount,
						  const Decimal& lastClose)
    {
      using Stats = GridPerformanceStatistics<Decimal>;

      Decimal totalInvested (Decimal (buyCount) * tradeAmount);
      const Decimal& finalEquity = equity.back();

      return BacktestResult<Decimal> (buyCount,
				      sellCount,
				      totalInvested,
				      Stats::computeCumulativeReturn (finalEquity, totalInvested),
				      Stats::computeMaxDrawdown (equity),
				      Stats::computeWinRate (equity),
				      portfolio.getShares(),
				      portfolio.getMarketValue (lastClose),
				      finalEquity);
    }

    static void validateSeries (const PriceSeries<Decimal>& series)
    {
      if (series.isEmpty())
	throw InvalidInputException ("GridBacktestEngine::run - price series for "
				     + series.getSymbol() + " is empty");

      for (auto it = series.beginPriceSeries(); it != series.endPriceSeries(); ++it)
	{
	  if (!(it->getCloseValue() > DecimalConstants<Decimal>::DecimalZero) || !isFinite (it->getCloseValue()))
	    throw InvalidInputException ("GridBacktestEngine::run - " + series.getSymbol()
					 + " has a non-positive close on "
					 + boost::gregorian::to_iso_extended_string (it->getDate()));
	}
    }

    static bool isFinite (const Decimal& value)
    {
      if constexpr (std::is_floating_point_v<Decimal>)
	return std::isfinite (value);
      else
	return true;
    }
  };
}

#endif
