// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __GRID_PERFORMANCE_STATISTICS_H
#define __GRID_PERFORMANCE_STATISTICS_H 1

#include <vector>
#include "DecimalConstants.h"

namespace mkc_gridbacktest
{
  /**
   * @class GridPerformanceStatistics
   * @brief Statistics derived from a completed equity trajectory.
   *
   * Every scan runs strictly left to right over the trajectory so that the
   * floating point operations, and therefore the results, are reproducible
   * bit for bit.
   */
  template <class Decimal> class GridPerformanceStatistics
  {
  public:
    /**
     * @brief Prefix maximum of the equity values.
     *
     * runningPeak[i] = max(equity[0..i]); non-decreasing by construction.
     */
    static std::vector<Decimal> computeRunningPeak (const std::vector<Decimal>& equity)
    {
      std::vector<Decimal> peaks;
      peaks.reserve (equity.size());

      for (std::size_t i = 0; i < equity.size(); ++i)
	{
	  if (i == 0 || equity[i] > peaks.back())
	    peaks.push_back (equity[i]);
	  else
	    peaks.push_back (peaks.back());
	}

      return peaks;
    }

    /**
     * @brief Most negative relative decline from the running peak.
     *
     * drawdown[i] = (equity[i] - runningPeak[i]) / runningPeak[i]. A running
     * peak that is not positive has no meaningful relative decline (the
     * trajectory always starts at zero equity), so such indices are skipped.
     *
     * @return min(drawdown[i]) over the indices with a positive peak, or zero
     *         when there is no such index. Never positive.
     */
    static Decimal computeMaxDrawdown (const std::vector<Decimal>& equity)
    {
      const Decimal& zero = DecimalConstants<Decimal>::DecimalZero;
      Decimal maxDrawdown (zero);
      Decimal runningPeak (zero);

      for (std::size_t i = 0; i < equity.size(); ++i)
	{
	  if (i == 0 || equity[i] > runningPeak)
	    runningPeak = equity[i];

	  if (!(runningPeak > zero))
	    continue;

	  Decimal drawdown ((equity[i] - runningPeak) / runningPeak);
	  if (drawdown < maxDrawdown)
	    maxDrawdown = drawdown;
	}

      return maxDrawdown;
    }

    /**
     * @brief Fraction of consecutive pairs with strictly increasing equity.
     * @return count(equity[i] > equity[i-1]) / (N - 1), or zero when N <= 1
     */
    static Decimal computeWinRate (const std::vector<Decimal>& equity)
    {
      if (equity.size() <= 1)
	return DecimalConstants<Decimal>::DecimalZero;

      unsigned long numUpDays = 0;
      for (std::size_t i = 1; i < equity.size(); ++i)
	{
	  if (equity[i] > equity[i - 1])
	    ++numUpDays;
	}

      return Decimal (numUpDays) / Decimal (equity.size() - 1);
    }

    /**
     * @brief Final equity relative to the capital deployed by all buys.
     * @return finalEquity / totalInvested - 1, or exactly zero when nothing was invested
     */
    static Decimal computeCumulativeReturn (const Decimal& finalEquity, const Decimal& totalInvested)
    {
      if (!(totalInvested > DecimalConstants<Decimal>::DecimalZero))
	return DecimalConstants<Decimal>::DecimalZero;

      return finalEquity / totalInvested - DecimalConstants<Decimal>::DecimalOne;
    }

    // (current - previous) / previous
    static Decimal computeDailyChange (const Decimal& previousClose, const Decimal& currentClose)
    {
      return (currentClose - previousClose) / previousClose;
    }
  };
}

#endif
