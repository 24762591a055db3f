// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_RESULT_H
#define __BACKTEST_RESULT_H 1

namespace mkc_gridbacktest
{
  /**
   * @class BacktestResult
   * @brief Summary statistics of one grid backtest run.
   *
   * All ratios are fractions, not percentages: a cumulative return of
   * -0.25 means -25%. Formatting is left to the presentation layer.
   */
  template <class Decimal> class BacktestResult
  {
  public:
    BacktestResult (unsigned int buyCount,
		    unsigned int sellCount,
		    const Decimal& totalInvested,
		    const Decimal& cumulativeReturn,
		    const Decimal& maxDrawdown,
		    const Decimal& winRate,
		    const Decimal& finalShares,
		    const Decimal& finalPositionValue,
		    const Decimal& finalEquity)
      : mBuyCount(buyCount),
	mSellCount(sellCount),
	mTotalInvested(totalInvested),
	mCumulativeReturn(cumulativeReturn),
	mMaxDrawdown(maxDrawdown),
	mWinRate(winRate),
	mFinalShares(finalShares),
	mFinalPositionValue(finalPositionValue),
	mFinalEquity(finalEquity)
    {}

    BacktestResult (const BacktestResult<Decimal>& rhs) = default;
    BacktestResult<Decimal>& operator=(const BacktestResult<Decimal>& rhs) = default;

    unsigned int getBuyCount() const
    {
      return mBuyCount;
    }

    unsigned int getSellCount() const
    {
      return mSellCount;
    }

    unsigned int getTotalTradeCount() const
    {
      return mBuyCount + mSellCount;
    }

    // buyCount * tradeAmount
    const Decimal& getTotalInvested() const
    {
      return mTotalInvested;
    }

    const Decimal& getCumulativeReturn() const
    {
      return mCumulativeReturn;
    }

    // Most negative drawdown from the running equity peak; zero or below
    const Decimal& getMaxDrawdown() const
    {
      return mMaxDrawdown;
    }

    // Fraction of day-over-day steps with rising equity, in [0, 1]
    const Decimal& getWinRate() const
    {
      return mWinRate;
    }

    const Decimal& getFinalShares() const
    {
      return mFinalShares;
    }

    const Decimal& getFinalPositionValue() const
    {
      return mFinalPositionValue;
    }

    const Decimal& getFinalEquity() const
    {
      return mFinalEquity;
    }

  private:
    unsigned int mBuyCount;
    unsigned int mSellCount;
    Decimal mTotalInvested;
    Decimal mCumulativeReturn;
    Decimal mMaxDrawdown;
    Decimal mWinRate;
    Decimal mFinalShares;
    Decimal mFinalPositionValue;
    Decimal mFinalEquity;
  };
}

#endif
