// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EQUITY_TRAJECTORY_H
#define __EQUITY_TRAJECTORY_H 1

#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "GridBacktestException.h"
#include "TradeAction.h"

namespace mkc_gridbacktest
{
  using boost::gregorian::date;

  //
  // class EquityTrajectoryEntry
  //
  // Post-trade snapshot of one day of a grid backtest.
  //

  template <class Decimal> class EquityTrajectoryEntry
  {
  public:
    EquityTrajectoryEntry (const date& entryDate,
			   const Decimal& closePrice,
			   const Decimal& dailyChange,
			   TradeAction action,
			   const Decimal& shares,
			   const Decimal& cash,
			   const Decimal& equity)
      : mDate(entryDate),
	mClose(closePrice),
	mDailyChange(dailyChange),
	mAction(action),
	mShares(shares),
	mCash(cash),
	mEquity(equity)
    {}

    EquityTrajectoryEntry (const EquityTrajectoryEntry<Decimal>& rhs) = default;
    EquityTrajectoryEntry<Decimal>& operator=(const EquityTrajectoryEntry<Decimal>& rhs) = default;

    const date& getDate() const
    {
      return mDate;
    }

    const Decimal& getClose() const
    {
      return mClose;
    }

    // (close - previous close) / previous close; zero on the first day
    const Decimal& getDailyChange() const
    {
      return mDailyChange;
    }

    TradeAction getAction() const
    {
      return mAction;
    }

    const Decimal& getShares() const
    {
      return mShares;
    }

    const Decimal& getCash() const
    {
      return mCash;
    }

    const Decimal& getEquity() const
    {
      return mEquity;
    }

  private:
    date mDate;
    Decimal mClose;
    Decimal mDailyChange;
    TradeAction mAction;
    Decimal mShares;
    Decimal mCash;
    Decimal mEquity;
  };

  /**
   * @class EquityTrajectory
   * @brief One post-trade snapshot per input observation, in date order.
   *
   * Built by GridBacktestEngine and never modified once the run returns.
   */
  template <class Decimal> class EquityTrajectory
  {
    using EntryVector = std::vector<EquityTrajectoryEntry<Decimal>>;

  public:
    typedef typename EntryVector::const_iterator ConstTrajectoryIterator;

    EquityTrajectory()
      : mEntries()
    {}

    explicit EquityTrajectory (unsigned long numElements)
      : mEntries()
    {
      mEntries.reserve (numElements);
    }

    EquityTrajectory (const EquityTrajectory<Decimal>& rhs) = default;
    EquityTrajectory<Decimal>& operator=(const EquityTrajectory<Decimal>& rhs) = default;
    EquityTrajectory (EquityTrajectory<Decimal>&& rhs) = default;
    EquityTrajectory<Decimal>& operator=(EquityTrajectory<Decimal>&& rhs) = default;

    void addEntry (const EquityTrajectoryEntry<Decimal>& entry)
    {
      mEntries.push_back (entry);
    }

    unsigned long getNumEntries() const
    {
      return mEntries.size();
    }

    const EquityTrajectoryEntry<Decimal>& getEntry (unsigned long index) const
    {
      if (index >= mEntries.size())
	throw GridBacktestException ("EquityTrajectory::getEntry - index " + std::to_string (index)
				     + " out of range");

      return mEntries[index];
    }

    const EquityTrajectoryEntry<Decimal>& getLastEntry() const
    {
      if (mEntries.empty())
	throw GridBacktestException ("EquityTrajectory::getLastEntry - trajectory is empty");

      return mEntries.back();
    }

    ConstTrajectoryIterator beginTrajectory() const
    {
      return mEntries.begin();
    }

    ConstTrajectoryIterator endTrajectory() const
    {
      return mEntries.end();
    }

    std::vector<Decimal> getEquityValues() const
    {
      std::vector<Decimal> equity;
      equity.reserve (mEntries.size());

      for (const auto& entry : mEntries)
	equity.push_back (entry.getEquity());

      return equity;
    }

  private:
    EntryVector mEntries;
  };
}

#endif
