// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PRICE_SERIES_H
#define __PRICE_SERIES_H 1

#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DateRange.h"
#include "GridBacktestException.h"

namespace mkc_gridbacktest
{
  using boost::gregorian::date;

  //
  // class PriceSeriesEntry
  //
  // A single daily observation: trading date and closing price.
  //

  template <class Decimal> class PriceSeriesEntry
  {
  public:
    PriceSeriesEntry (const date& entryDate, const Decimal& closePrice)
      : mDate(entryDate),
	mClose(closePrice)
    {}

    PriceSeriesEntry (const PriceSeriesEntry<Decimal>& rhs) = default;
    PriceSeriesEntry<Decimal>& operator=(const PriceSeriesEntry<Decimal>& rhs) = default;

    ~PriceSeriesEntry()
    {}

    const date& getDate() const
    {
      return mDate;
    }

    const Decimal& getCloseValue() const
    {
      return mClose;
    }

  private:
    date mDate;
    Decimal mClose;
  };

  template <class Decimal>
  inline bool operator==(const PriceSeriesEntry<Decimal>& lhs, const PriceSeriesEntry<Decimal>& rhs)
  {
    return (lhs.getDate() == rhs.getDate()) && (lhs.getCloseValue() == rhs.getCloseValue());
  }

  template <class Decimal>
  inline bool operator!=(const PriceSeriesEntry<Decimal>& lhs, const PriceSeriesEntry<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @class PriceSeries
   * @brief Ordered sequence of daily closing prices for one symbol.
   *
   * Entries are appended in chronological order. Dates must be strictly
   * increasing; gaps (weekends, holidays, suspensions) are allowed. The
   * series places no constraint on the price values themselves: data
   * quality checks belong to the consumer (see GridBacktestEngine).
   *
   * Once built, a series is shared as std::shared_ptr<const PriceSeries>
   * and never modified again.
   */
  template <class Decimal> class PriceSeries
  {
    using EntryVector = std::vector<PriceSeriesEntry<Decimal>>;

  public:
    typedef typename EntryVector::const_iterator ConstPriceSeriesIterator;

    explicit PriceSeries (const std::string& symbol)
      : mSymbol(symbol),
	mEntries()
    {}

    PriceSeries (const std::string& symbol, unsigned long numElements)
      : mSymbol(symbol),
	mEntries()
    {
      mEntries.reserve(numElements);
    }

    PriceSeries (const PriceSeries<Decimal>& rhs) = default;
    PriceSeries<Decimal>& operator=(const PriceSeries<Decimal>& rhs) = default;
    PriceSeries (PriceSeries<Decimal>&& rhs) = default;
    PriceSeries<Decimal>& operator=(PriceSeries<Decimal>&& rhs) = default;

    ~PriceSeries()
    {}

    /**
     * @brief Append an observation.
     * @throws PriceSeriesException if the date is invalid or not after the last date.
     */
    void addEntry (const PriceSeriesEntry<Decimal>& entry)
    {
      if (entry.getDate().is_special())
	throw PriceSeriesException ("PriceSeries::addEntry - " + mSymbol + ": entry date is not a valid date");

      if (!mEntries.empty() && !(mEntries.back().getDate() < entry.getDate()))
	throw PriceSeriesException ("PriceSeries::addEntry - " + mSymbol + ": entry date "
				    + boost::gregorian::to_iso_extended_string (entry.getDate())
				    + " is not after last date "
				    + boost::gregorian::to_iso_extended_string (mEntries.back().getDate()));

      mEntries.push_back (entry);
    }

    void addEntry (const date& entryDate, const Decimal& closePrice)
    {
      addEntry (PriceSeriesEntry<Decimal> (entryDate, closePrice));
    }

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    unsigned long getNumEntries() const
    {
      return mEntries.size();
    }

    bool isEmpty() const
    {
      return mEntries.empty();
    }

    const PriceSeriesEntry<Decimal>& getEntry (unsigned long index) const
    {
      if (index >= mEntries.size())
	throw PriceSeriesException ("PriceSeries::getEntry - index " + std::to_string (index)
				    + " out of range for " + mSymbol);

      return mEntries[index];
    }

    const date& getFirstDate() const
    {
      if (mEntries.empty())
	throw PriceSeriesException ("PriceSeries::getFirstDate - " + mSymbol + " has no entries");

      return mEntries.front().getDate();
    }

    const date& getLastDate() const
    {
      if (mEntries.empty())
	throw PriceSeriesException ("PriceSeries::getLastDate - " + mSymbol + " has no entries");

      return mEntries.back().getDate();
    }

    ConstPriceSeriesIterator beginPriceSeries() const
    {
      return mEntries.begin();
    }

    ConstPriceSeriesIterator endPriceSeries() const
    {
      return mEntries.end();
    }

    std::vector<Decimal> getCloseValues() const
    {
      std::vector<Decimal> closes;
      closes.reserve (mEntries.size());

      for (const auto& entry : mEntries)
	closes.push_back (entry.getCloseValue());

      return closes;
    }

    /**
     * @brief Copy of this series restricted to the closed range [first, last].
     *
     * The result may be empty when no observation falls inside the range.
     */
    std::shared_ptr<PriceSeries<Decimal>> filterToDateRange (const DateRange& range) const
    {
      auto filtered = std::make_shared<PriceSeries<Decimal>> (mSymbol);

      for (const auto& entry : mEntries)
	{
	  if (entry.getDate() > range.getLastDate())
	    break;

	  if (range.contains (entry.getDate()))
	    filtered->mEntries.push_back (entry);
	}

      return filtered;
    }

  private:
    std::string mSymbol;
    EntryVector mEntries;
  };

  template <class Decimal>
  inline bool operator==(const PriceSeries<Decimal>& lhs, const PriceSeries<Decimal>& rhs)
  {
    if (lhs.getSymbol() != rhs.getSymbol() || lhs.getNumEntries() != rhs.getNumEntries())
      return false;

    return std::equal (lhs.beginPriceSeries(), lhs.endPriceSeries(), rhs.beginPriceSeries());
  }

  template <class Decimal>
  inline bool operator!=(const PriceSeries<Decimal>& lhs, const PriceSeries<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
