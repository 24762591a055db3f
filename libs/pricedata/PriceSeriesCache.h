// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PRICE_SERIES_CACHE_H
#define __PRICE_SERIES_CACHE_H 1

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/mutex.hpp>
#include "PriceDataSource.h"

namespace mkc_gridbacktest
{
  /**
   * @brief Caching decorator for a PriceDataSource.
   *
   * Entries are keyed by (symbol, first date, last date) and live for a
   * caller supplied time to live. A lookup younger than the TTL is served
   * from the cache; an expired or missing entry is fetched from the wrapped
   * source. Fetch failures propagate and are never cached.
   *
   * All public member functions lock the same mutex, so one cache may be
   * shared between threads. The fetch itself runs under the lock.
   *
   * @tparam Decimal numeric type of the cached series
   */
  template <class Decimal>
  class PriceSeriesCache : public PriceDataSource<Decimal>
  {
  public:
    typedef std::function<boost::posix_time::ptime()> ClockFunction;

    /**
     * @param source wrapped provider, must not be null
     * @param timeToLive maximum age of a cached series, must be positive
     * @param clock time source, universal second clock when empty
     */
    PriceSeriesCache (std::shared_ptr<PriceDataSource<Decimal>> source,
		      const boost::posix_time::time_duration& timeToLive,
		      ClockFunction clock = ClockFunction())
      : PriceDataSource<Decimal>(),
	mSource(source),
	mTimeToLive(timeToLive),
	mClock(clock),
	mCache(),
	mHitCount(0),
	mMissCount(0),
	mCacheMutex()
    {
      if (!mSource)
	throw std::invalid_argument ("PriceSeriesCache: wrapped price source is null");

      if (mTimeToLive.is_special() || mTimeToLive <= boost::posix_time::time_duration (0, 0, 0))
	throw std::invalid_argument ("PriceSeriesCache: time to live must be positive");

      if (!mClock)
	mClock = []() { return boost::posix_time::second_clock::universal_time(); };
    }

    PriceSeriesCache (const PriceSeriesCache&) = delete;
    PriceSeriesCache& operator= (const PriceSeriesCache&) = delete;

    ~PriceSeriesCache()
    {}

    std::shared_ptr<const PriceSeries<Decimal>>
    getPriceSeries (const std::string& symbol, const DateRange& range) override
    {
      boost::mutex::scoped_lock Lock(mCacheMutex);

      CacheKey key (symbol, range.getFirstDate(), range.getLastDate());
      boost::posix_time::ptime now = mClock();

      typename CacheMap::iterator it = mCache.find (key);
      if (it != mCache.end())
	{
	  if ((now - it->second.mFetchTime) < mTimeToLive)
	    {
	      mHitCount++;
	      return it->second.mSeries;
	    }

	  mCache.erase (it);
	}

      mMissCount++;
      std::shared_ptr<const PriceSeries<Decimal>> series = mSource->getPriceSeries (symbol, range);
      mCache.insert (std::make_pair (key, CacheEntry (series, now)));

      return series;
    }

    std::string getSourceName() const override
    {
      return "cached " + mSource->getSourceName();
    }

    // Drops every range cached for symbol
    void invalidate (const std::string& symbol)
    {
      boost::mutex::scoped_lock Lock(mCacheMutex);

      typename CacheMap::iterator it = mCache.begin();
      while (it != mCache.end())
	{
	  if (std::get<0>(it->first) == symbol)
	    it = mCache.erase (it);
	  else
	    ++it;
	}
    }

    void clear()
    {
      boost::mutex::scoped_lock Lock(mCacheMutex);
      mCache.clear();
    }

    size_t getNumEntries() const
    {
      boost::mutex::scoped_lock Lock(mCacheMutex);
      return mCache.size();
    }

    unsigned long getHitCount() const
    {
      boost::mutex::scoped_lock Lock(mCacheMutex);
      return mHitCount;
    }

    unsigned long getMissCount() const
    {
      boost::mutex::scoped_lock Lock(mCacheMutex);
      return mMissCount;
    }

    const boost::posix_time::time_duration& getTimeToLive() const
    {
      return mTimeToLive;
    }

  private:
    typedef std::tuple<std::string, boost::gregorian::date, boost::gregorian::date> CacheKey;

    struct CacheEntry
    {
      CacheEntry (std::shared_ptr<const PriceSeries<Decimal>> series,
		  const boost::posix_time::ptime& fetchTime)
	: mSeries(series),
	  mFetchTime(fetchTime)
      {}

      std::shared_ptr<const PriceSeries<Decimal>> mSeries;
      boost::posix_time::ptime mFetchTime;
    };

    typedef std::map<CacheKey, CacheEntry> CacheMap;

    std::shared_ptr<PriceDataSource<Decimal>> mSource;
    boost::posix_time::time_duration mTimeToLive;
    ClockFunction mClock;
    CacheMap mCache;
    unsigned long mHitCount;
    unsigned long mMissCount;
    mutable boost::mutex mCacheMutex;
  };
}

#endif
