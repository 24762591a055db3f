// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DATE_RANGE_H
#define __DATE_RANGE_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace mkc_gridbacktest
{
  using boost::gregorian::date;

  class DateRangeException : public std::runtime_error
  {
  public:
  DateRangeException(const std::string& msg) 
    : std::runtime_error(msg)
      {}

    ~DateRangeException()
      {}
  };

  // Closed interval [firstDate, lastDate] of calendar days
  class DateRange
  {
  public:
    DateRange(const date& firstDate, const date& lastDate)
      : mFirstDate(firstDate),
	mLastDate(lastDate)
    {
      if (firstDate.is_special() || lastDate.is_special())
	throw DateRangeException ("DateRange::DateRange - dates must be valid calendar dates");

      if (lastDate < firstDate)
	throw DateRangeException ("DateRange::DateRange - Second date cannot occur before first date");
    }

    DateRange(const DateRange&) = default;
    DateRange& operator=(const DateRange&) = default;
    ~DateRange() noexcept = default;

    const date& getFirstDate() const
    {
      return mFirstDate;
    }

    const date& getLastDate() const
    {
      return mLastDate;
    }

    bool contains(const date& d) const
    {
      return (d >= mFirstDate) && (d <= mLastDate);
    }

    std::string toString() const
    {
      return boost::gregorian::to_iso_extended_string(mFirstDate)
	+ " to "
	+ boost::gregorian::to_iso_extended_string(mLastDate);
    }

  private:
    date mFirstDate;
    date mLastDate;
  };

  inline bool operator==(const DateRange& lhs, const DateRange& rhs)
    {
      return ((lhs.getFirstDate() == rhs.getFirstDate()) &&
	      (lhs.getLastDate() == rhs.getLastDate()));
    }

  inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
    {
      return !(lhs == rhs);
    }

  inline bool operator<(const DateRange& lhs, const DateRange& rhs)
    {
      if (lhs.getFirstDate() != rhs.getFirstDate())
	return lhs.getFirstDate() < rhs.getFirstDate();

      return lhs.getLastDate() < rhs.getLastDate();
    }
}

#endif
