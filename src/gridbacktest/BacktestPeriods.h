#pragma once

#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DateRange.h"

namespace gridbacktest
{

enum class RunMode
{
    BullMarketComparison,   ///< Three historical A-share bull markets side by side
    FullHistory             ///< One period from 2015 to today
};

/**
 * @brief Parse "bull" or "full" (case insensitive)
 * @throws std::invalid_argument for any other value
 */
RunMode runModeFromString(const std::string& modeString);

std::string runModeToString(RunMode mode);

/**
 * @brief A labelled date range that is backtested on its own
 */
class BacktestPeriod
{
public:
    BacktestPeriod(const std::string& label, const mkc_gridbacktest::DateRange& dateRange)
        : mLabel(label),
          mDateRange(dateRange)
    {}

    const std::string& getLabel() const
    {
        return mLabel;
    }

    const mkc_gridbacktest::DateRange& getDateRange() const
    {
        return mDateRange;
    }

private:
    std::string mLabel;
    mkc_gridbacktest::DateRange mDateRange;
};

/**
 * @brief Build the periods of a run mode
 *
 * Open ended periods end on today. A period that starts after today is
 * left out, so the result can be shorter than the mode's full list.
 *
 * @param mode Which period set to build
 * @param today Last date of the open ended periods
 */
std::vector<BacktestPeriod> createBacktestPeriods(RunMode mode, const boost::gregorian::date& today);

} // namespace gridbacktest
