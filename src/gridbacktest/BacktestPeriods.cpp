#include "BacktestPeriods.h"
#include <algorithm>
#include <stdexcept>
#include <boost/algorithm/string/predicate.hpp>

using mkc_gridbacktest::DateRange;
using boost::gregorian::date;

namespace gridbacktest
{

RunMode runModeFromString(const std::string& modeString)
{
    if (boost::iequals(modeString, "bull"))
        return RunMode::BullMarketComparison;
    else if (boost::iequals(modeString, "full"))
        return RunMode::FullHistory;

    throw std::invalid_argument("Unknown run mode '" + modeString + "', expected bull or full");
}

std::string runModeToString(RunMode mode)
{
    switch (mode)
    {
        case RunMode::BullMarketComparison:
            return "bull";
        case RunMode::FullHistory:
            return "full";
        default:
            return "bull";
    }
}

namespace
{

void addPeriod(std::vector<BacktestPeriod>& periods,
               const std::string& label,
               const date& firstDate,
               const date& lastDate,
               const date& today)
{
    if (firstDate > today)
        return;

    periods.emplace_back(label, DateRange(firstDate, std::min(lastDate, today)));
}

} // anonymous namespace

std::vector<BacktestPeriod> createBacktestPeriods(RunMode mode, const date& today)
{
    if (today.is_special())
        throw std::invalid_argument("createBacktestPeriods: today is not a valid date");

    std::vector<BacktestPeriod> periods;

    if (mode == RunMode::BullMarketComparison)
    {
        addPeriod(periods, "2016-2017 Blue Chip Bull", date(2016, 1, 1), date(2017, 12, 31), today);
        addPeriod(periods, "2019-2021 Growth Sector Bull", date(2019, 1, 1), date(2021, 2, 10), today);
        addPeriod(periods, "2024-Present Policy Bull", date(2024, 9, 24), today, today);
    }
    else
    {
        addPeriod(periods, "2015-Present Full History", date(2015, 1, 1), today, today);
    }

    return periods;
}

} // namespace gridbacktest
