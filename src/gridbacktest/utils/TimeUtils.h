#pragma once

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace gridbacktest
{
namespace utils
{

/**
 * @brief Generate a timestamp string for file naming
 *
 * Creates a timestamp in the format "MMM_DD_YYYY_HHMM" suitable for use in filenames.
 * Example: "Aug_25_2024_1430"
 */
std::string getCurrentTimestamp();

/**
 * @brief Parse a calendar date given as "YYYY-MM-DD" or "YYYYMMDD"
 * @throws std::invalid_argument if the string is not a valid date
 */
boost::gregorian::date parseCalendarDate(const std::string& dateString);

// Today's date in the local time zone
boost::gregorian::date getLocalToday();

} // namespace utils
} // namespace gridbacktest
