#include "TimeUtils.h"
#include <chrono>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace gridbacktest
{
namespace utils
{

std::string getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%b_%d_%Y_%H%M");
    return ss.str();
}

boost::gregorian::date parseCalendarDate(const std::string& dateString)
{
    boost::gregorian::date result;

    try
    {
        if (dateString.find('-') != std::string::npos)
            result = boost::gregorian::from_simple_string(dateString);
        else
            result = boost::gregorian::from_undelimited_string(dateString);
    }
    catch (const std::exception& e)
    {
        throw std::invalid_argument("Invalid date '" + dateString + "': " + e.what());
    }

    if (result.is_special())
        throw std::invalid_argument("Invalid date '" + dateString + "'");

    return result;
}

boost::gregorian::date getLocalToday()
{
    return boost::gregorian::day_clock::local_day();
}

} // namespace utils
} // namespace gridbacktest
