#include <memory>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian.hpp>
#include "../PriceSeries.h"

typedef double DecimalType;
typedef mkc_gridbacktest::PriceSeries<DecimalType> PriceSeriesType;

// Date from an undelimited string, e.g. "20160104"
boost::gregorian::date createDate (const std::string& dateString);

// Series of closes on consecutive weekdays starting at firstDate
std::shared_ptr<PriceSeriesType>
createWeekdayPriceSeries (const std::string& symbol,
			  const std::string& firstDate,
			  const std::vector<DecimalType>& closes);
