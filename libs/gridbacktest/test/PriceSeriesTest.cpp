#include <catch2/catch_test_macros.hpp>
#include "TestUtils.h"
#include "PriceSeries.h"

using namespace mkc_gridbacktest;
using boost::gregorian::date;

TEST_CASE("PriceSeries: entries are kept in insertion order", "[PriceSeries]")
{
  PriceSeriesType series ("510300.SS");
  series.addEntry (createDate ("20160104"), 3.55);
  series.addEntry (createDate ("20160105"), 3.51);
  series.addEntry (createDate ("20160107"), 3.32);

  REQUIRE (series.getSymbol() == "510300.SS");
  REQUIRE (series.getNumEntries() == 3);
  REQUIRE_FALSE (series.isEmpty());
  REQUIRE (series.getFirstDate() == createDate ("20160104"));
  REQUIRE (series.getLastDate() == createDate ("20160107"));
  REQUIRE (series.getEntry (1).getCloseValue() == 3.51);

  std::vector<DecimalType> closes = series.getCloseValues();
  REQUIRE (closes == std::vector<DecimalType>{3.55, 3.51, 3.32});
}

TEST_CASE("PriceSeries: dates must be strictly increasing", "[PriceSeries]")
{
  PriceSeriesType series ("600519.SS");
  series.addEntry (createDate ("20190102"), 598.98);

  SECTION ("duplicate date")
    {
      REQUIRE_THROWS_AS (series.addEntry (createDate ("20190102"), 600.0), PriceSeriesException);
    }

  SECTION ("earlier date")
    {
      REQUIRE_THROWS_AS (series.addEntry (createDate ("20181228"), 590.0), PriceSeriesException);
    }

  SECTION ("invalid date")
    {
      REQUIRE_THROWS_AS (series.addEntry (date (boost::gregorian::not_a_date_time), 590.0),
			 PriceSeriesException);
    }

  REQUIRE (series.getNumEntries() == 1);
}

TEST_CASE("PriceSeries: empty series accessors", "[PriceSeries]")
{
  PriceSeriesType series ("000001.SS");

  REQUIRE (series.isEmpty());
  REQUIRE (series.getNumEntries() == 0);
  REQUIRE_THROWS_AS (series.getFirstDate(), PriceSeriesException);
  REQUIRE_THROWS_AS (series.getLastDate(), PriceSeriesException);
  REQUIRE_THROWS_AS (series.getEntry (0), PriceSeriesException);
}

TEST_CASE("PriceSeries: price values are not validated on insertion", "[PriceSeries]")
{
  PriceSeriesType series ("BAD");
  REQUIRE_NOTHROW (series.addEntry (createDate ("20200102"), 0.0));
  REQUIRE_NOTHROW (series.addEntry (createDate ("20200103"), -1.0));
  REQUIRE (series.getNumEntries() == 2);
}

TEST_CASE("PriceSeries: filterToDateRange", "[PriceSeries]")
{
  auto series = createWeekdayPriceSeries ("300750.SZ", "20240920",
					  {100.0, 101.0, 102.0, 103.0, 104.0, 105.0});
  // 2024-09-20 is a Friday: entries fall on 20, 23, 24, 25, 26, 27 September

  SECTION ("inclusive bounds")
    {
      auto filtered = series->filterToDateRange (DateRange (createDate ("20240924"),
							     createDate ("20240926")));
      REQUIRE (filtered->getSymbol() == "300750.SZ");
      REQUIRE (filtered->getNumEntries() == 3);
      REQUIRE (filtered->getFirstDate() == createDate ("20240924"));
      REQUIRE (filtered->getLastDate() == createDate ("20240926"));
      REQUIRE (filtered->getEntry (0).getCloseValue() == 102.0);
    }

  SECTION ("range covering a weekend only")
    {
      auto filtered = series->filterToDateRange (DateRange (createDate ("20240921"),
							     createDate ("20240922")));
      REQUIRE (filtered->isEmpty());
    }

  SECTION ("range wider than the series")
    {
      auto filtered = series->filterToDateRange (DateRange (createDate ("20240101"),
							     createDate ("20241231")));
      REQUIRE (*filtered == *series);
    }
}
