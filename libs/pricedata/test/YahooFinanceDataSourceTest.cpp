#include <catch2/catch_test_macros.hpp>
#include "TestUtils.h"
#include "YahooFinanceDataSource.h"

using namespace mkc_gridbacktest;

namespace
{
  // Replays a canned response and remembers the requested uri
  class FakeHttpClient : public HttpClient
  {
  public:
    FakeHttpClient (long statusCode, const std::string& body)
      : mResponse{statusCode, body},
	mLastUri(),
	mNumRequests(0)
    {}

    HttpResponse get (const std::string& uri) override
    {
      mLastUri = uri;
      mNumRequests++;
      return mResponse;
    }

    HttpResponse mResponse;
    std::string mLastUri;
    int mNumRequests;
  };

  // Timestamps are local midnight in Shanghai, i.e. 16:00 UTC of the previous day
  const char *shanghaiChart = R"({
    "chart": {
      "result": [{
        "meta": {"symbol": "510300.SS", "gmtoffset": 28800, "exchangeTimezoneName": "Asia/Shanghai"},
        "timestamp": [1727107200, 1727193600, 1727280000, 1727366400, 1727625600],
        "indicators": {
          "quote": [{"close": [3.60, 3.70, null, 4.00, 4.30]}],
          "adjclose": [{"adjclose": [3.50, 3.60, null, 3.90, 4.20]}]
        }
      }],
      "error": null
    }
  })";

  DateRange createRange (const std::string& first, const std::string& last)
  {
    return DateRange (createDate (first), createDate (last));
  }
}

TEST_CASE("YahooFinanceDataSource: builds the chart request", "[YahooFinanceDataSource]")
{
  auto client = std::make_shared<FakeHttpClient> (200, shanghaiChart);
  YahooFinanceDataSource<DecimalType> source (client);

  REQUIRE (source.getSourceName() == "yahoo");
  REQUIRE (source.buildChartUri ("510300.SS", createRange ("20240924", "20240930")) ==
	   "https://query1.finance.yahoo.com/v8/finance/chart/510300.SS"
	   "?period1=1727136000&period2=1727740800&interval=1d&events=div%2Csplit&includeAdjustedClose=true");
}

TEST_CASE("YahooFinanceDataSource: escapes index symbols in the request path", "[YahooFinanceDataSource]")
{
  auto client = std::make_shared<FakeHttpClient> (200, shanghaiChart);
  YahooFinanceDataSource<DecimalType> source (client);

  REQUIRE (client->escapeUrlComponent ("600519.SS") == "600519.SS");
  REQUIRE (client->escapeUrlComponent ("^GSPC") == "%5EGSPC");
  REQUIRE (client->escapeUrlComponent ("BRK B/A") == "BRK%20B%2FA");

  REQUIRE (source.buildChartUri ("^GSPC", createRange ("20240924", "20240930")) ==
	   "https://query1.finance.yahoo.com/v8/finance/chart/%5EGSPC"
	   "?period1=1727136000&period2=1727740800&interval=1d&events=div%2Csplit&includeAdjustedClose=true");

  source.getPriceSeries ("^SSEC", createRange ("20240924", "20240930"));
  REQUIRE (client->mLastUri.find ("/chart/%5ESSEC?period1=") != std::string::npos);
}

TEST_CASE("YahooFinanceDataSource: parses adjusted closes on exchange dates", "[YahooFinanceDataSource]")
{
  auto client = std::make_shared<FakeHttpClient> (200, shanghaiChart);
  YahooFinanceDataSource<DecimalType> source (client);

  auto series = source.getPriceSeries ("510300.SS", createRange ("20240924", "20240930"));

  REQUIRE (client->mNumRequests == 1);
  REQUIRE (client->mLastUri.find ("510300.SS?period1=") != std::string::npos);

  REQUIRE (series->getSymbol() == "510300.SS");
  REQUIRE (series->getNumEntries() == 4);
  REQUIRE (series->getFirstDate() == createDate ("20240924"));
  REQUIRE (series->getLastDate() == createDate ("20240930"));
  REQUIRE (series->getCloseValues() == std::vector<DecimalType>{3.50, 3.60, 3.90, 4.20});
}

TEST_CASE("YahooFinanceDataSource: unadjusted closes on request", "[YahooFinanceDataSource]")
{
  auto client = std::make_shared<FakeHttpClient> (200, shanghaiChart);
  YahooFinanceDataSource<DecimalType> source (client, false);

  auto series = source.getPriceSeries ("510300.SS", createRange ("20240924", "20240930"));
  REQUIRE (series->getCloseValues() == std::vector<DecimalType>{3.60, 3.70, 4.00, 4.30});
}

TEST_CASE("YahooFinanceDataSource: rows outside the range are dropped", "[YahooFinanceDataSource]")
{
  auto client = std::make_shared<FakeHttpClient> (200, shanghaiChart);
  YahooFinanceDataSource<DecimalType> source (client);

  auto series = source.getPriceSeries ("510300.SS", createRange ("20240925", "20240927"));
  REQUIRE (series->getNumEntries() == 2);
  REQUIRE (series->getFirstDate() == createDate ("20240925"));
  REQUIRE (series->getLastDate() == createDate ("20240927"));
}

TEST_CASE("YahooFinanceDataSource: failures are categorized", "[YahooFinanceDataSource]")
{
  DateRange range (createRange ("20240924", "20240930"));

  SECTION ("unknown symbol")
    {
      auto client = std::make_shared<FakeHttpClient>
	(404, R"({"chart":{"result":null,"error":{"code":"Not Found","description":"No data found, symbol may be delisted"}}})");
      YahooFinanceDataSource<DecimalType> source (client);

      REQUIRE_THROWS_AS (source.getPriceSeries ("XXXXXX.SS", range), SymbolNotFoundException);
    }

  SECTION ("server error")
    {
      auto client = std::make_shared<FakeHttpClient> (503, "<html>Service Unavailable</html>");
      YahooFinanceDataSource<DecimalType> source (client);

      REQUIRE_THROWS_AS (source.getPriceSeries ("510300.SS", range), DataSourceConnectionException);
    }

  SECTION ("rate limited with a JSON body")
    {
      auto client = std::make_shared<FakeHttpClient>
	(429, R"({"chart":{"result":null,"error":{"code":"Too Many Requests","description":"slow down"}}})");
      YahooFinanceDataSource<DecimalType> source (client);

      REQUIRE_THROWS_AS (source.getPriceSeries ("510300.SS", range), DataSourceConnectionException);
    }

  SECTION ("body is not JSON")
    {
      auto client = std::make_shared<FakeHttpClient> (200, "Edge: Too Many Requests");
      YahooFinanceDataSource<DecimalType> source (client);

      REQUIRE_THROWS_AS (source.getPriceSeries ("510300.SS", range), DataSourceFormatException);
    }

  SECTION ("result without close prices")
    {
      auto client = std::make_shared<FakeHttpClient>
	(200, R"({"chart":{"result":[{"meta":{},"timestamp":[1727107200],"indicators":{}}],"error":null}})");
      YahooFinanceDataSource<DecimalType> source (client);

      REQUIRE_THROWS_AS (source.getPriceSeries ("510300.SS", range), DataSourceFormatException);
    }

  SECTION ("result without timestamps")
    {
      auto client = std::make_shared<FakeHttpClient>
	(200, R"({"chart":{"result":[{"meta":{"gmtoffset":28800},"indicators":{"quote":[{}]}}],"error":null}})");
      YahooFinanceDataSource<DecimalType> source (client);

      REQUIRE_THROWS_AS (source.getPriceSeries ("510300.SS", range), NoDataInRangeException);
    }

  SECTION ("only null closes")
    {
      auto client = std::make_shared<FakeHttpClient>
	(200, R"({"chart":{"result":[{"meta":{"gmtoffset":28800},"timestamp":[1727107200,1727193600],)"
	      R"("indicators":{"quote":[{"close":[null,null]}]}}],"error":null}})");
      YahooFinanceDataSource<DecimalType> source (client, false);

      REQUIRE_THROWS_AS (source.getPriceSeries ("510300.SS", range), NoDataInRangeException);
    }
}
