// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __YAHOO_FINANCE_DATA_SOURCE_H
#define __YAHOO_FINANCE_DATA_SOURCE_H 1

#include <ctime>
#include <memory>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/format.hpp>
#include <rapidjson/document.h>
#include "HttpClient.h"
#include "PriceDataSource.h"

namespace mkc_gridbacktest
{
  /**
   * @class YahooFinanceDataSource
   * @brief Daily closes from the Yahoo Finance chart API.
   *
   * One GET request per call:
   *   https://query1.finance.yahoo.com/v8/finance/chart/<symbol>?period1=..&period2=..&interval=1d
   *
   * The reply is classified as follows:
   * - chart.error.code "Not Found"          -> SymbolNotFoundException
   * - any other non-200 status              -> DataSourceConnectionException
   * - unparsable JSON, other chart errors   -> DataSourceFormatException
   * - no usable close inside the range      -> NoDataInRangeException
   *
   * Timestamps are shifted by the exchange gmtoffset before the trading date
   * is taken, so Shanghai and Shenzhen bars land on their local date. Null
   * closes (suspended days) are skipped.
   */
  template <class Decimal>
  class YahooFinanceDataSource : public PriceDataSource<Decimal>
  {
  public:
    YahooFinanceDataSource (std::shared_ptr<HttpClient> httpClient,
			    bool useAdjustedClose = true,
			    const std::string& baseUri = "https://query1.finance.yahoo.com/v8/finance/chart/")
      : PriceDataSource<Decimal>(),
	mHttpClient(httpClient),
	mUseAdjustedClose(useAdjustedClose),
	mBaseUri(baseUri)
    {}

    ~YahooFinanceDataSource()
    {}

    std::shared_ptr<const PriceSeries<Decimal>>
    getPriceSeries (const std::string& symbol, const DateRange& range) override
    {
      HttpResponse response = mHttpClient->get (buildChartUri (symbol, range));

      rapidjson::Document jsonDocument;
      jsonDocument.Parse (response.body.c_str());
      bool parsed = !jsonDocument.HasParseError() && jsonDocument.IsObject();

      if (parsed)
	checkChartError (jsonDocument, symbol, response.statusCode);

      if (response.statusCode != 200)
	throw DataSourceConnectionException ((boost::format ("Yahoo Finance returned HTTP status %1% for %2%")
					      % response.statusCode % symbol).str());

      if (!parsed)
	throw DataSourceFormatException ("Yahoo Finance reply for " + symbol + " is not valid JSON");

      return createPriceSeries (jsonDocument, symbol, range);
    }

    std::string getSourceName() const override
    {
      return "yahoo";
    }

    // period2 is exclusive on the server side, so it is set to the day after the range
    std::string buildChartUri (const std::string& symbol, const DateRange& range) const
    {
      boost::posix_time::ptime first (range.getFirstDate());
      boost::posix_time::ptime afterLast (range.getLastDate() + boost::gregorian::days (1));

      return (boost::format ("%1%%2%?period1=%3%&period2=%4%&interval=1d&events=div%%2Csplit&includeAdjustedClose=true")
	      % mBaseUri % mHttpClient->escapeUrlComponent (symbol)
	      % timestampFromPtime (first) % timestampFromPtime (afterLast)).str();
    }

  private:
    static long long timestampFromPtime (const boost::posix_time::ptime& time)
    {
      boost::posix_time::ptime epoch (boost::gregorian::date (1970, 1, 1));
      return (time - epoch).total_seconds();
    }

    static boost::gregorian::date dateFromTimestamp (long long timestamp, long long gmtOffset)
    {
      boost::posix_time::ptime epoch (boost::gregorian::date (1970, 1, 1));
      return (epoch + boost::posix_time::seconds (static_cast<long> (timestamp + gmtOffset))).date();
    }

    static void checkChartError (const rapidjson::Document& jsonDocument,
				 const std::string& symbol,
				 long statusCode)
    {
      if (!jsonDocument.HasMember ("chart") || !jsonDocument["chart"].IsObject())
	return;

      const rapidjson::Value& chart = jsonDocument["chart"];
      if (!chart.HasMember ("error") || !chart["error"].IsObject())
	return;

      const rapidjson::Value& error = chart["error"];
      std::string code = (error.HasMember ("code") && error["code"].IsString()) ? error["code"].GetString() : "";
      std::string description = (error.HasMember ("description") && error["description"].IsString()) ?
	error["description"].GetString() : "";

      if (code == "Not Found")
	throw SymbolNotFoundException ("Yahoo Finance does not know " + symbol + ": " + description);

      if (statusCode == 200)
	throw DataSourceFormatException ("Yahoo Finance chart error for " + symbol + ": "
					 + code + " " + description);
    }

    std::shared_ptr<const PriceSeries<Decimal>>
    createPriceSeries (const rapidjson::Document& jsonDocument,
		       const std::string& symbol,
		       const DateRange& range) const
    {
      const rapidjson::Value* result = getFirstResult (jsonDocument);
      if (result == nullptr)
	throw DataSourceFormatException ("Yahoo Finance reply for " + symbol + " has no chart result");

      if (!result->HasMember ("timestamp") || !(*result)["timestamp"].IsArray())
	throw NoDataInRangeException ("No prices for " + symbol + " between " + range.toString());

      const rapidjson::Value& timestamps = (*result)["timestamp"];
      const rapidjson::Value& closes = getCloseArray (*result, symbol);

      if (closes.Size() != timestamps.Size())
	throw DataSourceFormatException ("Yahoo Finance reply for " + symbol
					 + " has mismatched timestamp and close arrays");

      long long gmtOffset = 0;
      if (result->HasMember ("meta") && (*result)["meta"].IsObject())
	{
	  const rapidjson::Value& meta = (*result)["meta"];
	  if (meta.HasMember ("gmtoffset") && meta["gmtoffset"].IsInt64())
	    gmtOffset = meta["gmtoffset"].GetInt64();
	}

      auto series = std::make_shared<PriceSeries<Decimal>> (symbol, timestamps.Size());

      for (rapidjson::SizeType idx = 0; idx != timestamps.Size(); idx++)
	{
	  if (!timestamps[idx].IsInt64() || !closes[idx].IsNumber())
	    continue;

	  boost::gregorian::date entryDate = dateFromTimestamp (timestamps[idx].GetInt64(), gmtOffset);
	  if (!range.contains (entryDate))
	    continue;

	  // the live bar of the current session can repeat the last daily bar
	  if (!series->isEmpty() && !(series->getLastDate() < entryDate))
	    continue;

	  series->addEntry (entryDate, Decimal (closes[idx].GetDouble()));
	}

      if (series->isEmpty())
	throw NoDataInRangeException ("No prices for " + symbol + " between " + range.toString());

      return series;
    }

    static const rapidjson::Value* getFirstResult (const rapidjson::Document& jsonDocument)
    {
      if (!jsonDocument.HasMember ("chart") || !jsonDocument["chart"].IsObject())
	return nullptr;

      const rapidjson::Value& chart = jsonDocument["chart"];
      if (!chart.HasMember ("result") || !chart["result"].IsArray() || chart["result"].Empty())
	return nullptr;

      const rapidjson::Value& first = chart["result"][0];
      return first.IsObject() ? &first : nullptr;
    }

    const rapidjson::Value& getCloseArray (const rapidjson::Value& result, const std::string& symbol) const
    {
      if (!result.HasMember ("indicators") || !result["indicators"].IsObject())
	throw DataSourceFormatException ("Yahoo Finance reply for " + symbol + " has no indicators");

      const rapidjson::Value& indicators = result["indicators"];

      if (mUseAdjustedClose && indicators.HasMember ("adjclose") && indicators["adjclose"].IsArray()
	  && !indicators["adjclose"].Empty())
	{
	  const rapidjson::Value& adjClose = indicators["adjclose"][0];
	  if (adjClose.IsObject() && adjClose.HasMember ("adjclose") && adjClose["adjclose"].IsArray())
	    return adjClose["adjclose"];
	}

      if (indicators.HasMember ("quote") && indicators["quote"].IsArray() && !indicators["quote"].Empty())
	{
	  const rapidjson::Value& quote = indicators["quote"][0];
	  if (quote.IsObject() && quote.HasMember ("close") && quote["close"].IsArray())
	    return quote["close"];
	}

      throw DataSourceFormatException ("Yahoo Finance reply for " + symbol + " has no close prices");
    }

  private:
    std::shared_ptr<HttpClient> mHttpClient;
    bool mUseAdjustedClose;
    std::string mBaseUri;
  };
}

#endif
