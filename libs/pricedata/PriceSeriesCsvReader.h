// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PRICE_SERIES_CSV_READER_H
#define __PRICE_SERIES_CSV_READER_H 1

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "PriceSeries.h"
#include "DataUnavailableException.h"

namespace mkc_gridbacktest
{
  template <class Decimal>
  class PriceSeriesCsvReader
  {
  public:
    PriceSeriesCsvReader (const std::string& fileName, const std::string& symbol)
      : mFileName (fileName),
	mPriceSeries(std::make_shared<PriceSeries<Decimal>> (symbol))
    {
      // ensure file exists (all readers inherit this check)
      std::ifstream fin(mFileName);
      if (!fin.is_open())
	throw std::runtime_error("Cannot open file: " + mFileName);
    }

    PriceSeriesCsvReader(const PriceSeriesCsvReader& rhs) = default;
    PriceSeriesCsvReader& operator=(const PriceSeriesCsvReader &rhs) = default;

    virtual ~PriceSeriesCsvReader()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    std::shared_ptr<PriceSeries<Decimal>> getPriceSeries()
    {
      return mPriceSeries;
    }

    // Parse the whole file into the price series
    virtual void readFile() = 0;

  protected:
    void addEntry (const boost::gregorian::date& entryDate, const Decimal& closePrice)
    {
      mPriceSeries->addEntry (entryDate, closePrice);
    }

    // Accepts ISO "2016-01-04" as well as undelimited "20160104"
    static boost::gregorian::date parseDate (const std::string& dateStamp, unsigned int lineNumber)
    {
      try
	{
	  if (dateStamp.find ('-') != std::string::npos)
	    return boost::gregorian::from_simple_string (dateStamp);
	  else
	    return boost::gregorian::from_undelimited_string (dateStamp);
	}
      catch (const std::exception& e)
	{
	  throw DataSourceFormatException ("Invalid date '" + dateStamp + "' on line "
					   + std::to_string (lineNumber) + ": " + e.what());
	}
    }

    static Decimal parsePrice (const std::string& priceString, unsigned int lineNumber)
    {
      try
	{
	  return boost::lexical_cast<Decimal> (priceString);
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw DataSourceFormatException ("Invalid price '" + priceString + "' on line "
					   + std::to_string (lineNumber));
	}
    }

    // Placeholder rows written for days without a quote
    static bool isMissingValue (const std::string& value)
    {
      return value.empty() || boost::iequals (value, "null") || boost::iequals (value, "nan");
    }

  private:
    std::string mFileName;
    std::shared_ptr<PriceSeries<Decimal>> mPriceSeries;
  };

  //
  // Reader for Yahoo Finance daily download files
  //
  // The file format is (header required, extra columns ignored):
  // Date,Open,High,Low,Close,Adj Close,Volume
  //
  // When adjusted prices are requested and the file carries an
  // "Adj Close" column that column is used; otherwise "Close".
  //

  template <class Decimal>
  class YahooFormatCsvReader : public PriceSeriesCsvReader<Decimal>
  {
  public:
    YahooFormatCsvReader (const std::string& fileName,
			  const std::string& symbol,
			  bool useAdjustedClose = true) :
      PriceSeriesCsvReader<Decimal> (fileName, symbol),
      mUseAdjustedClose(useAdjustedClose)
    {}

    ~YahooFormatCsvReader()
    {}

    void readFile() override
    {
      try
	{
	  io::CSVReader<3, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>>
	    csvFile (this->getFileName());

	  csvFile.read_header (io::ignore_extra_column | io::ignore_missing_column,
			       "Date", "Close", "Adj Close");

	  if (!csvFile.has_column ("Date") || !csvFile.has_column ("Close"))
	    throw DataSourceFormatException ("YahooFormatCsvReader: " + this->getFileName()
					     + " has no Date and Close columns");

	  bool useAdjusted = mUseAdjustedClose && csvFile.has_column ("Adj Close");

	  std::string dateStamp, closeString, adjCloseString;
	  while (csvFile.read_row (dateStamp, closeString, adjCloseString))
	    {
	      const std::string& priceString = useAdjusted ? adjCloseString : closeString;
	      unsigned int lineNumber = csvFile.get_file_line();

	      if (this->isMissingValue (priceString))
		continue;

	      this->addEntry (this->parseDate (dateStamp, lineNumber),
			      this->parsePrice (priceString, lineNumber));
	    }
	}
      catch (const io::error::base& e)
	{
	  throw DataSourceFormatException (std::string ("YahooFormatCsvReader: ") + e.what());
	}
      catch (const PriceSeriesException& e)
	{
	  throw DataSourceFormatException (std::string ("YahooFormatCsvReader: ") + e.what());
	}
    }

  private:
    bool mUseAdjustedClose;
  };

  //
  // Reader for Price Action Lab formatted files
  //
  // The file format is (no header):
  // Date,Open,High,Low,Close
  // with undelimited dates, e.g. 20160104
  //

  template <class Decimal>
  class PALFormatCsvReader : public PriceSeriesCsvReader<Decimal>
  {
  public:
    PALFormatCsvReader (const std::string& fileName, const std::string& symbol) :
      PriceSeriesCsvReader<Decimal> (fileName, symbol)
    {}

    ~PALFormatCsvReader()
    {}

    void readFile() override
    {
      try
	{
	  io::CSVReader<5> csvFile (this->getFileName());
	  csvFile.set_header ("Date", "Open", "High", "Low", "Close");

	  std::string dateStamp;
	  std::string openString, highString, lowString, closeString;

	  while (csvFile.read_row (dateStamp, openString, highString, lowString, closeString))
	    {
	      unsigned int lineNumber = csvFile.get_file_line();

	      this->addEntry (this->parseDate (dateStamp, lineNumber),
			      this->parsePrice (closeString, lineNumber));
	    }
	}
      catch (const io::error::base& e)
	{
	  throw DataSourceFormatException (std::string ("PALFormatCsvReader: ") + e.what());
	}
      catch (const PriceSeriesException& e)
	{
	  throw DataSourceFormatException (std::string ("PALFormatCsvReader: ") + e.what());
	}
    }
  };
}

#endif
