// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __CSV_DIRECTORY_DATA_SOURCE_H
#define __CSV_DIRECTORY_DATA_SOURCE_H 1

#include <memory>
#include <stdexcept>
#include <string>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include "PriceDataSource.h"
#include "PriceSeriesCsvReader.h"

namespace mkc_gridbacktest
{
  enum class CsvFileFormat {
    YAHOO,   ///< <SYMBOL>.csv with Date,Open,High,Low,Close,Adj Close,Volume header
    PAL      ///< <SYMBOL>.txt with headerless Date,Open,High,Low,Close rows
  };

  /**
   * @brief Parse "yahoo" or "pal" (case insensitive).
   * @throws std::invalid_argument for any other value
   */
  inline CsvFileFormat csvFileFormatFromString (const std::string& formatString)
  {
    if (boost::iequals (formatString, "yahoo"))
      return CsvFileFormat::YAHOO;
    else if (boost::iequals (formatString, "pal"))
      return CsvFileFormat::PAL;

    throw std::invalid_argument ("Unknown csv file format: " + formatString);
  }

  /**
   * @class CsvDirectoryDataSource
   * @brief Serves price series from one file per symbol in a local directory.
   *
   * The file for a symbol is <directory>/<SYMBOL>.csv (Yahoo format) or
   * <directory>/<SYMBOL>.txt (PAL format). The whole file is read on every
   * request and then restricted to the requested range; wrap the source in a
   * PriceSeriesCache to avoid rereading.
   */
  template <class Decimal>
  class CsvDirectoryDataSource : public PriceDataSource<Decimal>
  {
  public:
    CsvDirectoryDataSource (const std::string& directory,
			    CsvFileFormat format = CsvFileFormat::YAHOO,
			    bool useAdjustedClose = true)
      : PriceDataSource<Decimal>(),
	mDirectory(directory),
	mFormat(format),
	mUseAdjustedClose(useAdjustedClose)
    {
      if (!boost::filesystem::is_directory (mDirectory))
	throw std::invalid_argument ("CsvDirectoryDataSource: " + mDirectory.string()
				     + " is not a directory");
    }

    ~CsvDirectoryDataSource()
    {}

    std::shared_ptr<const PriceSeries<Decimal>>
    getPriceSeries (const std::string& symbol, const DateRange& range) override
    {
      boost::filesystem::path dataFile (getDataFilePath (symbol));

      if (!boost::filesystem::exists (dataFile))
	throw SymbolNotFoundException ("No price file " + dataFile.string() + " for symbol " + symbol);

      std::shared_ptr<PriceSeriesCsvReader<Decimal>> reader = createReader (dataFile.string(), symbol);
      reader->readFile();

      std::shared_ptr<PriceSeries<Decimal>> inRange (reader->getPriceSeries()->filterToDateRange (range));
      if (inRange->isEmpty())
	throw NoDataInRangeException ("No prices for " + symbol + " between " + range.toString());

      return inRange;
    }

    std::string getSourceName() const override
    {
      return "csv";
    }

    boost::filesystem::path getDataFilePath (const std::string& symbol) const
    {
      return mDirectory / (symbol + ((mFormat == CsvFileFormat::PAL) ? ".txt" : ".csv"));
    }

  private:
    std::shared_ptr<PriceSeriesCsvReader<Decimal>>
    createReader (const std::string& fileName, const std::string& symbol) const
    {
      if (mFormat == CsvFileFormat::PAL)
	return std::make_shared<PALFormatCsvReader<Decimal>> (fileName, symbol);

      return std::make_shared<YahooFormatCsvReader<Decimal>> (fileName, symbol, mUseAdjustedClose);
    }

  private:
    boost::filesystem::path mDirectory;
    CsvFileFormat mFormat;
    bool mUseAdjustedClose;
  };
}

#endif
