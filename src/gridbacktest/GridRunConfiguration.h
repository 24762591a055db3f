// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BacktestPeriods.h"
#include "CsvDirectoryDataSource.h"
#include "GridStrategyParams.h"

namespace gridbacktest
{
  class GridRunConfigurationException : public std::runtime_error
  {
  public:
  GridRunConfigurationException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~GridRunConfigurationException()
      {}
  };

  enum class PriceSourceType
  {
    CSV,
    YAHOO
  };

  // Parse "csv" or "yahoo" (case insensitive), throws GridRunConfigurationException
  PriceSourceType priceSourceTypeFromString(const std::string& sourceString);

  std::string priceSourceTypeToString(PriceSourceType sourceType);

  // Parse "yahoo" or "pal" (case insensitive), throws GridRunConfigurationException
  mkc_gridbacktest::CsvFileFormat parseCsvFileFormat(const std::string& formatString);

  // Upper bound of the cache time to live, one year
  constexpr double MaxCacheTimeToLiveHours = 8760.0;

  /**
   * @brief Everything one invocation of the grid backtester needs to know.
   *
   * Values start at the documented defaults, are overlaid by the JSON
   * configuration file and then by explicit command line options.
   */
  class GridRunConfiguration
  {
  public:
    GridRunConfiguration();

    const std::string& getTicker() const { return mTicker; }
    void setTicker(const std::string& ticker) { mTicker = ticker; }

    const std::string& getSearchQuery() const { return mSearchQuery; }
    void setSearchQuery(const std::string& query) { mSearchQuery = query; }

    RunMode getRunMode() const { return mRunMode; }
    void setRunMode(RunMode mode) { mRunMode = mode; }

    double getBuyDropPercent() const { return mBuyDropPercent; }
    void setBuyDropPercent(double percent) { mBuyDropPercent = percent; }

    double getSellRisePercent() const { return mSellRisePercent; }
    void setSellRisePercent(double percent) { mSellRisePercent = percent; }

    double getTradeAmount() const { return mTradeAmount; }
    void setTradeAmount(double amount) { mTradeAmount = amount; }

    PriceSourceType getPriceSourceType() const { return mPriceSourceType; }
    void setPriceSourceType(PriceSourceType sourceType) { mPriceSourceType = sourceType; }

    mkc_gridbacktest::CsvFileFormat getCsvFileFormat() const { return mCsvFileFormat; }
    void setCsvFileFormat(mkc_gridbacktest::CsvFileFormat format) { mCsvFileFormat = format; }

    const std::string& getDataDirectory() const { return mDataDirectory; }
    void setDataDirectory(const std::string& directory) { mDataDirectory = directory; }

    bool getUseAdjustedClose() const { return mUseAdjustedClose; }
    void setUseAdjustedClose(bool useAdjusted) { mUseAdjustedClose = useAdjusted; }

    double getCacheTimeToLiveHours() const { return mCacheTimeToLiveHours; }
    void setCacheTimeToLiveHours(double hours) { mCacheTimeToLiveHours = hours; }

    const std::string& getOutputDirectory() const { return mOutputDirectory; }
    void setOutputDirectory(const std::string& directory) { mOutputDirectory = directory; }

    const std::string& getLogFile() const { return mLogFile; }
    void setLogFile(const std::string& logFile) { mLogFile = logFile; }

    const boost::gregorian::date& getToday() const { return mToday; }
    void setToday(const boost::gregorian::date& today) { mToday = today; }

    /**
     * @brief Check that the configuration can be run
     * @throws GridRunConfigurationException naming the first offending setting
     */
    void validate() const;

    /**
     * @brief Settings that are legal but outside the recommended ranges
     * @return one human readable message per finding, empty when none
     */
    std::vector<std::string> getWarnings() const;

    /**
     * @brief Strategy parameters for the engine
     * @throws GridRunConfigurationException if the thresholds or amount are invalid
     */
    mkc_gridbacktest::GridStrategyParams<double> createStrategyParams() const;

  private:
    std::string mTicker;
    std::string mSearchQuery;
    RunMode mRunMode;
    double mBuyDropPercent;
    double mSellRisePercent;
    double mTradeAmount;
    PriceSourceType mPriceSourceType;
    mkc_gridbacktest::CsvFileFormat mCsvFileFormat;
    std::string mDataDirectory;
    bool mUseAdjustedClose;
    double mCacheTimeToLiveHours;
    std::string mOutputDirectory;
    std::string mLogFile;
    boost::gregorian::date mToday;
  };

  /**
   * @brief Overlays settings from a JSON configuration file.
   *
   * Recognized keys: ticker, search, mode, buyPct, sellPct, amount, source,
   * csvFormat, dataDir, adjusted, cacheTtlHours, outputDir, logFile, today. Unknown keys
   * are rejected so that misspelled settings do not go unnoticed.
   */
  class GridRunConfigurationFileReader
  {
  public:
    GridRunConfigurationFileReader(const std::string& configurationFileName);
    ~GridRunConfigurationFileReader()
      {}

    // @throws GridRunConfigurationException if the file cannot be read or is invalid
    void readConfigurationFile(GridRunConfiguration& configuration) const;

    // Same as readConfigurationFile for JSON text already in memory
    static void applyJsonConfiguration(const std::string& jsonContent,
                                       GridRunConfiguration& configuration);

  private:
    std::string mConfigurationFileName;
  };
}
