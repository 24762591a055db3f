#include "GridRunConfiguration.h"
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/algorithm/string/predicate.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include "DecimalConstants.h"
#include "GridBacktestException.h"
#include "utils/TimeUtils.h"

using namespace mkc_gridbacktest;

namespace gridbacktest
{
  PriceSourceType priceSourceTypeFromString(const std::string& sourceString)
  {
    if (boost::iequals(sourceString, "csv"))
      return PriceSourceType::CSV;
    else if (boost::iequals(sourceString, "yahoo"))
      return PriceSourceType::YAHOO;

    throw GridRunConfigurationException("Unknown price source '" + sourceString
					+ "', expected csv or yahoo");
  }

  std::string priceSourceTypeToString(PriceSourceType sourceType)
  {
    return (sourceType == PriceSourceType::YAHOO) ? "yahoo" : "csv";
  }

  CsvFileFormat parseCsvFileFormat(const std::string& formatString)
  {
    try
      {
	return csvFileFormatFromString(formatString);
      }
    catch (const std::invalid_argument& e)
      {
	throw GridRunConfigurationException(std::string(e.what()) + ", expected yahoo or pal");
      }
  }

  GridRunConfiguration::GridRunConfiguration()
    : mTicker("510300.SS"),
      mSearchQuery(),
      mRunMode(RunMode::BullMarketComparison),
      mBuyDropPercent(DecimalConstants<double>::DefaultBuyDropPercent),
      mSellRisePercent(DecimalConstants<double>::DefaultSellRisePercent),
      mTradeAmount(DecimalConstants<double>::DefaultTradeAmount),
      mPriceSourceType(PriceSourceType::CSV),
      mCsvFileFormat(CsvFileFormat::YAHOO),
      mDataDirectory("data"),
      mUseAdjustedClose(true),
      mCacheTimeToLiveHours(24.0),
      mOutputDirectory(),
      mLogFile(),
      mToday(utils::getLocalToday())
  {}

  void GridRunConfiguration::validate() const
  {
    if (mTicker.empty() && mSearchQuery.empty())
      throw GridRunConfigurationException("No ticker given");

    createStrategyParams();

    if (mPriceSourceType == PriceSourceType::CSV && mDataDirectory.empty())
      throw GridRunConfigurationException("The csv price source needs a data directory");

    if (!std::isfinite(mCacheTimeToLiveHours) || !(mCacheTimeToLiveHours > 0.0))
      throw GridRunConfigurationException("Cache time to live must be a positive number of hours");

    if (mCacheTimeToLiveHours > MaxCacheTimeToLiveHours)
      throw GridRunConfigurationException("Cache time to live must not exceed "
					  + std::to_string(static_cast<int>(MaxCacheTimeToLiveHours))
					  + " hours");

    if (mToday.is_special())
      throw GridRunConfigurationException("Today is not a valid date");
  }

  std::vector<std::string> GridRunConfiguration::getWarnings() const
  {
    const double minPercent = DecimalConstants<double>::RecommendedMinThresholdPercent;
    const double maxPercent = DecimalConstants<double>::RecommendedMaxThresholdPercent;
    std::vector<std::string> warnings;

    auto checkThreshold = [&](const std::string& name, double percent)
      {
	if (percent < minPercent || percent > maxPercent)
	  {
	    std::ostringstream msg;
	    msg << name << " threshold " << percent << "% is outside the recommended range "
		<< minPercent << "% to " << maxPercent << "%";
	    warnings.push_back(msg.str());
	  }
      };

    checkThreshold("Buy", mBuyDropPercent);
    checkThreshold("Sell", mSellRisePercent);

    return warnings;
  }

  GridStrategyParams<double> GridRunConfiguration::createStrategyParams() const
  {
    try
      {
	return GridStrategyParams<double>(mBuyDropPercent, mSellRisePercent, mTradeAmount);
      }
    catch (const InvalidInputException& e)
      {
	throw GridRunConfigurationException(std::string("Invalid strategy parameters: ") + e.what());
      }
  }

  GridRunConfigurationFileReader::GridRunConfigurationFileReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  void GridRunConfigurationFileReader::readConfigurationFile(GridRunConfiguration& configuration) const
  {
    std::ifstream file(mConfigurationFileName);
    if (!file.is_open())
      throw GridRunConfigurationException("Could not open configuration file: " + mConfigurationFileName);

    std::string jsonContent((std::istreambuf_iterator<char>(file)),
			    std::istreambuf_iterator<char>());

    try
      {
	applyJsonConfiguration(jsonContent, configuration);
      }
    catch (const GridRunConfigurationException& e)
      {
	throw GridRunConfigurationException(mConfigurationFileName + ": " + e.what());
      }
  }

  namespace
  {
    std::string getStringMember(const rapidjson::Value& value, const char *key)
    {
      if (!value.IsString())
	throw GridRunConfigurationException(std::string("'") + key + "' must be a string");

      return value.GetString();
    }

    double getNumberMember(const rapidjson::Value& value, const char *key)
    {
      if (!value.IsNumber())
	throw GridRunConfigurationException(std::string("'") + key + "' must be a number");

      return value.GetDouble();
    }

    bool getBoolMember(const rapidjson::Value& value, const char *key)
    {
      if (!value.IsBool())
	throw GridRunConfigurationException(std::string("'") + key + "' must be true or false");

      return value.GetBool();
    }
  }

  void GridRunConfigurationFileReader::applyJsonConfiguration(const std::string& jsonContent,
							      GridRunConfiguration& configuration)
  {
    rapidjson::Document doc;
    doc.Parse(jsonContent.c_str());

    if (doc.HasParseError())
      throw GridRunConfigurationException(std::string("JSON parse error at offset ")
					  + std::to_string(doc.GetErrorOffset()) + ": "
					  + rapidjson::GetParseError_En(doc.GetParseError()));

    if (!doc.IsObject())
      throw GridRunConfigurationException("Configuration must be a JSON object");

    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it)
      {
	std::string key = it->name.GetString();
	const rapidjson::Value& value = it->value;

	if (key == "ticker")
	  configuration.setTicker(getStringMember(value, "ticker"));
	else if (key == "search")
	  configuration.setSearchQuery(getStringMember(value, "search"));
	else if (key == "mode")
	  {
	    try
	      {
		configuration.setRunMode(runModeFromString(getStringMember(value, "mode")));
	      }
	    catch (const std::invalid_argument& e)
	      {
		throw GridRunConfigurationException(e.what());
	      }
	  }
	else if (key == "buyPct")
	  configuration.setBuyDropPercent(getNumberMember(value, "buyPct"));
	else if (key == "sellPct")
	  configuration.setSellRisePercent(getNumberMember(value, "sellPct"));
	else if (key == "amount")
	  configuration.setTradeAmount(getNumberMember(value, "amount"));
	else if (key == "source")
	  configuration.setPriceSourceType(priceSourceTypeFromString(getStringMember(value, "source")));
	else if (key == "csvFormat")
	  configuration.setCsvFileFormat(parseCsvFileFormat(getStringMember(value, "csvFormat")));
	else if (key == "dataDir")
	  configuration.setDataDirectory(getStringMember(value, "dataDir"));
	else if (key == "adjusted")
	  configuration.setUseAdjustedClose(getBoolMember(value, "adjusted"));
	else if (key == "cacheTtlHours")
	  configuration.setCacheTimeToLiveHours(getNumberMember(value, "cacheTtlHours"));
	else if (key == "outputDir")
	  configuration.setOutputDirectory(getStringMember(value, "outputDir"));
	else if (key == "logFile")
	  configuration.setLogFile(getStringMember(value, "logFile"));
	else if (key == "today")
	  {
	    try
	      {
		configuration.setToday(utils::parseCalendarDate(getStringMember(value, "today")));
	      }
	    catch (const std::invalid_argument& e)
	      {
		throw GridRunConfigurationException(e.what());
	      }
	  }
	else
	  throw GridRunConfigurationException("Unknown configuration key '" + key + "'");
      }
  }
}
