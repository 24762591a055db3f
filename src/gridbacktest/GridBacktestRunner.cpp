#include "GridBacktestRunner.h"
#include <stdexcept>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include "CsvDirectoryDataSource.h"
#include "HttpClient.h"
#include "PriceSeriesCache.h"
#include "YahooFinanceDataSource.h"
#include "reporting/EquityCurveWriter.h"
#include "utils/OutputUtils.h"

using namespace mkc_gridbacktest;

namespace gridbacktest
{

std::shared_ptr<PriceDataSource<Num>>
createPriceDataSource(const GridRunConfiguration& configuration)
{
    std::shared_ptr<PriceDataSource<Num>> source;

    if (configuration.getPriceSourceType() == PriceSourceType::YAHOO)
    {
        source = std::make_shared<YahooFinanceDataSource<Num>>(std::make_shared<CurlHttpClient>(),
                                                               configuration.getUseAdjustedClose());
    }
    else
    {
        source = std::make_shared<CsvDirectoryDataSource<Num>>(configuration.getDataDirectory(),
                                                                configuration.getCsvFileFormat(),
                                                                configuration.getUseAdjustedClose());
    }

    double ttlHours = configuration.getCacheTimeToLiveHours();
    if (!(ttlHours <= MaxCacheTimeToLiveHours))
        ttlHours = MaxCacheTimeToLiveHours;

    long ttlSeconds = static_cast<long>(ttlHours * 3600.0);
    if (ttlSeconds < 1)
        ttlSeconds = 1;

    return std::make_shared<PriceSeriesCache<Num>>(source, boost::posix_time::seconds(ttlSeconds));
}

GridBacktestRunner::GridBacktestRunner(const GridRunConfiguration& configuration,
                                       std::shared_ptr<PriceDataSource<Num>> priceSource,
                                       std::ostream& log,
                                       std::ostream& errorLog)
    : mConfiguration(configuration),
      mPriceSource(priceSource),
      mEngine(),
      mLog(log),
      mErrorLog(errorLog)
{
    if (!mPriceSource)
        throw std::invalid_argument("GridBacktestRunner: price source is null");
}

GridRunReport GridBacktestRunner::run(const std::string& symbol) const
{
    GridRunReport report;
    report.symbol = symbol;

    GridStrategyParams<Num> params = mConfiguration.createStrategyParams();
    std::vector<BacktestPeriod> periods = createBacktestPeriods(mConfiguration.getRunMode(),
                                                                mConfiguration.getToday());

    for (const auto& period : periods)
    {
        mLog << "[INFO] " << period.getLabel() << ": fetching " << symbol << " "
             << period.getDateRange().toString() << " from " << mPriceSource->getSourceName()
             << std::endl;

        std::shared_ptr<const PriceSeries<Num>> series;
        try
        {
            series = mPriceSource->getPriceSeries(symbol, period.getDateRange());
        }
        catch (const DataUnavailableException& e)
        {
            mErrorLog << "[WARN] Skipping " << period.getLabel() << " (" << e.getCategory() << "): "
                      << e.what() << std::endl;
            report.skippedPeriods.push_back(SkippedPeriod{period.getLabel(), e.getCategory(), e.what()});
            continue;
        }

        try
        {
            BacktestPeriodResult result(period, series, mEngine.run(*series, params));
            const BacktestResult<Num>& stats = result.getBacktestResult();

            mLog << "[INFO] " << period.getLabel() << ": " << series->getNumEntries() << " closes, "
                 << stats.getBuyCount() << " buys, " << stats.getSellCount() << " sells" << std::endl;

            if (!mConfiguration.getOutputDirectory().empty())
                writeEquityCurve(symbol, result, report);

            report.results.push_back(result);
        }
        catch (const InvalidInputException& e)
        {
            mErrorLog << "[WARN] Skipping " << period.getLabel() << " (InvalidInput): "
                      << e.what() << std::endl;
            report.skippedPeriods.push_back(SkippedPeriod{period.getLabel(), "InvalidInput", e.what()});
        }
    }

    return report;
}

void GridBacktestRunner::writeEquityCurve(const std::string& symbol,
                                          const BacktestPeriodResult& result,
                                          GridRunReport& report) const
{
    std::string fileName = utils::createEquityCurveFileName(mConfiguration.getOutputDirectory(),
                                                            symbol,
                                                            result.getPeriod().getLabel());
    try
    {
        boost::filesystem::create_directories(mConfiguration.getOutputDirectory());
        reporting::EquityCurveWriter::writeEquityCurveFile(fileName, result.getRun().getEquityTrajectory());
        report.equityCurveFiles.push_back(fileName);
        mLog << "[INFO] Equity curve written to " << fileName << std::endl;
    }
    catch (const boost::filesystem::filesystem_error& e)
    {
        mErrorLog << "[ERROR] Could not create output directory: " << e.what() << std::endl;
    }
    catch (const std::runtime_error& e)
    {
        mErrorLog << "[ERROR] " << e.what() << std::endl;
    }
}

std::string GridBacktestRunner::resolveSymbol(const GridRunConfiguration& configuration,
                                              const SymbolDirectory& directory,
                                              std::ostream& log)
{
    std::string symbol = configuration.getTicker();

    if (!configuration.getSearchQuery().empty())
    {
        boost::optional<std::string> match = directory.findSymbol(configuration.getSearchQuery());
        if (match)
        {
            symbol = *match;
            log << "[INFO] Matched '" << configuration.getSearchQuery() << "' to " << symbol << std::endl;
        }
        else
        {
            log << "[WARN] '" << configuration.getSearchQuery()
                << "' is not in the symbol directory, using ticker " << symbol << std::endl;
        }
    }

    if (symbol.empty())
        throw GridRunConfigurationException("No ticker given and the search found nothing");

    if (!SymbolDirectory::hasExchangeSuffix(symbol))
        log << "[WARN] Ticker " << symbol << " has no .SS or .SZ exchange suffix" << std::endl;

    return symbol;
}

} // namespace gridbacktest
