#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "BacktestPeriods.h"
#include "GridBacktestEngine.h"
#include "GridRunConfiguration.h"
#include "PriceDataSource.h"
#include "SymbolDirectory.h"

namespace gridbacktest
{

using Num = double;

/**
 * @brief Engine output for one period that could be backtested
 */
class BacktestPeriodResult
{
public:
    BacktestPeriodResult(const BacktestPeriod& period,
                         std::shared_ptr<const mkc_gridbacktest::PriceSeries<Num>> series,
                         const mkc_gridbacktest::GridBacktestRun<Num>& run)
        : mPeriod(period),
          mSeries(series),
          mRun(run)
    {}

    const BacktestPeriod& getPeriod() const
    {
        return mPeriod;
    }

    std::shared_ptr<const mkc_gridbacktest::PriceSeries<Num>> getPriceSeries() const
    {
        return mSeries;
    }

    const mkc_gridbacktest::GridBacktestRun<Num>& getRun() const
    {
        return mRun;
    }

    const mkc_gridbacktest::BacktestResult<Num>& getBacktestResult() const
    {
        return mRun.getBacktestResult();
    }

private:
    BacktestPeriod mPeriod;
    std::shared_ptr<const mkc_gridbacktest::PriceSeries<Num>> mSeries;
    mkc_gridbacktest::GridBacktestRun<Num> mRun;
};

/**
 * @brief A period that produced no result, with the reason
 */
struct SkippedPeriod
{
    std::string label;
    std::string category;
    std::string message;
};

/**
 * @brief Everything one invocation produced, in period order
 */
struct GridRunReport
{
    std::string symbol;
    std::vector<BacktestPeriodResult> results;
    std::vector<SkippedPeriod> skippedPeriods;
    std::vector<std::string> equityCurveFiles;
};

/**
 * @brief Build the price source named by the configuration, wrapped in a cache
 * @throws std::invalid_argument if the csv data directory does not exist
 */
std::shared_ptr<mkc_gridbacktest::PriceDataSource<Num>>
createPriceDataSource(const GridRunConfiguration& configuration);

/**
 * @brief Runs the grid strategy over every period of the configured run mode
 *
 * Periods are processed one after another. A period whose prices cannot be
 * fetched, or whose prices the engine rejects, is logged and skipped; the
 * remaining periods still run.
 */
class GridBacktestRunner
{
public:
    GridBacktestRunner(const GridRunConfiguration& configuration,
                       std::shared_ptr<mkc_gridbacktest::PriceDataSource<Num>> priceSource,
                       std::ostream& log,
                       std::ostream& errorLog);

    GridRunReport run(const std::string& symbol) const;

    /**
     * @brief Pick the ticker to backtest
     *
     * A search query that matches the directory wins over the ticker. A miss
     * falls back to the ticker with a warning. Tickers without an exchange
     * suffix are accepted with a warning.
     */
    static std::string resolveSymbol(const GridRunConfiguration& configuration,
                                     const mkc_gridbacktest::SymbolDirectory& directory,
                                     std::ostream& log);

private:
    void writeEquityCurve(const std::string& symbol,
                          const BacktestPeriodResult& result,
                          GridRunReport& report) const;

private:
    GridRunConfiguration mConfiguration;
    std::shared_ptr<mkc_gridbacktest::PriceDataSource<Num>> mPriceSource;
    mkc_gridbacktest::GridBacktestEngine<Num> mEngine;
    std::ostream& mLog;
    std::ostream& mErrorLog;
};

} // namespace gridbacktest
