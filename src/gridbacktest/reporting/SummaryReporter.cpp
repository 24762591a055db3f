#include "SummaryReporter.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "utils/OutputUtils.h"

using namespace mkc_gridbacktest;
using gridbacktest::utils::formatPercent;
using gridbacktest::utils::formatWithThousandsSeparators;

namespace gridbacktest
{
namespace reporting
{

namespace
{

const int kPeriodWidth = 30;
const int kCountWidth = 7;
const int kPercentWidth = 19;
const int kValueWidth = 22;

std::string markIf(const std::string& text, bool marked)
{
    return marked ? text + " *" : text + "  ";
}

} // anonymous namespace

void SummaryReporter::writeConfigurationSummary(std::ostream& out,
                                                const GridRunConfiguration& configuration,
                                                const std::string& symbol)
{
    writeSectionHeader(out, "Configuration Summary");
    out << "Ticker: " << symbol << std::endl;
    out << "Run Mode: " << runModeToString(configuration.getRunMode()) << std::endl;
    out << "Buy Trigger: -" << configuration.getBuyDropPercent() << "%" << std::endl;
    out << "Sell Trigger: +" << configuration.getSellRisePercent() << "%" << std::endl;
    out << "Trade Amount: " << configuration.getTradeAmount() << std::endl;
    out << "Price Source: " << priceSourceTypeToString(configuration.getPriceSourceType());
    if (configuration.getPriceSourceType() == PriceSourceType::CSV)
        out << " (" << configuration.getDataDirectory() << ")";
    out << std::endl;
    out << "Adjusted Closes: " << (configuration.getUseAdjustedClose() ? "yes" : "no") << std::endl;
    out << "Today: " << boost::gregorian::to_iso_extended_string(configuration.getToday()) << std::endl;
    writeSectionFooter(out);
}

void SummaryReporter::writeSummaryTable(std::ostream& out, const GridRunReport& report)
{
    writeSectionHeader(out, "Grid Backtest Summary: " + report.symbol);

    std::vector<double> cumulativeReturns;
    std::vector<double> winRates;
    for (const auto& result : report.results)
    {
        cumulativeReturns.push_back(result.getBacktestResult().getCumulativeReturn());
        winRates.push_back(result.getBacktestResult().getWinRate());
    }

    std::vector<bool> bestReturn = findColumnMaxima(cumulativeReturns);
    std::vector<bool> bestWinRate = findColumnMaxima(winRates);

    out << std::left << std::setw(kPeriodWidth) << "Period"
        << std::right << std::setw(kCountWidth) << "Buys"
        << std::setw(kCountWidth) << "Sells"
        << std::setw(kPercentWidth) << "Cumulative Return"
        << std::setw(kPercentWidth) << "Max Drawdown"
        << std::setw(kPercentWidth) << "Daily Win Rate"
        << std::setw(kCountWidth + 6) << "Total Trades"
        << std::setw(kValueWidth) << "Final Position Value" << std::endl;

    for (size_t i = 0; i < report.results.size(); ++i)
    {
        const BacktestResult<double>& stats = report.results[i].getBacktestResult();

        out << std::left << std::setw(kPeriodWidth) << report.results[i].getPeriod().getLabel()
            << std::right << std::setw(kCountWidth) << stats.getBuyCount()
            << std::setw(kCountWidth) << stats.getSellCount()
            << std::setw(kPercentWidth) << markIf(formatPercent(stats.getCumulativeReturn(), 2), bestReturn[i])
            << std::setw(kPercentWidth) << markIf(formatPercent(stats.getMaxDrawdown(), 2), false)
            << std::setw(kPercentWidth) << markIf(formatPercent(stats.getWinRate(), 1), bestWinRate[i])
            << std::setw(kCountWidth + 6) << stats.getTotalTradeCount()
            << std::setw(kValueWidth) << formatWithThousandsSeparators(stats.getFinalPositionValue())
            << std::endl;
    }

    if (report.results.empty())
        out << "No period produced a result." << std::endl;
    else
        out << "* best in column" << std::endl;

    for (const auto& skipped : report.skippedPeriods)
        out << "Skipped " << skipped.label << " (" << skipped.category << "): " << skipped.message << std::endl;

    writeSectionFooter(out);
}

void SummaryReporter::writeSummaryReportFile(const std::string& fileName,
                                             const GridRunConfiguration& configuration,
                                             const GridRunReport& report)
{
    std::ofstream file(fileName);
    if (!file.is_open())
        throw std::runtime_error("Could not open summary report file for writing: " + fileName);

    writeConfigurationSummary(file, configuration, report.symbol);
    file << std::endl;
    writeSummaryTable(file, report);

    if (!report.equityCurveFiles.empty())
    {
        file << std::endl << "Equity curves:" << std::endl;
        for (const auto& curveFile : report.equityCurveFiles)
            file << "  " << curveFile << std::endl;
    }
}

std::vector<bool> SummaryReporter::findColumnMaxima(const std::vector<double>& values)
{
    std::vector<bool> flags(values.size(), false);
    if (values.empty())
        return flags;

    double best = *std::max_element(values.begin(), values.end());
    for (size_t i = 0; i < values.size(); ++i)
        flags[i] = (values[i] == best);

    return flags;
}

void SummaryReporter::writeSectionHeader(std::ostream& out, const std::string& title)
{
    out << "=== " << title << " ===" << std::endl;
}

void SummaryReporter::writeSectionFooter(std::ostream& out)
{
    out << "===================================" << std::endl;
}

} // namespace reporting
} // namespace gridbacktest
