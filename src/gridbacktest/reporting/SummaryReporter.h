#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "GridBacktestRunner.h"
#include "GridRunConfiguration.h"

namespace gridbacktest
{
namespace reporting
{

/**
 * @brief Console and file reports of a grid run
 *
 * The summary table has one row per backtested period with the columns
 * Period, Buys, Sells, Cumulative Return, Max Drawdown, Daily Win Rate,
 * Total Trades and Final Position Value. The best cumulative return and the
 * best daily win rate are marked with '*'; ties are all marked.
 */
class SummaryReporter
{
public:
    static void writeConfigurationSummary(std::ostream& out,
                                          const GridRunConfiguration& configuration,
                                          const std::string& symbol);

    static void writeSummaryTable(std::ostream& out, const GridRunReport& report);

    /**
     * @brief Write configuration summary and table to a file
     * @throws std::runtime_error if the file cannot be opened
     */
    static void writeSummaryReportFile(const std::string& fileName,
                                       const GridRunConfiguration& configuration,
                                       const GridRunReport& report);

    /**
     * @brief Flags the entries equal to the largest value
     * @return one flag per value, all false for an empty input
     */
    static std::vector<bool> findColumnMaxima(const std::vector<double>& values);

private:
    static void writeSectionHeader(std::ostream& out, const std::string& title);
    static void writeSectionFooter(std::ostream& out);
};

} // namespace reporting
} // namespace gridbacktest
