#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <boost/filesystem.hpp>
#include "GridRunCommandLine.h"
#include "GridRunConfiguration.h"
#include "GridBacktestRunner.h"
#include "SymbolDirectory.h"

// Utility modules
#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"

// Reporting modules
#include "reporting/SummaryReporter.h"

using namespace gridbacktest;
using namespace gridbacktest::utils;
using namespace gridbacktest::reporting;

int main(int argc, char **argv)
{
    GridRunCommandLine commandLine;
    GridRunConfiguration config;

    try {
        config = commandLine.parse(argc, argv);
        if (commandLine.isHelpRequested()) {
            commandLine.printUsage(std::cout);
            return 0;
        }
        config.validate();
    }
    catch (const GridRunConfigurationException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << "Run with --help for the list of options." << std::endl;
        return 1;
    }

    // -- Logging: console, optionally mirrored to a file --
    std::ofstream logFile;
    std::unique_ptr<TeeStream> logStream;
    std::unique_ptr<TeeStream> errorStream;

    if (!config.getLogFile().empty()) {
        logFile.open(config.getLogFile(), std::ios::out | std::ios::app);
        if (!logFile.is_open()) {
            std::cerr << "Error: could not open log file '" << config.getLogFile() << "'" << std::endl;
            return 1;
        }
        logStream = std::make_unique<TeeStream>(std::cout, logFile);
        errorStream = std::make_unique<TeeStream>(std::cerr, logFile);
    }

    std::ostream& log = logStream ? static_cast<std::ostream&>(*logStream) : std::cout;
    std::ostream& errorLog = errorStream ? static_cast<std::ostream&>(*errorStream) : std::cerr;

    log << "Grid backtest started " << getCurrentTimestamp() << std::endl;

    for (const auto& warning : config.getWarnings())
        log << "[WARN] " << warning << std::endl;

    std::string symbol;
    std::shared_ptr<mkc_gridbacktest::PriceDataSource<Num>> priceSource;

    try {
        symbol = GridBacktestRunner::resolveSymbol(config,
                                                   mkc_gridbacktest::SymbolDirectory::createDefault(),
                                                   log);
        priceSource = createPriceDataSource(config);
    }
    catch (const GridRunConfigurationException& e) {
        errorLog << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::invalid_argument& e) {
        errorLog << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    SummaryReporter::writeConfigurationSummary(log, config, symbol);

    GridBacktestRunner runner(config, priceSource, log, errorLog);
    GridRunReport report = runner.run(symbol);

    log << std::endl;
    SummaryReporter::writeSummaryTable(log, report);

    if (!config.getOutputDirectory().empty()) {
        std::string reportFileName = createSummaryReportFileName(config.getOutputDirectory(), symbol);
        try {
            boost::filesystem::create_directories(config.getOutputDirectory());
            SummaryReporter::writeSummaryReportFile(reportFileName, config, report);
            log << "Summary report written to " << reportFileName << std::endl;
        }
        catch (const std::runtime_error& e) {
            errorLog << "[ERROR] " << e.what() << std::endl;
        }
    }

    if (report.results.empty()) {
        errorLog << "No period could be backtested for " << symbol << std::endl;
        return 1;
    }

    return 0;
}
