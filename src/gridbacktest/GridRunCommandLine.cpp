#include "GridRunCommandLine.h"
#include <string>
#include "utils/TimeUtils.h"

namespace po = boost::program_options;

namespace gridbacktest
{

namespace
{

// Explicitly given on the command line, as opposed to a default value
bool isGiven(const po::variables_map& vm, const char* name)
{
    return vm.count(name) && !vm[name].defaulted();
}

} // anonymous namespace

GridRunCommandLine::GridRunCommandLine()
    : mOptions("Options"),
      mHelpRequested(false)
{
    mOptions.add_options()
        ("help,h", "Show help message")
        ("ticker,t", po::value<std::string>()->default_value("510300.SS"),
         "Exchange code of the instrument, e.g. 600519.SS")
        ("search,s", po::value<std::string>(),
         "Look up the ticker by (part of) the company name")
        ("mode,m", po::value<std::string>()->default_value("bull"),
         "bull: three bull market periods; full: 2015 to today")
        ("buy-pct", po::value<double>()->default_value(1.0),
         "Buy after a daily drop of at least this many percent")
        ("sell-pct", po::value<double>()->default_value(1.5),
         "Sell after a daily rise of at least this many percent")
        ("amount", po::value<double>()->default_value(1000.0),
         "Cash amount of every buy and sell")
        ("source", po::value<std::string>()->default_value("csv"),
         "Price source: csv or yahoo")
        ("csv-format", po::value<std::string>()->default_value("yahoo"),
         "File layout of the csv source: yahoo (<TICKER>.csv) or pal (<TICKER>.txt)")
        ("data-dir,d", po::value<std::string>()->default_value("data"),
         "Directory with the price files of the csv source")
        ("adjusted", po::value<bool>()->default_value(true),
         "Use dividend and split adjusted closes")
        ("cache-ttl-hours", po::value<double>()->default_value(24.0),
         "Time to live of cached price series")
        ("config,c", po::value<std::string>(),
         "JSON configuration file, overridden by command line options")
        ("output-dir,o", po::value<std::string>(),
         "Write equity curves and the summary report to this directory")
        ("log-file", po::value<std::string>(),
         "Mirror console output to this file")
        ("today", po::value<std::string>(),
         "End date of open ended periods (YYYY-MM-DD), defaults to the local date");
}

GridRunConfiguration GridRunCommandLine::parse(int argc, const char* const argv[])
{
    po::variables_map vm;

    try
    {
        po::store(po::parse_command_line(argc, argv, mOptions), vm);
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        throw GridRunConfigurationException(e.what());
    }

    GridRunConfiguration configuration;
    mHelpRequested = vm.count("help") > 0;
    if (mHelpRequested)
        return configuration;

    if (vm.count("config"))
    {
        GridRunConfigurationFileReader reader(vm["config"].as<std::string>());
        reader.readConfigurationFile(configuration);
    }

    applyCommandLineOptions(vm, configuration);
    return configuration;
}

void GridRunCommandLine::applyCommandLineOptions(const po::variables_map& vm,
                                                 GridRunConfiguration& configuration) const
{
    if (isGiven(vm, "ticker"))
        configuration.setTicker(vm["ticker"].as<std::string>());

    if (isGiven(vm, "search"))
        configuration.setSearchQuery(vm["search"].as<std::string>());

    if (isGiven(vm, "mode"))
    {
        try
        {
            configuration.setRunMode(runModeFromString(vm["mode"].as<std::string>()));
        }
        catch (const std::invalid_argument& e)
        {
            throw GridRunConfigurationException(e.what());
        }
    }

    if (isGiven(vm, "buy-pct"))
        configuration.setBuyDropPercent(vm["buy-pct"].as<double>());

    if (isGiven(vm, "sell-pct"))
        configuration.setSellRisePercent(vm["sell-pct"].as<double>());

    if (isGiven(vm, "amount"))
        configuration.setTradeAmount(vm["amount"].as<double>());

    if (isGiven(vm, "source"))
        configuration.setPriceSourceType(priceSourceTypeFromString(vm["source"].as<std::string>()));

    if (isGiven(vm, "csv-format"))
        configuration.setCsvFileFormat(parseCsvFileFormat(vm["csv-format"].as<std::string>()));

    if (isGiven(vm, "data-dir"))
        configuration.setDataDirectory(vm["data-dir"].as<std::string>());

    if (isGiven(vm, "adjusted"))
        configuration.setUseAdjustedClose(vm["adjusted"].as<bool>());

    if (isGiven(vm, "cache-ttl-hours"))
        configuration.setCacheTimeToLiveHours(vm["cache-ttl-hours"].as<double>());

    if (isGiven(vm, "output-dir"))
        configuration.setOutputDirectory(vm["output-dir"].as<std::string>());

    if (isGiven(vm, "log-file"))
        configuration.setLogFile(vm["log-file"].as<std::string>());

    if (isGiven(vm, "today"))
    {
        try
        {
            configuration.setToday(utils::parseCalendarDate(vm["today"].as<std::string>()));
        }
        catch (const std::invalid_argument& e)
        {
            throw GridRunConfigurationException(e.what());
        }
    }
}

void GridRunCommandLine::printUsage(std::ostream& out) const
{
    out << "Asymmetric grid strategy backtester\n\n";
    out << "Usage: gridbacktest [options]\n\n";
    out << mOptions << std::endl;

    out << "\nExamples:\n";
    out << "  # Compare the three bull markets for the CSI 300 ETF from local csv files\n";
    out << "  gridbacktest --data-dir data --ticker 510300.SS\n\n";
    out << "  # Full history of Kweichow Moutai from Yahoo Finance, buy at -2%, sell at +3%\n";
    out << "  gridbacktest --source yahoo --search 茅台 --mode full --buy-pct 2 --sell-pct 3\n";
}

} // namespace gridbacktest
