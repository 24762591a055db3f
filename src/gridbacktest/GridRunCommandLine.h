#pragma once

#include <ostream>
#include <boost/program_options.hpp>
#include "GridRunConfiguration.h"

namespace gridbacktest
{

/**
 * @brief Command line front end for GridRunConfiguration
 *
 * Options given on the command line override the configuration file named
 * by --config, which in turn overrides the built in defaults.
 */
class GridRunCommandLine
{
public:
    GridRunCommandLine();

    /**
     * @brief Parse argv into a configuration
     * @throws GridRunConfigurationException on unknown options or bad values
     */
    GridRunConfiguration parse(int argc, const char* const argv[]);

    bool isHelpRequested() const
    {
        return mHelpRequested;
    }

    void printUsage(std::ostream& out) const;

private:
    void applyCommandLineOptions(const boost::program_options::variables_map& vm,
                                 GridRunConfiguration& configuration) const;

private:
    boost::program_options::options_description mOptions;
    bool mHelpRequested;
};

} // namespace gridbacktest
