#pragma once

#include <ostream>
#include <string>
#include "EquityTrajectory.h"

namespace gridbacktest
{
namespace reporting
{

/**
 * @brief Writes an equity trajectory as CSV
 *
 * Columns: Date,Close,DailyChange,Action,Shares,Cash,Equity
 */
class EquityCurveWriter
{
public:
    static void writeEquityCurve(std::ostream& out,
                                 const mkc_gridbacktest::EquityTrajectory<double>& trajectory);

    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    static void writeEquityCurveFile(const std::string& fileName,
                                     const mkc_gridbacktest::EquityTrajectory<double>& trajectory);
};

} // namespace reporting
} // namespace gridbacktest
