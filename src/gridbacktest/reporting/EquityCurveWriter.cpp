#include "EquityCurveWriter.h"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "TradeAction.h"

using namespace mkc_gridbacktest;

namespace gridbacktest
{
namespace reporting
{

void EquityCurveWriter::writeEquityCurve(std::ostream& out,
                                         const EquityTrajectory<double>& trajectory)
{
    out << "Date,Close,DailyChange,Action,Shares,Cash,Equity" << std::endl;

    std::ios_base::fmtflags savedFlags = out.flags();
    std::streamsize savedPrecision = out.precision();
    out << std::setprecision(12);

    for (auto it = trajectory.beginTrajectory(); it != trajectory.endTrajectory(); ++it)
    {
        out << boost::gregorian::to_iso_extended_string(it->getDate()) << ","
            << it->getClose() << ","
            << it->getDailyChange() << ","
            << tradeActionToString(it->getAction()) << ","
            << it->getShares() << ","
            << it->getCash() << ","
            << it->getEquity() << "\n";
    }

    out.flags(savedFlags);
    out.precision(savedPrecision);
    out.flush();
}

void EquityCurveWriter::writeEquityCurveFile(const std::string& fileName,
                                             const EquityTrajectory<double>& trajectory)
{
    std::ofstream file(fileName);
    if (!file.is_open())
        throw std::runtime_error("Could not open equity curve file for writing: " + fileName);

    writeEquityCurve(file, trajectory);
}

} // namespace reporting
} // namespace gridbacktest
