#include "OutputUtils.h"
#include "TimeUtils.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <boost/filesystem.hpp>

namespace gridbacktest
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string formatPercent(double fraction, int decimals)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << (fraction * 100.0) << "%";
    return ss.str();
}

std::string formatWithThousandsSeparators(double value)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0) << std::fabs(value);
    std::string digits = ss.str();

    // -0.4 rounds to "0" and must not print a sign
    bool negative = value < 0.0 && digits != "0";

    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it)
    {
        if (count > 0 && count % 3 == 0)
            grouped.insert(grouped.begin(), ',');
        grouped.insert(grouped.begin(), *it);
        ++count;
    }

    return negative ? "-" + grouped : grouped;
}

std::string sanitizeFileNameComponent(const std::string& text)
{
    std::string result;
    bool pendingSeparator = false;

    for (char c : text)
    {
        bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.';
        if (!keep)
        {
            pendingSeparator = !result.empty();
            continue;
        }

        if (pendingSeparator)
            result += '_';
        pendingSeparator = false;
        result += c;
    }

    return result;
}

std::string createEquityCurveFileName(const std::string& outputDir,
                                      const std::string& symbol,
                                      const std::string& periodLabel)
{
    boost::filesystem::path filePath(outputDir);
    filePath /= sanitizeFileNameComponent(symbol) + "_" + sanitizeFileNameComponent(periodLabel)
        + "_equity.csv";
    return filePath.string();
}

std::string createSummaryReportFileName(const std::string& outputDir,
                                        const std::string& symbol)
{
    boost::filesystem::path filePath(outputDir);
    filePath /= sanitizeFileNameComponent(symbol) + "_Grid_Summary_" + getCurrentTimestamp() + ".txt";
    return filePath.string();
}

} // namespace utils
} // namespace gridbacktest
