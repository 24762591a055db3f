#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace gridbacktest
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used with TeeStream to write the console log to a log file as well.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Format a fraction as a percentage, e.g. 0.12345 -> "12.35%"
 * @param fraction Value where 1.0 means 100%
 * @param decimals Digits after the decimal point
 */
std::string formatPercent(double fraction, int decimals);

/**
 * @brief Round to a whole number and group digits by thousands, e.g. 1234567.8 -> "1,234,568"
 */
std::string formatWithThousandsSeparators(double value);

/**
 * @brief Turn a period label into a file name fragment
 *
 * Runs of characters other than letters, digits, '-' and '.' become a single '_'.
 * Example: "2019-2021 Growth Sector Bull" -> "2019-2021_Growth_Sector_Bull"
 */
std::string sanitizeFileNameComponent(const std::string& text);

/**
 * @brief Create the equity curve file name for a symbol and period
 * @return <outputDir>/<symbol>_<period>_equity.csv
 */
std::string createEquityCurveFileName(const std::string& outputDir,
                                      const std::string& symbol,
                                      const std::string& periodLabel);

/**
 * @brief Create a timestamped summary report file name
 * @return <outputDir>/<symbol>_Grid_Summary_<timestamp>.txt
 */
std::string createSummaryReportFileName(const std::string& outputDir,
                                        const std::string& symbol);

} // namespace utils
} // namespace gridbacktest
