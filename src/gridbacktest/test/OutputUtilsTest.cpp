#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"

using namespace gridbacktest::utils;
using boost::gregorian::date;

TEST_CASE("Percent formatting", "[OutputUtils]")
{
    REQUIRE(formatPercent(0.12345, 2) == "12.35%");
    REQUIRE(formatPercent(-0.98462, 2) == "-98.46%");
    REQUIRE(formatPercent(0.0, 2) == "0.00%");
    REQUIRE(formatPercent(2.0 / 3.0, 1) == "66.7%");
}

TEST_CASE("Thousands separators", "[OutputUtils]")
{
    REQUIRE(formatWithThousandsSeparators(0.0) == "0");
    REQUIRE(formatWithThousandsSeparators(999.4) == "999");
    REQUIRE(formatWithThousandsSeparators(1000.0) == "1,000");
    REQUIRE(formatWithThousandsSeparators(1234567.8) == "1,234,568");
    REQUIRE(formatWithThousandsSeparators(-25000.0) == "-25,000");
    REQUIRE(formatWithThousandsSeparators(-0.4) == "0");
}

TEST_CASE("File names", "[OutputUtils]")
{
    REQUIRE(sanitizeFileNameComponent("2019-2021 Growth Sector Bull") == "2019-2021_Growth_Sector_Bull");
    REQUIRE(sanitizeFileNameComponent("  a / b  ") == "a_b");
    REQUIRE(sanitizeFileNameComponent("510300.SS") == "510300.SS");

    std::string fileName = createEquityCurveFileName("out", "510300.SS", "2016-2017 Blue Chip Bull");
    REQUIRE(boost::filesystem::path(fileName).filename().string() ==
            "510300.SS_2016-2017_Blue_Chip_Bull_equity.csv");
    REQUIRE(boost::filesystem::path(fileName).parent_path().string() == "out");
}

TEST_CASE("TeeStream writes to both streams", "[OutputUtils]")
{
    std::ostringstream first;
    std::ostringstream second;

    TeeStream tee(first, second);
    tee << "[INFO] fetching " << 42 << std::endl;

    REQUIRE(first.str() == "[INFO] fetching 42\n");
    REQUIRE(second.str() == first.str());
}

TEST_CASE("Calendar date parsing", "[TimeUtils]")
{
    REQUIRE(parseCalendarDate("2024-09-24") == date(2024, 9, 24));
    REQUIRE(parseCalendarDate("20210210") == date(2021, 2, 10));
    REQUIRE_THROWS_AS(parseCalendarDate("2021-02-30"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCalendarDate("soon"), std::invalid_argument);
    REQUIRE_FALSE(getCurrentTimestamp().empty());
}
