#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "csv_file_provider.hpp"
#include "yahoo_chart_provider.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using namespace data;
using test_support::day;

TEST(CsvFileProviderTest, NormalizesStandardExport) {
    CsvFileProvider provider("unused");
    const std::string payload =
        "Date,Open,High,Low,Close,Volume,Dividends\n"
        "2024-01-03,10.5,11,10,10.8,120000,0\n"
        "2024-01-02,10,10.6,9.9,10.4,100000,0.25\n";

    auto bars = provider.normalize(payload);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].date, day("2024-01-02")); // Sorted ascending
    EXPECT_DOUBLE_EQ(bars[0].close, 10.4);
    EXPECT_EQ(bars[0].volume, 100000);
    ASSERT_TRUE(bars[0].dividend.has_value());
    EXPECT_DOUBLE_EQ(*bars[0].dividend, 0.25);
    EXPECT_FALSE(bars[1].dividend.has_value());
}

TEST(CsvFileProviderTest, MissingColumnsFallBackToClose) {
    CsvFileProvider provider("unused");
    auto bars = provider.normalize("trade_date,close,pe_ttm\n2024-01-02,20.0,15.5\n");
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].open, 20.0);
    EXPECT_DOUBLE_EQ(bars[0].high, 20.0);
    EXPECT_EQ(bars[0].volume, 0);
    ASSERT_TRUE(bars[0].pe_ttm.has_value());
    EXPECT_DOUBLE_EQ(*bars[0].pe_ttm, 15.5);
}

TEST(CsvFileProviderTest, DuplicateDatesKeepLaterRowAndBadRowsAreSkipped) {
    CsvFileProvider provider("unused");
    const std::string payload =
        "Date,Close\n"
        "2024-01-02,10\n"
        "not-a-date,11\n"
        "2024-01-03,\n"
        "2024-01-02,12\n";

    auto bars = provider.normalize(payload);
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].close, 12.0);
}

TEST(CsvFileProviderTest, PayloadWithoutCloseColumnIsRejected) {
    CsvFileProvider provider("unused");
    EXPECT_THROW(provider.normalize("Date,Open\n2024-01-02,10\n"), core::DataLoadException);
    EXPECT_THROW(provider.normalize(""), core::DataLoadException);
}

TEST(CsvFileProviderTest, ReadsAssetFileFromDirectory) {
    auto dir = std::filesystem::temp_directory_path() / "settlement_backtester_csv_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "XYZ.csv");
        out << "Date,Close\n2024-01-02,5\n";
    }

    CsvFileProvider provider(dir.string());
    std::string raw = provider.fetchRaw("XYZ", "1d", day("2024-01-01"), day("2024-01-31"));
    auto bars = provider.normalize(raw);
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].close, 5.0);

    EXPECT_THROW(provider.fetchRaw("MISSING", "1d", day("2024-01-01"), day("2024-01-31")), core::DataLoadException);
    std::filesystem::remove_all(dir);
}

TEST(YahooChartProviderTest, NormalizesChartPayload) {
    // 2024-01-02 14:30 UTC, 2024-01-03 14:30 UTC, 2024-01-04 14:30 UTC
    const std::string payload = R"({
        "chart": {
            "result": [{
                "timestamp": [1704205800, 1704292200, 1704378600],
                "events": {"dividends": {"1704292200": {"amount": 0.24, "date": 1704292200}}},
                "indicators": {"quote": [{
                    "open":   [185.0, 184.2, null],
                    "high":   [186.0, 185.9, null],
                    "low":    [183.5, 183.4, null],
                    "close":  [185.6, 184.25, null],
                    "volume": [82488700, 58414500, null]
                }]}
            }],
            "error": null
        }
    })";

    YahooChartProvider provider;
    auto bars = provider.normalize(payload);
    ASSERT_EQ(bars.size(), 2u); // Null close row dropped
    EXPECT_EQ(bars[0].date, day("2024-01-02"));
    EXPECT_DOUBLE_EQ(bars[0].open, 185.0);
    EXPECT_EQ(bars[0].volume, 82488700);
    EXPECT_FALSE(bars[0].dividend.has_value());
    EXPECT_EQ(bars[1].date, day("2024-01-03"));
    ASSERT_TRUE(bars[1].dividend.has_value());
    EXPECT_DOUBLE_EQ(*bars[1].dividend, 0.24);
}

TEST(YahooChartProviderTest, ErrorPayloadsAreRejected) {
    YahooChartProvider provider;
    EXPECT_THROW(provider.normalize("{not json"), core::DataLoadException);
    EXPECT_THROW(provider.normalize(R"({"chart": {"result": null, "error": {"code": "Not Found"}}})"),
                 core::DataLoadException);
    EXPECT_THROW(provider.normalize(R"({"chart": {"result": [], "error": null}})"), core::DataLoadException);
}

TEST(PriceProviderTest, IntervalLabelFollowsClockStep) {
    EXPECT_EQ(intervalLabel(1), "1d");
    EXPECT_EQ(intervalLabel(5), "1d");
    EXPECT_EQ(intervalLabel(7), "1wk");
}
