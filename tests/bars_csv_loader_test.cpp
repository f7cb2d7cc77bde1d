// bars_csv_loader_test.cpp - Tests for the bars CSV reader

#include <gtest/gtest.h>

#include "market_data/bars_csv_loader.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

using namespace QuantSignal::Core;

namespace {

std::string failure_message(const std::string& csv_text) {
    std::istringstream input_stream(csv_text);
    try {
        parse_bars_csv(input_stream, "test.csv");
    } catch (const std::runtime_error& load_error) {
        return load_error.what();
    }
    return "";
}

} // anonymous namespace

TEST(BarsCsvLoaderTest, ParsesRowsInFileOrder) {
    std::istringstream input_stream(
        "timestamp,open,high,low,close,volume\n"
        "2024-01-02T09:30:00Z,100.0,101.5,99.5,101.0,12000\n"
        "\n"
        "2024-01-02T09:31:00Z,101.0,102.0,100.5,101.8,9000\n");
    PriceSeries bars = parse_bars_csv(input_stream, "test.csv");

    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].timestamp, "2024-01-02T09:30:00Z");
    EXPECT_DOUBLE_EQ(bars[0].open_price, 100.0);
    EXPECT_DOUBLE_EQ(bars[0].high_price, 101.5);
    EXPECT_DOUBLE_EQ(bars[0].low_price, 99.5);
    EXPECT_DOUBLE_EQ(bars[0].close_price, 101.0);
    EXPECT_DOUBLE_EQ(bars[0].volume, 12000.0);
    EXPECT_DOUBLE_EQ(bars[1].close_price, 101.8);
}

TEST(BarsCsvLoaderTest, ColumnOrderComesFromHeader) {
    std::istringstream input_stream(
        "Close,Volume,Timestamp,Open,High,Low\r\n"
        "50.5,300,2024-01-02,50,51,49.5\r\n");
    PriceSeries bars = parse_bars_csv(input_stream, "test.csv");

    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].close_price, 50.5);
    EXPECT_DOUBLE_EQ(bars[0].volume, 300.0);
    EXPECT_EQ(bars[0].timestamp, "2024-01-02");
    EXPECT_DOUBLE_EQ(bars[0].low_price, 49.5);
}

TEST(BarsCsvLoaderTest, HeaderOnlyGivesEmptySeries) {
    std::istringstream input_stream("timestamp,open,high,low,close,volume\n");
    EXPECT_TRUE(parse_bars_csv(input_stream, "test.csv").empty());
}

TEST(BarsCsvLoaderTest, EmptyInputThrows) {
    EXPECT_EQ(failure_message("").rfind("Bars file is empty", 0), 0u);
}

TEST(BarsCsvLoaderTest, MissingColumnIsNamed) {
    std::string message = failure_message("timestamp,open,high,low,close\n2024-01-02,1,1,1,1\n");
    EXPECT_NE(message.find("is missing column: volume"), std::string::npos);
}

TEST(BarsCsvLoaderTest, FieldCountMismatchNamesTheLine) {
    std::string message = failure_message("timestamp,open,high,low,close,volume\n2024-01-02,1,1,1\n");
    EXPECT_NE(message.find("on line 2"), std::string::npos);
}

TEST(BarsCsvLoaderTest, InvalidNumberNamesColumnAndLine) {
    std::string message = failure_message(
        "timestamp,open,high,low,close,volume\n"
        "2024-01-02,1,1,1,1,10\n"
        "2024-01-03,abc,1,1,1,10\n");
    EXPECT_EQ(message, "Invalid open value 'abc' on line 3");
}

TEST(BarsCsvLoaderTest, TrailingGarbageInNumberIsRejected) {
    std::string message = failure_message("timestamp,open,high,low,close,volume\n2024-01-02,1,1,1,1.5x,10\n");
    EXPECT_EQ(message, "Invalid close value '1.5x' on line 2");
}

TEST(BarsCsvLoaderTest, MissingFileThrows) {
    EXPECT_THROW(load_bars_from_csv("/nonexistent/quant_signal_bars.csv"), std::runtime_error);
}
