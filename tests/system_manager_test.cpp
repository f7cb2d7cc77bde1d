// system_manager_test.cpp - Tests for the run() entry used by the CLI
//
// run() owns the stdout contract: one JSON document and an exit code, even
// when the input cannot be loaded.

#include <gtest/gtest.h>

#include "system/system_manager.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

using QuantSignal::System::SystemInitializationResult;

namespace {

std::string write_bars_file(const std::string& file_name, const QuantSignal::Core::PriceSeries& bars) {
    std::string file_path = ::testing::TempDir() + file_name;
    std::ofstream bars_stream(file_path);
    bars_stream << "timestamp,open,high,low,close,volume\n";
    for (const QuantSignal::Core::Bar& bar : bars) {
        bars_stream << bar.timestamp << "," << bar.open_price << "," << bar.high_price << ","
                    << bar.low_price << "," << bar.close_price << "," << bar.volume << "\n";
    }
    return file_path;
}

} // anonymous namespace

// ===========================================================================
// Fixture
// ===========================================================================
class SystemManagerRunTest : public ::testing::Test {
protected:
    SystemInitializationResult system;

    void SetUp() override {
        system.config.reasoning.api_key.clear();
        system.config.logging.log_report_tables = false;
    }
};

TEST_F(SystemManagerRunTest, ValidFilePrintsResultWithoutService) {
    std::string bars_path = write_bars_file("quant_signal_run_bars.csv", test_helpers::make_linear_series(30, 100.0, 1.0));

    testing::internal::CaptureStdout();
    int exit_code = QuantSignal::System::run(system, bars_path, "AAPL");
    std::string printed_output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(exit_code, 0);
    nlohmann::json result_json = nlohmann::json::parse(printed_output);
    EXPECT_TRUE(result_json["success"].get<bool>());
    EXPECT_EQ(result_json["decision"]["decision"], "HOLD");
    EXPECT_EQ(result_json["decision"]["keyFactors"][0], "SERVICE_NOT_CONFIGURED");
}

TEST_F(SystemManagerRunTest, MissingFilePrintsFailureDocument) {
    testing::internal::CaptureStdout();
    int exit_code = QuantSignal::System::run(system, ::testing::TempDir() + "no_such_bars.csv", "AAPL");
    std::string printed_output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(exit_code, 1);
    nlohmann::json failure_json = nlohmann::json::parse(printed_output);
    EXPECT_FALSE(failure_json["success"].get<bool>());
    EXPECT_EQ(failure_json["symbol"], "AAPL");
}

TEST_F(SystemManagerRunTest, InvalidUtf8SymbolStillPrintsFailureDocument) {
    const std::string broken_symbol = "AB\xC3";

    testing::internal::CaptureStdout();
    int exit_code = 0;
    EXPECT_NO_THROW(exit_code = QuantSignal::System::run(system, ::testing::TempDir() + "no_such_bars.csv", broken_symbol));
    std::string printed_output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(exit_code, 1);
    nlohmann::json failure_json = nlohmann::json::parse(printed_output);
    EXPECT_FALSE(failure_json["success"].get<bool>());
    EXPECT_EQ(failure_json["symbol"].get<std::string>().rfind("AB", 0), 0u);
}
