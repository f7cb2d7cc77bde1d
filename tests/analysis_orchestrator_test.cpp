// analysis_orchestrator_test.cpp - End-to-end tests for AnalysisOrchestrator
//
// Whole pipeline on synthetic series with a stub reasoning service:
// validation, the three analyzers, decision synthesis and report assembly.

#include <gtest/gtest.h>

#include "system/analysis_orchestrator.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

using namespace QuantSignal::Core;
using QuantSignal::Config::SystemConfig;
using QuantSignal::System::AnalysisOrchestrator;
using QuantSignal::System::AnalysisOutcome;

// ===========================================================================
// Fixture
// ===========================================================================
class AnalysisOrchestratorTest : public ::testing::Test {
protected:
    SystemConfig config;
    test_helpers::StubReasoningService* stub_service = nullptr;

    void SetUp() override {
        config.logging.log_report_tables = false;
    }

    std::unique_ptr<AnalysisOrchestrator> make_orchestrator(const std::string& reply_text) {
        std::unique_ptr<test_helpers::StubReasoningService> reasoning_service(
            new test_helpers::StubReasoningService(reply_text));
        stub_service = reasoning_service.get();
        return std::unique_ptr<AnalysisOrchestrator>(new AnalysisOrchestrator(config, std::move(reasoning_service)));
    }
};

// ===========================================================================
// 1. Full pipeline
// ===========================================================================

TEST_F(AnalysisOrchestratorTest, RisingSeriesEndToEnd) {
    std::unique_ptr<AnalysisOrchestrator> orchestrator = make_orchestrator(test_helpers::VALID_LONG_REPLY);
    AnalysisOutcome outcome = orchestrator->analyze_symbol("AAPL", test_helpers::make_linear_series(30, 100.0, 1.0));

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    ASSERT_TRUE(outcome.result.has_value());
    const AnalysisResult& result = *outcome.result;
    const TrendReport& trend_report = result.synthesis.trend_report;

    EXPECT_EQ(trend_report.short_term.direction, TrendDirection::BULLISH);
    EXPECT_EQ(trend_report.medium_term.direction, TrendDirection::BULLISH);
    EXPECT_EQ(trend_report.long_term.direction, TrendDirection::BULLISH);
    EXPECT_DOUBLE_EQ(trend_report.confidence_breakdown.agreement, 0.4);
    EXPECT_NEAR(trend_report.confidence, 0.9025, 1e-3);
    EXPECT_EQ(trend_report.overall_direction, TrendDirection::BULLISH);

    EXPECT_EQ(result.synthesis.record.get_decision(), DecisionType::LONG);
    EXPECT_EQ(result.data_points, 30u);
    EXPECT_DOUBLE_EQ(result.current_price, 129.0);
    EXPECT_EQ(stub_service->call_count, 1);
    EXPECT_NE(stub_service->last_request.user_prompt.find("market data for AAPL"), std::string::npos);
}

TEST_F(AnalysisOrchestratorTest, ResultSerializesToWireJson) {
    std::unique_ptr<AnalysisOrchestrator> orchestrator = make_orchestrator(test_helpers::VALID_LONG_REPLY);
    AnalysisOutcome outcome = orchestrator->analyze_symbol("AAPL", test_helpers::make_linear_series(30, 100.0, 1.0));
    ASSERT_TRUE(outcome.result.has_value());

    nlohmann::json result_json = ReportAssembler::analysis_result_to_json(*outcome.result);
    EXPECT_EQ(result_json["symbol"], "AAPL");
    EXPECT_EQ(result_json["decision"]["decision"], "LONG");
    EXPECT_EQ(result_json["summary"]["trendDirection"], "Bullish");
    EXPECT_EQ(result_json["trend"]["breakout"]["status"], "Resistance Breakout");
}

TEST_F(AnalysisOrchestratorTest, MalformedReplyStillSucceedsWithHold) {
    std::unique_ptr<AnalysisOrchestrator> orchestrator = make_orchestrator("not json {broken");
    AnalysisOutcome outcome = orchestrator->analyze_symbol("AAPL", test_helpers::make_linear_series(30, 100.0, 1.0));

    ASSERT_TRUE(outcome.success);
    const DecisionRecord& record = outcome.result->synthesis.record;
    EXPECT_EQ(record.get_decision(), DecisionType::HOLD);
    EXPECT_DOUBLE_EQ(record.get_confidence(), 0.0);
    EXPECT_EQ(record.get_risk_level(), RiskLevel::HIGH);
    EXPECT_TRUE(record.has_key_factor("PARSING_ERROR"));
}

TEST_F(AnalysisOrchestratorTest, MissingServiceGivesNotConfiguredHold) {
    AnalysisOrchestrator orchestrator(config, nullptr);
    EXPECT_FALSE(orchestrator.has_reasoning_service());

    AnalysisOutcome outcome = orchestrator.analyze_symbol("AAPL", test_helpers::make_linear_series(30, 100.0, 1.0));
    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.result->synthesis.record.get_decision(), DecisionType::HOLD);
    EXPECT_TRUE(outcome.result->synthesis.record.has_key_factor("SERVICE_NOT_CONFIGURED"));
    EXPECT_TRUE(outcome.result->synthesis.model_used.empty());
}

// ===========================================================================
// 2. Rejected input
// ===========================================================================

TEST_F(AnalysisOrchestratorTest, ShortSeriesIsRejectedBeforeAnyCall) {
    std::unique_ptr<AnalysisOrchestrator> orchestrator = make_orchestrator(test_helpers::VALID_LONG_REPLY);
    AnalysisOutcome outcome = orchestrator->analyze_symbol("AAPL", test_helpers::make_linear_series(5, 100.0, 1.0));

    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.result.has_value());
    EXPECT_EQ(outcome.error_message, "Insufficient data for AAPL: 5 bars, at least 10 required");
    EXPECT_EQ(stub_service->call_count, 0);
}

TEST_F(AnalysisOrchestratorTest, InvalidBarIsRejected) {
    std::unique_ptr<AnalysisOrchestrator> orchestrator = make_orchestrator(test_helpers::VALID_LONG_REPLY);
    PriceSeries bars = test_helpers::make_linear_series(30, 100.0, 1.0);
    bars[12].low_price = bars[12].high_price + 1.0;

    AnalysisOutcome outcome = orchestrator->analyze_symbol("AAPL", bars);
    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.error_message.find("Bar 12"), std::string::npos);
}

TEST_F(AnalysisOrchestratorTest, EmptySymbolIsRejected) {
    std::unique_ptr<AnalysisOrchestrator> orchestrator = make_orchestrator(test_helpers::VALID_LONG_REPLY);
    AnalysisOutcome outcome = orchestrator->analyze_symbol("", test_helpers::make_linear_series(30, 100.0, 1.0));

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_message, "Symbol is required");
}
