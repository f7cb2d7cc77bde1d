// indicator_classifier_test.cpp - Tests for IndicatorClassifier
//
// Oscillator bands, the majority forecast, and the evidence / trigger text
// handed to the decision prompt.

#include <gtest/gtest.h>

#include "analysis/indicator_classifier/indicator_classifier.hpp"
#include "analysis/indicators/indicators.hpp"
#include "test_helpers.hpp"

using namespace QuantSignal::Core;
using QuantSignal::Config::IndicatorConfig;

// ===========================================================================
// Fixture
// ===========================================================================
class IndicatorClassifierTest : public ::testing::Test {
protected:
    IndicatorConfig config;
    IndicatorClassifier classifier{config};
};

// ===========================================================================
// 1. Classification bands
// ===========================================================================

TEST_F(IndicatorClassifierTest, RsiBands) {
    EXPECT_EQ(classifier.classify_rsi(75.0), SignalTag::BEARISH);
    EXPECT_EQ(classifier.classify_rsi(25.0), SignalTag::BULLISH);
    EXPECT_EQ(classifier.classify_rsi(50.0), SignalTag::NEUTRAL);
    EXPECT_EQ(classifier.classify_rsi(70.0), SignalTag::NEUTRAL);  // bands are strict
}

TEST_F(IndicatorClassifierTest, MacdComparesLineToSignal) {
    EXPECT_EQ(classifier.classify_macd(1.0, 0.5), SignalTag::BULLISH);
    EXPECT_EQ(classifier.classify_macd(-1.0, 0.5), SignalTag::BEARISH);
    EXPECT_EQ(classifier.classify_macd(0.0, 0.0), SignalTag::NEUTRAL);
}

TEST_F(IndicatorClassifierTest, RateOfChangeBands) {
    EXPECT_EQ(classifier.classify_rate_of_change(2.5), SignalTag::BULLISH);
    EXPECT_EQ(classifier.classify_rate_of_change(-2.5), SignalTag::BEARISH);
    EXPECT_EQ(classifier.classify_rate_of_change(2.0), SignalTag::NEUTRAL);
}

TEST_F(IndicatorClassifierTest, StochasticAndWilliamsBands) {
    EXPECT_EQ(classifier.classify_stochastic(85.0), SignalTag::BEARISH);
    EXPECT_EQ(classifier.classify_stochastic(15.0), SignalTag::BULLISH);
    EXPECT_EQ(classifier.classify_stochastic(50.0), SignalTag::NEUTRAL);

    EXPECT_EQ(classifier.classify_williams_r(-10.0), SignalTag::BEARISH);
    EXPECT_EQ(classifier.classify_williams_r(-90.0), SignalTag::BULLISH);
    EXPECT_EQ(classifier.classify_williams_r(-50.0), SignalTag::NEUTRAL);
}

// ===========================================================================
// 2. Forecast
// ===========================================================================

TEST_F(IndicatorClassifierTest, ForecastFollowsMajority) {
    IndicatorSignals signals;
    signals.rsi = SignalTag::BULLISH;
    signals.macd = SignalTag::BULLISH;
    signals.stochastic = SignalTag::BEARISH;
    EXPECT_EQ(classifier.determine_forecast(signals), SignalTag::BULLISH);
}

TEST_F(IndicatorClassifierTest, ForecastTieIsNeutral) {
    IndicatorSignals signals;
    signals.rsi = SignalTag::BULLISH;
    signals.macd = SignalTag::BEARISH;
    EXPECT_EQ(classifier.determine_forecast(signals), SignalTag::NEUTRAL);
}

// ===========================================================================
// 3. Short history
// ===========================================================================

TEST_F(IndicatorClassifierTest, ShortSeriesUsesNeutralReadings) {
    IndicatorReport report = classifier.analyze(test_helpers::make_linear_series(3, 100.0, 1.0));

    EXPECT_DOUBLE_EQ(report.values.rsi, 50.0);
    EXPECT_DOUBLE_EQ(report.values.macd_line, 0.0);
    EXPECT_DOUBLE_EQ(report.values.stochastic_k, 50.0);
    EXPECT_DOUBLE_EQ(report.values.williams_r, -50.0);
    EXPECT_DOUBLE_EQ(report.values.rate_of_change, 0.0);

    EXPECT_EQ(report.forecast, SignalTag::NEUTRAL);
    EXPECT_EQ(report.neutral_count, 5);
    EXPECT_EQ(report.evidence, "Mixed signals with no clear direction");
    EXPECT_EQ(report.trigger, "No clear trigger identified");
}

// ===========================================================================
// 4. Rising series
// ===========================================================================

TEST_F(IndicatorClassifierTest, RisingSeriesReadsOverbought) {
    // 30 bars is below the 34 the MACD needs, so MACD stays neutral
    IndicatorReport report = classifier.analyze(test_helpers::make_linear_series(30, 100.0, 1.0));

    EXPECT_DOUBLE_EQ(report.values.rsi, 100.0);
    EXPECT_EQ(report.signals.rsi, SignalTag::BEARISH);
    EXPECT_EQ(report.signals.macd, SignalTag::NEUTRAL);
    EXPECT_EQ(report.signals.rate_of_change, SignalTag::BULLISH);
    EXPECT_EQ(report.signals.stochastic, SignalTag::BEARISH);
    EXPECT_EQ(report.signals.williams_r, SignalTag::BEARISH);

    EXPECT_EQ(report.bullish_count, 1);
    EXPECT_EQ(report.bearish_count, 3);
    EXPECT_EQ(report.neutral_count, 1);
    EXPECT_EQ(report.forecast, SignalTag::BEARISH);
}

TEST_F(IndicatorClassifierTest, RisingSeriesEvidenceAndTrigger) {
    IndicatorReport report = classifier.analyze(test_helpers::make_linear_series(30, 100.0, 1.0));

    EXPECT_EQ(report.evidence.rfind("RSI: Bearish (100.00); ROC: Bullish (8.40)", 0), 0u);
    EXPECT_EQ(report.trigger, "RSI bearish condition");
    EXPECT_NE(report.summary.find("Signal Distribution: 1 Bullish, 3 Bearish, 1 Neutral"), std::string::npos);
}

TEST_F(IndicatorClassifierTest, LongerRisingSeriesHasBullishMacdCrossover) {
    IndicatorReport report = classifier.analyze(test_helpers::make_linear_series(40, 100.0, 1.0));

    EXPECT_GT(report.values.macd_line, report.values.macd_signal);
    EXPECT_GT(report.values.macd_histogram, 0.0);
    EXPECT_EQ(report.signals.macd, SignalTag::BULLISH);
    EXPECT_EQ(report.trigger, "RSI bearish condition; MACD bullish crossover");
}

TEST_F(IndicatorClassifierTest, FlatRangeFallsBackToMidReadings) {
    PriceSeries bars;
    for (int bar_index = 0; bar_index < 20; ++bar_index) {
        bars.push_back(test_helpers::make_bar(100.0, 100.0, 100.0, 100.0, 1000.0, bar_index));
    }
    IndicatorValues values = classifier.compute_indicator_values(bars);

    EXPECT_DOUBLE_EQ(values.stochastic_k, 50.0);
    EXPECT_DOUBLE_EQ(values.williams_r, -50.0);
    EXPECT_DOUBLE_EQ(values.rsi, 50.0);
}

// ===========================================================================
// 5. Indicator primitives
// ===========================================================================

TEST(IndicatorPrimitivesTest, LinearFitOfFlatValuesHasZeroFit) {
    LinearFitResult fit_result = fit_linear_trend({5.0, 5.0, 5.0, 5.0});
    EXPECT_DOUBLE_EQ(fit_result.slope, 0.0);
    EXPECT_DOUBLE_EQ(fit_result.r_squared, 0.0);
}

TEST(IndicatorPrimitivesTest, PercentageChangeNeedsPeriodPlusOneValues) {
    EXPECT_DOUBLE_EQ(calculate_percentage_change({100.0, 110.0}, 2), 0.0);
    EXPECT_NEAR(calculate_percentage_change({100.0, 105.0, 110.0}, 2), 10.0, 1e-9);
}

TEST(IndicatorPrimitivesTest, FallingSeriesRsiIsZero) {
    EXPECT_DOUBLE_EQ(calculate_rsi({20.0, 19.0, 18.0, 17.0, 16.0}, 3), 0.0);
}

TEST(IndicatorPrimitivesTest, EmaIsSeededWithFirstValue) {
    std::vector<double> ema_values = calculate_ema_series({10.0, 20.0}, 3);
    ASSERT_EQ(ema_values.size(), 2u);
    EXPECT_DOUBLE_EQ(ema_values[0], 10.0);
    EXPECT_DOUBLE_EQ(ema_values[1], 15.0);
}
