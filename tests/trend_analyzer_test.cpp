// trend_analyzer_test.cpp - Tests for TrendAnalyzer
//
// Covers the per-timeframe line fit, momentum, ADX-style strength, breakout
// detection, the weighted direction vote and the confidence breakdown.

#include <gtest/gtest.h>

#include "analysis/trend_analyzer/trend_analyzer.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <limits>
#include <random>

using namespace QuantSignal::Core;
using QuantSignal::Config::TrendAnalysisConfig;

// ===========================================================================
// Fixture
// ===========================================================================
class TrendAnalyzerTest : public ::testing::Test {
protected:
    TrendAnalysisConfig config;
    TrendAnalyzer analyzer{config};
};

// ===========================================================================
// 1. Short input
// ===========================================================================

TEST_F(TrendAnalyzerTest, FewerThanThreeBarsIsInsufficient) {
    for (int bar_count = 0; bar_count < 3; ++bar_count) {
        PriceSeries bars = test_helpers::make_linear_series(bar_count, 100.0, 1.0);
        TrendReport report = analyzer.analyze(bars);

        EXPECT_EQ(report.short_term.direction, TrendDirection::INSUFFICIENT_DATA) << bar_count << " bars";
        EXPECT_EQ(report.medium_term.direction, TrendDirection::INSUFFICIENT_DATA) << bar_count << " bars";
        EXPECT_EQ(report.long_term.direction, TrendDirection::INSUFFICIENT_DATA) << bar_count << " bars";
        EXPECT_DOUBLE_EQ(report.short_term.slope, 0.0);
        EXPECT_DOUBLE_EQ(report.long_term.fit_quality, 0.0);
        EXPECT_EQ(report.strength.classification, TrendStrengthClass::INSUFFICIENT_DATA);
        EXPECT_EQ(report.breakout.status, BreakoutStatus::INSUFFICIENT_DATA);
        EXPECT_EQ(report.overall_direction, TrendDirection::NEUTRAL);
        EXPECT_GE(report.confidence, 0.0);
        EXPECT_LE(report.confidence, 1.0);
    }
}

TEST_F(TrendAnalyzerTest, ThreeBarsAreEnoughForALineFit) {
    TrendReading reading = analyzer.compute_trend(test_helpers::make_linear_series(3, 100.0, 1.0));
    EXPECT_EQ(reading.direction, TrendDirection::BULLISH);
    EXPECT_NEAR(reading.slope, 1.0, 1e-9);
    EXPECT_NEAR(reading.fit_quality, 1.0, 1e-9);
    EXPECT_EQ(reading.strength_label, FitStrengthLabel::STRONG);
}

TEST_F(TrendAnalyzerTest, StrengthNeedsTwentyBars) {
    TrendStrength strength = analyzer.calculate_trend_strength(test_helpers::make_linear_series(19, 100.0, 1.0));
    EXPECT_EQ(strength.classification, TrendStrengthClass::INSUFFICIENT_DATA);
    EXPECT_DOUBLE_EQ(strength.score, 0.0);
}

TEST_F(TrendAnalyzerTest, VolumeMomentumNeedsTenBars) {
    VolumeMomentumReading reading = analyzer.calculate_volume_momentum(test_helpers::make_linear_series(9, 100.0, 1.0));
    EXPECT_EQ(reading.trend, VolumeTrend::INSUFFICIENT_DATA);
    EXPECT_DOUBLE_EQ(reading.ratio, 1.0);
}

// ===========================================================================
// 2. Monotonic rising series (30 bars, close = 100 + i)
// ===========================================================================

TEST_F(TrendAnalyzerTest, RisingSeriesAllTimeframesBullish) {
    TrendReport report = analyzer.analyze(test_helpers::make_linear_series(30, 100.0, 1.0));

    EXPECT_EQ(report.short_term.direction, TrendDirection::BULLISH);
    EXPECT_EQ(report.medium_term.direction, TrendDirection::BULLISH);
    EXPECT_EQ(report.long_term.direction, TrendDirection::BULLISH);
    EXPECT_EQ(report.long_term.strength_label, FitStrengthLabel::STRONG);
    EXPECT_NEAR(report.long_term.slope, 1.0, 1e-9);
    EXPECT_EQ(report.overall_direction, TrendDirection::BULLISH);
}

TEST_F(TrendAnalyzerTest, RisingSeriesMomentumReadings) {
    TrendReport report = analyzer.analyze(test_helpers::make_linear_series(30, 100.0, 1.0));

    // 129 vs 128 and 129 vs 124
    EXPECT_NEAR(report.momentum.price.one_bar_percentage, 100.0 / 128.0, 1e-9);
    EXPECT_NEAR(report.momentum.price.five_bar_percentage, 500.0 / 124.0, 1e-9);
    EXPECT_NEAR(report.momentum.price.ten_bar_percentage, 1000.0 / 119.0, 1e-9);
    EXPECT_EQ(report.momentum.price.label, MomentumLabel::MODERATE_BULLISH);
    EXPECT_EQ(report.momentum.volume.trend, VolumeTrend::STABLE);
    EXPECT_EQ(report.momentum.acceleration.label, AccelerationLabel::CONSTANT_VELOCITY);
}

TEST_F(TrendAnalyzerTest, RisingSeriesStrengthIsVeryStrong) {
    TrendReport report = analyzer.analyze(test_helpers::make_linear_series(30, 100.0, 1.0));
    EXPECT_NEAR(report.strength.score, 100.0, 1e-9);
    EXPECT_EQ(report.strength.classification, TrendStrengthClass::VERY_STRONG);
}

TEST_F(TrendAnalyzerTest, RisingSeriesConfidenceBreakdown) {
    TrendReport report = analyzer.analyze(test_helpers::make_linear_series(30, 100.0, 1.0));

    double momentum_gap = 500.0 / 124.0 - 100.0 / 128.0;
    double expected_consistency = (1.0 - momentum_gap / 10.0) * 0.3;

    EXPECT_DOUBLE_EQ(report.confidence_breakdown.agreement, 0.4);
    EXPECT_NEAR(report.confidence_breakdown.strength_contribution, 0.3, 1e-9);
    EXPECT_NEAR(report.confidence_breakdown.momentum_consistency, expected_consistency, 1e-9);
    EXPECT_NEAR(report.confidence, 0.9025, 1e-3);
    EXPECT_DOUBLE_EQ(report.confidence, report.confidence_breakdown.total);
}

TEST_F(TrendAnalyzerTest, FallingSeriesAgreementIsFull) {
    TrendReport report = analyzer.analyze(test_helpers::make_linear_series(30, 200.0, -1.0));

    EXPECT_EQ(report.short_term.direction, TrendDirection::BEARISH);
    EXPECT_EQ(report.medium_term.direction, TrendDirection::BEARISH);
    EXPECT_EQ(report.long_term.direction, TrendDirection::BEARISH);
    EXPECT_DOUBLE_EQ(report.confidence_breakdown.agreement, 0.4);
    EXPECT_EQ(report.overall_direction, TrendDirection::BEARISH);
}

// ===========================================================================
// 3. Flat series
// ===========================================================================

TEST_F(TrendAnalyzerTest, FlatSeriesIsNeutralAndWeak) {
    TrendReport report = analyzer.analyze(test_helpers::make_flat_series(30, 50.0));

    EXPECT_EQ(report.long_term.direction, TrendDirection::NEUTRAL);
    EXPECT_DOUBLE_EQ(report.long_term.slope, 0.0);
    EXPECT_DOUBLE_EQ(report.long_term.fit_quality, 0.0);
    EXPECT_EQ(report.long_term.strength_label, FitStrengthLabel::WEAK);
    EXPECT_DOUBLE_EQ(report.strength.score, 0.0);
    EXPECT_EQ(report.strength.classification, TrendStrengthClass::WEAK);
    EXPECT_EQ(report.breakout.status, BreakoutStatus::NONE);
    EXPECT_EQ(report.overall_direction, TrendDirection::NEUTRAL);
}

// ===========================================================================
// 4. Breakout
// ===========================================================================

TEST_F(TrendAnalyzerTest, CloseAboveRangeIsResistanceBreakout) {
    BreakoutState state = analyzer.analyze_breakout(test_helpers::make_range_then_close_series(105.2));

    EXPECT_EQ(state.status, BreakoutStatus::RESISTANCE_BREAKOUT);
    EXPECT_DOUBLE_EQ(state.resistance_level, 105.0);
    EXPECT_DOUBLE_EQ(state.support_level, 95.0);
    EXPECT_NEAR(state.strength_percentage, 0.2 / 105.0 * 100.0, 1e-9);
    EXPECT_NEAR(state.strength_percentage, 0.19, 0.001);
}

TEST_F(TrendAnalyzerTest, CloseBelowRangeIsSupportBreakdown) {
    BreakoutState state = analyzer.analyze_breakout(test_helpers::make_range_then_close_series(94.5));

    EXPECT_EQ(state.status, BreakoutStatus::SUPPORT_BREAKDOWN);
    EXPECT_NEAR(state.strength_percentage, 0.5 / 95.0 * 100.0, 1e-9);
}

TEST_F(TrendAnalyzerTest, CloseInsideBufferIsNotABreakout) {
    // 105.1 < 105 * 1.001
    BreakoutState state = analyzer.analyze_breakout(test_helpers::make_range_then_close_series(105.1));

    EXPECT_EQ(state.status, BreakoutStatus::NONE);
    EXPECT_DOUBLE_EQ(state.strength_percentage, 0.0);
}

TEST_F(TrendAnalyzerTest, BreakoutShowsInSummary) {
    TrendReport report = analyzer.analyze(test_helpers::make_range_then_close_series(105.2));
    EXPECT_NE(report.summary.find("- Breakout status: Resistance Breakout (Strength: 0.19%)"), std::string::npos);
}

// ===========================================================================
// 5. Momentum classification and volume
// ===========================================================================

TEST_F(TrendAnalyzerTest, MomentumLabelBands) {
    EXPECT_EQ(analyzer.classify_momentum(6.0), MomentumLabel::STRONG_BULLISH);
    EXPECT_EQ(analyzer.classify_momentum(-6.0), MomentumLabel::STRONG_BEARISH);
    EXPECT_EQ(analyzer.classify_momentum(3.0), MomentumLabel::MODERATE_BULLISH);
    EXPECT_EQ(analyzer.classify_momentum(-3.0), MomentumLabel::MODERATE_BEARISH);
    EXPECT_EQ(analyzer.classify_momentum(1.0), MomentumLabel::WEAK);
    EXPECT_EQ(analyzer.classify_momentum(2.0), MomentumLabel::WEAK);
}

TEST_F(TrendAnalyzerTest, RecentVolumeSurgeIsIncreasing) {
    PriceSeries bars = test_helpers::make_flat_series(15, 100.0, 1000.0);
    for (size_t bar_index = 10; bar_index < bars.size(); ++bar_index) {
        bars[bar_index].volume = 3000.0;
    }

    VolumeMomentumReading reading = analyzer.calculate_volume_momentum(bars);
    EXPECT_NEAR(reading.ratio, 3.0, 1e-9);
    EXPECT_EQ(reading.trend, VolumeTrend::INCREASING);
}

TEST_F(TrendAnalyzerTest, RecentVolumeDropIsDecreasing) {
    PriceSeries bars = test_helpers::make_flat_series(15, 100.0, 1000.0);
    for (size_t bar_index = 10; bar_index < bars.size(); ++bar_index) {
        bars[bar_index].volume = 500.0;
    }
    EXPECT_EQ(analyzer.calculate_volume_momentum(bars).trend, VolumeTrend::DECREASING);
}

TEST_F(TrendAnalyzerTest, AccelerationFollowsTheLastTwoChanges) {
    PriceSeries bars = test_helpers::make_linear_series(3, 100.0, 1.0);
    bars[2].close_price = 104.0;
    AccelerationReading reading = analyzer.calculate_acceleration(bars);
    EXPECT_DOUBLE_EQ(reading.value, 2.0);
    EXPECT_EQ(reading.label, AccelerationLabel::ACCELERATING_UP);
}

// ===========================================================================
// 6. Direction vote
// ===========================================================================

TEST_F(TrendAnalyzerTest, ShortTimeframeOutweighsOpposingMomentum) {
    TrendReport report;
    report.short_term.direction = TrendDirection::BULLISH;
    report.medium_term.direction = TrendDirection::NEUTRAL;
    report.long_term.direction = TrendDirection::NEUTRAL;
    report.momentum.price.label = MomentumLabel::STRONG_BEARISH;

    EXPECT_EQ(analyzer.determine_overall_direction(report), TrendDirection::BULLISH);
}

TEST_F(TrendAnalyzerTest, MomentumBonusBreaksTheTie) {
    TrendReport report;
    report.short_term.direction = TrendDirection::NEUTRAL;
    report.medium_term.direction = TrendDirection::NEUTRAL;
    report.long_term.direction = TrendDirection::INSUFFICIENT_DATA;
    report.momentum.price.label = MomentumLabel::MODERATE_BEARISH;

    EXPECT_EQ(analyzer.determine_overall_direction(report), TrendDirection::BEARISH);
}

TEST_F(TrendAnalyzerTest, NoVotesIsNeutral) {
    TrendReport report;
    report.short_term.direction = TrendDirection::NEUTRAL;
    report.medium_term.direction = TrendDirection::NEUTRAL;
    report.long_term.direction = TrendDirection::NEUTRAL;
    report.momentum.price.label = MomentumLabel::WEAK;

    EXPECT_EQ(analyzer.determine_overall_direction(report), TrendDirection::NEUTRAL);
}

// ===========================================================================
// 7. Confidence bounds
// ===========================================================================

TEST_F(TrendAnalyzerTest, ThreeDistinctDirectionsGiveNoAgreement) {
    TrendReport report;
    report.short_term.direction = TrendDirection::BULLISH;
    report.medium_term.direction = TrendDirection::BEARISH;
    report.long_term.direction = TrendDirection::NEUTRAL;

    EXPECT_DOUBLE_EQ(analyzer.calculate_confidence(report).agreement, 0.0);
}

TEST_F(TrendAnalyzerTest, StrengthContributionIsCapped) {
    TrendReport report;
    report.strength.score = 1.0e6;
    ConfidenceBreakdown breakdown = analyzer.calculate_confidence(report);

    EXPECT_DOUBLE_EQ(breakdown.strength_contribution, 0.3);
    EXPECT_LE(breakdown.total, 1.0);
}

TEST_F(TrendAnalyzerTest, NonFiniteMomentumDoesNotLeakIntoConfidence) {
    TrendReport report;
    report.momentum.price.one_bar_percentage = std::numeric_limits<double>::quiet_NaN();
    ConfidenceBreakdown breakdown = analyzer.calculate_confidence(report);

    EXPECT_TRUE(std::isfinite(breakdown.total));
    EXPECT_GE(breakdown.total, 0.0);
    EXPECT_LE(breakdown.total, 1.0);
}

TEST_F(TrendAnalyzerTest, ConfidenceStaysInUnitIntervalForRandomSeries) {
    std::mt19937 generator(42);
    std::uniform_real_distribution<double> price_distribution(0.5, 1000.0);
    std::uniform_int_distribution<int> length_distribution(0, 60);

    for (int series_index = 0; series_index < 100; ++series_index) {
        int bar_count = length_distribution(generator);
        PriceSeries bars;
        for (int bar_index = 0; bar_index < bar_count; ++bar_index) {
            double close_price = price_distribution(generator);
            bars.push_back(test_helpers::make_bar(close_price, close_price * 1.05, close_price * 0.95,
                                                  close_price, price_distribution(generator), bar_index));
        }

        TrendReport report = analyzer.analyze(bars);
        EXPECT_GE(report.confidence, 0.0) << "series " << series_index;
        EXPECT_LE(report.confidence, 1.0) << "series " << series_index;
    }
}

// ===========================================================================
// 8. Purity
// ===========================================================================

TEST_F(TrendAnalyzerTest, SameSeriesGivesSameReport) {
    PriceSeries bars = test_helpers::make_range_then_close_series(105.2);
    TrendReport first_report = analyzer.analyze(bars);
    TrendReport second_report = analyzer.analyze(bars);

    EXPECT_EQ(first_report.overall_direction, second_report.overall_direction);
    EXPECT_DOUBLE_EQ(first_report.confidence, second_report.confidence);
    EXPECT_DOUBLE_EQ(first_report.short_term.slope, second_report.short_term.slope);
    EXPECT_DOUBLE_EQ(first_report.strength.score, second_report.strength.score);
    EXPECT_EQ(first_report.breakout.status, second_report.breakout.status);
    EXPECT_EQ(first_report.summary, second_report.summary);
}

TEST_F(TrendAnalyzerTest, RecentWindowTakesTheTail) {
    PriceSeries bars = test_helpers::make_linear_series(30, 100.0, 1.0);
    PriceSeries window = TrendAnalyzer::select_recent_window(bars, 10);

    ASSERT_EQ(window.size(), 10u);
    EXPECT_DOUBLE_EQ(window.front().close_price, 120.0);
    EXPECT_EQ(TrendAnalyzer::select_recent_window(bars, 50).size(), 30u);
}
