#include "indicator_classifier.hpp"
#include "analysis/indicators/indicators.hpp"
#include "utils/format_utils.hpp"
#include <vector>
#include <utility>

namespace QuantSignal {
namespace Core {

using FormatUtils::format_fixed;

namespace {

void count_signal(SignalTag tag, int& bullish_count, int& bearish_count, int& neutral_count) {
    if (tag == SignalTag::BULLISH) {
        ++bullish_count;
    } else if (tag == SignalTag::BEARISH) {
        ++bearish_count;
    } else {
        ++neutral_count;
    }
}

std::string to_lower_copy(std::string text) {
    for (char& character : text) {
        if (character >= 'A' && character <= 'Z') {
            character = static_cast<char>(character - 'A' + 'a');
        }
    }
    return text;
}

} // anonymous namespace

IndicatorClassifier::IndicatorClassifier(const Config::IndicatorConfig& indicator_config)
    : config(indicator_config) {}

IndicatorReport IndicatorClassifier::analyze(const PriceSeries& bars) const {
    IndicatorReport report;
    report.values = compute_indicator_values(bars);
    report.signals = classify_signals(report.values);

    count_signal(report.signals.rsi, report.bullish_count, report.bearish_count, report.neutral_count);
    count_signal(report.signals.macd, report.bullish_count, report.bearish_count, report.neutral_count);
    count_signal(report.signals.rate_of_change, report.bullish_count, report.bearish_count, report.neutral_count);
    count_signal(report.signals.stochastic, report.bullish_count, report.bearish_count, report.neutral_count);
    count_signal(report.signals.williams_r, report.bullish_count, report.bearish_count, report.neutral_count);

    report.forecast = determine_forecast(report.signals);
    report.evidence = build_evidence(report.values, report.signals);
    report.trigger = identify_trigger(report.signals);
    report.summary = build_summary(report);
    return report;
}

IndicatorValues IndicatorClassifier::compute_indicator_values(const PriceSeries& bars) const {
    IndicatorValues values;
    std::vector<double> close_values = extract_closes(bars);

    values.rsi = calculate_rsi(close_values, config.rsi_period);

    MacdValues macd_values = calculate_macd(close_values, config.macd_fast_period, config.macd_slow_period, config.macd_signal_period);
    values.macd_line = macd_values.macd_line;
    values.macd_signal = macd_values.signal_line;
    values.macd_histogram = macd_values.histogram;

    values.rate_of_change = calculate_rate_of_change(close_values, config.roc_period);

    StochasticValues stochastic_values = calculate_stochastic(bars, config.stochastic_period, config.stochastic_smoothing_period);
    values.stochastic_k = stochastic_values.percent_k;
    values.stochastic_d = stochastic_values.percent_d;

    values.williams_r = calculate_williams_r(bars, config.williams_r_period);
    return values;
}

IndicatorSignals IndicatorClassifier::classify_signals(const IndicatorValues& values) const {
    IndicatorSignals signals;
    signals.rsi = classify_rsi(values.rsi);
    signals.macd = classify_macd(values.macd_line, values.macd_signal);
    signals.rate_of_change = classify_rate_of_change(values.rate_of_change);
    signals.stochastic = classify_stochastic(values.stochastic_k);
    signals.williams_r = classify_williams_r(values.williams_r);
    return signals;
}

SignalTag IndicatorClassifier::classify_rsi(double rsi_value) const {
    if (rsi_value > config.rsi_overbought_threshold) return SignalTag::BEARISH;
    if (rsi_value < config.rsi_oversold_threshold) return SignalTag::BULLISH;
    return SignalTag::NEUTRAL;
}

SignalTag IndicatorClassifier::classify_macd(double macd_line, double macd_signal) const {
    if (macd_line > macd_signal) return SignalTag::BULLISH;
    if (macd_line < macd_signal) return SignalTag::BEARISH;
    return SignalTag::NEUTRAL;
}

SignalTag IndicatorClassifier::classify_rate_of_change(double rate_of_change_value) const {
    if (rate_of_change_value > config.roc_bullish_threshold) return SignalTag::BULLISH;
    if (rate_of_change_value < config.roc_bearish_threshold) return SignalTag::BEARISH;
    return SignalTag::NEUTRAL;
}

SignalTag IndicatorClassifier::classify_stochastic(double stochastic_k_value) const {
    if (stochastic_k_value > config.stochastic_overbought_threshold) return SignalTag::BEARISH;
    if (stochastic_k_value < config.stochastic_oversold_threshold) return SignalTag::BULLISH;
    return SignalTag::NEUTRAL;
}

SignalTag IndicatorClassifier::classify_williams_r(double williams_r_value) const {
    if (williams_r_value > config.williams_r_overbought_threshold) return SignalTag::BEARISH;
    if (williams_r_value < config.williams_r_oversold_threshold) return SignalTag::BULLISH;
    return SignalTag::NEUTRAL;
}

SignalTag IndicatorClassifier::determine_forecast(const IndicatorSignals& signals) const {
    int bullish_count = 0;
    int bearish_count = 0;
    int neutral_count = 0;
    count_signal(signals.rsi, bullish_count, bearish_count, neutral_count);
    count_signal(signals.macd, bullish_count, bearish_count, neutral_count);
    count_signal(signals.rate_of_change, bullish_count, bearish_count, neutral_count);
    count_signal(signals.stochastic, bullish_count, bearish_count, neutral_count);
    count_signal(signals.williams_r, bullish_count, bearish_count, neutral_count);

    if (bullish_count > bearish_count) return SignalTag::BULLISH;
    if (bearish_count > bullish_count) return SignalTag::BEARISH;
    return SignalTag::NEUTRAL;
}

std::string IndicatorClassifier::build_evidence(const IndicatorValues& values, const IndicatorSignals& signals) const {
    const std::vector<std::pair<std::string, std::pair<SignalTag, double>>> evidence_candidates = {
        {"RSI", {signals.rsi, values.rsi}},
        {"MACD", {signals.macd, values.macd_line}},
        {"ROC", {signals.rate_of_change, values.rate_of_change}},
        {"STOCH", {signals.stochastic, values.stochastic_k}},
        {"WILLR", {signals.williams_r, values.williams_r}}
    };

    std::string evidence_text;
    for (const auto& candidate : evidence_candidates) {
        if (candidate.second.first == SignalTag::NEUTRAL) {
            continue;
        }
        if (!evidence_text.empty()) {
            evidence_text += "; ";
        }
        evidence_text += candidate.first + ": " + signal_tag_to_string(candidate.second.first) +
                         " (" + format_fixed(candidate.second.second, 2) + ")";
    }

    if (evidence_text.empty()) {
        return "Mixed signals with no clear direction";
    }
    return evidence_text;
}

std::string IndicatorClassifier::identify_trigger(const IndicatorSignals& signals) const {
    std::string trigger_text;
    if (signals.rsi != SignalTag::NEUTRAL) {
        trigger_text = "RSI " + to_lower_copy(signal_tag_to_string(signals.rsi)) + " condition";
    }
    if (signals.macd != SignalTag::NEUTRAL) {
        if (!trigger_text.empty()) {
            trigger_text += "; ";
        }
        trigger_text += "MACD " + to_lower_copy(signal_tag_to_string(signals.macd)) + " crossover";
    }
    if (trigger_text.empty()) {
        return "No clear trigger identified";
    }
    return trigger_text;
}

std::string IndicatorClassifier::build_summary(const IndicatorReport& report) const {
    std::string summary_text = "Technical Analysis Summary:\n";
    summary_text += "- RSI (" + format_fixed(report.values.rsi, 2) + "): " + signal_tag_to_string(report.signals.rsi) + "\n";
    summary_text += "- MACD (" + format_fixed(report.values.macd_line, 4) + "): " + signal_tag_to_string(report.signals.macd) + "\n";
    summary_text += "- Rate of Change (" + format_fixed(report.values.rate_of_change, 2) + "%): " + signal_tag_to_string(report.signals.rate_of_change) + "\n";
    summary_text += "- Stochastic (" + format_fixed(report.values.stochastic_k, 2) + "): " + signal_tag_to_string(report.signals.stochastic) + "\n";
    summary_text += "- Williams %R (" + format_fixed(report.values.williams_r, 2) + "): " + signal_tag_to_string(report.signals.williams_r) + "\n\n";
    summary_text += "Signal Distribution: " + std::to_string(report.bullish_count) + " Bullish, " +
                    std::to_string(report.bearish_count) + " Bearish, " +
                    std::to_string(report.neutral_count) + " Neutral";
    return summary_text;
}

} // namespace Core
} // namespace QuantSignal
