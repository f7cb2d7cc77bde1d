#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace QuantSignal {
namespace Core {

std::vector<double> extract_closes(const PriceSeries& bars) {
    std::vector<double> close_values;
    close_values.reserve(bars.size());
    for (const Bar& bar : bars) {
        close_values.push_back(bar.close_price);
    }
    return close_values;
}

std::vector<double> extract_volumes(const PriceSeries& bars) {
    std::vector<double> volume_values;
    volume_values.reserve(bars.size());
    for (const Bar& bar : bars) {
        volume_values.push_back(bar.volume);
    }
    return volume_values;
}

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum_value = 0.0;
    for (double value : values) {
        sum_value += value;
    }
    return sum_value / static_cast<double>(values.size());
}

double calculate_sample_standard_deviation(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    double mean_value = calculate_mean(values);
    double squared_deviation_sum = 0.0;
    for (double value : values) {
        squared_deviation_sum += (value - mean_value) * (value - mean_value);
    }
    return std::sqrt(squared_deviation_sum / static_cast<double>(values.size() - 1));
}

LinearFitResult fit_linear_trend(const std::vector<double>& values) {
    LinearFitResult fit_result;
    const size_t value_count = values.size();
    if (value_count < 2) {
        return fit_result;
    }

    const double index_mean = (static_cast<double>(value_count) - 1.0) / 2.0;
    const double value_mean = calculate_mean(values);

    double index_variance_sum = 0.0;
    double value_variance_sum = 0.0;
    double covariance_sum = 0.0;
    for (size_t value_index = 0; value_index < value_count; ++value_index) {
        double index_deviation = static_cast<double>(value_index) - index_mean;
        double value_deviation = values[value_index] - value_mean;
        index_variance_sum += index_deviation * index_deviation;
        value_variance_sum += value_deviation * value_deviation;
        covariance_sum += index_deviation * value_deviation;
    }

    if (index_variance_sum <= 0.0) {
        return fit_result;
    }
    fit_result.slope = covariance_sum / index_variance_sum;

    // Flat input has no explainable variance
    if (value_variance_sum <= 0.0) {
        fit_result.r_squared = 0.0;
        return fit_result;
    }
    double r_squared_value = (covariance_sum * covariance_sum) / (index_variance_sum * value_variance_sum);
    fit_result.r_squared = std::max(0.0, std::min(1.0, r_squared_value));
    return fit_result;
}

double calculate_percentage_change(const std::vector<double>& values, int period) {
    if (period < 1 || static_cast<int>(values.size()) < period + 1) {
        return 0.0;
    }
    double base_value = values[values.size() - 1 - static_cast<size_t>(period)];
    if (base_value == 0.0) {
        return 0.0;
    }
    return (values.back() - base_value) / base_value * 100.0;
}

std::vector<double> calculate_ema_series(const std::vector<double>& values, int period) {
    std::vector<double> ema_values;
    if (values.empty() || period < 1) {
        return ema_values;
    }
    const double smoothing_factor = 2.0 / (static_cast<double>(period) + 1.0);
    ema_values.reserve(values.size());
    ema_values.push_back(values.front());
    for (size_t value_index = 1; value_index < values.size(); ++value_index) {
        ema_values.push_back(smoothing_factor * values[value_index] + (1.0 - smoothing_factor) * ema_values.back());
    }
    return ema_values;
}

double calculate_rsi(const std::vector<double>& closes, int period) {
    if (period < 1 || static_cast<int>(closes.size()) < period + 1) {
        return 50.0;
    }

    // Wilder smoothing (alpha = 1 / period) over gains and losses
    const double smoothing_factor = 1.0 / static_cast<double>(period);
    double average_gain = 0.0;
    double average_loss = 0.0;
    for (size_t close_index = 1; close_index < closes.size(); ++close_index) {
        double price_change = closes[close_index] - closes[close_index - 1];
        double gain_value = price_change > 0.0 ? price_change : 0.0;
        double loss_value = price_change < 0.0 ? -price_change : 0.0;
        average_gain = (1.0 - smoothing_factor) * average_gain + smoothing_factor * gain_value;
        average_loss = (1.0 - smoothing_factor) * average_loss + smoothing_factor * loss_value;
    }

    if (average_gain == 0.0 && average_loss == 0.0) {
        return 50.0;
    }
    if (average_loss == 0.0) {
        return 100.0;
    }
    double relative_strength = average_gain / average_loss;
    return 100.0 - (100.0 / (1.0 + relative_strength));
}

MacdValues calculate_macd(const std::vector<double>& closes, int fast_period, int slow_period, int signal_period) {
    MacdValues macd_values;
    if (fast_period < 1 || slow_period <= fast_period || signal_period < 1) {
        return macd_values;
    }
    if (static_cast<int>(closes.size()) < slow_period + signal_period - 1) {
        return macd_values;
    }

    std::vector<double> fast_ema = calculate_ema_series(closes, fast_period);
    std::vector<double> slow_ema = calculate_ema_series(closes, slow_period);

    // MACD line becomes meaningful once the slow EMA has a full window
    std::vector<double> macd_line_values;
    for (size_t close_index = static_cast<size_t>(slow_period - 1); close_index < closes.size(); ++close_index) {
        macd_line_values.push_back(fast_ema[close_index] - slow_ema[close_index]);
    }

    std::vector<double> signal_values = calculate_ema_series(macd_line_values, signal_period);
    macd_values.macd_line = macd_line_values.back();
    macd_values.signal_line = signal_values.back();
    macd_values.histogram = macd_values.macd_line - macd_values.signal_line;
    return macd_values;
}

double calculate_rate_of_change(const std::vector<double>& closes, int period) {
    return calculate_percentage_change(closes, period);
}

StochasticValues calculate_stochastic(const PriceSeries& bars, int period, int smoothing_period) {
    StochasticValues stochastic_values;
    if (period < 1 || smoothing_period < 1 || static_cast<int>(bars.size()) < period) {
        return stochastic_values;
    }

    std::vector<double> percent_k_values;
    for (size_t end_index = static_cast<size_t>(period - 1); end_index < bars.size(); ++end_index) {
        double highest_high = bars[end_index].high_price;
        double lowest_low = bars[end_index].low_price;
        for (size_t window_index = end_index + 1 - static_cast<size_t>(period); window_index <= end_index; ++window_index) {
            highest_high = std::max(highest_high, bars[window_index].high_price);
            lowest_low = std::min(lowest_low, bars[window_index].low_price);
        }
        double price_range = highest_high - lowest_low;
        double percent_k = price_range > 0.0 ? 100.0 * (bars[end_index].close_price - lowest_low) / price_range : 50.0;
        percent_k_values.push_back(percent_k);
    }

    stochastic_values.percent_k = percent_k_values.back();
    if (static_cast<int>(percent_k_values.size()) >= smoothing_period) {
        std::vector<double> smoothing_window(percent_k_values.end() - smoothing_period, percent_k_values.end());
        stochastic_values.percent_d = calculate_mean(smoothing_window);
    } else {
        stochastic_values.percent_d = stochastic_values.percent_k;
    }
    return stochastic_values;
}

double calculate_williams_r(const PriceSeries& bars, int period) {
    if (period < 1 || static_cast<int>(bars.size()) < period) {
        return -50.0;
    }
    double highest_high = bars.back().high_price;
    double lowest_low = bars.back().low_price;
    for (size_t bar_index = bars.size() - static_cast<size_t>(period); bar_index < bars.size(); ++bar_index) {
        highest_high = std::max(highest_high, bars[bar_index].high_price);
        lowest_low = std::min(lowest_low, bars[bar_index].low_price);
    }
    double price_range = highest_high - lowest_low;
    if (price_range <= 0.0) {
        return -50.0;
    }
    return -100.0 * (highest_high - bars.back().close_price) / price_range;
}

DirectionalMovementResult calculate_directional_movement_index(const PriceSeries& bars, int period) {
    DirectionalMovementResult movement_result;
    if (period < 1 || static_cast<int>(bars.size()) < period) {
        return movement_result;
    }

    const size_t bar_count = bars.size();
    std::vector<double> true_range_values(bar_count, 0.0);
    std::vector<double> plus_movement_values(bar_count, 0.0);
    std::vector<double> minus_movement_values(bar_count, 0.0);

    // First bar has no previous close: range only, no directional movement
    true_range_values[0] = bars[0].high_price - bars[0].low_price;
    for (size_t bar_index = 1; bar_index < bar_count; ++bar_index) {
        const Bar& current_bar = bars[bar_index];
        const Bar& previous_bar = bars[bar_index - 1];
        true_range_values[bar_index] = std::max({current_bar.high_price - current_bar.low_price,
                                                 std::abs(current_bar.high_price - previous_bar.close_price),
                                                 std::abs(current_bar.low_price - previous_bar.close_price)});

        double up_move = current_bar.high_price - previous_bar.high_price;
        double down_move = previous_bar.low_price - current_bar.low_price;
        plus_movement_values[bar_index] = (up_move > down_move && up_move > 0.0) ? up_move : 0.0;
        minus_movement_values[bar_index] = (down_move > up_move && down_move > 0.0) ? down_move : 0.0;
    }

    std::vector<double> directional_index_values;
    const size_t window_length = static_cast<size_t>(period);
    for (size_t end_index = window_length - 1; end_index < bar_count; ++end_index) {
        double true_range_sum = 0.0;
        double plus_movement_sum = 0.0;
        double minus_movement_sum = 0.0;
        for (size_t window_index = end_index + 1 - window_length; window_index <= end_index; ++window_index) {
            true_range_sum += true_range_values[window_index];
            plus_movement_sum += plus_movement_values[window_index];
            minus_movement_sum += minus_movement_values[window_index];
        }

        // Window means share the divisor, so the ratios use the sums directly
        double plus_directional_indicator = true_range_sum > 0.0 ? 100.0 * plus_movement_sum / true_range_sum : 0.0;
        double minus_directional_indicator = true_range_sum > 0.0 ? 100.0 * minus_movement_sum / true_range_sum : 0.0;
        double indicator_sum = plus_directional_indicator + minus_directional_indicator;
        double directional_index = indicator_sum > 0.0
            ? 100.0 * std::abs(plus_directional_indicator - minus_directional_indicator) / indicator_sum
            : 0.0;
        directional_index_values.push_back(directional_index);
    }

    size_t samples_to_average = std::min(window_length, directional_index_values.size());
    std::vector<double> averaging_window(directional_index_values.end() - static_cast<std::ptrdiff_t>(samples_to_average),
                                         directional_index_values.end());
    movement_result.average_directional_index = calculate_mean(averaging_window);
    movement_result.directional_index_samples = static_cast<int>(samples_to_average);
    return movement_result;
}

} // namespace Core
} // namespace QuantSignal
