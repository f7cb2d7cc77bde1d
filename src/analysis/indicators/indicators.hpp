#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <vector>
#include "analysis/data_structures/data_structures.hpp"

namespace QuantSignal {
namespace Core {

struct LinearFitResult {
    double slope;
    double r_squared;

    LinearFitResult() : slope(0.0), r_squared(0.0) {}
};

struct MacdValues {
    double macd_line;
    double signal_line;
    double histogram;

    MacdValues() : macd_line(0.0), signal_line(0.0), histogram(0.0) {}
};

struct StochasticValues {
    double percent_k;
    double percent_d;

    StochasticValues() : percent_k(50.0), percent_d(50.0) {}
};

struct DirectionalMovementResult {
    double average_directional_index;
    int directional_index_samples;    // DX values averaged into the result

    DirectionalMovementResult() : average_directional_index(0.0), directional_index_samples(0) {}
};

std::vector<double> extract_closes(const PriceSeries& bars);
std::vector<double> extract_volumes(const PriceSeries& bars);

double calculate_mean(const std::vector<double>& values);
double calculate_sample_standard_deviation(const std::vector<double>& values);

// Ordinary least squares of values against their index (0, 1, 2, ...)
LinearFitResult fit_linear_trend(const std::vector<double>& values);

// Percentage change between the last value and the value period bars earlier; 0 when unavailable
double calculate_percentage_change(const std::vector<double>& values, int period);

// Recursive EMA seeded with the first value, alpha = 2 / (period + 1)
std::vector<double> calculate_ema_series(const std::vector<double>& values, int period);

double calculate_rsi(const std::vector<double>& closes, int period);
MacdValues calculate_macd(const std::vector<double>& closes, int fast_period, int slow_period, int signal_period);
double calculate_rate_of_change(const std::vector<double>& closes, int period);
StochasticValues calculate_stochastic(const PriceSeries& bars, int period, int smoothing_period);
double calculate_williams_r(const PriceSeries& bars, int period);

// ADX style strength: rolling means of true range and directional movement over period bars
DirectionalMovementResult calculate_directional_movement_index(const PriceSeries& bars, int period);

} // namespace Core
} // namespace QuantSignal

#endif // INDICATORS_HPP
