#include "series_validator.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>

namespace QuantSignal {
namespace Core {

SeriesValidator::SeriesValidator(int minimum_bars_required) : minimum_bars(minimum_bars_required) {}

bool SeriesValidator::validate_price_series(const std::string& symbol, const PriceSeries& bars, std::string& error_message) const {
    if (symbol.empty()) {
        error_message = "Symbol is required";
        return false;
    }

    if (static_cast<int>(bars.size()) < minimum_bars) {
        error_message = "Insufficient data for " + symbol + ": " + std::to_string(bars.size()) +
                        " bars, at least " + std::to_string(minimum_bars) + " required";
        return false;
    }

    std::time_t previous_epoch_seconds = 0;
    for (size_t bar_index = 0; bar_index < bars.size(); ++bar_index) {
        if (!validate_bar(bars[bar_index], bar_index, error_message)) {
            return false;
        }

        std::time_t epoch_seconds = 0;
        if (!TimeUtils::parse_timestamp_to_epoch_seconds(bars[bar_index].timestamp, epoch_seconds)) {
            error_message = "Bar " + std::to_string(bar_index) + " has an unparseable timestamp: '" + bars[bar_index].timestamp + "'";
            return false;
        }
        if (bar_index > 0 && epoch_seconds <= previous_epoch_seconds) {
            error_message = "Bars are not strictly time-ordered at index " + std::to_string(bar_index) +
                            " (" + bars[bar_index].timestamp + ")";
            return false;
        }
        previous_epoch_seconds = epoch_seconds;
    }
    return true;
}

bool SeriesValidator::validate_bar(const Bar& bar, size_t bar_index, std::string& error_message) const {
    const std::string bar_label = "Bar " + std::to_string(bar_index);

    if (!std::isfinite(bar.open_price) || !std::isfinite(bar.high_price) || !std::isfinite(bar.low_price) ||
        !std::isfinite(bar.close_price) || !std::isfinite(bar.volume)) {
        error_message = bar_label + " contains NaN or infinite values";
        return false;
    }

    if (bar.open_price <= 0.0 || bar.high_price <= 0.0 || bar.low_price <= 0.0 || bar.close_price <= 0.0) {
        error_message = bar_label + " has a zero or negative price";
        return false;
    }

    // OHLC relationship: high above everything, low below everything
    if (bar.high_price < std::max(bar.open_price, std::max(bar.close_price, bar.low_price)) ||
        bar.low_price > std::min(bar.open_price, bar.close_price)) {
        error_message = bar_label + " violates the OHLC relationship";
        return false;
    }

    if (bar.volume < 0.0) {
        error_message = bar_label + " has negative volume";
        return false;
    }
    return true;
}

} // namespace Core
} // namespace QuantSignal
