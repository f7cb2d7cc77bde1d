#ifndef SERIES_VALIDATOR_HPP
#define SERIES_VALIDATOR_HPP

#include <cstddef>
#include <string>
#include "analysis/data_structures/data_structures.hpp"

namespace QuantSignal {
namespace Core {

// Entry check for the analyzers: they assume every bar passed here.
class SeriesValidator {
public:
    explicit SeriesValidator(int minimum_bars_required);

    bool validate_price_series(const std::string& symbol, const PriceSeries& bars, std::string& error_message) const;
    bool validate_bar(const Bar& bar, size_t bar_index, std::string& error_message) const;

private:
    int minimum_bars;
};

} // namespace Core
} // namespace QuantSignal

#endif // SERIES_VALIDATOR_HPP
