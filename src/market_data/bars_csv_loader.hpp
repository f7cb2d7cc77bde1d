#ifndef BARS_CSV_LOADER_HPP
#define BARS_CSV_LOADER_HPP

#include <iosfwd>
#include <string>
#include "analysis/data_structures/data_structures.hpp"

namespace QuantSignal {
namespace Core {

/**
 * Reads bars from a CSV file with the header
 *   timestamp,open,high,low,close,volume
 * (column order taken from the header, names case-insensitive).
 * Blank lines are skipped. Any malformed row throws std::runtime_error
 * naming the line number.
 */
PriceSeries load_bars_from_csv(const std::string& file_path);

// Same parsing over an already opened stream (file_label only used in messages)
PriceSeries parse_bars_csv(std::istream& input_stream, const std::string& file_label);

} // namespace Core
} // namespace QuantSignal

#endif // BARS_CSV_LOADER_HPP
