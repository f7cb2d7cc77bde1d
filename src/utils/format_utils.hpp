#ifndef FORMAT_UTILS_HPP
#define FORMAT_UTILS_HPP

#include <cstddef>
#include <string>

namespace FormatUtils {

// Fixed-point rendering, e.g. format_fixed(0.19047, 2) -> "0.19"
std::string format_fixed(double value, int precision);

// Same as format_fixed with a leading '+' for positive values
std::string format_signed(double value, int precision);

std::string format_percentage(double percentage_value, int precision);

// First max_bytes bytes of text, shortened so a UTF-8 sequence is never split
std::string truncate_utf8(const std::string& text, size_t max_bytes);

} // namespace FormatUtils

#endif // FORMAT_UTILS_HPP
