#include "format_utils.hpp"
#include <sstream>
#include <iomanip>

namespace FormatUtils {

std::string format_fixed(double value, int precision) {
    std::ostringstream value_stream;
    value_stream << std::fixed << std::setprecision(precision) << value;
    return value_stream.str();
}

std::string format_signed(double value, int precision) {
    std::string formatted_value = format_fixed(value, precision);
    if (value > 0.0) {
        return "+" + formatted_value;
    }
    return formatted_value;
}

std::string format_percentage(double percentage_value, int precision) {
    return format_fixed(percentage_value, precision) + "%";
}

std::string truncate_utf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t cut_position = max_bytes;
    while (cut_position > 0 && (static_cast<unsigned char>(text[cut_position]) & 0xC0) == 0x80) {
        --cut_position;
    }
    return text.substr(0, cut_position);
}

} // namespace FormatUtils
