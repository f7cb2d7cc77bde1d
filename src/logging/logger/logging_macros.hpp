#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <algorithm>

// Standard indentation levels
#define LOG_INDENT_L0 ""                    // No indentation
#define LOG_INDENT_L1 "        "            // 8 spaces - Main section level
#define LOG_INDENT_L2 "        |   "        // 8 spaces + |   - Content level
#define LOG_INDENT_L3 "        |     "      // 8 spaces + |     - Sub-content level

// Section headers and footers
#define LOG_SECTION_HEADER(title) log_message(LOG_INDENT_L1 "+-- " + std::string(title), "")
#define LOG_SECTION_FOOTER() log_message(LOG_INDENT_L1 "+-- ", "")
#define LOG_SECTION_SEPARATOR() log_message(LOG_INDENT_L2, "")

// Content logging macros
#define LOG_CONTENT(msg) log_message(LOG_INDENT_L2 + std::string(msg), "")
#define LOG_SUBCONTENT(msg) log_message(LOG_INDENT_L3 + std::string(msg), "")

// Specialized macros for common patterns
#define LOG_ANALYSIS_HEADER(symbol) LOG_SECTION_HEADER("ANALYSIS - " + std::string(symbol))
#define LOG_ANALYSIS_COMPLETE(symbol) LOG_SECTION_HEADER("ANALYSIS COMPLETE - " + std::string(symbol))
#define LOG_DECISION_SYNTHESIS_HEADER() LOG_SECTION_HEADER("DECISION SYNTHESIS")
#define LOG_DECISION_FALLBACK_HEADER() LOG_SECTION_HEADER("DECISION FALLBACK - HOLD")

// Startup-specific macros (no indentation for top-level sections)
#define LOG_STARTUP_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_STARTUP_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SEPARATOR() log_message("|", "")

// Run banner (special case - no indentation)
#define LOG_ANALYSIS_RUN_HEADER(symbol) \
    log_message("", ""); \
    log_message("================================================================================", ""); \
    log_message("                          SIGNAL ANALYSIS RUN - " + std::string(symbol), ""); \
    log_message("================================================================================", ""); \
    log_message("", "")

// Comprehensive table formatting macros for structured logging
#define TABLE_HEADER_48(title, subtitle) do { \
    LOG_CONTENT("┌───────────────────┬──────────────────────────────────────────────────┐"); \
    LOG_CONTENT("│ " + std::string(title).substr(0,17) + std::string(17 - std::min(17, (int)std::string(title).length()), ' ') + " │ " + std::string(subtitle).substr(0,48) + std::string(48 - std::min(48, (int)std::string(subtitle).length()), ' ') + " │"); \
    LOG_CONTENT("├───────────────────┼──────────────────────────────────────────────────┤"); \
} while(0)

#define TABLE_ROW_48(label, value) do { \
    std::string label_str = std::string(label).substr(0,17); \
    std::string value_str = std::string(value).substr(0,48); \
    LOG_CONTENT("│ " + label_str + std::string(17 - label_str.length(), ' ') + " │ " + value_str + std::string(48 - value_str.length(), ' ') + " │"); \
} while(0)

#define TABLE_SEPARATOR_48() do { \
    LOG_CONTENT("├───────────────────┼──────────────────────────────────────────────────┤"); \
} while(0)

#define TABLE_FOOTER_48() do { \
    LOG_CONTENT("└───────────────────┴──────────────────────────────────────────────────┘"); \
} while(0)

#endif // LOGGING_MACROS_HPP
