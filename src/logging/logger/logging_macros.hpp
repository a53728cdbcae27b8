#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <string>

namespace BeanTrader {
namespace Logging {

constexpr size_t TABLE_LABEL_WIDTH = 17;
constexpr size_t TABLE_VALUE_WIDTH = 30;
constexpr size_t BANNER_WIDTH = 80;

// Truncates or right-pads text to exactly width characters
inline std::string pad_table_cell(const std::string& text, size_t width) {
    if (text.size() >= width) {
        return text.substr(0, width);
    }
    return text + std::string(width - text.size(), ' ');
}

inline std::string format_table_line(const std::string& label, const std::string& value) {
    return "│ " + pad_table_cell(label, TABLE_LABEL_WIDTH) + " │ " + pad_table_cell(value, TABLE_VALUE_WIDTH) + " │";
}

inline std::string center_banner_text(const std::string& text) {
    if (text.size() >= BANNER_WIDTH) {
        return text;
    }
    return std::string((BANNER_WIDTH - text.size()) / 2, ' ') + text;
}

} // namespace Logging
} // namespace BeanTrader

// Section framing for the trading thread
#define LOG_THREAD_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SUBCONTENT(msg) log_message("|     " + std::string(msg), "")
#define LOG_THREAD_SEPARATOR() log_message("|", "")
#define LOG_THREAD_SECTION_FOOTER() log_message("+-- ", "")

#define LOG_THREAD_MARKET_STATE_HEADER() LOG_THREAD_SECTION_HEADER("MARKET STATE")
#define LOG_THREAD_MARKET_SUMMARY_HEADER() LOG_THREAD_SECTION_HEADER("MARKET SUMMARY")
#define LOG_THREAD_DECISION_HEADER() LOG_THREAD_SECTION_HEADER("TRADE DECISION")
#define LOG_THREAD_ORDER_EXECUTION_HEADER() LOG_THREAD_SECTION_HEADER("ORDER EXECUTION")

// Startup output shares the section framing
#define LOG_STARTUP_SECTION_HEADER(title) LOG_THREAD_SECTION_HEADER(title)
#define LOG_STARTUP_CONTENT(msg) LOG_THREAD_CONTENT(msg)
#define LOG_STARTUP_SEPARATOR() LOG_THREAD_SEPARATOR()

#define LOG_BANNER(title) do { \
    log_message("", ""); \
    log_message(std::string(BANNER_WIDTH, '='), ""); \
    log_message(center_banner_text(title), ""); \
    log_message(std::string(BANNER_WIDTH, '='), ""); \
    log_message("", ""); \
} while(0)

#define LOG_TRADING_CYCLE_HEADER(cycle_number) LOG_BANNER("TRADING CYCLE #" + std::to_string(cycle_number))

// Two-column tables: 17-character labels, 30-character values
#define TABLE_HEADER_30(title, subtitle) do { \
    LOG_THREAD_CONTENT("┌───────────────────┬────────────────────────────────┐"); \
    LOG_THREAD_CONTENT(format_table_line(title, subtitle)); \
    LOG_THREAD_CONTENT("├───────────────────┼────────────────────────────────┤"); \
} while(0)

#define TABLE_ROW_30(label, value) LOG_THREAD_CONTENT(format_table_line(label, value))

#define TABLE_SEPARATOR_30() LOG_THREAD_CONTENT("├───────────────────┼────────────────────────────────┤")

#define TABLE_FOOTER_30() LOG_THREAD_CONTENT("└───────────────────┴────────────────────────────────┘")

#endif // LOGGING_MACROS_HPP
