#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"

// Thread-agnostic section macros
#define LOG_THREAD_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SUBCONTENT(msg) log_message("|     " + std::string(msg), "")
#define LOG_THREAD_SEPARATOR() log_message("|", "")
#define LOG_THREAD_SECTION_FOOTER() log_message("+-- ", "")

// Specialized section headers
#define LOG_THREAD_ORDER_EXECUTION_HEADER() LOG_THREAD_SECTION_HEADER("ORDER EXECUTION")
#define LOG_THREAD_POSITION_HEADER() LOG_THREAD_SECTION_HEADER("POSITION")
#define LOG_THREAD_DAILY_STATISTICS_HEADER() LOG_THREAD_SECTION_HEADER("DAILY STATISTICS")
#define LOG_THREAD_RECOVERY_HEADER() LOG_THREAD_SECTION_HEADER("STARTUP RECOVERY")

// Two-column table rows: label padded to 20 characters
#define TABLE_ROW(label, value) \
    do { \
        std::string table_label_string = std::string(label); \
        if (table_label_string.size() < 20) table_label_string.append(20 - table_label_string.size(), ' '); \
        LOG_THREAD_CONTENT(table_label_string + " : " + std::string(value)); \
    } while (0)

#endif // LOGGING_MACROS_HPP
