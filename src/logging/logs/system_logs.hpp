#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>
#include "configs/system_config.hpp"

namespace ValrTrader {
namespace Logging {

/**
 * Specialized logging for system management operations.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_startup_configuration(const ValrTrader::Config::SystemConfig& config);
    static void log_system_startup_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
    static void log_system_warning(const std::string& warning_message);
    static void log_startup_complete(int thread_count);
    static void log_shutdown_requested();
    static void log_shutdown_complete();

    // Exchange connectivity
    static void log_server_time(long long server_time_milliseconds, long long local_time_milliseconds);

    // Configuration
    static void log_configuration_validated(bool valid, const std::string& detail);
    static void log_fatal_error(const std::string& error_message);
};

} // namespace Logging
} // namespace ValrTrader

#endif // SYSTEM_LOGS_HPP
