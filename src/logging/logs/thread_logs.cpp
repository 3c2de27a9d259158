#include "thread_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace ValrTrader {
namespace Logging {

void ThreadLogs::log_thread_started(const std::string& thread_name) {
    log_message("THREAD: " + thread_name + " started", "");
}

void ThreadLogs::log_thread_exited(const std::string& thread_name) {
    log_message("THREAD: " + thread_name + " exited", "");
}

void ThreadLogs::log_thread_exception(const std::string& thread_name, const std::string& error_message) {
    log_message("ERROR: " + thread_name + " exception: " + error_message, "");
}

void ThreadLogs::log_loop_iteration_exception(const std::string& thread_name, const std::string& error_message) {
    log_message("ERROR: Exception in " + thread_name + " cycle: " + error_message, "");
}

} // namespace Logging
} // namespace ValrTrader
