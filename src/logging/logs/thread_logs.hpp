#ifndef THREAD_LOGS_HPP
#define THREAD_LOGS_HPP

#include <string>

namespace ValrTrader {
namespace Logging {

class ThreadLogs {
public:
    static void log_thread_started(const std::string& thread_name);
    static void log_thread_exited(const std::string& thread_name);
    static void log_thread_exception(const std::string& thread_name, const std::string& error_message);
    static void log_loop_iteration_exception(const std::string& thread_name, const std::string& error_message);
};

} // namespace Logging
} // namespace ValrTrader

#endif // THREAD_LOGS_HPP
