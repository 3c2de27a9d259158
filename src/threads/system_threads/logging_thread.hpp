#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <atomic>
#include <memory>
#include "logging/logger/async_logger.hpp"
#include "configs/system_config.hpp"

namespace ValrTrader {
namespace Threads {

class LoggingThread {
public:
    LoggingThread(std::shared_ptr<ValrTrader::Logging::AsyncLogger> logger,
                  ValrTrader::Logging::LoggingContext& context,
                  std::atomic<unsigned long>& iterations,
                  const ValrTrader::Config::SystemConfig& system_config)
        : logger_ptr(logger), logging_context(context), logger_iterations(&iterations), config(system_config) {}

    void operator()();

private:
    std::shared_ptr<ValrTrader::Logging::AsyncLogger> logger_ptr;
    ValrTrader::Logging::LoggingContext& logging_context;
    std::atomic<unsigned long>* logger_iterations;
    const ValrTrader::Config::SystemConfig& config;

    void setup_logging_thread();
    void execute_logging_processing_loop();
};

} // namespace Threads
} // namespace ValrTrader

#endif // LOGGING_THREAD_HPP
