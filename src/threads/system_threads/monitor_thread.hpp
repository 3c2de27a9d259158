#ifndef MONITOR_THREAD_HPP
#define MONITOR_THREAD_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include "configs/timing_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/trading_logic/trading_engine.hpp"

namespace ValrTrader {
namespace Threads {

// Drives TradingEngine::monitor_positions on the monitor interval.
struct MonitorThread {
    const ValrTrader::Config::TimingConfig& timing;
    ValrTrader::Core::TradingEngine& trading_engine;
    ValrTrader::Logging::LoggingContext& logging_context;
    std::mutex& state_mtx;
    std::condition_variable& state_cv;
    std::atomic<bool>& running;
    std::atomic<unsigned long>& iteration_counter;

    MonitorThread(const ValrTrader::Config::TimingConfig& timing_config,
                  ValrTrader::Core::TradingEngine& engine_ref,
                  ValrTrader::Logging::LoggingContext& context,
                  std::mutex& mtx,
                  std::condition_variable& cv,
                  std::atomic<bool>& running_flag,
                  std::atomic<unsigned long>& iterations)
        : timing(timing_config), trading_engine(engine_ref), logging_context(context), state_mtx(mtx),
          state_cv(cv), running(running_flag), iteration_counter(iterations) {}

    void operator()();

private:
    void execute_monitoring_loop();
    bool wait_interruptible(std::chrono::seconds wait_duration);
};

} // namespace Threads
} // namespace ValrTrader

#endif // MONITOR_THREAD_HPP
