#ifndef SCANNER_THREAD_HPP
#define SCANNER_THREAD_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/strategy_analysis/signal_source.hpp"
#include "trader/trading_logic/trading_engine.hpp"
#include "utils/clock.hpp"

namespace ValrTrader {
namespace Threads {

/**
 * @brief Scans every configured pair for a buy signal and hands signals to the engine.
 * Runs stale-order housekeeping once per UTC day.
 */
struct ScannerThread {
    const ValrTrader::Config::SystemConfig& config;
    ValrTrader::Core::SignalSourceInterface& signal_source;
    ValrTrader::Core::TradingEngine& trading_engine;
    const ValrTrader::Core::ClockInterface& clock;
    ValrTrader::Logging::LoggingContext& logging_context;
    std::mutex& state_mtx;
    std::condition_variable& state_cv;
    std::atomic<bool>& running;
    std::atomic<bool>& shutdown_requested;
    std::atomic<unsigned long>& iteration_counter;

    std::string last_cleanup_date;

    ScannerThread(const ValrTrader::Config::SystemConfig& system_config,
                  ValrTrader::Core::SignalSourceInterface& signal_source_ref,
                  ValrTrader::Core::TradingEngine& engine_ref,
                  const ValrTrader::Core::ClockInterface& clock_ref,
                  ValrTrader::Logging::LoggingContext& context,
                  std::mutex& mtx,
                  std::condition_variable& cv,
                  std::atomic<bool>& running_flag,
                  std::atomic<bool>& shutdown_flag,
                  std::atomic<unsigned long>& iterations)
        : config(system_config), signal_source(signal_source_ref), trading_engine(engine_ref), clock(clock_ref),
          logging_context(context), state_mtx(mtx), state_cv(cv), running(running_flag),
          shutdown_requested(shutdown_flag), iteration_counter(iterations) {}

    // Thread entrypoint
    void operator()();

    // One pass over all pairs plus daily housekeeping. Exposed for tests.
    void execute_scan_cycle();

private:
    void execute_scanning_loop();
    void run_daily_housekeeping();
    // False when shutdown interrupted the wait.
    bool wait_interruptible(std::chrono::milliseconds wait_duration);
};

} // namespace Threads
} // namespace ValrTrader

#endif // SCANNER_THREAD_HPP
