/**
 * Signal scanner thread.
 * Evaluates each pair in turn and starts a trade setup on a buy signal.
 */
#include "scanner_thread.hpp"
#include "api/general/api_errors.hpp"
#include "logging/logs/thread_logs.hpp"
#include "utils/time_utils.hpp"
#include <chrono>

using namespace ValrTrader::Threads;
using namespace ValrTrader::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void ScannerThread::operator()() {
    try {
        set_logging_context(logging_context);
        set_log_thread_tag("SCAN");
        ThreadLogs::log_thread_started("ScannerThread");

        execute_scanning_loop();

        ThreadLogs::log_thread_exited("ScannerThread");
    } catch (const std::exception& exception_error) {
        ThreadLogs::log_thread_exception("ScannerThread", exception_error.what());
    }
}

void ScannerThread::execute_scanning_loop() {
    while (running.load() && !shutdown_requested.load()) {
        try {
            execute_scan_cycle();
            iteration_counter.fetch_add(1);

            if (!wait_interruptible(std::chrono::seconds(config.timing.scan_interval_seconds))) {
                break;
            }
        } catch (const std::exception& exception_error) {
            ThreadLogs::log_loop_iteration_exception("ScannerThread", exception_error.what());
            if (!wait_interruptible(std::chrono::seconds(config.timing.thread_recovery_sleep_seconds))) {
                break;
            }
        }
    }
}

// ========================================================================
// SCAN CYCLE
// ========================================================================

void ScannerThread::execute_scan_cycle() {
    run_daily_housekeeping();

    for (const std::string& pair : config.strategy.pairs) {
        if (!running.load() || shutdown_requested.load()) {
            return;
        }

        try {
            ValrTrader::Core::SignalDecision signal_decision = signal_source.evaluate(pair);
            if (signal_decision.should_buy) {
                // Rejections are logged by the engine
                trading_engine.execute_trade_setup(pair, signal_decision);
            }
        } catch (const ValrTrader::API::ExchangeError& exchange_exception_error) {
            ThreadLogs::log_loop_iteration_exception("ScannerThread", pair + ": " + exchange_exception_error.what());
        }

        if (!wait_interruptible(std::chrono::milliseconds(config.timing.pair_scan_delay_milliseconds))) {
            return;
        }
    }
}

void ScannerThread::run_daily_housekeeping() {
    std::string current_date = TimeUtils::format_utc_date(clock.now());
    if (current_date == last_cleanup_date) {
        return;
    }
    trading_engine.cleanup_stale_orders();
    last_cleanup_date = current_date;
}

bool ScannerThread::wait_interruptible(std::chrono::milliseconds wait_duration) {
    std::unique_lock<std::mutex> wait_lock(state_mtx);
    state_cv.wait_for(wait_lock, wait_duration, [this]() {
        return !running.load() || shutdown_requested.load();
    });
    return running.load() && !shutdown_requested.load();
}
