/**
 * Position monitor thread.
 * Keeps running through shutdown_requested so open positions stay supervised
 * until the system stops.
 */
#include "monitor_thread.hpp"
#include "logging/logs/thread_logs.hpp"
#include <chrono>

using namespace ValrTrader::Threads;
using namespace ValrTrader::Logging;

void MonitorThread::operator()() {
    try {
        set_logging_context(logging_context);
        set_log_thread_tag("MONITR");
        ThreadLogs::log_thread_started("MonitorThread");

        execute_monitoring_loop();

        ThreadLogs::log_thread_exited("MonitorThread");
    } catch (const std::exception& exception_error) {
        ThreadLogs::log_thread_exception("MonitorThread", exception_error.what());
    }
}

void MonitorThread::execute_monitoring_loop() {
    while (running.load()) {
        try {
            trading_engine.monitor_positions();
            iteration_counter.fetch_add(1);

            if (!wait_interruptible(std::chrono::seconds(timing.monitor_interval_seconds))) {
                break;
            }
        } catch (const std::exception& exception_error) {
            ThreadLogs::log_loop_iteration_exception("MonitorThread", exception_error.what());
            if (!wait_interruptible(std::chrono::seconds(timing.thread_recovery_sleep_seconds))) {
                break;
            }
        }
    }
}

bool MonitorThread::wait_interruptible(std::chrono::seconds wait_duration) {
    std::unique_lock<std::mutex> wait_lock(state_mtx);
    state_cv.wait_for(wait_lock, wait_duration, [this]() {
        return !running.load();
    });
    return running.load();
}
