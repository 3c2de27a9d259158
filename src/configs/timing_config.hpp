// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

namespace ValrTrader {
namespace Config {

struct TimingConfig {
    // ========================================================================
    // ORDER AND POSITION TIMEOUTS
    // ========================================================================

    int entry_order_timeout_seconds = 60;             // Fill wait budget for an entry order
    int position_timeout_minutes = 60;                // Hard limit on holding a position
    int exit_order_timeout_minutes = 45;              // Hard limit on resting exit orders

    // ========================================================================
    // FILL POLL SCHEDULE
    // ========================================================================

    int fill_poll_fast_interval_milliseconds = 500;
    int fill_poll_fast_window_seconds = 10;
    int fill_poll_medium_interval_milliseconds = 1000;
    int fill_poll_medium_window_seconds = 30;
    int fill_poll_slow_interval_milliseconds = 2000;

    // ========================================================================
    // THREAD POLLING INTERVALS
    // ========================================================================

    int scan_interval_seconds = 300;
    int monitor_interval_seconds = 60;
    int pair_scan_delay_milliseconds = 500;
    int thread_recovery_sleep_seconds = 5;
    int thread_logging_poll_interval_sec = 1;

    // ========================================================================
    // HOUSEKEEPING
    // ========================================================================

    int stale_order_max_age_hours = 24;
};

} // namespace Config
} // namespace ValrTrader

#endif // TIMING_CONFIG_HPP
