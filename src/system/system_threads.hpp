#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <thread>
#include <atomic>
#include <chrono>

/**
 * @brief System thread handles and iteration counters
 *
 * Counters are referenced by the running thread objects, so an instance must
 * stay in place once threads are launched. Moves are only valid before that.
 */
struct SystemThreads {
    // =========================================================================
    // THREAD HANDLES
    // =========================================================================
    std::thread scanner_thread;   // Signal scan and trade setup
    std::thread monitor_thread;   // Open position supervision
    std::thread logger_thread;    // Async log drain

    // =========================================================================
    // PERFORMANCE MONITORING
    // =========================================================================
    std::chrono::steady_clock::time_point start_time;

    std::atomic<unsigned long> scanner_iterations{0};
    std::atomic<unsigned long> monitor_iterations{0};
    std::atomic<unsigned long> logger_iterations{0};

    SystemThreads() : start_time(std::chrono::steady_clock::now()) {}

    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;
    SystemThreads(SystemThreads&&) = delete;
    SystemThreads& operator=(SystemThreads&&) = delete;
};

#endif // SYSTEM_THREADS_HPP
