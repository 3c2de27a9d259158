#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include "system/system_modules.hpp"
#include "system/system_threads.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"

/**
 * @brief Central system state container
 *
 * Configuration, modules, thread handles and the shared shutdown primitives.
 */
struct SystemState {
    // =========================================================================
    // THREAD SYNCHRONIZATION
    // =========================================================================
    std::mutex mtx;                    // Guards interruptible waits of the worker threads
    std::condition_variable cv;        // Wakes workers and run() on shutdown

    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> running{true};               // Cleared to stop every worker loop
    std::atomic<bool> shutdown_requested{false};   // No new trade setups; fill waits abort

    // =========================================================================
    // CONFIGURATION, MODULES AND THREADS
    // =========================================================================
    ValrTrader::Config::SystemConfig config;
    std::unique_ptr<SystemModules> trading_modules;
    SystemThreads thread_handles;
    std::shared_ptr<ValrTrader::Logging::LoggingContext> logging_context;

    explicit SystemState(const ValrTrader::Config::SystemConfig& initial)
        : config(initial) {
        if (config.strategy.pairs.empty()) {
            throw std::runtime_error("At least one trading pair is required but none configured");
        }
    }
};

#endif // SYSTEM_STATE_HPP
