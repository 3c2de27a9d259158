#include "system_manager.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "api/general/api_errors.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/strategy_analysis/rsi_signal_scanner.hpp"
#include "trader/trading_logic/trading_engine_structures.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"

using namespace ValrTrader::Logging;
using namespace ValrTrader::Threads;

namespace ValrTrader {
namespace System {

namespace {

constexpr int SYSTEM_THREAD_COUNT = 3;

void create_trading_modules(SystemState& state) {
    state.trading_modules = std::make_unique<SystemModules>();
    SystemModules& modules = *state.trading_modules;

    modules.http_transport = std::make_unique<ValrTrader::API::CurlHttpTransport>();
    modules.exchange_gateway = std::make_unique<ValrTrader::API::ValrGateway>(state.config.api, *modules.http_transport);
    modules.system_clock = std::make_unique<ValrTrader::Core::SystemClock>();

    modules.order_store = std::make_unique<ValrTrader::Core::OrderStore>(
        state.config.persistence.orders_file,
        state.config.persistence.enable_order_persistence,
        *modules.system_clock);
    modules.position_store = std::make_unique<ValrTrader::Core::PositionStore>(state.config.persistence.positions_file);

    ValrTrader::Core::TradingEngineConstructionParams engine_params(
        state.config, *modules.exchange_gateway, *modules.order_store, *modules.position_store,
        *modules.system_clock, state.shutdown_requested);
    modules.trading_engine = std::make_unique<ValrTrader::Core::TradingEngine>(engine_params);

    modules.signal_source = std::make_unique<ValrTrader::Core::RsiSignalScanner>(
        *modules.exchange_gateway, state.config.strategy, *modules.system_clock);
}

// Logs exchange clock skew. A failure here is not fatal; recovery and the
// worker loops report their own exchange errors.
void check_exchange_connectivity(SystemState& state) {
    SystemModules& modules = *state.trading_modules;
    try {
        long long server_time_milliseconds = modules.exchange_gateway->get_server_time();
        long long local_time_milliseconds = TimeUtils::to_epoch_milliseconds(modules.system_clock->now());
        SystemLogs::log_server_time(server_time_milliseconds, local_time_milliseconds);
    } catch (const ValrTrader::API::ExchangeError& exchange_exception_error) {
        SystemLogs::log_system_warning(std::string("Exchange connectivity check failed: ") + exchange_exception_error.what());
    }
}

void request_stop(SystemState& state, bool stop_workers) {
    {
        std::lock_guard<std::mutex> state_lock(state.mtx);
        state.shutdown_requested.store(true);
        if (stop_workers) {
            state.running.store(false);
        }
    }
    state.cv.notify_all();
}

void join_if_running(std::thread& thread_handle) {
    if (thread_handle.joinable()) {
        thread_handle.join();
    }
}

} // namespace

// ========================================================================
// INITIALIZATION
// ========================================================================

SystemInitializationResult initialize(const std::string& config_directory) {
    SystemInitializationResult initialization_result;

    // Logging context must exist before any log_message call
    auto early_logging_context = std::make_shared<LoggingContext>();
    set_logging_context(*early_logging_context);

    ValrTrader::Config::SystemConfig initial_config;
    int config_load_result = load_system_config(initial_config, config_directory);
    if (config_load_result != 0) {
        SystemLogs::log_fatal_error("Config load failed with result: " + std::to_string(config_load_result));
        throw std::runtime_error("System initialization failed: configuration loading failed");
    }

    initialization_result.system_state = std::make_unique<SystemState>(initial_config);
    initialization_result.system_state->logging_context = early_logging_context;

    initialization_result.logger = initialize_application_foundation(initialization_result.system_state->config);
    initialize_http_library();

    SystemLogs::log_startup_configuration(initialization_result.system_state->config);
    return initialization_result;
}

// ========================================================================
// STARTUP
// ========================================================================

void startup(SystemState& system_state, std::shared_ptr<AsyncLogger> logger) {
    if (!logger) {
        throw std::runtime_error("System startup failed: Logger is required but not provided");
    }
    if (!system_state.logging_context) {
        throw std::runtime_error("Logging context not initialized - system must fail without context");
    }

    SystemThreads& handles = system_state.thread_handles;

    try {
        create_trading_modules(system_state);
        SystemModules& modules = *system_state.trading_modules;

        // Logger first so startup and recovery output is written as it happens
        modules.logging_thread = std::make_unique<LoggingThread>(
            logger, *system_state.logging_context, handles.logger_iterations, system_state.config);
        handles.logger_thread = std::thread(std::ref(*modules.logging_thread));

        check_exchange_connectivity(system_state);
        modules.trading_engine->startup_recovery();

        modules.scanner_thread = std::make_unique<ScannerThread>(
            system_state.config, *modules.signal_source, *modules.trading_engine, *modules.system_clock,
            *system_state.logging_context, system_state.mtx, system_state.cv,
            system_state.running, system_state.shutdown_requested, handles.scanner_iterations);
        modules.monitor_thread = std::make_unique<MonitorThread>(
            system_state.config.timing, *modules.trading_engine, *system_state.logging_context,
            system_state.mtx, system_state.cv, system_state.running, handles.monitor_iterations);

        handles.monitor_thread = std::thread(std::ref(*modules.monitor_thread));
        handles.scanner_thread = std::thread(std::ref(*modules.scanner_thread));
    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_startup_error(exception_error.what());
        throw;
    }

    SystemLogs::log_startup_complete(SYSTEM_THREAD_COUNT);
}

// ========================================================================
// RUN AND SHUTDOWN
// ========================================================================

void run(SystemState& system_state) {
    // Signal handlers only flip the atomics, so the wait is bounded
    std::unique_lock<std::mutex> state_lock(system_state.mtx);
    while (system_state.running.load() && !system_state.shutdown_requested.load()) {
        system_state.cv.wait_for(state_lock, std::chrono::seconds(1));
    }
}

void shutdown(SystemState& system_state, std::shared_ptr<AsyncLogger> logger) {
    SystemThreads& handles = system_state.thread_handles;
    try {
        SystemLogs::log_shutdown_requested();

        // Scanner first: no trade setup may start once shutdown is requested
        request_stop(system_state, false);
        join_if_running(handles.scanner_thread);

        request_stop(system_state, true);
        join_if_running(handles.monitor_thread);

        if (system_state.trading_modules && system_state.trading_modules->trading_engine) {
            system_state.trading_modules->trading_engine->persist_state();
        }
        SystemLogs::log_shutdown_complete();
    } catch (const std::exception& shutdown_exception_error) {
        SystemLogs::log_system_shutdown_error(std::string("Exception in shutdown: ") + shutdown_exception_error.what());
    }

    if (logger) {
        shutdown_global_logger(*logger);
    }
    join_if_running(handles.logger_thread);
    cleanup_http_library();
}

} // namespace System
} // namespace ValrTrader
