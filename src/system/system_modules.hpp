#ifndef SYSTEM_MODULES_HPP
#define SYSTEM_MODULES_HPP

#include <memory>
#include "api/general/curl_http_transport.hpp"
#include "api/valr/valr_gateway.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "threads/system_threads/monitor_thread.hpp"
#include "threads/system_threads/scanner_thread.hpp"
#include "trader/persistence/order_store.hpp"
#include "trader/persistence/position_store.hpp"
#include "trader/strategy_analysis/signal_source.hpp"
#include "trader/trading_logic/trading_engine.hpp"
#include "utils/clock.hpp"

/**
 * @brief Runtime module container
 *
 * Holds active system modules as smart pointers for centralized ownership.
 * Declaration order is construction order; threads are declared last so
 * they are destroyed before the modules they reference.
 */
struct SystemModules {
    // =========================================================================
    // EXCHANGE ACCESS
    // =========================================================================
    std::unique_ptr<ValrTrader::API::CurlHttpTransport> http_transport;   // libcurl request execution
    std::unique_ptr<ValrTrader::API::ValrGateway> exchange_gateway;       // Signed, rate limited VALR REST client
    std::unique_ptr<ValrTrader::Core::SystemClock> system_clock;          // Wall clock for timeouts and rollovers

    // =========================================================================
    // PERSISTENCE
    // =========================================================================
    std::unique_ptr<ValrTrader::Core::OrderStore> order_store;
    std::unique_ptr<ValrTrader::Core::PositionStore> position_store;

    // =========================================================================
    // TRADING COMPONENTS
    // =========================================================================
    std::unique_ptr<ValrTrader::Core::TradingEngine> trading_engine;      // Entry, protection and exit lifecycle
    ValrTrader::Core::SignalSourcePtr signal_source;                      // Buy signal per pair

    // =========================================================================
    // THREADING COMPONENTS
    // =========================================================================
    std::unique_ptr<ValrTrader::Threads::ScannerThread> scanner_thread;
    std::unique_ptr<ValrTrader::Threads::MonitorThread> monitor_thread;
    std::unique_ptr<ValrTrader::Threads::LoggingThread> logging_thread;
};

#endif // SYSTEM_MODULES_HPP
