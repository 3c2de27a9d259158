#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "api_config.hpp"
#include "strategy_config.hpp"
#include "timing_config.hpp"
#include "logging_config.hpp"
#include "persistence_config.hpp"
#include "pair_config.hpp"

namespace ValrTrader {
namespace Config {

/**
 * Main trading system configuration.
 * Each member is filled from its own CSV file under config/.
 */
struct SystemConfig {
    SystemConfig() {}

    ApiConfig api;                     // Exchange endpoint, credentials, retry and rate limit
    StrategyConfig strategy;           // Pairs, signal threshold, exits, sizing, order policy
    TimingConfig timing;               // Timeouts, poll schedule and thread intervals
    LoggingConfig logging;             // Log file and rotation
    PersistenceConfig persistence;     // Order and position store files
    PairConfig pairs;                  // Per-pair precision and tick size
};

} // namespace Config
} // namespace ValrTrader

#endif // SYSTEM_CONFIG_HPP
