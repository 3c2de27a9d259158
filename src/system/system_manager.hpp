#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include "system/system_state.hpp"
#include "logging/logger/async_logger.hpp"

namespace ValrTrader {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<ValrTrader::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// Config, logging and libcurl setup
SystemInitializationResult initialize(const std::string& config_directory = "config");

// System lifecycle management
void startup(SystemState& system_state, std::shared_ptr<ValrTrader::Logging::AsyncLogger> logger);
void run(SystemState& system_state);
void shutdown(SystemState& system_state, std::shared_ptr<ValrTrader::Logging::AsyncLogger> logger);

} // namespace System
} // namespace ValrTrader

#endif // SYSTEM_MANAGER_HPP
