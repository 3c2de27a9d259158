#include "system_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/decimal_utils.hpp"
#include <sstream>

namespace ValrTrader {
namespace Logging {

void SystemLogs::log_startup_configuration(const ValrTrader::Config::SystemConfig& config) {
    std::ostringstream pairs_stream;
    for (size_t pair_index = 0; pair_index < config.strategy.pairs.size(); ++pair_index) {
        if (pair_index > 0) pairs_stream << ",";
        pairs_stream << config.strategy.pairs[pair_index];
    }

    LOG_THREAD_SECTION_HEADER("VALR TRADER CONFIGURATION");
    TABLE_ROW("Exchange", config.api.base_url + "/" + config.api.api_version);
    TABLE_ROW("Pairs", pairs_stream.str());
    TABLE_ROW("RSI threshold", DecimalUtils::format_decimal(config.strategy.rsi_threshold));
    TABLE_ROW("Take profit %", DecimalUtils::format_decimal(config.strategy.take_profit_percentage));
    TABLE_ROW("Stop loss %", DecimalUtils::format_decimal(config.strategy.stop_loss_percentage));
    TABLE_ROW("Trade amount", DecimalUtils::format_decimal(config.strategy.base_trade_amount));
    TABLE_ROW("Max daily trades", std::to_string(config.strategy.max_daily_trades));
    TABLE_ROW("Protection mode", ValrTrader::Config::StrategyConfig::protection_mode_to_string(config.strategy.protection_mode));
    TABLE_ROW("Entry timeout", std::to_string(config.timing.entry_order_timeout_seconds) + "s");
    TABLE_ROW("Position timeout", std::to_string(config.timing.position_timeout_minutes) + "m");
    TABLE_ROW("Exit order timeout", std::to_string(config.timing.exit_order_timeout_minutes) + "m");
    TABLE_ROW("Rate limit", std::to_string(config.api.rate_limit_requests_per_window) + "/" +
              std::to_string(config.api.rate_limit_window_seconds) + "s");
    LOG_THREAD_SECTION_FOOTER();
}

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "");
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message(std::string("ERROR: System shutdown error: ") + error_message, "");
}

void SystemLogs::log_system_warning(const std::string& warning_message) {
    log_message(std::string("WARNING: ") + warning_message, "");
}

void SystemLogs::log_startup_complete(int thread_count) {
    log_message("SYSTEM_STARTUP: System startup completed, " + std::to_string(thread_count) + " threads running", "");
}

void SystemLogs::log_shutdown_requested() {
    log_message("SYSTEM_SHUTDOWN: Shutdown requested, no new trade setups will start", "");
}

void SystemLogs::log_shutdown_complete() {
    log_message("SYSTEM_SHUTDOWN: Shutdown complete", "");
}

void SystemLogs::log_server_time(long long server_time_milliseconds, long long local_time_milliseconds) {
    log_message("CONNECTIVITY: Exchange server time " + std::to_string(server_time_milliseconds) +
                " ms, local skew " + std::to_string(local_time_milliseconds - server_time_milliseconds) + " ms", "");
}

void SystemLogs::log_configuration_validated(bool valid, const std::string& detail) {
    if (valid) {
        log_message("CONFIG_VALIDATION: Configuration validated successfully", "");
    } else {
        log_message("CONFIG_VALIDATION: Configuration validation FAILED: " + detail, "");
    }
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

} // namespace Logging
} // namespace ValrTrader
