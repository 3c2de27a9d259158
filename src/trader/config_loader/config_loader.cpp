#include "config_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/system_logs.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

using ValrTrader::Logging::log_message;
using ValrTrader::Logging::SystemLogs;
using ValrTrader::Config::PairSettings;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    inline DecimalUtils::Decimal to_decimal(const std::string& input_value) {
        return DecimalUtils::parse_decimal(input_value);
    }

    std::vector<std::string> split_pairs(const std::string& pairs_value) {
        std::vector<std::string> pairs;
        std::string current_pair;
        for (char current_char : pairs_value) {
            if (current_char == ',' || current_char == ';' || current_char == ' ') {
                if (!trim(current_pair).empty()) pairs.push_back(trim(current_pair));
                current_pair.clear();
            } else {
                current_pair.push_back(current_char);
            }
        }
        if (!trim(current_pair).empty()) pairs.push_back(trim(current_pair));
        return pairs;
    }

    void apply_pair_property(PairSettings& pair_settings, const std::string& property_name, const std::string& property_value) {
        if (property_name == "price_decimals") pair_settings.price_decimals = std::stoi(property_value);
        else if (property_name == "quantity_decimals") pair_settings.quantity_decimals = std::stoi(property_value);
        else if (property_name == "tick_size") pair_settings.tick_size = to_decimal(property_value);
        else if (property_name == "minimum_quantity") pair_settings.minimum_quantity = to_decimal(property_value);
        else if (property_name == "quote_currency") pair_settings.quote_currency = property_value;
        else throw std::runtime_error("Unknown pair property: " + property_name);
    }

    // pair.<PAIR>.<property>; pair.default.* applies to every pair without its own value
    void apply_pair_entries(ValrTrader::Config::SystemConfig& cfg,
                            const std::vector<std::pair<std::string, std::string>>& pair_entries) {
        std::map<std::string, std::vector<std::pair<std::string, std::string>>> pair_properties;
        for (const auto& pair_entry : pair_entries) {
            std::string key_remainder = pair_entry.first.substr(5);
            size_t property_dot_position = key_remainder.rfind('.');
            if (property_dot_position == std::string::npos || property_dot_position == 0) {
                throw std::runtime_error("Malformed pair key: " + pair_entry.first);
            }
            std::string pair_name = key_remainder.substr(0, property_dot_position);
            std::string property_name = key_remainder.substr(property_dot_position + 1);
            if (pair_name == "default") {
                apply_pair_property(cfg.pairs.default_settings, property_name, pair_entry.second);
            } else {
                pair_properties[pair_name].push_back(std::make_pair(property_name, pair_entry.second));
            }
        }

        for (const auto& pair_property_entry : pair_properties) {
            PairSettings pair_settings = cfg.pairs.default_settings;
            for (const auto& property_entry : pair_property_entry.second) {
                apply_pair_property(pair_settings, property_entry.first, property_entry.second);
            }
            cfg.pairs.pair_settings[pair_property_entry.first] = pair_settings;
        }
    }
}

bool load_config_from_csv(ValrTrader::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        log_message("ERROR: Could not open config file: " + csv_path, "");
        return false;
    }

    std::vector<std::pair<std::string, std::string>> pair_entries;
    std::string config_line_string;
    try {
        while (std::getline(config_file_stream, config_line_string)) {
            config_line_string = trim(config_line_string);
            if (config_line_string.empty() || config_line_string[0] == '#') continue;
            std::stringstream config_line_stream(config_line_string);
            std::string config_key_string, config_value_string;
            if (!std::getline(config_line_stream, config_key_string, ',')) continue;
            if (!std::getline(config_line_stream, config_value_string)) continue;
            config_key_string = trim(config_key_string);
            config_value_string = trim(config_value_string);

            // API
            if (config_key_string == "api.base_url") cfg.api.base_url = config_value_string;
            else if (config_key_string == "api.api_version") cfg.api.api_version = config_value_string;
            else if (config_key_string == "api.api_key") cfg.api.api_key = config_value_string;
            else if (config_key_string == "api.api_secret") cfg.api.api_secret = config_value_string;
            else if (config_key_string == "api.request_timeout_seconds") cfg.api.request_timeout_seconds = std::stoi(config_value_string);
            else if (config_key_string == "api.max_retries") cfg.api.max_retries = std::stoi(config_value_string);
            else if (config_key_string == "api.retry_base_delay_milliseconds") cfg.api.retry_base_delay_milliseconds = std::stoi(config_value_string);
            else if (config_key_string == "api.retry_backoff_factor") cfg.api.retry_backoff_factor = std::stod(config_value_string);
            else if (config_key_string == "api.rate_limit_requests_per_window") cfg.api.rate_limit_requests_per_window = std::stoi(config_value_string);
            else if (config_key_string == "api.rate_limit_window_seconds") cfg.api.rate_limit_window_seconds = std::stoi(config_value_string);
            else if (config_key_string == "api.enable_ssl_verification") cfg.api.enable_ssl_verification = to_bool(config_value_string);

            // Strategy
            else if (config_key_string == "strategy.pairs") cfg.strategy.pairs = split_pairs(config_value_string);
            else if (config_key_string == "strategy.rsi_threshold") cfg.strategy.rsi_threshold = to_decimal(config_value_string);
            else if (config_key_string == "strategy.rsi_period") cfg.strategy.rsi_period = std::stoi(config_value_string);
            else if (config_key_string == "strategy.scan_cooldown_seconds") cfg.strategy.scan_cooldown_seconds = std::stoi(config_value_string);
            else if (config_key_string == "strategy.take_profit_percentage") cfg.strategy.take_profit_percentage = to_decimal(config_value_string);
            else if (config_key_string == "strategy.stop_loss_percentage") cfg.strategy.stop_loss_percentage = to_decimal(config_value_string);
            else if (config_key_string == "strategy.base_trade_amount") cfg.strategy.base_trade_amount = to_decimal(config_value_string);
            else if (config_key_string == "strategy.max_daily_trades") cfg.strategy.max_daily_trades = std::stoi(config_value_string);
            else if (config_key_string == "strategy.maker_fee_percentage") cfg.strategy.maker_fee_percentage = to_decimal(config_value_string);
            else if (config_key_string == "strategy.balance_safety_margin_percentage") cfg.strategy.balance_safety_margin_percentage = to_decimal(config_value_string);
            else if (config_key_string == "strategy.entry_pricing_mode") cfg.strategy.entry_pricing_mode = ValrTrader::Config::StrategyConfig::parse_entry_pricing_mode(config_value_string);
            else if (config_key_string == "strategy.protection_mode") cfg.strategy.protection_mode = ValrTrader::Config::StrategyConfig::parse_protection_mode(config_value_string);
            else if (config_key_string == "strategy.allow_multiple_positions_per_pair") cfg.strategy.allow_multiple_positions_per_pair = to_bool(config_value_string);

            // Timing
            else if (config_key_string == "timing.entry_order_timeout_seconds") cfg.timing.entry_order_timeout_seconds = std::stoi(config_value_string);
            else if (config_key_string == "timing.position_timeout_minutes") cfg.timing.position_timeout_minutes = std::stoi(config_value_string);
            else if (config_key_string == "timing.exit_order_timeout_minutes") cfg.timing.exit_order_timeout_minutes = std::stoi(config_value_string);
            else if (config_key_string == "timing.fill_poll_fast_interval_milliseconds") cfg.timing.fill_poll_fast_interval_milliseconds = std::stoi(config_value_string);
            else if (config_key_string == "timing.fill_poll_fast_window_seconds") cfg.timing.fill_poll_fast_window_seconds = std::stoi(config_value_string);
            else if (config_key_string == "timing.fill_poll_medium_interval_milliseconds") cfg.timing.fill_poll_medium_interval_milliseconds = std::stoi(config_value_string);
            else if (config_key_string == "timing.fill_poll_medium_window_seconds") cfg.timing.fill_poll_medium_window_seconds = std::stoi(config_value_string);
            else if (config_key_string == "timing.fill_poll_slow_interval_milliseconds") cfg.timing.fill_poll_slow_interval_milliseconds = std::stoi(config_value_string);
            else if (config_key_string == "timing.scan_interval_seconds") cfg.timing.scan_interval_seconds = std::stoi(config_value_string);
            else if (config_key_string == "timing.monitor_interval_seconds") cfg.timing.monitor_interval_seconds = std::stoi(config_value_string);
            else if (config_key_string == "timing.pair_scan_delay_milliseconds") cfg.timing.pair_scan_delay_milliseconds = std::stoi(config_value_string);
            else if (config_key_string == "timing.thread_recovery_sleep_seconds") cfg.timing.thread_recovery_sleep_seconds = std::stoi(config_value_string);
            else if (config_key_string == "timing.thread_logging_poll_interval_sec") cfg.timing.thread_logging_poll_interval_sec = std::stoi(config_value_string);
            else if (config_key_string == "timing.stale_order_max_age_hours") cfg.timing.stale_order_max_age_hours = std::stoi(config_value_string);

            // Logging
            else if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
            else if (config_key_string == "logging.max_log_file_size_mb") cfg.logging.max_log_file_size_mb = std::stoi(config_value_string);
            else if (config_key_string == "logging.log_backup_count") cfg.logging.log_backup_count = std::stoi(config_value_string);
            else if (config_key_string == "logging.console_output_enabled") cfg.logging.console_output_enabled = to_bool(config_value_string);

            // Persistence
            else if (config_key_string == "persistence.orders_file") cfg.persistence.orders_file = config_value_string;
            else if (config_key_string == "persistence.positions_file") cfg.persistence.positions_file = config_value_string;
            else if (config_key_string == "persistence.enable_order_persistence") cfg.persistence.enable_order_persistence = to_bool(config_value_string);

            // Pairs (applied after the whole file is read)
            else if (config_key_string.compare(0, 5, "pair.") == 0) pair_entries.push_back(std::make_pair(config_key_string, config_value_string));

            else log_message("WARNING: Unknown config key '" + config_key_string + "' in " + csv_path, "");
        }
        apply_pair_entries(cfg, pair_entries);
    } catch (const std::exception& line_exception_error) {
        log_message("CRITICAL: Error parsing config line: " + config_line_string + " - " + std::string(line_exception_error.what()), "");
        return false;
    }
    return true;
}

void apply_environment_overrides(ValrTrader::Config::SystemConfig& cfg) {
    const char* api_key_value = std::getenv("VALR_API_KEY");
    if (api_key_value && *api_key_value) {
        cfg.api.api_key = api_key_value;
    }
    const char* api_secret_value = std::getenv("VALR_API_SECRET");
    if (api_secret_value && *api_secret_value) {
        cfg.api.api_secret = api_secret_value;
    }
}

int load_system_config(ValrTrader::Config::SystemConfig& config, const std::string& config_directory) {
    // Load configuration from separate logical files
    std::vector<std::string> config_files = {
        config_directory + "/api_config.csv",
        config_directory + "/strategy_config.csv",
        config_directory + "/timing_config.csv",
        config_directory + "/logging_config.csv",
        config_directory + "/persistence_config.csv",
        config_directory + "/pairs_config.csv"
    };

    for (const auto& config_path : config_files) {
        if (!load_config_from_csv(config, config_path)) {
            log_message("ERROR: Failed to load config CSV from " + config_path, "");
            return 1;
        }
    }

    apply_environment_overrides(config);

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        SystemLogs::log_configuration_validated(false, validation_error);
        return 2;
    }
    SystemLogs::log_configuration_validated(true, "");
    return 0;
}

bool validate_config(const ValrTrader::Config::SystemConfig& config, std::string& error_message, bool require_credentials) {
    // API
    if (config.api.base_url.empty()) {
        error_message = "api.base_url is required";
        return false;
    }
    if (require_credentials && (config.api.api_key.empty() || config.api.api_secret.empty())) {
        error_message = "API credentials missing (set VALR_API_KEY and VALR_API_SECRET)";
        return false;
    }
    if (config.api.request_timeout_seconds <= 0) {
        error_message = "api.request_timeout_seconds must be > 0";
        return false;
    }
    if (config.api.max_retries < 0) {
        error_message = "api.max_retries must be >= 0";
        return false;
    }
    if (config.api.retry_base_delay_milliseconds <= 0) {
        error_message = "api.retry_base_delay_milliseconds must be > 0";
        return false;
    }
    if (config.api.retry_backoff_factor <= 1.0) {
        error_message = "api.retry_backoff_factor must be > 1";
        return false;
    }
    if (config.api.rate_limit_requests_per_window <= 0 || config.api.rate_limit_window_seconds <= 0) {
        error_message = "api rate limit must allow at least one request per positive window";
        return false;
    }

    // Strategy
    if (config.strategy.pairs.empty()) {
        error_message = "strategy.pairs must list at least one pair";
        return false;
    }
    if (config.strategy.rsi_threshold <= 0 || config.strategy.rsi_threshold >= 100) {
        error_message = "strategy.rsi_threshold must be between 0 and 100";
        return false;
    }
    if (config.strategy.rsi_period <= 0) {
        error_message = "strategy.rsi_period must be > 0";
        return false;
    }
    if (config.strategy.take_profit_percentage <= 0) {
        error_message = "strategy.take_profit_percentage must be > 0";
        return false;
    }
    if (config.strategy.stop_loss_percentage <= 0 || config.strategy.stop_loss_percentage >= 100) {
        error_message = "strategy.stop_loss_percentage must be > 0 and < 100";
        return false;
    }
    if (config.strategy.base_trade_amount <= 0) {
        error_message = "strategy.base_trade_amount must be > 0";
        return false;
    }
    if (config.strategy.max_daily_trades <= 0) {
        error_message = "strategy.max_daily_trades must be > 0";
        return false;
    }
    if (config.strategy.maker_fee_percentage < 0 || config.strategy.balance_safety_margin_percentage < 0) {
        error_message = "fee and safety margin percentages must not be negative";
        return false;
    }

    // Timing
    if (config.timing.entry_order_timeout_seconds <= 0 || config.timing.position_timeout_minutes <= 0 ||
        config.timing.exit_order_timeout_minutes <= 0) {
        error_message = "order and position timeouts must be > 0";
        return false;
    }
    if (config.timing.fill_poll_fast_interval_milliseconds <= 0 || config.timing.fill_poll_medium_interval_milliseconds <= 0 ||
        config.timing.fill_poll_slow_interval_milliseconds <= 0) {
        error_message = "fill poll intervals must be > 0";
        return false;
    }
    if (config.timing.scan_interval_seconds <= 0 || config.timing.monitor_interval_seconds <= 0) {
        error_message = "scan and monitor intervals must be > 0";
        return false;
    }
    if (config.timing.stale_order_max_age_hours <= 0) {
        error_message = "timing.stale_order_max_age_hours must be > 0";
        return false;
    }

    // Logging and persistence
    if (config.logging.log_file.empty() || config.logging.max_log_file_size_mb <= 0 || config.logging.log_backup_count < 0) {
        error_message = "logging configuration incomplete";
        return false;
    }
    if (config.persistence.positions_file.empty() ||
        (config.persistence.enable_order_persistence && config.persistence.orders_file.empty())) {
        error_message = "persistence file paths are required";
        return false;
    }

    // Pairs
    auto validate_pair_settings = [&error_message](const std::string& pair_name, const PairSettings& pair_settings) {
        if (pair_settings.price_decimals < 0 || pair_settings.quantity_decimals < 0) {
            error_message = "pair." + pair_name + " decimals must not be negative";
            return false;
        }
        if (pair_settings.tick_size <= 0) {
            error_message = "pair." + pair_name + ".tick_size must be > 0";
            return false;
        }
        return true;
    };
    if (!validate_pair_settings("default", config.pairs.default_settings)) {
        return false;
    }
    for (const auto& pair_entry : config.pairs.pair_settings) {
        if (!validate_pair_settings(pair_entry.first, pair_entry.second)) {
            return false;
        }
    }
    return true;
}
