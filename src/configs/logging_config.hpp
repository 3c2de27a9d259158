// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace ValrTrader {
namespace Config {

struct LoggingConfig {
    std::string log_file = "logs/valr_trader.log";
    int max_log_file_size_mb = 10;
    int log_backup_count = 5;
    bool console_output_enabled = true;
};

} // namespace Config
} // namespace ValrTrader

#endif // LOGGING_CONFIG_HPP
