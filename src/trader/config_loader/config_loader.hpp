#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

bool load_config_from_csv(ValrTrader::Config::SystemConfig& cfg, const std::string& csv_path);
void apply_environment_overrides(ValrTrader::Config::SystemConfig& cfg);
int load_system_config(ValrTrader::Config::SystemConfig& config, const std::string& config_directory = "config");
bool validate_config(const ValrTrader::Config::SystemConfig& config, std::string& error_message, bool require_credentials = true);

#endif // CONFIG_LOADER_HPP
