#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

bool load_config_from_csv(QuantSignal::Config::SystemConfig& cfg, const std::string& csv_path);
bool load_reasoning_api_key_from_environment(QuantSignal::Config::SystemConfig& cfg);
int load_system_config(QuantSignal::Config::SystemConfig& config, const std::string& config_directory);
bool validate_config(const QuantSignal::Config::SystemConfig& config, std::string& error_message);

#endif // CONFIG_LOADER_HPP
