#pragma once

#include <stdexcept>
#include <string>

#include "config/config_schema.hpp"

namespace codeexec::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Defaults, then the JSON file named by CODEEXEC_CONFIG_FILE, then the environment.
Config LoadConfig();

void ApplyConfigFromJson(Config& config, const std::string& json_text);
void Validate(const Config& config);

}  // namespace codeexec::config
