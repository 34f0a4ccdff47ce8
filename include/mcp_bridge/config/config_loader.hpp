#pragma once

#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_bridge {

// Read a YAML file with optional `server`, `dispatch` and `logging` maps.
// Missing keys keep their defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse the command line. The -c/--config path, if given, is returned
// through `config_path`.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv,
                                     std::string* config_path = nullptr);

// Fields the command line changed from their defaults replace the YAML ones.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

Result<void, Error> ValidateConfig(const AppConfig& config);

// "auto", "always" or "never".
Result<ColorChoice, Error> ParseColorChoice(std::string_view text);

} // namespace mcp_bridge
