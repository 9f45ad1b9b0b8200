#pragma once

#include <toolwire/config/app_config.hpp>
#include <toolwire/core/result.hpp>

#include <string_view>

namespace toolwire {

// Parse a YAML config file into an AppConfig. Relative resource paths are
// resolved against the directory of the config file.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments.
Result<CliOptions, Error> ParseCli(int argc, const char* const* argv);

// Apply CLI flags on top of a file (or default) configuration.
AppConfig ApplyCliOverrides(AppConfig base, const CliOptions& cli);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// ParseCli-independent pipeline used by main(): load the file named by
// cli.config_path (or start from defaults), apply overrides, validate.
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli);

} // namespace toolwire
