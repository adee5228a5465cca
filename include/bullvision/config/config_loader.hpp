#pragma once

#include <bullvision/config/app_config.hpp>
#include <bullvision/core/result.hpp>
#include <bullvision/server/tool_server_spec.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace bullvision {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse command-line arguments (--config, --log-level, --json-logs,
// --list-tools) into an AppConfig holding only what was given.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Resolve engine.api_key_env: if api_key is empty and api_key_env is set,
// read the environment variable into api_key.
Result<AppConfig, Error> ResolveApiKeyEnv(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Convert the validated server entries into launch specs, in order.
Result<std::vector<ToolServerSpec>, Error> ToServerSpecs(const AppConfig& config);

// Read a whole text file (system prompt).
Result<std::string, Error> ReadTextFile(const std::string& path);

} // namespace bullvision
