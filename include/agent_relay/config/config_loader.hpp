#pragma once

#include <agent_relay/config/app_config.hpp>
#include <agent_relay/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace agent_relay {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI flags (subcommand tokens already stripped) into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields left at their default in cli_overrides keep the yaml_base value.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// If api_key is empty, read it from the api_key_env environment variable.
// A missing variable leaves the key empty; ValidateConfig reports it.
AppConfig ResolveApiKeyEnv(AppConfig config);

// Validate that values are sane. require_model demands an API key (the
// `servers` and `tools` commands never call the model).
Result<void, Error> ValidateConfig(const AppConfig& config, bool require_model = true);

// Read the "mcpServers" object of a settings file:
//   {"mcpServers": {"name": {"command", "args", "env", "description"}}}
Result<std::map<std::string, ServerConfig>, Error> LoadMcpServers(std::string_view file_path);

} // namespace agent_relay
