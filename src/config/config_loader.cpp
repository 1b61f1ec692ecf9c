#include <agent_relay/config/config_loader.hpp>

#include <agent_relay/core/types.hpp>
#include <agent_relay/core/version.hpp>

#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace agent_relay {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", message, std::nullopt, ErrorCategory::Configuration};
}

template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

template <typename T>
void ReadOptional(const YAML::Node& node, const char* key, std::optional<T>& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

// Build a ServerConfig from a parsed YAML node.
Result<ServerConfig, Error> ParseYamlServer(const std::string& name, const YAML::Node& node) {
    if (!node["command"]) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Server '" + name + "' missing 'command' field"));
    }
    ServerConfig server;
    server.command = node["command"].as<std::string>();
    if (node["args"]) {
        for (const auto& arg : node["args"]) {
            server.args.push_back(arg.as<std::string>());
        }
    }
    if (node["env"]) {
        for (const auto& entry : node["env"]) {
            server.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
    server.description = node["description"] ? node["description"].as<std::string>()
                                             : name + " MCP server";
    return Result<ServerConfig, Error>::Ok(std::move(server));
}

Result<void, Error> RequirePositive(const char* field, int value) {
    if (value <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            std::string(field) + " must be positive, got " + std::to_string(value)));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        // -- Model --
        if (root["model"]) {
            const auto& model = root["model"];
            ReadScalar(model, "api_key", config.model.api_key);
            ReadScalar(model, "api_key_env", config.model.api_key_env);
            ReadScalar(model, "name", config.model.name);
            ReadScalar(model, "max_tokens", config.model.max_tokens);
            ReadScalar(model, "host", config.model.host);
            ReadOptional(model, "system_prompt", config.model.system_prompt);
            ReadOptional(model, "instructions_file", config.model.instructions_file);
        }

        // -- Conversation --
        if (root["conversation"]) {
            const auto& conv = root["conversation"];
            ReadScalar(conv, "idle_timeout_minutes", config.conversation.idle_timeout_minutes);
            ReadScalar(conv, "max_history_messages", config.conversation.max_history_messages);
            ReadScalar(conv, "max_rounds", config.conversation.max_rounds);
        }

        // -- Approval --
        if (root["approval"]) {
            const auto& approval = root["approval"];
            ReadScalar(approval, "timeout_seconds", config.approval.timeout_seconds);
            ReadScalar(approval, "poll_interval_ms", config.approval.poll_interval_ms);
            ReadScalar(approval, "require_approval_for_shell",
                       config.approval.require_approval_for_shell);
        }

        // -- MCP --
        if (root["mcp"]) {
            const auto& mcp = root["mcp"];
            ReadOptional(mcp, "settings_file", config.mcp.settings_file);
            ReadScalar(mcp, "init_timeout_seconds", config.mcp.init_timeout_seconds);
            ReadScalar(mcp, "request_timeout_seconds", config.mcp.request_timeout_seconds);
            ReadScalar(mcp, "max_scan_lines", config.mcp.max_scan_lines);
            if (mcp["servers"]) {
                for (const auto& entry : mcp["servers"]) {
                    auto name = entry.first.as<std::string>();
                    auto server = ParseYamlServer(name, entry.second);
                    if (server.IsErr()) {
                        return Result<AppConfig, Error>::Err(server.Error());
                    }
                    config.mcp.servers[name] = std::move(server).Value();
                }
            }
        }

        // -- Tools --
        if (root["tools"]) {
            const auto& tools = root["tools"];
            ReadScalar(tools, "shell_timeout_seconds", config.tools.shell_timeout_seconds);
            ReadScalar(tools, "file_read_limit", config.tools.file_read_limit);
            ReadScalar(tools, "bridge_output_limit", config.tools.bridge_output_limit);
            ReadScalar(tools, "search_host", config.tools.search_host);
        }

        // -- Options --
        ReadScalar(root, "principal", config.principal);
        ReadOptional(root, "snapshot_file", config.snapshot_file);
        ReadOptional(root, "log_file", config.log_file);
        ReadScalar(root, "quiet", config.quiet);
        ReadScalar(root, "json_logs", config.json_logs);
        if (root["verbose"]) {
            config.verbosity = root["verbose"].as<bool>() ? 1 : 0;
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    // --version is handled by main before any parsing; -v is verbosity here.
    argparse::ArgumentParser program("agent-relay", kVersion,
                                     argparse::default_arguments::help);

    int verbosity = 0;

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--principal")
        .help("Principal id allowed to talk to the agent");
    program.add_argument("--snapshot")
        .help("JSON file persisting conversations and approvals");
    program.add_argument("--mcp-settings")
        .help("JSON settings file with an mcpServers object");
    program.add_argument("--model")
        .help("Model name");
    program.add_argument("--api-key-env")
        .help("Environment variable containing the API key");
    program.add_argument("--instructions")
        .help("File appended to the system prompt");
    program.add_argument("--max-rounds")
        .help("Maximum model calls per turn")
        .scan<'i', int>();
    program.add_argument("--approval-timeout")
        .help("Seconds to wait for an approval decision")
        .scan<'i', int>();
    program.add_argument("--log-file")
        .help("Also write logs to this file");
    program.add_argument("--json-logs")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose logging (-vv for debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("-q", "--quiet")
        .help("Errors only")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--principal")) {
        config.principal = *val;
    }
    if (auto val = program.present("--snapshot")) {
        config.snapshot_file = *val;
    }
    if (auto val = program.present("--mcp-settings")) {
        config.mcp.settings_file = *val;
    }
    if (auto val = program.present("--model")) {
        config.model.name = *val;
    }
    if (auto val = program.present("--api-key-env")) {
        config.model.api_key_env = *val;
    }
    if (auto val = program.present("--instructions")) {
        config.model.instructions_file = *val;
    }
    if (auto val = program.present<int>("--max-rounds")) {
        config.conversation.max_rounds = *val;
    }
    if (auto val = program.present<int>("--approval-timeout")) {
        config.approval.timeout_seconds = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--json-logs")) {
        config.json_logs = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    config.verbosity = verbosity;

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    if (cli_overrides.principal != defaults.principal) {
        merged.principal = cli_overrides.principal;
    }
    if (cli_overrides.snapshot_file.has_value()) {
        merged.snapshot_file = cli_overrides.snapshot_file;
    }
    if (cli_overrides.mcp.settings_file.has_value()) {
        merged.mcp.settings_file = cli_overrides.mcp.settings_file;
    }
    if (cli_overrides.model.name != defaults.model.name) {
        merged.model.name = cli_overrides.model.name;
    }
    if (cli_overrides.model.api_key_env != defaults.model.api_key_env) {
        merged.model.api_key_env = cli_overrides.model.api_key_env;
    }
    if (!cli_overrides.model.api_key.empty()) {
        merged.model.api_key = cli_overrides.model.api_key;
    }
    if (cli_overrides.model.instructions_file.has_value()) {
        merged.model.instructions_file = cli_overrides.model.instructions_file;
    }
    if (cli_overrides.conversation.max_rounds != defaults.conversation.max_rounds) {
        merged.conversation.max_rounds = cli_overrides.conversation.max_rounds;
    }
    if (cli_overrides.approval.timeout_seconds != defaults.approval.timeout_seconds) {
        merged.approval.timeout_seconds = cli_overrides.approval.timeout_seconds;
    }

    // Options
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.json_logs) {
        merged.json_logs = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.verbosity > 0) {
        merged.verbosity = cli_overrides.verbosity;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveApiKeyEnv
// ---------------------------------------------------------------------------
AppConfig ResolveApiKeyEnv(AppConfig config) {
    if (config.model.api_key.empty() && !config.model.api_key_env.empty()) {
        const char* env_val = std::getenv(config.model.api_key_env.c_str());
        if (env_val != nullptr) {
            config.model.api_key = env_val;
        }
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config, bool require_model) {
    if (require_model) {
        if (config.model.api_key.empty()) {
            return Result<void, Error>::Err(MakeConfigError(
                "Missing API key: set model.api_key or the " +
                config.model.api_key_env + " environment variable"));
        }
        if (config.model.name.empty()) {
            return Result<void, Error>::Err(MakeConfigError("Missing required field: model.name"));
        }
        if (config.model.host.empty()) {
            return Result<void, Error>::Err(MakeConfigError("Missing required field: model.host"));
        }
    }
    if (config.principal.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: principal"));
    }

    const std::pair<const char*, int> positives[] = {
        {"model.max_tokens", config.model.max_tokens},
        {"conversation.idle_timeout_minutes", config.conversation.idle_timeout_minutes},
        {"conversation.max_history_messages", config.conversation.max_history_messages},
        {"conversation.max_rounds", config.conversation.max_rounds},
        {"approval.timeout_seconds", config.approval.timeout_seconds},
        {"approval.poll_interval_ms", config.approval.poll_interval_ms},
        {"mcp.init_timeout_seconds", config.mcp.init_timeout_seconds},
        {"mcp.request_timeout_seconds", config.mcp.request_timeout_seconds},
        {"mcp.max_scan_lines", config.mcp.max_scan_lines},
        {"tools.shell_timeout_seconds", config.tools.shell_timeout_seconds},
        {"tools.file_read_limit", config.tools.file_read_limit},
        {"tools.bridge_output_limit", config.tools.bridge_output_limit},
    };
    for (const auto& [field, value] : positives) {
        auto ok = RequirePositive(field, value);
        if (ok.IsErr()) {
            return ok;
        }
    }

    for (const auto& [name, server] : config.mcp.servers) {
        auto valid_name = ServerName::Create(name);
        if (valid_name.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid server name '" + name + "': " + valid_name.Error()));
        }
        if (server.command.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Server '" + name + "' has an empty command"));
        }
    }

    if (config.verbosity > 0 && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadMcpServers
// ---------------------------------------------------------------------------
Result<std::map<std::string, ServerConfig>, Error> LoadMcpServers(std::string_view file_path) {
    using ServerMap = std::map<std::string, ServerConfig>;

    std::ifstream in{std::string(file_path)};
    if (!in) {
        return Result<ServerMap, Error>::Err(
            MakeConfigError("Cannot open MCP settings file: " + std::string(file_path)));
    }
    auto root = nlohmann::json::parse(in, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return Result<ServerMap, Error>::Err(
            MakeConfigError("MCP settings file is not a JSON object: " + std::string(file_path)));
    }

    ServerMap servers;
    auto it = root.find("mcpServers");
    if (it == root.end()) {
        return Result<ServerMap, Error>::Ok(std::move(servers));
    }
    if (!it->is_object()) {
        return Result<ServerMap, Error>::Err(MakeConfigError("'mcpServers' must be an object"));
    }

    for (const auto& [name, entry] : it->items()) {
        if (!entry.is_object()) {
            return Result<ServerMap, Error>::Err(
                MakeConfigError("Server '" + name + "' must be an object"));
        }
        ServerConfig server;
        server.command = entry.value("command", "");
        if (entry.contains("args") && entry["args"].is_array()) {
            for (const auto& arg : entry["args"]) {
                if (arg.is_string()) {
                    server.args.push_back(arg.get<std::string>());
                }
            }
        }
        if (entry.contains("env") && entry["env"].is_object()) {
            for (const auto& [key, value] : entry["env"].items()) {
                server.env[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        server.description = entry.value("description", name + " MCP server");
        servers[name] = std::move(server);
    }
    return Result<ServerMap, Error>::Ok(std::move(servers));
}

} // namespace agent_relay
