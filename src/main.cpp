#include <agent_relay/agent/anthropic_client.hpp>
#include <agent_relay/agent/busy_registry.hpp>
#include <agent_relay/agent/console_channel.hpp>
#include <agent_relay/agent/inbound_router.hpp>
#include <agent_relay/agent/turn_orchestrator.hpp>
#include <agent_relay/approval/approval_gate.hpp>
#include <agent_relay/config/config_loader.hpp>
#include <agent_relay/core/ansi.hpp>
#include <agent_relay/core/log.hpp>
#include <agent_relay/core/terminal.hpp>
#include <agent_relay/core/version.hpp>
#include <agent_relay/http/http_client.hpp>
#include <agent_relay/rpc/connection_pool.hpp>
#include <agent_relay/store/memory_store.hpp>
#include <agent_relay/tools/builtin_capabilities.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage   = 2;

// Flags that never consume the next argument.
bool IsBooleanFlag(std::string_view arg) {
    return arg == "-v" || arg == "-vv" || arg == "-vvv" || arg == "--verbose" ||
           arg == "-q" || arg == "--quiet" || arg == "--color" || arg == "--no-color" ||
           arg == "--json-logs" || arg == "-h" || arg == "--help" || arg == "--version";
}

// Positional arguments (command and its operand) with their argv indices.
struct Positionals {
    std::vector<std::string> values;
    std::vector<int> indices;
};

Positionals FindPositionals(int argc, const char* const* argv) {
    Positionals result;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (IsBooleanFlag(arg)) continue;
        if (!arg.empty() && arg[0] == '-') {
            // Value flag: "--flag value" consumes the next token.
            if (arg.find('=') == std::string_view::npos && i + 1 < argc) {
                ++i;
            }
            continue;
        }
        result.values.emplace_back(arg);
        result.indices.push_back(i);
    }
    return result;
}

// argv without the positional tokens, so LoadFromCli sees only flags.
std::vector<const char*> StripPositionals(int argc, const char* const* argv,
                                          const Positionals& positionals) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    std::size_t next = 0;
    for (int i = 1; i < argc; ++i) {
        if (next < positionals.indices.size() && positionals.indices[next] == i) {
            ++next;
            continue;
        }
        stripped.push_back(argv[i]);
    }
    return stripped;
}

bool HasFlag(int argc, const char* const* argv, std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == flag) return true;
    }
    return false;
}

int ColorFlag(int argc, const char* const* argv) {
    int color = -1;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color") color = 1;
        if (arg == "--no-color") color = 0;
    }
    return color;
}

void PrintTopLevelHelp(std::ostream& out, bool color) {
    const char* bold = color ? agent_relay::ansi::kBold : "";
    const char* reset = color ? agent_relay::ansi::kReset : "";
    out << bold << "agent-relay" << reset << " " << agent_relay::kVersion
        << " - tool-using model agent with human approval\n\n"
        << bold << "Usage:" << reset << "\n"
        << "  agent-relay [run] [flags]        interactive session on stdin/stdout\n"
        << "  agent-relay servers [flags]      list configured MCP servers\n"
        << "  agent-relay tools <server>       list the tools of one MCP server\n\n"
        << bold << "Flags:" << reset << "\n"
        << "  -c, --config <file>        YAML config file\n"
        << "  --principal <id>           principal allowed to talk to the agent\n"
        << "  --snapshot <file>          persist conversations and approvals as JSON\n"
        << "  --mcp-settings <file>      JSON file with an mcpServers object\n"
        << "  --model <name>             model name\n"
        << "  --api-key-env <var>        environment variable with the API key\n"
        << "  --instructions <file>      appended to the system prompt\n"
        << "  --max-rounds <n>           model calls per turn (default 10)\n"
        << "  --approval-timeout <s>     approval wait in seconds (default 300)\n"
        << "  --log-file <file>          also write logs to a file\n"
        << "  --json-logs                log as JSON lines\n"
        << "  -v, -vv                    info / debug logging\n"
        << "  -q, --quiet                errors only\n"
        << "  --color, --no-color        force or disable color\n"
        << "  --version                  print version\n"
        << "  -h, --help                 this help\n\n"
        << bold << "In a session:" << reset << "\n"
        << "  APPROVE <id> / DENY <id>   answer an approval request\n"
        << "  /reset                     start a fresh conversation\n"
        << "  /quit                      leave\n";
}

void PrintError(const agent_relay::Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

void InitLogging(const agent_relay::AppConfig& config, bool use_color) {
    using namespace agent_relay;

    auto level = LogLevel::Warn;
    if (config.verbosity >= 2) level = LogLevel::Debug;
    else if (config.verbosity == 1) level = LogLevel::Info;
    if (config.quiet) level = LogLevel::Error;

    std::unique_ptr<ILogSink> sink;
    if (config.json_logs) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(use_color);
    }
    if (config.log_file.has_value()) {
        auto file = std::make_unique<FileSink>(*config.log_file);
        if (file->IsOpen()) {
            sink = std::make_unique<TeeSink>(std::move(sink), std::move(file));
        } else {
            std::cerr << "Warning: cannot open log file " << *config.log_file << "\n";
        }
    }
    InitGlobalLogger(std::move(sink), level);
}

// Settings-file servers first, inline servers override by name.
agent_relay::Result<std::map<std::string, agent_relay::ServerConfig>, agent_relay::Error>
ResolveServers(const agent_relay::AppConfig& config) {
    using namespace agent_relay;
    using ServerMap = std::map<std::string, ServerConfig>;

    ServerMap servers;
    if (config.mcp.settings_file.has_value()) {
        auto loaded = LoadMcpServers(*config.mcp.settings_file);
        if (loaded.IsErr()) {
            return Result<ServerMap, Error>::Err(loaded.Error());
        }
        servers = std::move(loaded).Value();
        LogInfo("config", "loaded " + std::to_string(servers.size()) +
                              " servers from " + *config.mcp.settings_file);
    }
    for (const auto& [name, server] : config.mcp.servers) {
        servers[name] = server;
    }
    return Result<ServerMap, Error>::Ok(std::move(servers));
}

agent_relay::ConnectionOptions ToConnectionOptions(const agent_relay::McpConfig& mcp) {
    agent_relay::ConnectionOptions options;
    options.init_timeout = std::chrono::seconds(mcp.init_timeout_seconds);
    options.request_timeout = std::chrono::seconds(mcp.request_timeout_seconds);
    options.max_scan_lines = mcp.max_scan_lines;
    return options;
}

// ---------------------------------------------------------------------------
// servers
// ---------------------------------------------------------------------------
int HandleServers(agent_relay::IConnectionPool& pool) {
    auto names = pool.ServerNames();
    if (names.empty()) {
        std::cout << "No MCP servers configured.\n";
        return kExitSuccess;
    }
    for (const auto& name : names) {
        std::cout << name << "\t" << pool.Describe(name).value_or("") << "\n";
    }
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// tools <server>
// ---------------------------------------------------------------------------
int HandleTools(agent_relay::IConnectionPool& pool, const std::string& server,
                bool json_output) {
    using namespace agent_relay;

    auto connection = pool.GetOrCreate(server);
    if (connection.IsErr()) {
        PrintError(connection.Error(), json_output);
        return connection.Error().ExitCode();
    }
    auto listed = connection.Value()->SendRequest("tools/list", nlohmann::json::object());
    pool.ShutdownAll();
    if (listed.IsErr()) {
        PrintError(listed.Error(), json_output);
        return listed.Error().ExitCode();
    }
    const auto& result = listed.Value();
    if (json_output) {
        std::cout << result.dump(2) << "\n";
        return kExitSuccess;
    }
    if (!result.contains("tools") || !result["tools"].is_array() || result["tools"].empty()) {
        std::cout << "No tools found on this server.\n";
        return kExitSuccess;
    }
    for (const auto& tool : result["tools"]) {
        std::cout << tool.value("name", "?");
        auto description = tool.value("description", "");
        if (!description.empty()) {
            std::cout << "\t" << description.substr(0, description.find('\n'));
        }
        std::cout << "\n";
    }
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
int HandleRun(const agent_relay::AppConfig& config, agent_relay::IConnectionPool& pool,
              bool use_color) {
    using namespace agent_relay;

    std::unique_ptr<MemoryStore> store;
    if (config.snapshot_file.has_value()) {
        auto opened = MemoryStore::Open(*config.snapshot_file);
        if (opened.IsErr()) {
            PrintError(opened.Error(), config.json_logs);
            return opened.Error().ExitCode();
        }
        store = std::move(opened).Value();
    } else {
        store = std::make_unique<MemoryStore>();
    }

    HttpClient model_http("https://" + config.model.host);
    HttpClient search_http("https://" + config.tools.search_host,
                           HttpClientOptions{std::chrono::seconds(10), std::chrono::seconds(10)});

    AnthropicOptions model_options;
    model_options.api_key = config.model.api_key;
    model_options.model = config.model.name;
    model_options.max_tokens = config.model.max_tokens;
    AnthropicClient model(model_http, model_options);

    ConsoleChannel channel(std::cout, use_color);

    ApprovalOptions approval_options;
    approval_options.timeout = std::chrono::seconds(config.approval.timeout_seconds);
    approval_options.poll_interval = std::chrono::milliseconds(config.approval.poll_interval_ms);
    ApprovalGate approvals(*store, channel, approval_options);

    CapabilityRegistry registry;
    BuiltinCapabilityOptions tool_options;
    tool_options.shell.timeout = std::chrono::seconds(config.tools.shell_timeout_seconds);
    tool_options.shell.require_approval = config.approval.require_approval_for_shell;
    tool_options.file_read_limit = static_cast<std::size_t>(config.tools.file_read_limit);
    tool_options.bridge_output_limit = static_cast<std::size_t>(config.tools.bridge_output_limit);
    auto registered = RegisterBuiltinCapabilities(registry, tool_options, search_http, pool);
    if (registered.IsErr()) {
        PrintError(registered.Error(), config.json_logs);
        return registered.Error().ExitCode();
    }

    OrchestratorOptions turn_options;
    turn_options.system_prompt = ComposeSystemPrompt(
        config.model.system_prompt.value_or(kDefaultSystemPrompt),
        config.model.instructions_file);
    turn_options.max_rounds = config.conversation.max_rounds;
    turn_options.max_history_messages =
        static_cast<std::size_t>(config.conversation.max_history_messages);
    turn_options.idle_timeout = std::chrono::minutes(config.conversation.idle_timeout_minutes);

    BusyRegistry busy;
    TurnOrchestrator orchestrator(*store, model, registry, approvals, channel, busy,
                                  std::move(turn_options));
    InboundRouter router(config.principal, orchestrator, approvals, *store, channel);

    LogInfo("main", "session for '" + config.principal + "' with " +
                        std::to_string(registry.Descriptors().size()) + " tools");
    const bool interactive = IsStdinTty();
    if (interactive) {
        std::cout << "agent-relay " << kVersion << " (" << config.model.name
                  << "). /quit to leave.\n";
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "/quit" || line == "/exit") break;
        router.Route(config.principal, line);
    }

    router.WaitIdle();
    pool.ShutdownAll();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace agent_relay;

    const int color_flag = ColorFlag(argc, argv);
    const bool stdout_color =
        color_flag == 1 || (color_flag == -1 && !NoColorEnvSet() && IsStdoutTty());

    auto positionals = FindPositionals(argc, argv);
    if (HasFlag(argc, argv, "--version") && positionals.values.empty()) {
        std::cout << "agent-relay " << kVersion << "\n";
        return kExitSuccess;
    }
    if (HasFlag(argc, argv, "--help") || HasFlag(argc, argv, "-h")) {
        PrintTopLevelHelp(std::cout, stdout_color);
        return kExitSuccess;
    }

    std::string command = positionals.values.empty() ? "run" : positionals.values.front();
    if (command != "run" && command != "servers" && command != "tools") {
        std::cerr << "Error: unknown command '" << command << "'. See agent-relay --help.\n";
        return kExitUsage;
    }
    const std::size_t expected_positionals = command == "tools" ? 2 : 1;
    if (command == "tools" && positionals.values.size() < 2) {
        std::cerr << "Error: usage: agent-relay tools <server>\n";
        return kExitUsage;
    }
    if (positionals.values.size() > expected_positionals) {
        std::cerr << "Error: unexpected argument '" << positionals.values[expected_positionals]
                  << "'\n";
        return kExitUsage;
    }

    // Step 1: CLI flags.
    auto stripped = StripPositionals(argc, argv, positionals);
    auto cli_result = LoadFromCli(static_cast<int>(stripped.size()), stripped.data());
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error(), false);
        return cli_result.Error().ExitCode();
    }
    auto cli_config = std::move(cli_result).Value();

    // Step 2: YAML config, CLI on top.
    AppConfig config;
    if (cli_config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*cli_config.config_file);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error(), cli_config.json_logs);
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli_config);
    } else {
        config = std::move(cli_config);
    }

    // Step 3: logging.
    InitLogging(config, ShouldUseColor(color_flag));

    // Step 4: API key and validation.
    config = ResolveApiKeyEnv(std::move(config));
    auto valid = ValidateConfig(config, command == "run");
    if (valid.IsErr()) {
        PrintError(valid.Error(), config.json_logs);
        return valid.Error().ExitCode();
    }

    // Step 5: MCP servers.
    auto servers = ResolveServers(config);
    if (servers.IsErr()) {
        PrintError(servers.Error(), config.json_logs);
        return servers.Error().ExitCode();
    }
    ConnectionPool pool(std::move(servers).Value(), ToConnectionOptions(config.mcp));

    if (command == "servers") {
        return HandleServers(pool);
    }
    if (command == "tools") {
        return HandleTools(pool, positionals.values[1], config.json_logs);
    }
    return HandleRun(config, pool, stdout_color);
}
