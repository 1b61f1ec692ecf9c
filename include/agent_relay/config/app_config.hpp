#pragma once

#include <agent_relay/rpc/server_connection.hpp>

#include <map>
#include <optional>
#include <string>

namespace agent_relay {

struct ModelConfig {
    std::string api_key;
    std::string api_key_env = "ANTHROPIC_API_KEY"; // read when api_key is empty
    std::string name = "claude-sonnet-4-5-20250929";
    int max_tokens = 4096;
    std::string host = "api.anthropic.com";
    std::optional<std::string> system_prompt;     // built-in prompt when unset
    std::optional<std::string> instructions_file; // appended to the system prompt
};

struct ConversationConfig {
    int idle_timeout_minutes = 60;
    int max_history_messages = 50;
    int max_rounds = 10;
};

struct ApprovalConfig {
    int timeout_seconds = 300;
    int poll_interval_ms = 2000;
    bool require_approval_for_shell = true;
};

struct McpConfig {
    std::optional<std::string> settings_file; // JSON with an "mcpServers" object
    std::map<std::string, ServerConfig> servers;
    int init_timeout_seconds = 60;
    int request_timeout_seconds = 120;
    int max_scan_lines = 200;
};

struct ToolsConfig {
    int shell_timeout_seconds = 30;
    int file_read_limit = 10000;
    int bridge_output_limit = 8000;
    std::string search_host = "api.duckduckgo.com";
};

struct AppConfig {
    ModelConfig model;
    ConversationConfig conversation;
    ApprovalConfig approval;
    McpConfig mcp;
    ToolsConfig tools;
    std::string principal = "console";
    std::optional<std::string> snapshot_file;
    std::optional<std::string> log_file;
    std::optional<std::string> config_file; // -c/--config
    int verbosity = 0;                       // 0 warn, 1 info, 2+ debug
    bool quiet = false;
    bool json_logs = false;
};

} // namespace agent_relay
