#pragma once

#include <agent_relay/agent/model_client.hpp>
#include <agent_relay/http/i_http_client.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace agent_relay {

inline constexpr const char* kAnthropicApiVersion = "2023-06-01";
inline constexpr const char* kDefaultModel = "claude-sonnet-4-5-20250929";
inline constexpr const char* kDefaultSystemPrompt =
    "You are an assistant that can act on the user's machine.\n"
    "\n"
    "CONSTRAINTS:\n"
    "- Keep responses concise; replies are read on a small screen.\n"
    "- Use short paragraphs and bullet points where appropriate.\n"
    "\n"
    "CAPABILITIES (tools you can call):\n"
    "- execute_bash - run shell commands on the local machine.\n"
    "- read_file    - read a local file (absolute path).\n"
    "- write_file   - create or overwrite a local file (absolute path).\n"
    "- web_search   - search the web for current information.\n"
    "- send_media   - send an image or file URL back to the user.\n"
    "- mcp_call     - call tools on the user's MCP servers.\n"
    "\n"
    "MCP USAGE:\n"
    "1. First call mcp_call with action=\"list_tools\" to see the tools of a server.\n"
    "2. Then call mcp_call with action=\"call_tool\", the tool_name, and arguments.\n"
    "3. If the instructions below give exact tool names, you can skip list_tools.\n"
    "\n"
    "SAFETY:\n"
    "- Destructive shell commands and file writes require the user's approval\n"
    "  before execution. Read-only commands are auto-approved.\n"
    "- MCP calls and file reads are auto-approved.\n"
    "- Never expose secrets, API keys, or credentials in responses.\n"
    "\n"
    "Be helpful, direct, and action-oriented.";

struct AnthropicOptions {
    std::string api_key;
    std::string model = kDefaultModel;
    int max_tokens = 4096;
};

/// base + "\n\n--- Instructions ---\n" + the instructions file, cut at
/// `limit` characters. A missing or unreadable file leaves base unchanged.
std::string ComposeSystemPrompt(const std::string& base,
                                const std::optional<std::string>& instructions_file,
                                std::size_t limit = 12000);

// ---------------------------------------------------------------------------
// AnthropicClient: Messages API (POST /v1/messages) over IHttpClient.
// ---------------------------------------------------------------------------
class AnthropicClient : public IModelClient {
public:
    AnthropicClient(IHttpClient& http, AnthropicOptions options);

    Result<ModelResponse, Error> Complete(const ModelRequest& request) override;

    /// Request body for one call; exposed for tests.
    [[nodiscard]] nlohmann::json BuildRequestBody(const ModelRequest& request) const;

    /// Parses {content: [...], stop_reason: ".."}.
    static Result<ModelResponse, Error> ParseResponse(const std::string& body);

private:
    IHttpClient& http_;
    AnthropicOptions options_;
};

} // namespace agent_relay
