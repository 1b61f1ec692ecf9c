#include <agent_relay/tools/bridge_capability.hpp>

#include <agent_relay/core/log.hpp>

namespace agent_relay {

namespace {

constexpr std::size_t kToolDescriptionChars = 100;

std::string ErrorText(const Error& error) {
    std::string text = "Error: " + error.message;
    if (error.detail.has_value() && !error.detail->empty()) {
        text += ". " + *error.detail;
    }
    return text;
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

} // anonymous namespace

std::string FlattenToolResult(const nlohmann::json& result) {
    std::string joined;
    bool any = false;
    if (result.is_object() && result.contains("content") && result["content"].is_array()) {
        for (const auto& block : result["content"]) {
            std::string text;
            if (block.is_string()) {
                text = block.get<std::string>();
            } else {
                text = StringField(block, "text");
            }
            if (text.empty()) continue;
            if (any) joined += "\n";
            joined += text;
            any = true;
        }
    }
    if (any) return joined;
    return result.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

BridgeCapability::BridgeCapability(IConnectionPool& pool, std::size_t output_limit)
    : pool_(pool), output_limit_(output_limit) {}

CapabilityDescriptor BridgeCapability::Describe() const {
    std::string server_list;
    auto names = pool_.ServerNames();
    for (const auto& name : names) {
        server_list += "  - **" + name + "**: " + pool_.Describe(name).value_or("") + "\n";
    }

    return CapabilityDescriptor{
        "mcp_call",
        "Call a tool on one of the user's MCP servers.\n\n"
        "Available servers:\n" + server_list + "\n"
        "USAGE:\n"
        "1. First call with action='list_tools' and server_name to see available tools.\n"
        "2. Then call with action='call_tool', server_name, tool_name, and arguments.\n\n"
        "IMPORTANT: You must know the exact tool name. Use list_tools first if unsure.",
        {
            {"type", "object"},
            {"properties", {
                {"action", {
                    {"type", "string"},
                    {"enum", nlohmann::json::array({"list_tools", "call_tool"})},
                    {"description", "Either 'list_tools' to discover tools, or 'call_tool' to invoke one"},
                }},
                {"server_name", {
                    {"type", "string"},
                    {"enum", names},
                    {"description", "Which MCP server to use"},
                }},
                {"tool_name", {
                    {"type", "string"},
                    {"description", "The tool to call (required when action='call_tool')"},
                }},
                {"arguments", {
                    {"type", "object"},
                    {"description", "Arguments to pass to the tool (required when action='call_tool')"},
                }},
            }},
            {"required", nlohmann::json::array({"action", "server_name"})},
        }};
}

std::string BridgeCapability::Execute(const nlohmann::json& input) {
    auto action = StringField(input, "action");
    auto server_name = StringField(input, "server_name");
    auto tool_name = StringField(input, "tool_name");
    LogDebug("bridge", "action=" + action + " server=" + server_name + " tool=" + tool_name);

    if (!pool_.Describe(server_name).has_value()) {
        return "Error: Unknown server '" + server_name + "'. Available: " +
               JoinNames(pool_.ServerNames());
    }

    if (action == "list_tools") {
        return ListTools(server_name);
    }
    if (action == "call_tool") {
        if (tool_name.empty()) {
            return "Error: tool_name is required when action='call_tool'";
        }
        nlohmann::json arguments = nlohmann::json::object();
        if (input.contains("arguments") && input["arguments"].is_object()) {
            arguments = input["arguments"];
        }
        return CallTool(server_name, tool_name, arguments);
    }
    return "Error: Unknown action '" + action + "'. Use 'list_tools' or 'call_tool'.";
}

std::string BridgeCapability::ListTools(const std::string& server_name) {
    auto connection = pool_.GetOrCreate(server_name);
    if (connection.IsErr()) {
        return ErrorText(connection.Error());
    }
    auto result = connection.Value()->SendRequest("tools/list", nlohmann::json::object());
    if (result.IsErr()) {
        LogWarn("bridge", server_name + ": " + result.Error().ToString());
        return ErrorText(result.Error());
    }

    const auto& body = result.Value();
    if (!body.contains("tools") || !body["tools"].is_array() || body["tools"].empty()) {
        return "No tools found on this server.";
    }

    const auto& tools = body["tools"];
    std::string out = "Available tools (" + std::to_string(tools.size()) + "):";
    for (const auto& tool : tools) {
        auto name = StringField(tool, "name", "?");
        auto description = StringField(tool, "description");
        if (description.size() > kToolDescriptionChars) {
            description = Utf8Prefix(description, kToolDescriptionChars) + "...";
        }
        out += "\n- **" + name + "**: " + description;
    }
    return out;
}

std::string BridgeCapability::CallTool(const std::string& server_name,
                                       const std::string& tool_name,
                                       const nlohmann::json& arguments) {
    auto connection = pool_.GetOrCreate(server_name);
    if (connection.IsErr()) {
        return ErrorText(connection.Error());
    }
    auto result = connection.Value()->SendRequest(
        "tools/call", {{"name", tool_name}, {"arguments", arguments}});
    if (result.IsErr()) {
        LogWarn("bridge", server_name + "/" + tool_name + ": " + result.Error().ToString());
        return ErrorText(result.Error());
    }

    auto output = FlattenToolResult(result.Value());
    if (output.size() > output_limit_) {
        output = Utf8Prefix(output, output_limit_) + "\n\n... (truncated)";
    }
    return output;
}

} // namespace agent_relay
