#include <agent_relay/tools/shell_capability.hpp>

#include <agent_relay/core/log.hpp>
#include <agent_relay/rpc/child_process.hpp>

#include <regex>
#include <vector>

namespace agent_relay {

namespace {

std::string Strip(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

const std::regex& DestructivePattern() {
    static const std::regex pattern(
        R"(\b(?:)"
        // deletion
        R"(rm|rmdir|del|erase|remove-item|shred|unlink|dd|mkfs(?:\.\w+)?|format|truncate)"
        // process termination
        R"(|kill|pkill|killall|stop-process|taskkill)"
        // power
        R"(|shutdown|reboot|poweroff|halt|restart-computer)"
        // users, services, scheduled tasks
        R"(|net\s+(?:user|localgroup)|useradd|userdel|usermod|passwd)"
        R"(|reg\s+(?:delete|add)|sc\s+(?:delete|stop))"
        R"(|systemctl\s+(?:stop|disable|mask|restart)|crontab\s+-r)"
        R"(|schtasks\s+/(?:create|delete))"
        // links, attributes, permissions, ownership
        R"(|mklink|attrib|icacls|cacls|chmod|chown|chgrp)"
        // move / rename
        R"(|mv|move|ren|rename)"
        // package install / removal
        R"(|pip3?\s+(?:install|uninstall)|npm\s+(?:install|uninstall))"
        R"(|apt(?:-get)?\s+(?:install|remove|purge)|yum\s+(?:install|remove)|dnf\s+(?:install|remove))"
        // destructive git operations
        R"(|git\s+(?:push|reset|rebase|merge|checkout|clean))"
        R"()\b)"
        // mutating HTTP
        R"(|\bcurl\b.*\s-[dX])"
        R"(|\bcurl\b.*--(?:data|request))"
        R"(|\bwget\b.*--(?:post-data|post-file|method))"
        R"(|\binvoke-webrequest\b.*-method\b)",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

} // anonymous namespace

bool IsDestructiveCommand(const std::string& command) {
    return std::regex_search(command, DestructivePattern());
}

ShellCapability::ShellCapability(ShellOptions options) : options_(options) {}

CapabilityDescriptor ShellCapability::Describe() const {
    return CapabilityDescriptor{
        "execute_bash",
        "Execute a shell command on the local system. Output (stdout + stderr) is "
        "captured and returned. Commands time out after " +
            std::to_string(options_.timeout.count()) +
            " seconds. Read-only commands (ls, cat, grep, find, date, pwd, whoami, "
            "etc.) run immediately. Destructive commands (rm, kill, mv, chmod, "
            "git push, etc.) require user approval.",
        {
            {"type", "object"},
            {"properties", {
                {"command", {{"type", "string"},
                             {"description", "The shell command to execute"}}},
                {"reason", {{"type", "string"},
                            {"description", "Brief explanation of why this command is needed"}}},
            }},
            {"required", nlohmann::json::array({"command"})},
        }};
}

bool ShellCapability::NeedsApproval(const nlohmann::json& input) const {
    if (!options_.require_approval) return false;
    auto command = StringField(input, "command");
    bool destructive = IsDestructiveCommand(command);
    LogDebug("shell", std::string(destructive ? "requires approval: " : "auto-approved: ") +
                          Utf8Prefix(command, 80));
    return destructive;
}

std::string ShellCapability::ApprovalDescription(const nlohmann::json& input) const {
    return "Run command:\n" + StringField(input, "command");
}

std::string ShellCapability::Execute(const nlohmann::json& input) {
    auto command = StringField(input, "command");
    if (Strip(command).empty()) {
        return "Error: command is required";
    }

    LogInfo("shell", "running: " + Utf8Prefix(command, 200));
    auto run = RunShellCommand(command, options_.timeout);
    if (run.IsErr()) {
        if (run.Error().category == ErrorCategory::Timeout) {
            return "Error: Command timed out after " +
                   std::to_string(options_.timeout.count()) + " seconds";
        }
        return "Error: " + run.Error().message;
    }

    const auto& out = run.Value();
    std::vector<std::string> parts;
    auto stdout_text = Strip(out.stdout_text);
    auto stderr_text = Strip(out.stderr_text);
    if (!stdout_text.empty()) parts.push_back("STDOUT:\n" + stdout_text);
    if (!stderr_text.empty()) parts.push_back("STDERR:\n" + stderr_text);
    parts.push_back("Exit code: " + std::to_string(out.exit_code));

    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += "\n\n";
        result += parts[i];
    }
    return result;
}

} // namespace agent_relay
