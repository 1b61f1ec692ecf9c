#include <agent_relay/tools/file_capabilities.hpp>

#include <agent_relay/core/log.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace agent_relay {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// read_file
// ---------------------------------------------------------------------------
FileReadCapability::FileReadCapability(std::size_t read_limit)
    : read_limit_(read_limit) {}

CapabilityDescriptor FileReadCapability::Describe() const {
    return CapabilityDescriptor{
        "read_file",
        "Read the contents of a local file. Provide an absolute path. "
        "Output is truncated to " + std::to_string(read_limit_) + " characters.",
        {
            {"type", "object"},
            {"properties", {
                {"file_path", {{"type", "string"},
                               {"description", "Absolute path to the file"}}},
            }},
            {"required", nlohmann::json::array({"file_path"})},
        }};
}

std::string FileReadCapability::Execute(const nlohmann::json& input) {
    auto path = StringField(input, "file_path");
    if (path.empty()) {
        return "Error: file_path is required";
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return "Error: File not found: " + path;
    }
    if (!fs::is_regular_file(path, ec)) {
        return "Error: Not a file: " + path;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "Error reading file: cannot open " + path;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto content = ss.str();

    LogDebug("tools", "read_file " + path + " (" + std::to_string(content.size()) + " bytes)");
    if (content.size() > read_limit_) {
        return Utf8Prefix(content, read_limit_) + "\n\n... (truncated, " +
               std::to_string(content.size()) + " chars total)";
    }
    return content;
}

// ---------------------------------------------------------------------------
// write_file
// ---------------------------------------------------------------------------
CapabilityDescriptor FileWriteCapability::Describe() const {
    return CapabilityDescriptor{
        "write_file",
        "Write content to a local file. Creates parent directories if needed. "
        "Overwrites the file if it already exists. Provide an absolute path.",
        {
            {"type", "object"},
            {"properties", {
                {"file_path", {{"type", "string"},
                               {"description", "Absolute path where the file should be written"}}},
                {"content", {{"type", "string"},
                             {"description", "Content to write"}}},
            }},
            {"required", nlohmann::json::array({"file_path", "content"})},
        }};
}

std::string FileWriteCapability::ApprovalDescription(const nlohmann::json& input) const {
    auto content = StringField(input, "content");
    return "Write file:\n" + StringField(input, "file_path") + " (" +
           std::to_string(content.size()) + " chars)";
}

std::string FileWriteCapability::Execute(const nlohmann::json& input) {
    auto path = StringField(input, "file_path");
    if (path.empty()) {
        return "Error: file_path is required";
    }
    auto content = StringField(input, "content");

    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return "Error writing file: " + ec.message();
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return "Error writing file: cannot open " + path;
    }
    file << content;
    file.close();
    if (!file) {
        return "Error writing file: write to " + path + " failed";
    }

    LogInfo("tools", "wrote " + std::to_string(content.size()) + " bytes to " + path);
    return "Wrote " + std::to_string(content.size()) + " characters to " + path;
}

} // namespace agent_relay
