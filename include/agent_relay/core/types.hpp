#pragma once

#include <agent_relay/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace agent_relay {

// ---------------------------------------------------------------------------
// ServerName: key of a configured external tool server.
//
// Rules:
//   - Non-empty, max 64 characters
//   - ASCII letters, digits, '-', '_' and '.'
// ---------------------------------------------------------------------------
class ServerName {
public:
    static Result<ServerName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ServerName& other) const { return value_ == other.value_; }
    bool operator!=(const ServerName& other) const { return value_ != other.value_; }
    bool operator<(const ServerName& other) const { return value_ < other.value_; }

    ServerName(const ServerName&) = default;
    ServerName& operator=(const ServerName&) = default;
    ServerName(ServerName&&) noexcept = default;
    ServerName& operator=(ServerName&&) noexcept = default;

private:
    explicit ServerName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// ApprovalToken: 8 uppercase hex characters identifying an approval request.
// Create() normalizes lowercase input so "approve ab12cd34" matches.
// ---------------------------------------------------------------------------
class ApprovalToken {
public:
    static Result<ApprovalToken, std::string> Create(std::string_view token);

    /// Fresh random token.
    static ApprovalToken Generate();

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ApprovalToken& other) const { return value_ == other.value_; }
    bool operator!=(const ApprovalToken& other) const { return value_ != other.value_; }

    ApprovalToken(const ApprovalToken&) = default;
    ApprovalToken& operator=(const ApprovalToken&) = default;
    ApprovalToken(ApprovalToken&&) noexcept = default;
    ApprovalToken& operator=(ApprovalToken&&) noexcept = default;

private:
    explicit ApprovalToken(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace agent_relay

template <>
struct std::hash<agent_relay::ServerName> {
    size_t operator()(const agent_relay::ServerName& n) const noexcept {
        return std::hash<std::string>{}(n.Value());
    }
};
