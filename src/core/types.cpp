#include <agent_relay/core/types.hpp>

#include <algorithm>
#include <cctype>
#include <random>

namespace agent_relay {

namespace {

bool IsServerNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           c == '-' || c == '_' || c == '.';
}

bool IsUpperHex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F');
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ServerName
// ---------------------------------------------------------------------------
Result<ServerName, std::string> ServerName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ServerName, std::string>::Err("Server name must not be empty");
    }
    if (name.size() > 64) {
        return Result<ServerName, std::string>::Err(
            "Server name must be at most 64 characters, got " +
            std::to_string(name.size()));
    }
    if (!std::all_of(name.begin(), name.end(), IsServerNameChar)) {
        return Result<ServerName, std::string>::Err(
            "Server name must contain only letters, digits, '-', '_' and '.'");
    }
    return Result<ServerName, std::string>::Ok(ServerName(std::string(name)));
}

// ---------------------------------------------------------------------------
// ApprovalToken
// ---------------------------------------------------------------------------
Result<ApprovalToken, std::string> ApprovalToken::Create(std::string_view token) {
    if (token.size() != 8) {
        return Result<ApprovalToken, std::string>::Err(
            "Approval token must be exactly 8 characters, got " +
            std::to_string(token.size()));
    }
    std::string upper(token);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (!std::all_of(upper.begin(), upper.end(), IsUpperHex)) {
        return Result<ApprovalToken, std::string>::Err(
            "Approval token must contain only hex digits");
    }
    return Result<ApprovalToken, std::string>::Ok(ApprovalToken(std::move(upper)));
}

ApprovalToken ApprovalToken::Generate() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string value(8, '0');
    for (auto& c : value) {
        c = kHex[dist(rng)];
    }
    return ApprovalToken(std::move(value));
}

} // namespace agent_relay
