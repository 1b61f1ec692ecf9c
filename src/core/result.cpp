#include <agent_relay/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace agent_relay {

namespace {

// Model APIs report failures as {"type":"error","error":{"type":..,"message":..}}.
std::optional<std::string> ExtractApiErrorMessage(const std::string& body) {
    if (body.empty()) return std::nullopt;
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    auto it = parsed.find("error");
    if (it == parsed.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_object() && it->contains("message") && (*it)["message"].is_string()) {
        auto msg = (*it)["message"].get<std::string>();
        if (!msg.empty()) return msg;
    }
    return std::nullopt;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto api_error = ExtractApiErrorMessage(response_body);

    ErrorCategory category = ErrorCategory::Internal;
    std::string message;

    switch (status_code) {
        case 400:
            message = "Bad request";
            break;
        case 401:
        case 403:
            category = ErrorCategory::Authentication;
            message = "Authentication failed, check the API key";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::Timeout;
            message = "Rate limited, retry later";
            break;
        case 500:
            message = "Server error";
            break;
        case 502:
        case 503:
        case 504:
        case 529:
            category = ErrorCategory::Connection;
            message = "Service unavailable or overloaded";
            break;
        default:
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }
    if (api_error.has_value()) {
        message += ": " + *api_error;
    }

    return Error{operation, endpoint, "HTTP " + std::to_string(status_code) + " " + message,
                 api_error, category};
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Configuration:     return 2;
        case ErrorCategory::Initialization:    return 3;
        case ErrorCategory::Timeout:           return 4;
        case ErrorCategory::UnknownCapability: return 5;
        case ErrorCategory::ProtocolDecode:    return 6;
        case ErrorCategory::NoResponse:        return 6;
        case ErrorCategory::ProcessExited:     return 7;
        case ErrorCategory::RpcError:          return 8;
        case ErrorCategory::Connection:        return 9;
        case ErrorCategory::Authentication:    return 10;
        case ErrorCategory::NotFound:          return 11;
        case ErrorCategory::MaxRoundsExceeded: return 12;
        case ErrorCategory::Internal:          return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Configuration:     return "configuration";
        case ErrorCategory::Initialization:    return "initialization";
        case ErrorCategory::Timeout:           return "timeout";
        case ErrorCategory::UnknownCapability: return "unknown_capability";
        case ErrorCategory::ProtocolDecode:    return "protocol_decode";
        case ErrorCategory::NoResponse:        return "no_response";
        case ErrorCategory::ProcessExited:     return "process_exited";
        case ErrorCategory::RpcError:          return "rpc_error";
        case ErrorCategory::Connection:        return "connection";
        case ErrorCategory::Authentication:    return "authentication";
        case ErrorCategory::NotFound:          return "not_found";
        case ErrorCategory::MaxRoundsExceeded: return "max_rounds_exceeded";
        case ErrorCategory::Internal:          return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!target.empty()) {
        oss << " [" << target << "]";
    }
    oss << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " (" << *detail << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!target.empty()) {
        body["target"] = target;
    }
    if (detail.has_value() && !detail->empty()) {
        body["detail"] = *detail;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace agent_relay
