#include <agent_relay/rpc/rpc_codec.hpp>

#include <agent_relay/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace agent_relay {

namespace {

constexpr const char* kContentLength = "content-length:";
constexpr std::size_t kMaxContentLength = 64 * 1024 * 1024;

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool StartsWithIgnoreCase(const std::string& s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

Error MakeDecodeError(const std::string& message, ErrorCategory category) {
    return Error{"RpcCodec::DecodeOne", "", message, std::nullopt, category};
}

// Decimal digits only, at most kMaxContentLength.
std::optional<std::size_t> ParseContentLength(const std::string& value) {
    if (value.empty() || value.size() > 10) return std::nullopt;
    std::size_t length = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        length = length * 10 + static_cast<std::size_t>(c - '0');
    }
    if (length > kMaxContentLength) return std::nullopt;
    return length;
}

// A response carries a non-null id and no method.
bool IsResponse(const nlohmann::json& msg) {
    if (!msg.is_object()) return false;
    if (msg.contains("method")) return false;
    auto it = msg.find("id");
    return it != msg.end() && !it->is_null();
}

bool IdMatches(const nlohmann::json& id, std::int64_t expected) {
    if (id.is_number_integer()) {
        return id.get<std::int64_t>() == expected;
    }
    if (id.is_string()) {
        return id.get<std::string>() == std::to_string(expected);
    }
    return false;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Sources
// ---------------------------------------------------------------------------
Result<std::string, Error> StreamMessageSource::ReadLine() {
    std::string line;
    if (!std::getline(in_, line)) {
        return Result<std::string, Error>::Err(Error{
            "StreamMessageSource::ReadLine", "", "Server closed connection (EOF)",
            std::nullopt, ErrorCategory::ProcessExited});
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return Result<std::string, Error>::Ok(std::move(line));
}

Result<std::string, Error> StreamMessageSource::ReadExact(std::size_t n) {
    std::string body(n, '\0');
    in_.read(body.data(), static_cast<std::streamsize>(n));
    if (static_cast<std::size_t>(in_.gcount()) != n) {
        return Result<std::string, Error>::Err(Error{
            "StreamMessageSource::ReadExact", "", "Server closed connection (EOF)",
            std::nullopt, ErrorCategory::ProcessExited});
    }
    return Result<std::string, Error>::Ok(std::move(body));
}

Result<std::string, Error> ProcessMessageSource::ReadLine() {
    return process_.ReadLine(deadline_);
}

Result<std::string, Error> ProcessMessageSource::ReadExact(std::size_t n) {
    return process_.ReadExact(n, deadline_);
}

// ---------------------------------------------------------------------------
// Encode
// ---------------------------------------------------------------------------
std::string EncodeMessage(std::string_view method,
                          const nlohmann::json& params,
                          std::optional<std::int64_t> id) {
    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"method", std::string(method)},
    };
    if (!params.is_null()) {
        msg["params"] = params;
    }
    if (id.has_value()) {
        msg["id"] = *id;
    }
    return msg.dump() + "\n";
}

// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> DecodeOne(IMessageSource& source,
                                        std::optional<std::int64_t> expected_id,
                                        int max_lines) {
    for (int scanned = 0; scanned < max_lines; ++scanned) {
        auto line_result = source.ReadLine();
        if (line_result.IsErr()) {
            return Result<nlohmann::json, Error>::Err(line_result.Error());
        }
        auto line = Trim(line_result.Value());
        if (line.empty()) continue;

        nlohmann::json msg;
        if (StartsWithIgnoreCase(line, kContentLength)) {
            auto value = Trim(line.substr(std::string_view(kContentLength).size()));
            auto parsed_length = ParseContentLength(value);
            if (!parsed_length) {
                return Result<nlohmann::json, Error>::Err(MakeDecodeError(
                    "Invalid Content-Length header: " + line,
                    ErrorCategory::ProtocolDecode));
            }
            const std::size_t length = *parsed_length;
            // Remaining headers up to the blank separator.
            for (;;) {
                auto header = source.ReadLine();
                if (header.IsErr()) {
                    return Result<nlohmann::json, Error>::Err(header.Error());
                }
                if (Trim(header.Value()).empty()) break;
            }
            auto body = source.ReadExact(length);
            if (body.IsErr()) {
                return Result<nlohmann::json, Error>::Err(body.Error());
            }
            msg = nlohmann::json::parse(body.Value(), nullptr, false);
            if (msg.is_discarded()) {
                return Result<nlohmann::json, Error>::Err(MakeDecodeError(
                    "Content-Length body is not valid JSON",
                    ErrorCategory::ProtocolDecode));
            }
        } else {
            if (line.front() != '{') {
                LogDebug("rpc", "skipping non-JSON line: " + line.substr(0, 120));
                continue;
            }
            msg = nlohmann::json::parse(line, nullptr, false);
            if (msg.is_discarded()) {
                LogDebug("rpc", "skipping unparseable line: " + line.substr(0, 120));
                continue;
            }
        }

        if (!IsResponse(msg)) {
            continue;
        }
        if (expected_id.has_value() && !IdMatches(msg["id"], *expected_id)) {
            LogDebug("rpc", "skipping response for id " + msg["id"].dump() +
                                ", waiting for " + std::to_string(*expected_id));
            continue;
        }
        return Result<nlohmann::json, Error>::Ok(std::move(msg));
    }

    return Result<nlohmann::json, Error>::Err(MakeDecodeError(
        "Exceeded max lines without receiving a JSON-RPC response",
        ErrorCategory::NoResponse));
}

Result<nlohmann::json, Error> ExtractResult(const nlohmann::json& response) {
    if (response.contains("error") && !response["error"].is_null()) {
        const auto& err = response["error"];
        std::string message = "RPC error";
        if (err.is_object()) {
            if (err.contains("code") && err["code"].is_number_integer()) {
                message += " " + std::to_string(err["code"].get<std::int64_t>());
            }
            if (err.contains("message") && err["message"].is_string()) {
                message += ": " + err["message"].get<std::string>();
            }
        } else {
            message += ": " + err.dump();
        }
        std::optional<std::string> detail;
        if (err.is_object() && err.contains("data")) {
            detail = err["data"].dump();
        }
        return Result<nlohmann::json, Error>::Err(Error{
            "RpcCodec::ExtractResult", "", message, detail, ErrorCategory::RpcError});
    }
    if (!response.contains("result")) {
        return Result<nlohmann::json, Error>::Err(Error{
            "RpcCodec::ExtractResult", "", "Response has neither result nor error",
            std::nullopt, ErrorCategory::ProtocolDecode});
    }
    return Result<nlohmann::json, Error>::Ok(response["result"]);
}

} // namespace agent_relay
