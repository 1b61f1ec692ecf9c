#pragma once

#include <agent_relay/core/result.hpp>
#include <agent_relay/rpc/child_process.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace agent_relay {

constexpr int kDefaultMaxScanLines = 200;

// ---------------------------------------------------------------------------
// IMessageSource: byte source the decoder pulls from. Both reads fail with
// a ProcessExited error at end of stream.
// ---------------------------------------------------------------------------
class IMessageSource {
public:
    virtual ~IMessageSource() = default;

    /// Next line without its terminator.
    virtual Result<std::string, Error> ReadLine() = 0;

    /// Exactly n bytes.
    virtual Result<std::string, Error> ReadExact(std::size_t n) = 0;

    IMessageSource(const IMessageSource&) = delete;
    IMessageSource& operator=(const IMessageSource&) = delete;

protected:
    IMessageSource() = default;
};

// Reads from a std::istream (tests, recorded transcripts).
class StreamMessageSource : public IMessageSource {
public:
    explicit StreamMessageSource(std::istream& in) : in_(in) {}

    Result<std::string, Error> ReadLine() override;
    Result<std::string, Error> ReadExact(std::size_t n) override;

private:
    std::istream& in_;
};

// Reads a child's stdout; every read shares one deadline.
class ProcessMessageSource : public IMessageSource {
public:
    ProcessMessageSource(ChildProcess& process, Deadline deadline)
        : process_(process), deadline_(deadline) {}

    Result<std::string, Error> ReadLine() override;
    Result<std::string, Error> ReadExact(std::size_t n) override;

private:
    ChildProcess& process_;
    Deadline deadline_;
};

/// One newline-terminated JSON-RPC 2.0 message. A missing id makes it a
/// notification; null params are omitted.
std::string EncodeMessage(std::string_view method,
                          const nlohmann::json& params,
                          std::optional<std::int64_t> id);

/// Reads until a JSON-RPC response arrives, accepting newline-delimited JSON
/// and Content-Length framing. Notifications, server-initiated requests,
/// responses for another id and non-JSON lines are skipped. Gives up with a
/// NoResponse error after max_lines scanned lines.
Result<nlohmann::json, Error> DecodeOne(IMessageSource& source,
                                        std::optional<std::int64_t> expected_id,
                                        int max_lines = kDefaultMaxScanLines);

/// The "result" member of a response; "error" maps to an RpcError.
Result<nlohmann::json, Error> ExtractResult(const nlohmann::json& response);

} // namespace agent_relay
