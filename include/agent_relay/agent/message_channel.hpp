#pragma once

#include <agent_relay/core/result.hpp>

#include <string>

namespace agent_relay {

// ---------------------------------------------------------------------------
// IMessageChannel: outbound side of the human-facing transport.
// ---------------------------------------------------------------------------
class IMessageChannel {
public:
    virtual ~IMessageChannel() = default;

    virtual Result<void, Error> SendText(const std::string& principal,
                                         const std::string& text) = 0;

    /// Prompts the human to answer "APPROVE <token>" or "DENY <token>".
    virtual Result<void, Error> SendApprovalRequest(const std::string& principal,
                                                    const std::string& description,
                                                    const std::string& token) = 0;

    virtual Result<void, Error> SendMedia(const std::string& principal,
                                          const std::string& media_url,
                                          const std::string& caption) = 0;

    IMessageChannel(const IMessageChannel&) = delete;
    IMessageChannel& operator=(const IMessageChannel&) = delete;

protected:
    IMessageChannel() = default;
};

} // namespace agent_relay
