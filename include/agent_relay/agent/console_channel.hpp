#pragma once

#include <agent_relay/agent/message_channel.hpp>

#include <mutex>
#include <ostream>

namespace agent_relay {

// ---------------------------------------------------------------------------
// ConsoleChannel: IMessageChannel that prints to a stream (stdout for the
// interactive `run` command). Writes from concurrent turns are serialized.
// ---------------------------------------------------------------------------
class ConsoleChannel : public IMessageChannel {
public:
    explicit ConsoleChannel(std::ostream& out, bool use_color = false);

    Result<void, Error> SendText(const std::string& principal,
                                 const std::string& text) override;
    Result<void, Error> SendApprovalRequest(const std::string& principal,
                                            const std::string& description,
                                            const std::string& token) override;
    Result<void, Error> SendMedia(const std::string& principal,
                                  const std::string& media_url,
                                  const std::string& caption) override;

private:
    Result<void, Error> Write(const char* operation, const std::string& text);

    std::ostream& out_;
    bool use_color_;
    std::mutex mutex_;
};

} // namespace agent_relay
