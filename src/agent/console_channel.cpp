#include <agent_relay/agent/console_channel.hpp>

#include <agent_relay/core/ansi.hpp>

namespace agent_relay {

ConsoleChannel::ConsoleChannel(std::ostream& out, bool use_color)
    : out_(out), use_color_(use_color) {}

Result<void, Error> ConsoleChannel::Write(const char* operation, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << "\n" << std::flush;
    if (!out_) {
        return Result<void, Error>::Err(Error{
            operation, "console", "Failed to write to output stream", std::nullopt,
            ErrorCategory::Internal});
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ConsoleChannel::SendText(const std::string& principal,
                                             const std::string& text) {
    (void)principal;
    if (use_color_) {
        return Write("ConsoleChannel::SendText",
                     std::string(ansi::kCyan) + "assistant> " + ansi::kReset + text);
    }
    return Write("ConsoleChannel::SendText", "assistant> " + text);
}

Result<void, Error> ConsoleChannel::SendApprovalRequest(const std::string& principal,
                                                        const std::string& description,
                                                        const std::string& token) {
    (void)principal;
    std::string header = "Approval required [" + token + "]";
    if (use_color_) {
        header = std::string(ansi::kBold) + ansi::kYellow + header + ansi::kReset;
    }
    return Write("ConsoleChannel::SendApprovalRequest",
                 header + "\n" + description + "\n\nReply APPROVE " + token +
                     " or DENY " + token);
}

Result<void, Error> ConsoleChannel::SendMedia(const std::string& principal,
                                              const std::string& media_url,
                                              const std::string& caption) {
    (void)principal;
    std::string text = "[media] " + media_url;
    if (!caption.empty()) {
        text += "\n" + caption;
    }
    return Write("ConsoleChannel::SendMedia", text);
}

} // namespace agent_relay
