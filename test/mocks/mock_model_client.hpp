#pragma once

#include <agent_relay/agent/model_client.hpp>

#include <deque>
#include <mutex>
#include <vector>

namespace agent_relay {
namespace testing {

// ---------------------------------------------------------------------------
// MockModelClient: scripted model. Each Complete() pops the next response
// and records a copy of the request it was given.
// ---------------------------------------------------------------------------
class MockModelClient : public IModelClient {
public:
    void Enqueue(Result<ModelResponse, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(std::move(response));
    }

    void EnqueueEndTurn(const std::string& text) {
        Enqueue(Result<ModelResponse, Error>::Ok(EndTurn(text)));
    }

    void EnqueueToolUse(const std::string& id, const std::string& name,
                        const nlohmann::json& input) {
        Enqueue(Result<ModelResponse, Error>::Ok(ToolUse({{id, name, input}})));
    }

    static ModelResponse EndTurn(const std::string& text) {
        ModelResponse response;
        response.stop_reason = "end_turn";
        response.content = nlohmann::json::array({{{"type", "text"}, {"text", text}}});
        return response;
    }

    static ModelResponse ToolUse(const std::vector<ToolInvocation>& invocations) {
        ModelResponse response;
        response.stop_reason = "tool_use";
        for (const auto& invocation : invocations) {
            response.content.push_back({
                {"type", "tool_use"},
                {"id", invocation.id},
                {"name", invocation.name},
                {"input", invocation.input},
            });
        }
        return response;
    }

    Result<ModelResponse, Error> Complete(const ModelRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (responses_.empty()) {
            return Result<ModelResponse, Error>::Err(Error{
                "MockModelClient::Complete", "", "No canned response enqueued",
                std::nullopt, ErrorCategory::Internal});
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

    [[nodiscard]] std::vector<ModelRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Result<ModelResponse, Error>> responses_;
    std::vector<ModelRequest> requests_;
};

} // namespace testing
} // namespace agent_relay
