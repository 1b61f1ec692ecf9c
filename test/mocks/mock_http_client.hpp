#pragma once

#include <agent_relay/http/i_http_client.hpp>

#include <deque>
#include <string>
#include <vector>

namespace agent_relay {
namespace testing {

// ---------------------------------------------------------------------------
// MockHttpClient: hand-written IHttpClient for offline unit testing.
//
// Usage:
//   MockHttpClient mock;
//   mock.EnqueuePost(Result<HttpResponse, Error>::Ok({200, {}, R"({"content":[]})"}));
//   auto result = mock.Post("/v1/messages", body, "application/json");
//   CHECK(mock.PostCalls()[0].path == "/v1/messages");
//
// Responses are consumed FIFO. An empty queue yields a descriptive error.
// ---------------------------------------------------------------------------

struct GetCall {
    std::string path;
    HttpHeaders headers;
};

struct PostCall {
    std::string path;
    std::string body;
    std::string content_type;
    HttpHeaders headers;
};

class MockHttpClient : public IHttpClient {
public:
    MockHttpClient() = default;

    void EnqueueGet(Result<HttpResponse, Error> response) {
        get_responses_.push_back(std::move(response));
    }

    void EnqueuePost(Result<HttpResponse, Error> response) {
        post_responses_.push_back(std::move(response));
    }

    [[nodiscard]] const std::vector<GetCall>& GetCalls() const noexcept { return get_calls_; }
    [[nodiscard]] size_t GetCallCount() const noexcept { return get_calls_.size(); }

    [[nodiscard]] const std::vector<PostCall>& PostCalls() const noexcept { return post_calls_; }
    [[nodiscard]] size_t PostCallCount() const noexcept { return post_calls_.size(); }

    Result<HttpResponse, Error> Get(std::string_view path,
                                    const HttpHeaders& headers) override {
        get_calls_.push_back({std::string(path), headers});
        return Dequeue(get_responses_, "Get", path);
    }

    Result<HttpResponse, Error> Post(std::string_view path,
                                     std::string_view body,
                                     std::string_view content_type,
                                     const HttpHeaders& headers) override {
        post_calls_.push_back({
            std::string(path),
            std::string(body),
            std::string(content_type),
            headers,
        });
        return Dequeue(post_responses_, "Post", path);
    }

private:
    static Result<HttpResponse, Error> Dequeue(std::deque<Result<HttpResponse, Error>>& queue,
                                               const char* method, std::string_view path) {
        if (queue.empty()) {
            return Result<HttpResponse, Error>::Err(Error{
                std::string("MockHttpClient::") + method, std::string(path),
                "No canned response enqueued", std::nullopt, ErrorCategory::Internal});
        }
        auto response = std::move(queue.front());
        queue.pop_front();
        return response;
    }

    std::deque<Result<HttpResponse, Error>> get_responses_;
    std::deque<Result<HttpResponse, Error>> post_responses_;
    std::vector<GetCall> get_calls_;
    std::vector<PostCall> post_calls_;
};

} // namespace testing
} // namespace agent_relay
