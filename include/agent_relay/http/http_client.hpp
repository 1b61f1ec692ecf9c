#pragma once

#include <agent_relay/http/i_http_client.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace agent_relay {

struct HttpClientOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{120};
};

// ---------------------------------------------------------------------------
// HttpClient: IHttpClient over cpp-httplib. The pimpl keeps httplib out of
// the public header.
// ---------------------------------------------------------------------------
class HttpClient : public IHttpClient {
public:
    /// base_url like "https://api.anthropic.com".
    explicit HttpClient(const std::string& base_url,
                        const HttpClientOptions& options = {});
    ~HttpClient() override;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace agent_relay
