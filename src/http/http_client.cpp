#include <agent_relay/http/http_client.hpp>

#include <agent_relay/core/log.hpp>

#include <httplib.h>

#include <mutex>

namespace agent_relay {

namespace {

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

httplib::Headers ToHttplibHeaders(const HttpHeaders& hdrs) {
    httplib::Headers result;
    for (const auto& [key, value] : hdrs) {
        result.emplace(key, value);
    }
    return result;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttpClient::Impl {
    std::string base_url;
    std::unique_ptr<httplib::Client> client;
    // httplib::Client is not safe for concurrent requests.
    std::mutex mutex;

    Impl(const std::string& url, const HttpClientOptions& opts)
        : base_url(url), client(std::make_unique<httplib::Client>(url)) {
        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);
        client->set_follow_location(true);
    }

    Result<HttpResponse, Error> Finish(const char* operation, std::string_view path,
                                       const httplib::Result& res) {
        if (!res) {
            const auto http_error = res.error();
            return Result<HttpResponse, Error>::Err(Error{
                operation, base_url + std::string(path),
                "HTTP request failed: " + httplib::to_string(http_error),
                std::nullopt, CategoryFromHttpTransportError(http_error)});
        }
        LogDebug("http", std::string(operation) + " " + std::string(path) + " -> " +
                             std::to_string(res->status));
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

HttpClient::HttpClient(const std::string& base_url, const HttpClientOptions& options)
    : impl_(std::make_unique<Impl>(base_url, options)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse, Error> HttpClient::Get(std::string_view path,
                                            const HttpHeaders& headers) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto res = impl_->client->Get(std::string(path), ToHttplibHeaders(headers));
    return impl_->Finish("HttpClient::Get", path, res);
}

Result<HttpResponse, Error> HttpClient::Post(std::string_view path,
                                             std::string_view body,
                                             std::string_view content_type,
                                             const HttpHeaders& headers) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto res = impl_->client->Post(std::string(path), ToHttplibHeaders(headers),
                                   std::string(body), std::string(content_type));
    return impl_->Finish("HttpClient::Post", path, res);
}

} // namespace agent_relay
