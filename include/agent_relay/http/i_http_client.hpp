#pragma once

#include <agent_relay/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace agent_relay {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpClient: HTTP(S) client bound to one base URL.
//
// The model client and web search depend on this interface rather than on
// cpp-httplib, so tests run offline against MockHttpClient.
// Transport failures are returned as Err; any HTTP status is an Ok response.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

protected:
    IHttpClient() = default;
};

} // namespace agent_relay
