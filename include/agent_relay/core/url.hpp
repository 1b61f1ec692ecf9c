#pragma once

#include <initializer_list>
#include <string>
#include <utility>

namespace agent_relay {

// Percent-encode a query-string value per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// Build "?k1=v1&k2=v2" with every value percent-encoded.
std::string BuildQueryString(
    const std::initializer_list<std::pair<std::string, std::string>>& params);

} // namespace agent_relay
