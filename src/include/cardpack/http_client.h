#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * \file http_client.h
 * \brief Minimal blocking HTTP transport interface.
 *
 * The object-store driver and the remote resource fetcher talk HTTP
 * through this seam; `httplib_client.h` provides the cpp-httplib backend.
 */

namespace cardpack {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest final {
    std::string method = "GET";
    /// Absolute `http(s)://` URL.
    std::string url;
    HttpHeaders headers;
    std::string body;
};

struct HttpResponse final {
    int status = 0;
    HttpHeaders headers;
    std::string body;
    /// Transport failure (connect, TLS, timeout); empty on success.
    std::string error;

    bool ok() const noexcept
    {
        return error.empty() && status >= 200 && status < 300;
    }
};

/// Case-insensitive header lookup; returns empty when absent.
std::string_view
find_header(const HttpHeaders& headers, std::string_view name) noexcept;

/// Replaces (case-insensitively) or appends a header.
void
set_header(HttpHeaders* headers, std::string_view name, std::string value);

/// Implementations must be safe to call from multiple threads.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

}  // namespace cardpack
