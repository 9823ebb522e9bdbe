#include "cardpack/httplib_client.h"

#include "cardpack/url.h"

#include <httplib.h>

namespace cardpack {
namespace {

    static bool iequals(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            char x = a[i];
            char y = b[i];
            if (x >= 'A' && x <= 'Z') {
                x = static_cast<char>(x - 'A' + 'a');
            }
            if (y >= 'A' && y <= 'Z') {
                y = static_cast<char>(y - 'A' + 'a');
            }
            if (x != y) {
                return false;
            }
        }
        return true;
    }

}  // namespace

HttpResponse
HttplibClient::execute(const HttpRequest& request)
{
    HttpResponse out;
    ParsedUrl url;
    if (!parse_http_url(request.url, &url)) {
        out.error = "invalid url";
        return out;
    }

    httplib::Client cli(url.scheme + "://" + url.host);
    cli.set_connection_timeout(options_.connect_timeout_seconds, 0);
    cli.set_read_timeout(options_.read_timeout_seconds, 0);
    cli.set_write_timeout(options_.write_timeout_seconds, 0);
    cli.set_follow_location(options_.follow_redirects);
    // Paths arrive percent-encoded and signed as-is.
    cli.set_url_encode(false);

    httplib::Headers headers;
    std::string content_type;
    for (const auto& [name, value] : request.headers) {
        if (iequals(name, "Content-Type")) {
            content_type = value;
        } else if (!iequals(name, "Host")) {
            headers.emplace(name, value);
        }
    }
    std::string target = url.path;
    if (!url.query.empty()) {
        target.push_back('?');
        target.append(url.query);
    }

    httplib::Result res;
    if (request.method == "GET") {
        res = cli.Get(target, headers);
    } else if (request.method == "HEAD") {
        res = cli.Head(target, headers);
    } else if (request.method == "DELETE") {
        res = cli.Delete(target, headers);
    } else if (request.method == "PUT") {
        res = cli.Put(target, headers, request.body, content_type);
    } else if (request.method == "POST") {
        res = cli.Post(target, headers, request.body, content_type);
    } else {
        out.error = "unsupported method " + request.method;
        return out;
    }

    if (!res) {
        out.error = httplib::to_string(res.error());
        return out;
    }
    out.status = res->status;
    out.body   = res->body;
    for (const auto& [name, value] : res->headers) {
        out.headers.emplace_back(name, value);
    }
    return out;
}

}  // namespace cardpack
