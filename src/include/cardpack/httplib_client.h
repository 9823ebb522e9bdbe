#pragma once

#include "cardpack/http_client.h"

/**
 * \file httplib_client.h
 * \brief \ref HttpClient backed by cpp-httplib.
 */

namespace cardpack {

struct HttplibClientOptions final {
    int connect_timeout_seconds = 10;
    int read_timeout_seconds    = 60;
    int write_timeout_seconds   = 60;
    bool follow_redirects       = true;
};

/// Opens one connection per request; safe to share across threads.
class HttplibClient final : public HttpClient {
public:
    explicit HttplibClient(HttplibClientOptions options = {})
        : options_(options)
    {
    }

    HttpResponse execute(const HttpRequest& request) override;

private:
    HttplibClientOptions options_;
};

}  // namespace cardpack
