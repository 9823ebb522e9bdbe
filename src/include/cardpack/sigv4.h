#pragma once

#include "cardpack/http_client.h"

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file sigv4.h
 * \brief AWS Signature Version 4 for S3-compatible object stores.
 */

namespace cardpack {

struct SigV4Credentials final {
    std::string access_key;
    std::string secret_key;
    std::string region  = "auto";
    std::string service = "s3";
    /// Optional STS session token.
    std::string session_token;
};

/// Formats unix seconds as `YYYYMMDDTHHMMSSZ`.
std::string
amz_timestamp(int64_t unix_seconds);

/**
 * \brief Signs \p request in place with an `Authorization` header.
 *
 * Adds `x-amz-date` and `x-amz-content-sha256` (unless already present).
 * Every request header plus `host` is signed. Returns false if the URL is
 * not an absolute http(s) URL.
 */
bool
sigv4_sign_request(const SigV4Credentials& creds, int64_t now,
                   HttpRequest* request);

/**
 * \brief Builds a presigned URL (query-string authentication).
 *
 * \p signed_headers are headers the client must send (e.g. Content-Type);
 * `host` is always signed. The payload is `UNSIGNED-PAYLOAD`.
 */
bool
sigv4_presign_url(const SigV4Credentials& creds, std::string_view method,
                  std::string_view url, const HttpHeaders& signed_headers,
                  int64_t now, int64_t expires_seconds, std::string* out);

}  // namespace cardpack
