#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * \file url.h
 * \brief Percent-encoding and minimal URL splitting.
 */

namespace cardpack {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * \brief RFC 3986 percent-encoding.
 *
 * Unreserved characters (`A-Z a-z 0-9 - . _ ~`) are kept; `/` is kept when
 * \p keep_slash is true. Hex digits are upper case.
 */
std::string
url_encode(std::string_view text, bool keep_slash = false);

/// Decodes `%XX` escapes (and `+` as space when \p plus_as_space).
/// Returns false on a truncated or non-hex escape.
bool
url_decode(std::string_view text, std::string* out,
           bool plus_as_space = false);

/// Parses `a=1&b=2` (decoded). Malformed escapes are kept verbatim.
QueryParams
parse_query(std::string_view query);

/// Returns the first value for \p key, or empty.
std::string_view
query_value(const QueryParams& params, std::string_view key) noexcept;

struct ParsedUrl final {
    /// `http` or `https`.
    std::string scheme;
    /// Host with optional `:port`.
    std::string host;
    /// Path starting with `/` (never empty).
    std::string path;
    /// Raw query without `?`.
    std::string query;
};

/// Splits an absolute `http(s)://host[:port]/path?query` URL.
bool
parse_http_url(std::string_view url, ParsedUrl* out);

}  // namespace cardpack
