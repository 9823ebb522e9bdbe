#include "cardpack/sigv4.h"

#include "cardpack/digest.h"
#include "cardpack/url.h"

#include <algorithm>
#include <ctime>
#include <map>

namespace cardpack {
namespace {

    static constexpr std::string_view kAlgorithm       = "AWS4-HMAC-SHA256";
    static constexpr std::string_view kUnsignedPayload = "UNSIGNED-PAYLOAD";

    static std::string lower(std::string_view s)
    {
        std::string out(s);
        for (char& c : out) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return out;
    }


    // Trims and collapses runs of spaces, as canonical header values require.
    static std::string canonical_value(std::string_view v)
    {
        std::string out;
        bool space = false;
        for (char c : v) {
            if (c == ' ' || c == '\t') {
                space = !out.empty();
                continue;
            }
            if (space) {
                out.push_back(' ');
                space = false;
            }
            out.push_back(c);
        }
        return out;
    }


    static std::string canonical_query(const QueryParams& params)
    {
        std::vector<std::pair<std::string, std::string>> encoded;
        encoded.reserve(params.size());
        for (const auto& [k, v] : params) {
            encoded.emplace_back(url_encode(k), url_encode(v));
        }
        std::sort(encoded.begin(), encoded.end());
        std::string out;
        for (const auto& [k, v] : encoded) {
            if (!out.empty()) {
                out.push_back('&');
            }
            out.append(k);
            out.push_back('=');
            out.append(v);
        }
        return out;
    }


    struct Canonical final {
        std::string headers;
        std::string signed_names;
    };


    static Canonical canonical_headers(std::string_view host,
                                       const HttpHeaders& headers)
    {
        std::map<std::string, std::string> sorted;
        sorted["host"] = std::string(host);
        for (const auto& [k, v] : headers) {
            std::string name = lower(k);
            std::string val  = canonical_value(v);
            const auto it    = sorted.find(name);
            if (it != sorted.end() && name != "host") {
                it->second.push_back(',');
                it->second.append(val);
            } else {
                sorted[name] = std::move(val);
            }
        }
        Canonical c;
        for (const auto& [k, v] : sorted) {
            c.headers.append(k);
            c.headers.push_back(':');
            c.headers.append(v);
            c.headers.push_back('\n');
            if (!c.signed_names.empty()) {
                c.signed_names.push_back(';');
            }
            c.signed_names.append(k);
        }
        return c;
    }


    static std::string scope_of(const SigV4Credentials& creds,
                                std::string_view date)
    {
        std::string scope(date);
        scope.push_back('/');
        scope.append(creds.region);
        scope.push_back('/');
        scope.append(creds.service);
        scope.append("/aws4_request");
        return scope;
    }


    static std::string signature(const SigV4Credentials& creds,
                                 std::string_view timestamp,
                                 std::string_view scope,
                                 std::string_view canonical_request)
    {
        std::string to_sign(kAlgorithm);
        to_sign.push_back('\n');
        to_sign.append(timestamp);
        to_sign.push_back('\n');
        to_sign.append(scope);
        to_sign.push_back('\n');
        to_sign.append(sha256_hex(canonical_request));

        const std::string_view date = timestamp.substr(0, 8);
        std::vector<std::byte> k = hmac_sha256("AWS4" + creds.secret_key,
                                               date);
        k = hmac_sha256(k, creds.region);
        k = hmac_sha256(k, creds.service);
        k = hmac_sha256(k, "aws4_request");
        return hex_encode(hmac_sha256(k, to_sign));
    }


    static std::string canonical_request(std::string_view method,
                                         std::string_view path,
                                         std::string_view query,
                                         const Canonical& headers,
                                         std::string_view payload_hash)
    {
        std::string req(method);
        req.push_back('\n');
        req.append(path);
        req.push_back('\n');
        req.append(query);
        req.push_back('\n');
        req.append(headers.headers);
        req.push_back('\n');
        req.append(headers.signed_names);
        req.push_back('\n');
        req.append(payload_hash);
        return req;
    }

}  // namespace

std::string
amz_timestamp(int64_t unix_seconds)
{
    const std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm {};
    gmtime_r(&t, &tm);
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return std::string(buf, n);
}


bool
sigv4_sign_request(const SigV4Credentials& creds, int64_t now,
                   HttpRequest* request)
{
    ParsedUrl url;
    if (!request || !parse_http_url(request->url, &url)) {
        return false;
    }
    const std::string timestamp = amz_timestamp(now);
    set_header(&request->headers, "x-amz-date", timestamp);
    std::string payload_hash(
        find_header(request->headers, "x-amz-content-sha256"));
    if (payload_hash.empty()) {
        payload_hash = sha256_hex(request->body);
        set_header(&request->headers, "x-amz-content-sha256", payload_hash);
    }
    if (!creds.session_token.empty()) {
        set_header(&request->headers, "x-amz-security-token",
                   creds.session_token);
    }

    HttpHeaders to_sign;
    for (const auto& [k, v] : request->headers) {
        if (lower(k) != "authorization") {
            to_sign.emplace_back(k, v);
        }
    }
    const Canonical headers = canonical_headers(url.host, to_sign);
    const std::string creq  = canonical_request(
        request->method, url.path, canonical_query(parse_query(url.query)),
        headers, payload_hash);
    const std::string scope = scope_of(creds, timestamp.substr(0, 8));

    std::string auth(kAlgorithm);
    auth.append(" Credential=");
    auth.append(creds.access_key);
    auth.push_back('/');
    auth.append(scope);
    auth.append(",SignedHeaders=");
    auth.append(headers.signed_names);
    auth.append(",Signature=");
    auth.append(signature(creds, timestamp, scope, creq));
    set_header(&request->headers, "Authorization", std::move(auth));
    return true;
}


bool
sigv4_presign_url(const SigV4Credentials& creds, std::string_view method,
                  std::string_view url, const HttpHeaders& signed_headers,
                  int64_t now, int64_t expires_seconds, std::string* out)
{
    ParsedUrl parsed;
    if (!out || !parse_http_url(url, &parsed)) {
        return false;
    }
    const std::string timestamp = amz_timestamp(now);
    const std::string scope     = scope_of(creds, timestamp.substr(0, 8));
    const Canonical headers     = canonical_headers(parsed.host,
                                                    signed_headers);

    QueryParams params = parse_query(parsed.query);
    params.emplace_back("X-Amz-Algorithm", std::string(kAlgorithm));
    params.emplace_back("X-Amz-Credential", creds.access_key + "/" + scope);
    params.emplace_back("X-Amz-Date", timestamp);
    params.emplace_back("X-Amz-Expires", std::to_string(expires_seconds));
    if (!creds.session_token.empty()) {
        params.emplace_back("X-Amz-Security-Token", creds.session_token);
    }
    params.emplace_back("X-Amz-SignedHeaders", headers.signed_names);

    const std::string query = canonical_query(params);
    const std::string creq  = canonical_request(method, parsed.path, query,
                                                headers, kUnsignedPayload);

    std::string result = parsed.scheme;
    result.append("://");
    result.append(parsed.host);
    result.append(parsed.path);
    result.push_back('?');
    result.append(query);
    result.append("&X-Amz-Signature=");
    result.append(signature(creds, timestamp, scope, creq));
    *out = std::move(result);
    return true;
}

}  // namespace cardpack
