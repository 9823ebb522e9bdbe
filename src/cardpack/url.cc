#include "cardpack/url.h"

namespace cardpack {
namespace {

    static bool is_unreserved(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
               || (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_'
               || c == '~';
    }


    static int hex_value(char c) noexcept
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }

}  // namespace

std::string
url_encode(std::string_view text, bool keep_slash)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size() * 3);
    for (char c : text) {
        if (is_unreserved(c) || (keep_slash && c == '/')) {
            out.push_back(c);
            continue;
        }
        const unsigned char b = static_cast<unsigned char>(c);
        out.push_back('%');
        out.push_back(kHex[(b >> 4) & 0xF]);
        out.push_back(kHex[b & 0xF]);
    }
    return out;
}


bool
url_decode(std::string_view text, std::string* out, bool plus_as_space)
{
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+' && plus_as_space) {
            result.push_back(' ');
            continue;
        }
        if (c != '%') {
            result.push_back(c);
            continue;
        }
        if (i + 2 >= text.size()) {
            return false;
        }
        const int hi = hex_value(text[i + 1]);
        const int lo = hex_value(text[i + 2]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        result.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    *out = std::move(result);
    return true;
}


QueryParams
parse_query(std::string_view query)
{
    QueryParams params;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string_view::npos) {
            amp = query.size();
        }
        const std::string_view item = query.substr(pos, amp - pos);
        if (!item.empty()) {
            const size_t eq        = item.find('=');
            const std::string_view k = item.substr(0, eq);
            const std::string_view v = (eq == std::string_view::npos)
                                           ? std::string_view()
                                           : item.substr(eq + 1);
            std::string key;
            std::string value;
            if (!url_decode(k, &key, true)) {
                key.assign(k);
            }
            if (!url_decode(v, &value, true)) {
                value.assign(v);
            }
            params.emplace_back(std::move(key), std::move(value));
        }
        pos = amp + 1;
    }
    return params;
}


std::string_view
query_value(const QueryParams& params, std::string_view key) noexcept
{
    for (const auto& [k, v] : params) {
        if (k == key) {
            return v;
        }
    }
    return {};
}


bool
parse_http_url(std::string_view url, ParsedUrl* out)
{
    if (!out) {
        return false;
    }
    const size_t sep = url.find("://");
    if (sep == std::string_view::npos) {
        return false;
    }
    ParsedUrl parsed;
    parsed.scheme.assign(url.substr(0, sep));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return false;
    }
    std::string_view rest = url.substr(sep + 3);
    const size_t slash    = rest.find_first_of("/?#");
    parsed.host.assign(rest.substr(0, slash));
    if (parsed.host.empty()) {
        return false;
    }
    rest = (slash == std::string_view::npos) ? std::string_view()
                                             : rest.substr(slash);
    const size_t hash = rest.find('#');
    if (hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }
    const size_t q = rest.find('?');
    parsed.path.assign(rest.substr(0, q));
    if (q != std::string_view::npos) {
        parsed.query.assign(rest.substr(q + 1));
    }
    if (parsed.path.empty()) {
        parsed.path = "/";
    }
    *out = std::move(parsed);
    return true;
}

}  // namespace cardpack
