#include "cardpack/card_refs.h"

#include <algorithm>
#include <unordered_set>

namespace cardpack {
namespace {

    static std::string_view trim_trailing_punct(std::string_view token) noexcept
    {
        while (!token.empty()) {
            const char c = token.back();
            if (c != '.' && c != ',' && c != ';' && c != ':' && c != '!'
                && c != '?') {
                break;
            }
            token.remove_suffix(1);
        }
        return token;
    }


    template<typename Fn>
    static void visit_strings(CardJson& node, Fn&& fn)
    {
        if (node.is_string()) {
            fn(node.get_ref<std::string&>());
        } else if (node.is_object() || node.is_array()) {
            for (auto& child : node) {
                visit_strings(child, fn);
            }
        }
    }


    template<typename Fn>
    static void visit_strings(const CardJson& node, Fn&& fn)
    {
        if (node.is_string()) {
            fn(node.get_ref<const std::string&>());
        } else if (node.is_object() || node.is_array()) {
            for (const auto& child : node) {
                visit_strings(child, fn);
            }
        }
    }


    // Calls fn(begin, end) for every token of \p s.
    template<typename Fn>
    static void for_each_token(std::string_view s, Fn&& fn)
    {
        size_t i = 0;
        while (i < s.size()) {
            if (is_ref_delimiter(s[i])) {
                ++i;
                continue;
            }
            size_t j = i;
            while (j < s.size() && !is_ref_delimiter(s[j])) {
                ++j;
            }
            fn(i, j);
            i = j;
        }
    }


    static size_t rewrite_string(const std::string& s,
                                 const RefMapping& mapping, RefHits* hits,
                                 std::string* out)
    {
        size_t replaced = 0;
        size_t copied   = 0;
        std::string result;
        for_each_token(s, [&](size_t b, size_t e) {
            const std::string_view token(s.data() + b, e - b);
            auto it                 = mapping.find(token);
            std::string_view suffix = {};
            if (it == mapping.end()) {
                const std::string_view bare = trim_trailing_punct(token);
                if (bare.empty() || bare.size() == token.size()) {
                    return;
                }
                it = mapping.find(bare);
                if (it == mapping.end()) {
                    return;
                }
                suffix = token.substr(bare.size());
            }
            result.append(s, copied, b - copied);
            result.append(it->second);
            result.append(suffix);
            copied = e;
            replaced += 1;
            if (hits) {
                (*hits)[it->first] += 1;
            }
        });
        if (replaced != 0) {
            result.append(s, copied, std::string::npos);
            *out = std::move(result);
        }
        return replaced;
    }


    static bool starts_with(std::string_view s, std::string_view p) noexcept
    {
        return s.substr(0, p.size()) == p;
    }


    static bool is_remote(std::string_view url) noexcept
    {
        return starts_with(url, "http://") || starts_with(url, "https://");
    }


    static char lower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }


    static size_t ifind(std::string_view s, std::string_view needle,
                        size_t from) noexcept
    {
        if (needle.size() > s.size()) {
            return std::string_view::npos;
        }
        for (size_t i = from; i + needle.size() <= s.size(); ++i) {
            bool match = true;
            for (size_t k = 0; k < needle.size(); ++k) {
                if (lower(s[i + k]) != needle[k]) {
                    match = false;
                    break;
                }
            }
            if (match) {
                return i;
            }
        }
        return std::string_view::npos;
    }


    static bool is_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }


    static void markdown_images(std::string_view s,
                                std::vector<std::string>* out)
    {
        size_t pos = 0;
        while ((pos = s.find("![", pos)) != std::string_view::npos) {
            const size_t close = s.find("](", pos + 2);
            if (close == std::string_view::npos) {
                return;
            }
            size_t b = close + 2;
            while (b < s.size() && is_space(s[b])) {
                ++b;
            }
            size_t e = b;
            while (e < s.size() && !is_space(s[e]) && s[e] != ')') {
                ++e;
            }
            const std::string_view url = s.substr(b, e - b);
            if (is_remote(url)) {
                out->emplace_back(url);
            }
            pos = e;
        }
    }


    static void html_images(std::string_view s, std::vector<std::string>* out)
    {
        size_t pos = 0;
        while ((pos = ifind(s, "<img", pos)) != std::string_view::npos) {
            size_t tag_end = s.find('>', pos);
            if (tag_end == std::string_view::npos) {
                tag_end = s.size();
            }
            const std::string_view tag = s.substr(pos, tag_end - pos);
            size_t at                  = 0;
            while ((at = ifind(tag, "src", at)) != std::string_view::npos) {
                const bool boundary = at > 0 && is_space(tag[at - 1]);
                size_t p            = at + 3;
                at                  = p;
                if (!boundary) {
                    continue;
                }
                while (p < tag.size() && is_space(tag[p])) {
                    ++p;
                }
                if (p >= tag.size() || tag[p] != '=') {
                    continue;
                }
                ++p;
                while (p < tag.size() && is_space(tag[p])) {
                    ++p;
                }
                if (p >= tag.size()) {
                    break;
                }
                std::string_view url;
                if (tag[p] == '"' || tag[p] == '\'') {
                    const size_t q = tag.find(tag[p], p + 1);
                    if (q == std::string_view::npos) {
                        break;
                    }
                    url = tag.substr(p + 1, q - p - 1);
                } else {
                    size_t e = p;
                    while (e < tag.size() && !is_space(tag[e])) {
                        ++e;
                    }
                    url = tag.substr(p, e - p);
                }
                if (is_remote(url)) {
                    out->emplace_back(url);
                }
                break;
            }
            pos = tag_end;
        }
    }

}  // namespace

bool
is_ref_delimiter(char c) noexcept
{
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case '\f':
    case '\v':
    case '"':
    case '\'':
    case '(':
    case ')':
    case '<':
    case '>':
    case '[':
    case ']':
    case '{':
    case '}':
    case '`':
    case '|':
    case '\\': return true;
    default: return false;
    }
}


size_t
rewrite_refs(CardJson* doc, const RefMapping& mapping, RefHits* hits)
{
    if (!doc || mapping.empty()) {
        return 0;
    }
    size_t total = 0;
    visit_strings(*doc, [&](std::string& value) {
        std::string rewritten;
        const size_t n = rewrite_string(value, mapping, hits, &rewritten);
        if (n != 0) {
            value = std::move(rewritten);
            total += n;
        }
    });
    return total;
}


size_t
count_ref(const CardJson& doc, std::string_view token)
{
    if (token.empty()) {
        return 0;
    }
    size_t count = 0;
    visit_strings(doc, [&](const std::string& value) {
        for_each_token(value, [&](size_t b, size_t e) {
            const std::string_view t(value.data() + b, e - b);
            if (t == token || trim_trailing_punct(t) == token) {
                count += 1;
            }
        });
    });
    return count;
}


size_t
count_substring(const CardJson& doc, std::string_view needle)
{
    if (needle.empty()) {
        return 0;
    }
    size_t count = 0;
    visit_strings(doc, [&](const std::string& value) {
        size_t pos = 0;
        while ((pos = value.find(needle, pos)) != std::string::npos) {
            count += 1;
            pos += needle.size();
        }
    });
    return count;
}


std::vector<std::string>
find_scheme_refs(const CardJson& doc, std::string_view scheme)
{
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    visit_strings(doc, [&](const std::string& value) {
        for_each_token(value, [&](size_t b, size_t e) {
            const std::string_view t = trim_trailing_punct(
                std::string_view(value.data() + b, e - b));
            if (t.size() > scheme.size() && starts_with(t, scheme)) {
                std::string token(t);
                if (seen.insert(token).second) {
                    out.push_back(std::move(token));
                }
            }
        });
    });
    return out;
}


std::vector<std::string>
find_external_image_refs(const CardJson& doc)
{
    std::vector<std::string> found;
    visit_strings(doc, [&](const std::string& value) {
        markdown_images(value, &found);
        html_images(value, &found);
    });
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (std::string& url : found) {
        if (seen.insert(url).second) {
            out.push_back(std::move(url));
        }
    }
    return out;
}

}  // namespace cardpack
