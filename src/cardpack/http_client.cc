#include "cardpack/http_client.h"

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

std::string_view
find_header(const HttpHeaders& headers, std::string_view name) noexcept
{
    for (const auto& [k, v] : headers) {
        if (iequals(k, name)) {
            return v;
        }
    }
    return {};
}


void
set_header(HttpHeaders* headers, std::string_view name, std::string value)
{
    for (auto& [k, v] : *headers) {
        if (iequals(k, name)) {
            v = std::move(value);
            return;
        }
    }
    headers->emplace_back(std::string(name), std::move(value));
}

}  // namespace cardpack
