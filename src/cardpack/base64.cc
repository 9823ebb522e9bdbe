#include "cardpack/base64.h"

#include <cstdint>

namespace cardpack {
namespace {

    static constexpr char kEnc[]
        = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    static int8_t dec(char c) noexcept
    {
        if (c >= 'A' && c <= 'Z') {
            return static_cast<int8_t>(c - 'A');
        }
        if (c >= 'a' && c <= 'z') {
            return static_cast<int8_t>(c - 'a' + 26);
        }
        if (c >= '0' && c <= '9') {
            return static_cast<int8_t>(c - '0' + 52);
        }
        if (c == '+') {
            return 62;
        }
        if (c == '/') {
            return 63;
        }
        return -1;
    }

    static bool is_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f'
               || c == '\v';
    }

    // Walks \p text and emits decoded bytes through \p emit. Returns false on
    // any character outside the alphabet or misplaced padding.
    template<typename Emit>
    static bool decode_into(std::string_view text, Emit&& emit) noexcept
    {
        uint32_t acc      = 0;
        uint32_t bits     = 0;
        uint32_t digits   = 0;
        uint32_t padding  = 0;
        for (char c : text) {
            if (is_space(c)) {
                continue;
            }
            if (c == '=') {
                padding += 1;
                if (padding > 2) {
                    return false;
                }
                continue;
            }
            if (padding != 0) {
                return false;
            }
            const int8_t v = dec(c);
            if (v < 0) {
                return false;
            }
            acc = (acc << 6) | static_cast<uint32_t>(v);
            bits += 6;
            digits += 1;
            if (bits >= 8) {
                bits -= 8;
                emit(static_cast<uint8_t>((acc >> bits) & 0xFFU));
            }
        }
        if ((digits % 4U) == 1U) {
            return false;
        }
        if (padding != 0 && ((digits + padding) % 4U) != 0U) {
            return false;
        }
        return true;
    }

}  // namespace

void
base64_encode(std::span<const std::byte> bytes, std::string* out)
{
    if (!out) {
        return;
    }
    out->reserve(out->size() + ((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const uint8_t a = static_cast<uint8_t>(bytes[i + 0]);
        const uint8_t b = static_cast<uint8_t>(bytes[i + 1]);
        const uint8_t c = static_cast<uint8_t>(bytes[i + 2]);
        out->push_back(kEnc[(a >> 2) & 0x3F]);
        out->push_back(kEnc[((a & 0x03) << 4) | ((b >> 4) & 0x0F)]);
        out->push_back(kEnc[((b & 0x0F) << 2) | ((c >> 6) & 0x03)]);
        out->push_back(kEnc[c & 0x3F]);
    }

    const size_t rest = bytes.size() - i;
    if (rest == 1) {
        const uint8_t a = static_cast<uint8_t>(bytes[i]);
        out->push_back(kEnc[(a >> 2) & 0x3F]);
        out->push_back(kEnc[(a & 0x03) << 4]);
        out->append("==");
    } else if (rest == 2) {
        const uint8_t a = static_cast<uint8_t>(bytes[i + 0]);
        const uint8_t b = static_cast<uint8_t>(bytes[i + 1]);
        out->push_back(kEnc[(a >> 2) & 0x3F]);
        out->push_back(kEnc[((a & 0x03) << 4) | ((b >> 4) & 0x0F)]);
        out->push_back(kEnc[(b & 0x0F) << 2]);
        out->push_back('=');
    }
}


std::string
base64_encode(std::string_view text)
{
    std::string out;
    base64_encode(std::span<const std::byte>(
                      reinterpret_cast<const std::byte*>(text.data()),
                      text.size()),
                  &out);
    return out;
}


bool
base64_decode(std::string_view text, std::vector<std::byte>* out)
{
    if (!out) {
        return false;
    }
    out->clear();
    out->reserve((text.size() / 4) * 3);
    const bool ok = decode_into(text, [out](uint8_t b) {
        out->push_back(std::byte { b });
    });
    if (!ok) {
        out->clear();
    }
    return ok;
}


bool
looks_like_base64(std::string_view text) noexcept
{
    bool any = false;
    const bool ok = decode_into(text, [&any](uint8_t) { any = true; });
    return ok && any;
}

}  // namespace cardpack
