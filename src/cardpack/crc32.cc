#include "cardpack/crc32.h"

#include <array>

namespace cardpack {
namespace {

    static constexpr uint32_t kPolynomial = 0xEDB88320U;

    static constexpr std::array<uint32_t, 256> make_table() noexcept
    {
        std::array<uint32_t, 256> table {};
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1U) ? (kPolynomial ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        return table;
    }

    static constexpr std::array<uint32_t, 256> kTable = make_table();

}  // namespace

uint32_t
crc32_update(uint32_t state, std::span<const std::byte> bytes) noexcept
{
    uint32_t c = state;
    for (size_t i = 0; i < bytes.size(); ++i) {
        const uint8_t b = static_cast<uint8_t>(bytes[i]);
        c               = kTable[(c ^ b) & 0xFFU] ^ (c >> 8);
    }
    return c;
}


uint32_t
crc32(std::span<const std::byte> bytes) noexcept
{
    return crc32_final(crc32_update(crc32_init(), bytes));
}


uint32_t
crc32_concat(std::span<const std::byte> a,
             std::span<const std::byte> b) noexcept
{
    return crc32_final(crc32_update(crc32_update(crc32_init(), a), b));
}

}  // namespace cardpack
