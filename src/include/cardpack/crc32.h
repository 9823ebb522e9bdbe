#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file crc32.h
 * \brief Table-driven CRC-32 (reflected polynomial 0xEDB88320).
 *
 * Bit-exact with the checksum used by PNG chunks and ZIP entries.
 */

namespace cardpack {

/// Initial state for the streaming form.
constexpr uint32_t
crc32_init() noexcept
{
    return 0xFFFFFFFFU;
}

/// Feeds \p bytes into a running CRC state (not finalized).
uint32_t
crc32_update(uint32_t state, std::span<const std::byte> bytes) noexcept;

/// Finalizes a running CRC state.
constexpr uint32_t
crc32_final(uint32_t state) noexcept
{
    return state ^ 0xFFFFFFFFU;
}

/// Returns the CRC-32 of \p bytes.
uint32_t
crc32(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Returns `crc32(a ++ b)` without materializing the concatenation.
 *
 * Used to checksum a PNG chunk's type tag and data in place.
 */
uint32_t
crc32_concat(std::span<const std::byte> a,
             std::span<const std::byte> b) noexcept;

}  // namespace cardpack
