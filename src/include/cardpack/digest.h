#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file digest.h
 * \brief SHA-256, HMAC-SHA256 and random identifiers (OpenSSL).
 */

namespace cardpack {

/// Lower-case hex encoding of \p bytes.
std::string
hex_encode(std::span<const std::byte> bytes);

std::vector<std::byte>
sha256(std::span<const std::byte> bytes);

/// Lower-case hex SHA-256 of \p bytes.
std::string
sha256_hex(std::span<const std::byte> bytes);

std::string
sha256_hex(std::string_view text);

std::vector<std::byte>
hmac_sha256(std::span<const std::byte> key, std::string_view message);

std::vector<std::byte>
hmac_sha256(std::string_view key, std::string_view message);

/// Constant-time comparison of two strings of equal length.
bool
constant_time_equal(std::string_view a, std::string_view b) noexcept;

/**
 * \brief Returns \p nbytes of cryptographic randomness as lower-case hex.
 *
 * Returns an empty string if the OpenSSL generator fails.
 */
std::string
random_hex_id(size_t nbytes = 16);

/// Views the bytes of \p text.
inline std::span<const std::byte>
as_bytes(std::string_view text) noexcept
{
    return std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(text.data()), text.size());
}

}  // namespace cardpack
