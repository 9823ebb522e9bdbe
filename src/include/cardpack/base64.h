#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file base64.h
 * \brief Standard (RFC 4648) base64 used for card payloads in PNG text chunks.
 */

namespace cardpack {

/// Appends the base64 encoding of \p bytes (with `=` padding) to \p out.
void
base64_encode(std::span<const std::byte> bytes, std::string* out);

/// Convenience overload that encodes the raw bytes of \p text.
std::string
base64_encode(std::string_view text);

/**
 * \brief Decodes \p text into \p out.
 *
 * ASCII whitespace is ignored. Padding is optional but, when present, must
 * only appear at the end. Returns false (and leaves \p out cleared) if any
 * other character falls outside the base64 alphabet.
 */
bool
base64_decode(std::string_view text, std::vector<std::byte>* out);

/// Returns true if \p text is non-empty and decodes as base64.
bool
looks_like_base64(std::string_view text) noexcept;

}  // namespace cardpack
