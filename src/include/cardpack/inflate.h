#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file inflate.h
 * \brief Bounded zlib/deflate decompression for PNG text chunks and ZIP entries.
 */

namespace cardpack {

enum class InflateStatus : uint8_t {
    Ok,
    /// The stream is truncated or not valid deflate data.
    Malformed,
    /// Output would exceed the caller's cap.
    LimitExceeded,
};

enum class InflateFormat : uint8_t {
    /// RFC 1950 (zlib header + adler32), used by PNG zTXt/iTXt.
    Zlib,
    /// RFC 1951 raw deflate, used by ZIP method 8.
    Raw,
};

/**
 * \brief Inflates \p in into \p out (replacing its contents).
 *
 * \p max_output_bytes of 0 means unlimited. On failure \p out holds whatever
 * was produced before the error.
 */
InflateStatus
inflate_bytes(std::span<const std::byte> in, InflateFormat format,
              uint64_t max_output_bytes, std::vector<std::byte>* out);

/// Compresses \p in as a zlib stream (used to write zTXt in tests and tools).
bool
deflate_zlib(std::span<const std::byte> in, std::vector<std::byte>* out);

}  // namespace cardpack
