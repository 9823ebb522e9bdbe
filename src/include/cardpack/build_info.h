#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how CardPack was built.
 */

namespace cardpack {

/**
 * \brief CardPack build information.
 *
 * Values are compiled into the binary at build time.
 */
struct BuildInfo final {
    /// CardPack version string (e.g. "0.1.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// CMake generator used to configure the build (e.g. "Ninja").
    std::string_view cmake_generator;

    /// Target platform (e.g. "Linux", "Darwin").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    /// Compiler ID (e.g. "Clang", "GNU").
    std::string_view cxx_compiler_id;

    /// Compiler version string.
    std::string_view cxx_compiler_version;

    /// Whether the cpp-httplib transport was compiled in.
    bool has_httplib = false;

    /// Whether the libwebp image transcoder was built.
    bool has_webp = false;
};

/// Returns build information for the linked CardPack library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `CardPack vX.Y.Z <build_type> [features]`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Convenience overload for the linked CardPack library build.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace cardpack
