#pragma once

#include "cardpack/card_json.h"
#include "cardpack/png_card.h"
#include "cardpack/zip_archive.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file card_bundle.h
 * \brief Detects and reads card bundles (PNG card, JSON card, CharX archive).
 */

namespace cardpack {

/// Reference scheme used inside bundle-originated card data.
inline constexpr std::string_view kEmbeddedScheme = "embeded://";

enum class BundleFormat : uint8_t {
    Unknown,
    Png,
    Json,
    CharX,
};

enum class BundleStatus : uint8_t {
    Ok,
    /// Not a PNG, JSON document or ZIP archive.
    UnknownFormat,
    /// Recognized container with broken structure.
    Malformed,
    /// PNG without a card text chunk, or ZIP without `card.json`.
    NoCardData,
    /// Card data is not a JSON object.
    InvalidCardData,
};

/// One binary asset carried by a bundle.
struct Asset final {
    std::string name;
    /// Semantic type (`icon`, `background`, `emotion`, `other`, ...).
    std::string type;
    /// Lower-case file extension without the dot.
    std::string ext;
    /// Path inside the bundle; `embeded://<path>` references this asset.
    std::string path;
    std::vector<std::byte> bytes;
    bool is_main = false;
};

struct CardBundle final {
    BundleFormat format = BundleFormat::Unknown;
    CardJson card_data;
    /// `v3` for `chara_card_v3`, otherwise `v2`.
    std::string spec_version;
    /// Bundle order. At most one asset has `is_main` set.
    std::vector<Asset> assets;
};

struct BundleReadOptions final {
    PngCardLimits png;
    ZipLimits zip;
};

BundleFormat
detect_bundle_format(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Parses \p bytes into card data plus assets.
 *
 * PNG cards yield the image with its card chunks stripped as the main
 * asset. CharX archives yield every `data.assets[]` entry whose
 * `embeded://` URI resolves to an archive member; the first `icon` named
 * `main` (else the first `icon`) is the main asset.
 */
BundleStatus
read_card_bundle(std::span<const std::byte> bytes,
                 const BundleReadOptions& options, CardBundle* out);

/// Returns `v3` or `v2` from the card's `spec` field.
std::string
card_spec_version(const CardJson& card);

/// Returns the asset marked as main, or nullptr.
const Asset*
main_asset(const CardBundle& bundle) noexcept;

const char*
bundle_format_name(BundleFormat format) noexcept;

const char*
bundle_status_name(BundleStatus status) noexcept;

}  // namespace cardpack
