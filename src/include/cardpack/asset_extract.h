#pragma once

#include "cardpack/card_bundle.h"
#include "cardpack/card_json.h"
#include "cardpack/card_refs.h"
#include "cardpack/image_transcode.h"
#include "cardpack/storage.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file asset_extract.h
 * \brief Persists ancillary bundle assets and repoints card references.
 */

namespace cardpack {

enum class ExtractStatus : uint8_t {
    Ok,
    /// Card data is not a JSON object.
    EmptyBundle,
    /// A store failed; assets persisted before it remain valid.
    StorageFailed,
};

/// Persisted form of an asset, recorded in the card version.
struct SavedAsset final {
    std::string name;
    std::string type;
    std::string ext;
    /// Public URL.
    std::string path;
    /// `scheme://path` the bytes were written to.
    std::string storage_url;
    std::string thumbnail_path;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
};

CardJson
saved_asset_to_json(const SavedAsset& asset);

bool
saved_asset_from_json(const CardJson& json, SavedAsset* out);

struct ExtractedBundle final {
    CardJson card_data;
    /// Every non-main asset, in bundle order.
    std::vector<Asset> assets;
};

/// Selects the ancillary assets of \p bundle. Zero assets is valid.
ExtractStatus
extract_assets(const CardBundle& bundle, ExtractedBundle* out);

struct PersistOptions final {
    /// First path segment of stored assets.
    std::string path_prefix = "assets";
    /// Extra whole-token rewrites applied in the same pass (e.g. the main
    /// portrait's `embeded://` reference). Not counted as asset references.
    RefMapping extra_mappings;
    /// Makes WebP thumbnails of image assets when set.
    ImageTranscoder* transcoder = nullptr;
};

struct PersistResult final {
    CardJson card_data;
    std::vector<SavedAsset> saved_assets;
    size_t extracted_count      = 0;
    /// Assets referenced at least once.
    size_t referenced_count     = 0;
    size_t replaced_occurrences = 0;
    /// `embeded://` tokens still present after the rewrite.
    std::vector<std::string> unresolved_refs;
    StorageStatus storage_status = StorageStatus::Ok;
};

/**
 * \brief Stores each asset at `assets/{card_id}/{i}_{safe_name}.{ext}`,
 * then rewrites `embeded://<path>` tokens to the public URLs in one pass.
 *
 * With a transcoder, each image asset also gets a WebP thumbnail at
 * `assets/{card_id}/thumbnails/{i}_{safe_name}.webp`. An image the codec
 * cannot read is kept without a thumbnail.
 *
 * Stores run sequentially. On failure the assets stored so far are
 * returned with `StorageFailed` and the card data is left unrewritten;
 * re-running writes to the same paths.
 */
ExtractStatus
persist_and_rewrite(std::string_view card_id, const CardJson& card_data,
                    std::span<const Asset> assets, Storage& storage,
                    const PersistOptions& options, PersistResult* out);

/// Replaces characters outside `[A-Za-z0-9_.-]` with `_`, collapses runs
/// of `_`, and caps the result at 100 characters.
std::string
sanitize_asset_name(std::string_view name);

/// Deterministic storage path for the asset at \p index.
std::string
asset_storage_path(std::string_view prefix, std::string_view card_id,
                   size_t index, const Asset& asset);

/// Storage path of the thumbnail of the asset at \p index.
std::string
asset_thumbnail_path(std::string_view prefix, std::string_view card_id,
                     size_t index, const Asset& asset);

const char*
extract_status_name(ExtractStatus status) noexcept;

}  // namespace cardpack
