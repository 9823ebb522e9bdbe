#include "cardpack/asset_extract.h"

#include "cardpack/image_probe.h"
#include "cardpack/log.h"

namespace cardpack {
namespace {

    static constexpr size_t kMaxNameLength = 100;

    static bool is_safe_char(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
               || (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
    }


    static std::string safe_ext(std::string_view ext)
    {
        std::string out;
        for (char c : ext) {
            if (c >= 'A' && c <= 'Z') {
                out.push_back(static_cast<char>(c - 'A' + 'a'));
            } else if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
                out.push_back(c);
            }
        }
        if (out.empty() || out.size() > 10) {
            return "bin";
        }
        return out;
    }


    // A codec failure leaves the thumbnail path empty and is not an error.
    static StorageStatus store_thumbnail(std::string_view card_id,
                                         size_t index, const Asset& asset,
                                         Storage& storage,
                                         const PersistOptions& options,
                                         SavedAsset* saved)
    {
        EncodedImage thumb;
        const TranscodeStatus ts = options.transcoder->thumbnail(
            asset.bytes, kAssetThumbnail, &thumb);
        if (ts != TranscodeStatus::Ok) {
            logger()->warn("asset '{}': no thumbnail: {}", asset.name,
                           transcode_status_name(ts));
            return StorageStatus::Ok;
        }
        StoreOptions so;
        so.content_type = "image/webp";
        std::string url;
        const StorageStatus st = storage.store(
            thumb.bytes,
            asset_thumbnail_path(options.path_prefix, card_id, index, asset),
            &url, so);
        if (st == StorageStatus::Ok) {
            saved->thumbnail_path = storage.public_url(url);
        }
        return st;
    }

}  // namespace

CardJson
saved_asset_to_json(const SavedAsset& asset)
{
    CardJson j   = CardJson::object();
    j["name"]    = asset.name;
    j["type"]    = asset.type;
    j["ext"]     = asset.ext;
    j["path"]    = asset.path;
    j["storage_url"] = asset.storage_url;
    if (!asset.thumbnail_path.empty()) {
        j["thumbnail_path"] = asset.thumbnail_path;
    }
    if (asset.width) {
        j["width"] = *asset.width;
    }
    if (asset.height) {
        j["height"] = *asset.height;
    }
    return j;
}


bool
saved_asset_from_json(const CardJson& json, SavedAsset* out)
{
    if (!json.is_object()) {
        return false;
    }
    SavedAsset a;
    a.name           = json.value("name", std::string());
    a.type           = json.value("type", std::string());
    a.ext            = json.value("ext", std::string());
    a.path           = json.value("path", std::string());
    a.storage_url    = json.value("storage_url", std::string());
    a.thumbnail_path = json.value("thumbnail_path", std::string());
    const auto w     = json.find("width");
    if (w != json.end() && w->is_number_unsigned()) {
        a.width = w->get<uint32_t>();
    }
    const auto h = json.find("height");
    if (h != json.end() && h->is_number_unsigned()) {
        a.height = h->get<uint32_t>();
    }
    *out = std::move(a);
    return true;
}


ExtractStatus
extract_assets(const CardBundle& bundle, ExtractedBundle* out)
{
    if (!bundle.card_data.is_object()) {
        return ExtractStatus::EmptyBundle;
    }
    ExtractedBundle result;
    result.card_data = bundle.card_data;
    for (const Asset& a : bundle.assets) {
        if (!a.is_main) {
            result.assets.push_back(a);
        }
    }
    *out = std::move(result);
    return ExtractStatus::Ok;
}


std::string
sanitize_asset_name(std::string_view name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        const char mapped = is_safe_char(c) ? c : '_';
        if (mapped == '_' && !out.empty() && out.back() == '_') {
            continue;
        }
        out.push_back(mapped);
    }
    if (out.size() > kMaxNameLength) {
        out.resize(kMaxNameLength);
    }
    if (out.empty()) {
        out = "asset";
    }
    return out;
}


std::string
asset_storage_path(std::string_view prefix, std::string_view card_id,
                   size_t index, const Asset& asset)
{
    std::string path(prefix);
    path.push_back('/');
    path.append(card_id);
    path.push_back('/');
    path.append(std::to_string(index));
    path.push_back('_');
    path.append(sanitize_asset_name(asset.name));
    path.push_back('.');
    path.append(safe_ext(asset.ext));
    return path;
}


std::string
asset_thumbnail_path(std::string_view prefix, std::string_view card_id,
                     size_t index, const Asset& asset)
{
    std::string path(prefix);
    path.push_back('/');
    path.append(card_id);
    path.append("/thumbnails/");
    path.append(std::to_string(index));
    path.push_back('_');
    path.append(sanitize_asset_name(asset.name));
    path.append(".webp");
    return path;
}


ExtractStatus
persist_and_rewrite(std::string_view card_id, const CardJson& card_data,
                    std::span<const Asset> assets, Storage& storage,
                    const PersistOptions& options, PersistResult* out)
{
    if (!card_data.is_object()) {
        return ExtractStatus::EmptyBundle;
    }
    PersistResult result;
    result.card_data       = card_data;
    result.extracted_count = assets.size();

    RefMapping mapping = options.extra_mappings;
    std::vector<std::string> tokens(assets.size());

    for (size_t i = 0; i < assets.size(); ++i) {
        const Asset& asset     = assets[i];
        const std::string path = asset_storage_path(options.path_prefix,
                                                    card_id, i, asset);
        const ImageInfo info   = probe_image(asset.bytes);
        StoreOptions store_opts;
        store_opts.content_type = std::string(image_content_type(info.format));

        std::string url;
        const StorageStatus st = storage.store(asset.bytes, path, &url,
                                               store_opts);
        if (st != StorageStatus::Ok) {
            logger()->error("asset {}/{} '{}' not stored: {}", i + 1,
                            assets.size(), path, storage_status_name(st));
            result.card_data      = card_data;
            result.storage_status = st;
            *out                  = std::move(result);
            return ExtractStatus::StorageFailed;
        }

        SavedAsset saved;
        saved.name        = asset.name;
        saved.type        = asset.type;
        saved.ext         = asset.ext;
        saved.path        = storage.public_url(url);
        saved.storage_url = url;
        if (is_image_extension(asset.ext) && info.width != 0
            && info.height != 0) {
            saved.width  = info.width;
            saved.height = info.height;
        }
        if (options.transcoder && is_image_extension(asset.ext)
            && info.format != ImageFormat::Unknown) {
            const StorageStatus ts = store_thumbnail(
                card_id, i, asset, storage, options, &saved);
            if (ts != StorageStatus::Ok) {
                logger()->error("asset {}/{} thumbnail not stored: {}", i + 1,
                                assets.size(), storage_status_name(ts));
                result.card_data      = card_data;
                result.storage_status = ts;
                *out                  = std::move(result);
                return ExtractStatus::StorageFailed;
            }
        }
        if (!asset.path.empty()) {
            tokens[i] = std::string(kEmbeddedScheme) + asset.path;
            mapping[tokens[i]] = saved.path;
        }
        result.saved_assets.push_back(std::move(saved));
    }

    RefHits hits;
    result.replaced_occurrences = rewrite_refs(&result.card_data, mapping,
                                               &hits);
    for (const std::string& token : tokens) {
        if (token.empty()) {
            continue;
        }
        const auto it = hits.find(token);
        if (it != hits.end() && it->second != 0) {
            result.referenced_count += 1;
        }
    }
    result.unresolved_refs = find_scheme_refs(result.card_data,
                                              kEmbeddedScheme);

    if (result.referenced_count < result.extracted_count) {
        logger()->warn("card {}: {} of {} extracted assets are unreferenced",
                       card_id,
                       result.extracted_count - result.referenced_count,
                       result.extracted_count);
    }
    for (const std::string& ref : result.unresolved_refs) {
        logger()->warn("card {}: unresolved reference {}", card_id, ref);
    }

    *out = std::move(result);
    return ExtractStatus::Ok;
}


const char*
extract_status_name(ExtractStatus status) noexcept
{
    switch (status) {
    case ExtractStatus::Ok: return "ok";
    case ExtractStatus::EmptyBundle: return "empty_bundle";
    case ExtractStatus::StorageFailed: return "storage_failed";
    }
    return "unknown";
}

}  // namespace cardpack
