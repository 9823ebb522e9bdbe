#include "cardpack/card_bundle.h"

#include "cardpack/log.h"

#include <cctype>
#include <cstring>

namespace cardpack {
namespace {

    static constexpr std::string_view kCharxCardEntry = "card.json";

    static std::string to_lower(std::string_view s)
    {
        std::string out(s);
        for (char& c : out) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }


    static std::string ext_of(std::string_view path)
    {
        const size_t slash = path.find_last_of('/');
        const size_t dot   = path.find_last_of('.');
        if (dot == std::string_view::npos
            || (slash != std::string_view::npos && dot < slash)
            || dot + 1 >= path.size()) {
            return "bin";
        }
        return to_lower(path.substr(dot + 1));
    }


    static std::string_view as_chars(std::span<const std::byte> bytes) noexcept
    {
        return std::string_view(reinterpret_cast<const char*>(bytes.data()),
                                bytes.size());
    }


    static std::string json_string(const CardJson& obj, const char* key)
    {
        const auto it = obj.find(key);
        if (it == obj.end() || !it->is_string()) {
            return {};
        }
        return it->get<std::string>();
    }


    static BundleStatus parse_card_object(std::string_view text,
                                          CardJson* out)
    {
        CardJson doc;
        if (!parse_card_json(text, &doc)) {
            return BundleStatus::InvalidCardData;
        }
        if (!doc.is_object()) {
            return BundleStatus::InvalidCardData;
        }
        *out = std::move(doc);
        return BundleStatus::Ok;
    }


    static BundleStatus read_png_bundle(std::span<const std::byte> bytes,
                                        const BundleReadOptions& options,
                                        CardBundle* out)
    {
        PngCardReadOptions read_opts;
        read_opts.limits = options.png;
        PngCardFile file;
        const PngCardStatus st = parse_png_card(bytes, read_opts, &file);
        if (st != PngCardStatus::Ok) {
            return BundleStatus::Malformed;
        }
        if (!file.has_payload) {
            return BundleStatus::NoCardData;
        }
        const BundleStatus cs = parse_card_object(file.payload.text,
                                                  &out->card_data);
        if (cs != BundleStatus::Ok) {
            return cs;
        }

        Asset portrait;
        portrait.name    = "main";
        portrait.type    = "icon";
        portrait.ext     = "png";
        portrait.is_main = true;
        if (strip_png_card(bytes, kCardTextKeys, &portrait.bytes)
            != PngCardStatus::Ok) {
            return BundleStatus::Malformed;
        }
        out->assets.push_back(std::move(portrait));
        return BundleStatus::Ok;
    }


    static BundleStatus read_charx_bundle(std::span<const std::byte> bytes,
                                          const BundleReadOptions& options,
                                          CardBundle* out)
    {
        ZipArchive zip;
        if (ZipArchive::open(bytes, options.zip, &zip) != ZipStatus::Ok) {
            return BundleStatus::Malformed;
        }
        std::vector<std::byte> card_bytes;
        const ZipStatus zs = zip.read(kCharxCardEntry, &card_bytes);
        if (zs == ZipStatus::NotFound) {
            return BundleStatus::NoCardData;
        }
        if (zs != ZipStatus::Ok) {
            return BundleStatus::Malformed;
        }
        const BundleStatus cs = parse_card_object(as_chars(card_bytes),
                                                  &out->card_data);
        if (cs != BundleStatus::Ok) {
            return cs;
        }

        const auto data = out->card_data.find("data");
        if (data == out->card_data.end() || !data->is_object()) {
            return BundleStatus::Ok;
        }
        const auto list = data->find("assets");
        if (list == data->end() || !list->is_array()) {
            return BundleStatus::Ok;
        }

        for (const CardJson& item : *list) {
            if (!item.is_object()) {
                continue;
            }
            const std::string uri = json_string(item, "uri");
            if (uri.compare(0, kEmbeddedScheme.size(), kEmbeddedScheme) != 0) {
                continue;
            }
            Asset asset;
            asset.path = uri.substr(kEmbeddedScheme.size());
            asset.name = json_string(item, "name");
            asset.type = json_string(item, "type");
            asset.ext  = to_lower(json_string(item, "ext"));
            if (asset.ext.empty()) {
                asset.ext = ext_of(asset.path);
            }
            const ZipStatus rs = zip.read(asset.path, &asset.bytes);
            if (rs != ZipStatus::Ok) {
                logger()->warn("charx asset '{}' skipped: {}", asset.path,
                               zip_status_name(rs));
                continue;
            }
            if (asset.name.empty()) {
                asset.name = asset.path;
            }
            out->assets.push_back(std::move(asset));
        }

        Asset* main = nullptr;
        for (Asset& a : out->assets) {
            if (a.type == "icon" && a.name == "main") {
                main = &a;
                break;
            }
        }
        if (!main) {
            for (Asset& a : out->assets) {
                if (a.type == "icon") {
                    main = &a;
                    break;
                }
            }
        }
        if (main) {
            main->is_main = true;
        }
        return BundleStatus::Ok;
    }

}  // namespace

BundleFormat
detect_bundle_format(std::span<const std::byte> bytes) noexcept
{
    static constexpr unsigned char kPngSig[8] = { 0x89, 0x50, 0x4E, 0x47,
                                                  0x0D, 0x0A, 0x1A, 0x0A };
    if (bytes.size() >= sizeof(kPngSig)
        && std::memcmp(bytes.data(), kPngSig, sizeof(kPngSig)) == 0) {
        return BundleFormat::Png;
    }
    if (looks_like_zip(bytes)) {
        return BundleFormat::CharX;
    }
    const std::string_view text = as_chars(bytes);
    size_t i                    = 0;
    // UTF-8 byte order mark.
    if (text.substr(0, 3) == "\xEF\xBB\xBF") {
        i = 3;
    }
    while (i < text.size()
           && (text[i] == ' ' || text[i] == '\t' || text[i] == '\r'
               || text[i] == '\n')) {
        ++i;
    }
    if (i < text.size() && text[i] == '{') {
        return BundleFormat::Json;
    }
    return BundleFormat::Unknown;
}


BundleStatus
read_card_bundle(std::span<const std::byte> bytes,
                 const BundleReadOptions& options, CardBundle* out)
{
    if (!out) {
        return BundleStatus::Malformed;
    }
    CardBundle bundle;
    bundle.format  = detect_bundle_format(bytes);
    BundleStatus st = BundleStatus::UnknownFormat;
    switch (bundle.format) {
    case BundleFormat::Png:
        st = read_png_bundle(bytes, options, &bundle);
        break;
    case BundleFormat::CharX:
        st = read_charx_bundle(bytes, options, &bundle);
        break;
    case BundleFormat::Json: {
        std::string_view text = as_chars(bytes);
        if (text.substr(0, 3) == "\xEF\xBB\xBF") {
            text.remove_prefix(3);
        }
        st = parse_card_object(text, &bundle.card_data);
        break;
    }
    case BundleFormat::Unknown: break;
    }
    if (st != BundleStatus::Ok) {
        return st;
    }
    bundle.spec_version = card_spec_version(bundle.card_data);
    *out                = std::move(bundle);
    return BundleStatus::Ok;
}


std::string
card_spec_version(const CardJson& card)
{
    if (card.is_object() && json_string(card, "spec") == "chara_card_v3") {
        return "v3";
    }
    return "v2";
}


const Asset*
main_asset(const CardBundle& bundle) noexcept
{
    for (const Asset& a : bundle.assets) {
        if (a.is_main) {
            return &a;
        }
    }
    return nullptr;
}


const char*
bundle_format_name(BundleFormat format) noexcept
{
    switch (format) {
    case BundleFormat::Unknown: return "unknown";
    case BundleFormat::Png: return "png";
    case BundleFormat::Json: return "json";
    case BundleFormat::CharX: return "charx";
    }
    return "unknown";
}


const char*
bundle_status_name(BundleStatus status) noexcept
{
    switch (status) {
    case BundleStatus::Ok: return "ok";
    case BundleStatus::UnknownFormat: return "unknown_format";
    case BundleStatus::Malformed: return "malformed";
    case BundleStatus::NoCardData: return "no_card_data";
    case BundleStatus::InvalidCardData: return "invalid_card_data";
    }
    return "unknown";
}

}  // namespace cardpack
