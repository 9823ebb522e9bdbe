#include "cardpack/asset_extract.h"
#include "cardpack/build_info.h"
#include "cardpack/card_bundle.h"
#include "cardpack/card_refs.h"
#include "cardpack/digest.h"
#include "cardpack/file_storage.h"
#include "cardpack/log.h"
#include "cardpack/png_card.h"
#include "cardpack/storage.h"
#include "cardpack/upload.h"
#include "cardpack/version_store.h"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cardpack {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [--log-level L] <command> [args]\n"
            "\n"
            "Commands:\n"
            "  info <file>                    Describe a card bundle\n"
            "  extract <file> [--out-dir D]   Write card.json and assets to D\n"
            "  embed <png> <json> -o <out>    Embed card JSON into a PNG\n"
            "        [--key K] [--itxt] [--no-minify]\n"
            "  ingest <file> --card-id ID     Upload a bundle into local storage\n"
            "        [--root DIR] [--db PATH]\n"
            "  version                        Print build info\n",
            argv0 ? argv0 : "cardtool");
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static bool read_file_bytes(const std::string& path,
                                std::vector<std::byte>* out)
    {
        std::FILE* f = std::fopen(path.c_str(), "rb");
        if (!f) {
            return false;
        }
        out->clear();
        std::byte buf[1 << 15];
        size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
            out->insert(out->end(), buf, buf + n);
        }
        const bool ok = std::ferror(f) == 0;
        std::fclose(f);
        return ok;
    }


    static bool write_file_bytes(const std::string& path,
                                 std::span<const std::byte> bytes)
    {
        std::FILE* f = std::fopen(path.c_str(), "wb");
        if (!f) {
            return false;
        }
        size_t written = 0;
        if (!bytes.empty()) {
            written = std::fwrite(bytes.data(), 1, bytes.size(), f);
        }
        const bool closed = std::fclose(f) == 0;
        return closed && written == bytes.size();
    }


    static const char* find_opt(int argc, char** argv, int first,
                                const char* name)
    {
        for (int i = first; i + 1 < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return nullptr;
    }


    static bool has_flag(int argc, char** argv, int first, const char* name)
    {
        for (int i = first; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return true;
            }
        }
        return false;
    }


    static bool load_bundle(const char* path, std::vector<std::byte>* bytes,
                            CardBundle* bundle)
    {
        if (!read_file_bytes(path, bytes)) {
            std::fprintf(stderr, "%s: cannot read\n", path);
            return false;
        }
        const BundleStatus st = read_card_bundle(*bytes, BundleReadOptions(),
                                                 bundle);
        if (st != BundleStatus::Ok) {
            std::fprintf(stderr, "%s: %s\n", path, bundle_status_name(st));
            return false;
        }
        return true;
    }


    static int cmd_info(const char* path)
    {
        std::vector<std::byte> bytes;
        CardBundle bundle;
        if (!load_bundle(path, &bytes, &bundle)) {
            return 1;
        }
        const CardJson& card = bundle.card_data;
        std::string name     = card.value("name", std::string());
        const auto data      = card.find("data");
        if (data != card.end() && data->is_object()) {
            name = data->value("name", name);
        }
        std::printf("file:     %s\n", path);
        std::printf("format:   %s\n", bundle_format_name(bundle.format));
        std::printf("spec:     %s\n", bundle.spec_version.c_str());
        std::printf("name:     %s\n", name.c_str());
        std::printf("sha256:   %s\n", sha256_hex(bytes).c_str());
        std::printf("assets:   %zu\n", bundle.assets.size());
        for (const Asset& a : bundle.assets) {
            std::printf("  %-4s %-12s %-24s %8zu %s\n", a.is_main ? "main" : "",
                        a.type.c_str(), a.name.c_str(), a.bytes.size(),
                        a.path.c_str());
        }
        const std::vector<std::string> internal
            = find_scheme_refs(card, kEmbeddedScheme);
        const std::vector<std::string> external = find_external_image_refs(
            card);
        std::printf("internal refs: %zu\n", internal.size());
        std::printf("external refs: %zu\n", external.size());
        for (const std::string& url : external) {
            std::printf("  %s\n", url.c_str());
        }
        return 0;
    }


    static int cmd_extract(const char* path, const std::string& out_dir)
    {
        std::vector<std::byte> bytes;
        CardBundle bundle;
        if (!load_bundle(path, &bytes, &bundle)) {
            return 1;
        }
        std::error_code ec;
        std::filesystem::create_directories(out_dir, ec);
        if (ec) {
            std::fprintf(stderr, "%s: %s\n", out_dir.c_str(),
                         ec.message().c_str());
            return 1;
        }
        const std::string json = dump_card_json(bundle.card_data);
        const std::string json_path = out_dir + "/card.json";
        if (!write_file_bytes(json_path, as_bytes(json))) {
            std::fprintf(stderr, "%s: write failed\n", json_path.c_str());
            return 1;
        }
        std::printf("%s\n", json_path.c_str());
        for (size_t i = 0; i < bundle.assets.size(); ++i) {
            const Asset& a = bundle.assets[i];
            const std::string file
                = out_dir + "/"
                  + std::filesystem::path(
                        asset_storage_path("assets", "card", i, a))
                        .filename()
                        .string();
            if (!write_file_bytes(file, a.bytes)) {
                std::fprintf(stderr, "%s: write failed\n", file.c_str());
                return 1;
            }
            std::printf("%s\n", file.c_str());
        }
        return 0;
    }


    static int cmd_embed(const char* png_path, const char* json_path,
                         const char* out_path, const PngCardEmbedOptions& opts)
    {
        std::vector<std::byte> png;
        std::vector<std::byte> json;
        if (!read_file_bytes(png_path, &png)) {
            std::fprintf(stderr, "%s: cannot read\n", png_path);
            return 1;
        }
        if (!read_file_bytes(json_path, &json)) {
            std::fprintf(stderr, "%s: cannot read\n", json_path);
            return 1;
        }
        const std::string_view text(reinterpret_cast<const char*>(json.data()),
                                    json.size());
        std::vector<std::byte> out;
        const PngCardStatus st = embed_png_card(png, text, opts, &out);
        if (st != PngCardStatus::Ok) {
            std::fprintf(stderr, "%s: %s\n", png_path, png_card_status_name(st));
            return 1;
        }
        if (!write_file_bytes(out_path, out)) {
            std::fprintf(stderr, "%s: write failed\n", out_path);
            return 1;
        }
        std::printf("%s (%zu bytes)\n", out_path, out.size());
        return 0;
    }


    static const char* content_type_for(BundleFormat format) noexcept
    {
        switch (format) {
        case BundleFormat::Png: return "image/png";
        case BundleFormat::Json: return "application/json";
        case BundleFormat::CharX: return "application/zip";
        case BundleFormat::Unknown: break;
        }
        return "application/octet-stream";
    }


    // Runs the direct-upload protocol against local storage end to end.
    static int cmd_ingest(const char* path, const std::string& card_id,
                          const std::string& root, const std::string& db_path)
    {
        std::vector<std::byte> bytes;
        if (!read_file_bytes(path, &bytes)) {
            std::fprintf(stderr, "%s: cannot read\n", path);
            return 1;
        }
        const std::string secret = random_hex_id(32);
        if (secret.empty()) {
            std::fprintf(stderr, "random source failed\n");
            return 1;
        }

        DriverRegistry registry;
        FileStorageOptions fo;
        fo.root               = root;
        fo.grant_secret       = secret;
        auto file_driver      = std::make_unique<FileStorageDriver>(fo);
        FileStorageDriver* fd = file_driver.get();
        if (registry.add(std::move(file_driver)) != StorageStatus::Ok) {
            return 1;
        }
        Storage storage(registry, "file");

        std::unique_ptr<VersionStore> store;
        std::string error;
        if (VersionStore::open(db_path, &store, &error) != StoreStatus::Ok) {
            std::fprintf(stderr, "%s: %s\n", db_path.c_str(), error.c_str());
            return 1;
        }

        UploadPolicy policy;
        policy.part_size = 1ull << 62;
        UploadCoordinator coordinator(storage, *store, policy);

        std::string session;
        UploadStatus st = coordinator.begin_session(card_id, &session);
        if (st != UploadStatus::Ok) {
            std::fprintf(stderr, "begin: %s\n", upload_status_name(st));
            return 1;
        }
        FileDescriptor desc;
        desc.key          = "card";
        desc.filename     = std::filesystem::path(path).filename().string();
        desc.size         = bytes.size();
        desc.content_type = content_type_for(detect_bundle_format(bytes));
        std::vector<Grant> grants;
        st = coordinator.request_grants(session, { &desc, 1 }, &grants);
        if (st != UploadStatus::Ok || grants.size() != 1) {
            std::fprintf(stderr, "grant: %s\n", upload_status_name(st));
            return 1;
        }

        const int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
                                std::chrono::system_clock::now()
                                    .time_since_epoch())
                                .count();
        GrantScope scope;
        StorageStatus ss = fd->verify_grant(grants[0].upload_url,
                                            desc.content_type, now, &scope);
        std::string etag;
        if (ss == StorageStatus::Ok) {
            ss = fd->accept_upload(scope, bytes, &etag);
        }
        if (ss != StorageStatus::Ok) {
            std::fprintf(stderr, "upload: %s\n", storage_status_name(ss));
            return 1;
        }

        const PartReceipt part { 1, etag };
        CommitResult result;
        st = coordinator.complete(session, desc.key, { &part, 1 }, &result);
        if (st != UploadStatus::Ok) {
            std::fprintf(stderr, "complete: %s\n", upload_status_name(st));
            return 1;
        }
        std::printf("version:  %s\n", result.version_id.c_str());
        std::printf("original: %s\n", result.storage_url.c_str());
        std::printf("image:    %s\n", result.image_url.c_str());
        std::printf("assets:   %zu extracted, %zu referenced\n",
                    result.extracted_count, result.referenced_count);
        for (const std::string& ref : result.unresolved_refs) {
            std::printf("unresolved: %s\n", ref.c_str());
        }
        if (result.external_refs != 0) {
            std::printf("external: %zu reference(s) queued\n",
                        result.external_refs);
        }
        return 0;
    }

}  // namespace
}  // namespace cardpack


int
main(int argc, char** argv)
{
    using namespace cardpack;

    int first = 1;
    if (argc > 2 && std::strcmp(argv[1], "--log-level") == 0) {
        if (!set_log_level(argv[2])) {
            std::fprintf(stderr, "invalid --log-level value\n");
            return 2;
        }
        first = 3;
    }
    if (first >= argc) {
        usage(argv[0]);
        return 2;
    }
    const std::string_view cmd = argv[first];
    const int rest             = first + 1;

    if (cmd == "--help" || cmd == "help") {
        usage(argv[0]);
        return 0;
    }
    if (cmd == "version" || cmd == "--version") {
        print_build_info_header();
        return 0;
    }
    if (cmd == "info" && rest < argc) {
        return cmd_info(argv[rest]);
    }
    if (cmd == "extract" && rest < argc) {
        const char* dir = find_opt(argc, argv, rest + 1, "--out-dir");
        return cmd_extract(argv[rest], dir ? dir : ".");
    }
    if (cmd == "embed" && rest + 1 < argc) {
        const char* out = find_opt(argc, argv, rest + 2, "-o");
        if (!out) {
            usage(argv[0]);
            return 2;
        }
        PngCardEmbedOptions opts;
        if (const char* key = find_opt(argc, argv, rest + 2, "--key")) {
            opts.key = key;
        }
        opts.base64 = !has_flag(argc, argv, rest + 2, "--itxt");
        opts.minify = !has_flag(argc, argv, rest + 2, "--no-minify");
        return cmd_embed(argv[rest], argv[rest + 1], out, opts);
    }
    if (cmd == "ingest" && rest < argc) {
        const char* card_id = find_opt(argc, argv, rest + 1, "--card-id");
        if (!card_id) {
            usage(argv[0]);
            return 2;
        }
        const char* root = find_opt(argc, argv, rest + 1, "--root");
        const char* db   = find_opt(argc, argv, rest + 1, "--db");
        return cmd_ingest(argv[rest], card_id, root ? root : "data/uploads",
                          db ? db : "data/cardpack.db");
    }
    usage(argv[0]);
    return 2;
}
