#include "cardpack/build_info.h"
#include "cardpack/config.h"
#include "cardpack/digest.h"
#include "cardpack/file_storage.h"
#include "cardpack/httplib_client.h"
#include "cardpack/image_probe.h"
#include "cardpack/log.h"
#include "cardpack/png_card.h"
#include "cardpack/post_process.h"
#include "cardpack/upload.h"
#include "cardpack/version_store.h"
#if CARDPACK_WITH_WEBP
#include "cardpack/webp_transcoder.h"
#endif

#include <httplib.h>

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cardpack {
namespace {

    static int http_status(UploadStatus st) noexcept
    {
        switch (st) {
        case UploadStatus::Ok: return 200;
        case UploadStatus::UnknownSession:
        case UploadStatus::NotFound: return 404;
        case UploadStatus::InvalidState:
        case UploadStatus::IncompleteParts: return 409;
        case UploadStatus::InvalidRequest: return 400;
        case UploadStatus::UnsupportedContentType: return 415;
        case UploadStatus::FileTooLarge: return 413;
        case UploadStatus::BundleRejected: return 422;
        case UploadStatus::UnknownScheme:
        case UploadStatus::StorageFailed:
        case UploadStatus::StoreFailed: return 500;
        }
        return 500;
    }


    static void reply_json(httplib::Response& res, int status,
                           const CardJson& body)
    {
        res.status = status;
        res.set_content(dump_card_json(body), "application/json");
    }


    static void reply_error(httplib::Response& res, int status,
                            std::string_view code)
    {
        CardJson body     = CardJson::object();
        body["error"]     = std::string(code);
        reply_json(res, status, body);
    }


    static bool parse_body(const httplib::Request& req, CardJson* out)
    {
        return parse_card_json(req.body, out) && out->is_object();
    }


    // Body of the completion and uploaded-report requests.
    static bool parse_completion(const httplib::Request& req, CardJson* body,
                                 std::vector<PartReceipt>* parts)
    {
        if (!parse_body(req, body) || !body->contains("parts")
            || !(*body)["parts"].is_array()) {
            return false;
        }
        for (const CardJson& p : (*body)["parts"]) {
            if (!p.is_object() || !p.contains("part_number")
                || !p["part_number"].is_number_unsigned()
                || !p.contains("etag") || !p["etag"].is_string()) {
                return false;
            }
            PartReceipt r;
            r.part_number = p["part_number"].get<uint32_t>();
            r.etag        = p["etag"].get<std::string>();
            parts->push_back(std::move(r));
        }
        return true;
    }


    static int64_t unix_now()
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }


    static std::string_view guess_content_type(std::string_view path,
                                               std::span<const std::byte> b)
    {
        const ImageInfo info = probe_image(b);
        if (info.format != ImageFormat::Unknown) {
            return image_content_type(info.format);
        }
        if (path.ends_with(".json")) {
            return "application/json";
        }
        if (path.ends_with(".charx")) {
            return "application/zip";
        }
        return "application/octet-stream";
    }


    struct Service final {
        ServiceConfig config;
        Storage* storage                 = nullptr;
        VersionStore* store              = nullptr;
        UploadCoordinator* coordinator   = nullptr;
        FileStorageDriver* direct_driver = nullptr;
    };


    static void install_routes(httplib::Server& svr, Service& svc)
    {
        svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
            res.set_content("ok", "text/plain");
        });

        svr.Post("/api/uploads/sessions", [&svc](const httplib::Request& req,
                                                 httplib::Response& res) {
            CardJson body;
            if (!parse_body(req, &body)) {
                reply_error(res, 400, "invalid_json");
                return;
            }
            std::string session;
            const UploadStatus st = svc.coordinator->begin_session(
                body.value("card_id", std::string()), &session);
            if (st != UploadStatus::Ok) {
                reply_error(res, http_status(st), upload_status_name(st));
                return;
            }
            CardJson out      = CardJson::object();
            out["session_id"] = session;
            reply_json(res, 201, out);
        });

        svr.Post("/api/uploads/presign", [&svc](const httplib::Request& req,
                                                httplib::Response& res) {
            CardJson body;
            if (!parse_body(req, &body) || !body.contains("files")
                || !body["files"].is_array()) {
                reply_error(res, 400, "invalid_json");
                return;
            }
            std::vector<FileDescriptor> files;
            for (const CardJson& f : body["files"]) {
                if (!f.is_object()) {
                    reply_error(res, 400, "invalid_request");
                    return;
                }
                FileDescriptor d;
                d.key          = f.value("key", std::string());
                d.filename     = f.value("filename", std::string());
                d.size         = f.value("size", uint64_t { 0 });
                d.content_type = f.value("content_type", std::string());
                files.push_back(std::move(d));
            }
            std::vector<Grant> grants;
            const UploadStatus st = svc.coordinator->request_grants(
                body.value("session_id", std::string()), files, &grants);
            if (st != UploadStatus::Ok) {
                reply_error(res, http_status(st), upload_status_name(st));
                return;
            }
            CardJson out = CardJson::object();
            CardJson arr = CardJson::array();
            for (const Grant& g : grants) {
                CardJson j         = CardJson::object();
                j["key"]           = g.key;
                j["upload_url"]    = g.upload_url;
                j["backend_key"]   = g.backend_key;
                j["upload_id"]     = g.upload_id;
                j["part_number"]   = g.part_number;
                j["expires_at"]    = g.expires_at;
                CardJson headers   = CardJson::object();
                for (const auto& [name, value] : g.headers) {
                    headers[name] = value;
                }
                j["headers"] = std::move(headers);
                arr.push_back(std::move(j));
            }
            out["grants"] = std::move(arr);
            reply_json(res, 200, out);
        });

        svr.Put(R"(/api/uploads/direct/(.+))",
                [&svc](const httplib::Request& req, httplib::Response& res) {
                    if (!svc.direct_driver) {
                        reply_error(res, 404, "direct_uploads_disabled");
                        return;
                    }
                    GrantScope scope;
                    StorageStatus st = svc.direct_driver->verify_grant(
                        req.target, req.get_header_value("Content-Type"),
                        unix_now(), &scope);
                    if (st != StorageStatus::Ok) {
                        reply_error(res, 403, storage_status_name(st));
                        return;
                    }
                    std::string etag;
                    st = svc.direct_driver->accept_upload(
                        scope, as_bytes(req.body), &etag);
                    if (st != StorageStatus::Ok) {
                        reply_error(res, 500, storage_status_name(st));
                        return;
                    }
                    res.set_header("ETag", "\"" + etag + "\"");
                    res.status = 200;
                });

        svr.Post("/api/uploads/uploaded", [&svc](const httplib::Request& req,
                                                 httplib::Response& res) {
            CardJson body;
            std::vector<PartReceipt> parts;
            if (!parse_completion(req, &body, &parts)) {
                reply_error(res, 400, "invalid_request");
                return;
            }
            const UploadStatus st = svc.coordinator->report_uploaded(
                body.value("session_id", std::string()),
                body.value("key", std::string()), parts);
            if (st != UploadStatus::Ok) {
                reply_error(res, http_status(st), upload_status_name(st));
                return;
            }
            CardJson out = CardJson::object();
            out["state"] = "parts_uploaded";
            reply_json(res, 200, out);
        });

        svr.Post("/api/uploads/complete", [&svc](const httplib::Request& req,
                                                 httplib::Response& res) {
            CardJson body;
            std::vector<PartReceipt> parts;
            if (!parse_completion(req, &body, &parts)) {
                reply_error(res, 400, "invalid_request");
                return;
            }
            CommitResult result;
            const UploadStatus st = svc.coordinator->complete(
                body.value("session_id", std::string()),
                body.value("key", std::string()), parts, &result);
            if (st != UploadStatus::Ok) {
                reply_error(res, http_status(st), upload_status_name(st));
                return;
            }
            CardJson out            = CardJson::object();
            out["version_id"]       = result.version_id;
            out["card_id"]          = result.card_id;
            out["image_url"]        = result.image_url;
            out["thumbnail_url"]    = result.thumbnail_url;
            out["content_hash"]     = result.content_hash;
            out["extracted_count"]  = result.extracted_count;
            out["referenced_count"] = result.referenced_count;
            out["unresolved_refs"]  = result.unresolved_refs;
            out["external_refs"]    = result.external_refs;
            reply_json(res, 200, out);
        });

        svr.Get(R"(/api/uploads/(.+))", [&svc](const httplib::Request& req,
                                               httplib::Response& res) {
            const std::string path = req.matches[1];
            if (!is_safe_storage_path(path)) {
                reply_error(res, 400, "invalid_path");
                return;
            }
            std::vector<std::byte> bytes;
            const StorageStatus st = svc.storage->retrieve(
                format_storage_url(svc.storage->default_scheme(), path),
                &bytes);
            if (st == StorageStatus::NotFound) {
                reply_error(res, 404, "not_found");
                return;
            }
            if (st != StorageStatus::Ok) {
                reply_error(res, 500, storage_status_name(st));
                return;
            }
            const std::string type(guess_content_type(path, bytes));
            res.status = 200;
            res.set_content(reinterpret_cast<const char*>(bytes.data()),
                            bytes.size(), type);
        });

        svr.Get(R"(/api/versions/([0-9a-f]+)/download)",
                [&svc](const httplib::Request& req, httplib::Response& res) {
                    CardVersion v;
                    const StoreStatus st = svc.store->get_version(
                        req.matches[1].str(), &v);
                    if (st == StoreStatus::NotFound) {
                        reply_error(res, 404, "not_found");
                        return;
                    }
                    if (st != StoreStatus::Ok) {
                        reply_error(res, 500, store_status_name(st));
                        return;
                    }
                    const std::string format = req.has_param("format")
                                                   ? req.get_param_value(
                                                         "format")
                                                   : "png";
                    const std::string json = dump_card_json(v.card_data);
                    if (format == "json") {
                        res.status = 200;
                        res.set_content(json, "application/json");
                        return;
                    }
                    const std::string& prefix = svc.storage->public_prefix();
                    if (format != "png" || !v.image_url.starts_with(prefix)) {
                        reply_error(res, 404, "no_portrait");
                        return;
                    }
                    std::vector<std::byte> portrait;
                    const StorageStatus ss = svc.storage->retrieve(
                        format_storage_url(
                            svc.storage->default_scheme(),
                            std::string_view(v.image_url).substr(
                                prefix.size())),
                        &portrait);
                    if (ss != StorageStatus::Ok) {
                        reply_error(res, 404, storage_status_name(ss));
                        return;
                    }
                    PngCardEmbedOptions opts;
                    opts.key = v.spec_version == "v3" ? "ccv3" : "chara";
                    std::vector<std::byte> out;
                    const PngCardStatus ps = embed_png_card(portrait, json,
                                                            opts, &out);
                    if (ps != PngCardStatus::Ok) {
                        reply_error(res, 422, png_card_status_name(ps));
                        return;
                    }
                    res.status = 200;
                    res.set_content(reinterpret_cast<const char*>(out.data()),
                                    out.size(), "image/png");
                });
    }

}  // namespace
}  // namespace cardpack


int
main()
{
    using namespace cardpack;

    Service svc;
    std::string error;
    if (!load_service_config(process_env, &svc.config, &error)) {
        std::fprintf(stderr, "config: %s\n", error.c_str());
        return 2;
    }
    if (!set_log_level(svc.config.log_level)) {
        std::fprintf(stderr, "config: invalid CARDPACK_LOG_LEVEL\n");
        return 2;
    }
    std::string line1;
    std::string line2;
    format_build_info_lines(&line1, &line2);
    logger()->info("{}", line1);
    logger()->info("{}", line2);

    HttplibClient http;
    DriverRegistry registry;
    if (register_drivers(svc.config, &http, &registry) != StorageStatus::Ok) {
        return 1;
    }
    Storage storage(registry, svc.config.storage_scheme,
                    svc.config.public_prefix);
    svc.storage       = &storage;
    svc.direct_driver = dynamic_cast<FileStorageDriver*>(
        registry.find("file"));

    std::unique_ptr<VersionStore> store;
    if (VersionStore::open(svc.config.db_path, &store, &error)
        != StoreStatus::Ok) {
        logger()->critical("version store {}: {}", svc.config.db_path, error);
        return 1;
    }
    svc.store = store.get();

#if CARDPACK_WITH_WEBP
    WebpTranscoder webp;
    ImageTranscoder* transcoder = &webp;
#else
    ImageTranscoder* transcoder = nullptr;
    logger()->warn("built without libwebp; no thumbnails or WebP copies");
#endif

    HttpResourceFetcher fetcher(http);
    PostProcessOptions post_options = svc.config.post_process;
    post_options.transcoder         = transcoder;
    PostProcessor post(*store, storage, fetcher, post_options);
    post.recover();

    UploadCoordinator coordinator(storage, *store, svc.config.upload, &post,
                                  {}, transcoder);
    svc.coordinator = &coordinator;

    std::mutex sweep_mutex;
    std::condition_variable sweep_cv;
    bool stopping = false;
    std::thread sweeper([&]() {
        std::unique_lock<std::mutex> lock(sweep_mutex);
        while (!sweep_cv.wait_for(lock, std::chrono::seconds(60),
                                  [&]() { return stopping; })) {
            coordinator.expire_sessions(unix_now());
        }
    });

    httplib::Server svr;
    install_routes(svr, svc);
    logger()->info("listening on {}:{}", svc.config.listen_host,
                   svc.config.listen_port);
    const bool ok = svr.listen(svc.config.listen_host, svc.config.listen_port);
    if (!ok) {
        logger()->critical("cannot listen on {}:{}", svc.config.listen_host,
                           svc.config.listen_port);
    }

    {
        std::lock_guard<std::mutex> lock(sweep_mutex);
        stopping = true;
    }
    sweep_cv.notify_all();
    sweeper.join();
    post.shutdown();
    return ok ? 0 : 1;
}
