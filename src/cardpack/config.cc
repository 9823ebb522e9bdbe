#include "cardpack/config.h"

#include "cardpack/file_storage.h"
#include "cardpack/log.h"
#include "cardpack/memory_storage.h"
#include "cardpack/object_store.h"

#include <charconv>
#include <cstdlib>

namespace cardpack {
namespace {

    static void get_env_or(const EnvLookup& env, const char* key,
                           std::string* value)
    {
        if (std::optional<std::string> v = env(key)) {
            *value = std::move(*v);
        }
    }


    template<typename T>
    static bool get_env_number(const EnvLookup& env, const char* key, T* value,
                               std::string* error)
    {
        const std::optional<std::string> v = env(key);
        if (!v) {
            return true;
        }
        T parsed        = 0;
        const char* end = v->data() + v->size();
        const auto res  = std::from_chars(v->data(), end, parsed);
        if (v->empty() || v->front() == '-' || res.ec != std::errc()
            || res.ptr != end) {
            if (error) {
                *error = std::string(key) + ": not a non-negative integer";
            }
            return false;
        }
        *value = parsed;
        return true;
    }

}  // namespace

std::optional<std::string>
process_env(const char* name)
{
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}


bool
load_service_config(const EnvLookup& env, ServiceConfig* out,
                    std::string* error)
{
    ServiceConfig cfg;
    get_env_or(env, "CARDPACK_LOG_LEVEL", &cfg.log_level);
    get_env_or(env, "CARDPACK_DB_PATH", &cfg.db_path);
    get_env_or(env, "CARDPACK_STORAGE", &cfg.storage_scheme);
    get_env_or(env, "CARDPACK_PUBLIC_PREFIX", &cfg.public_prefix);
    get_env_or(env, "CARDPACK_FILE_ROOT", &cfg.file_root);
    get_env_or(env, "CARDPACK_GRANT_SECRET", &cfg.grant_secret);
    get_env_or(env, "CARDPACK_R2_ENDPOINT", &cfg.r2_endpoint);
    get_env_or(env, "CARDPACK_R2_BUCKET", &cfg.r2_bucket);
    get_env_or(env, "CARDPACK_R2_ACCESS_KEY", &cfg.r2_access_key);
    get_env_or(env, "CARDPACK_R2_SECRET_KEY", &cfg.r2_secret_key);
    get_env_or(env, "CARDPACK_R2_REGION", &cfg.r2_region);
    get_env_or(env, "CARDPACK_R2_PUBLIC_BASE", &cfg.r2_public_base);
    get_env_or(env, "CARDPACK_LISTEN_HOST", &cfg.listen_host);

    if (!get_env_number(env, "CARDPACK_LISTEN_PORT", &cfg.listen_port, error)
        || !get_env_number(env, "CARDPACK_MAX_FILE_BYTES",
                           &cfg.upload.max_file_bytes, error)
        || !get_env_number(env, "CARDPACK_MAX_SESSION_BYTES",
                           &cfg.upload.max_session_bytes, error)
        || !get_env_number(env, "CARDPACK_PART_SIZE", &cfg.upload.part_size,
                           error)
        || !get_env_number(env, "CARDPACK_GRANT_TTL",
                           &cfg.upload.grant_ttl_seconds, error)
        || !get_env_number(env, "CARDPACK_SESSION_TTL",
                           &cfg.upload.session_ttl_seconds, error)
        || !get_env_number(env, "CARDPACK_WORKERS",
                           &cfg.post_process.worker_threads, error)
        || !get_env_number(env, "CARDPACK_MAX_ATTEMPTS",
                           &cfg.post_process.max_attempts, error)
        || !get_env_number(env, "CARDPACK_MAX_RESOURCE_BYTES",
                           &cfg.post_process.max_resource_bytes, error)) {
        return false;
    }

    if (cfg.listen_port <= 0 || cfg.listen_port > 65535) {
        if (error) {
            *error = "CARDPACK_LISTEN_PORT: out of range";
        }
        return false;
    }
    if (cfg.upload.part_size == 0) {
        if (error) {
            *error = "CARDPACK_PART_SIZE: must be positive";
        }
        return false;
    }
    if (cfg.storage_scheme == "r2"
        && (cfg.r2_endpoint.empty() || cfg.r2_bucket.empty())) {
        if (error) {
            *error = "CARDPACK_R2_ENDPOINT and CARDPACK_R2_BUCKET are "
                     "required for r2 storage";
        }
        return false;
    }
    *out = std::move(cfg);
    return true;
}


StorageStatus
register_drivers(const ServiceConfig& config, HttpClient* http,
                 DriverRegistry* registry)
{
    StorageStatus st = registry->add(std::make_unique<MemoryStorageDriver>());
    if (st != StorageStatus::Ok) {
        return st;
    }
    if (!config.file_root.empty()) {
        FileStorageOptions fo;
        fo.root         = config.file_root;
        fo.grant_secret = config.grant_secret;
        st = registry->add(std::make_unique<FileStorageDriver>(fo));
        if (st != StorageStatus::Ok) {
            return st;
        }
    }
    if (!config.r2_endpoint.empty()) {
        if (!http) {
            logger()->warn("r2 endpoint configured without an HTTP client");
        } else {
            ObjectStoreOptions oo;
            oo.endpoint                 = config.r2_endpoint;
            oo.bucket                   = config.r2_bucket;
            oo.credentials.access_key   = config.r2_access_key;
            oo.credentials.secret_key   = config.r2_secret_key;
            oo.credentials.region       = config.r2_region;
            oo.public_base              = config.r2_public_base;
            st = registry->add(
                std::make_unique<ObjectStoreDriver>(oo, *http));
            if (st != StorageStatus::Ok) {
                return st;
            }
        }
    }
    if (!registry->find(config.storage_scheme)) {
        logger()->error("storage scheme '{}' is not configured",
                        config.storage_scheme);
        return StorageStatus::UnknownScheme;
    }
    return StorageStatus::Ok;
}

}  // namespace cardpack
