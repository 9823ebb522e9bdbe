#pragma once

#include "cardpack/post_process.h"
#include "cardpack/storage.h"
#include "cardpack/upload.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

/**
 * \file config.h
 * \brief Service configuration from `CARDPACK_*` environment variables.
 */

namespace cardpack {

class HttpClient;

struct ServiceConfig final {
    std::string log_level = "info";
    /// SQLite database of card versions and post-processing tasks.
    std::string db_path   = "data/cardpack.db";

    /// Scheme new objects are written to (`file`, `r2` or `mem`).
    std::string storage_scheme = "file";
    std::string public_prefix  = "/api/uploads/";
    std::string file_root      = "data/uploads";
    /// HMAC key of local direct-upload grants.
    std::string grant_secret;

    std::string r2_endpoint;
    std::string r2_bucket;
    std::string r2_access_key;
    std::string r2_secret_key;
    std::string r2_region = "auto";
    std::string r2_public_base;

    std::string listen_host = "127.0.0.1";
    int listen_port         = 8080;

    UploadPolicy upload;
    PostProcessOptions post_process;
};

/// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

/// Looks up the process environment.
std::optional<std::string>
process_env(const char* name);

/**
 * \brief Reads every `CARDPACK_*` variable over the defaults.
 *
 * Returns false and names the offending variable in \p error when a
 * numeric value does not parse or a required value is missing.
 */
bool
load_service_config(const EnvLookup& env, ServiceConfig* out,
                    std::string* error);

/**
 * \brief Registers the drivers \p config describes.
 *
 * `mem` is always registered; `file` when a root is set; `r2` when an
 * endpoint is set and \p http is non-null. Fails with `UnknownScheme` when
 * the configured default scheme ends up unregistered.
 */
StorageStatus
register_drivers(const ServiceConfig& config, HttpClient* http,
                 DriverRegistry* registry);

}  // namespace cardpack
