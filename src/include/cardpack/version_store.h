#pragma once

#include "cardpack/asset_extract.h"
#include "cardpack/card_json.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

/**
 * \file version_store.h
 * \brief SQLite persistence for card versions and post-processing tasks.
 */

namespace cardpack {

enum class StoreStatus : uint8_t {
    Ok,
    NotFound,
    /// Primary key already present.
    Conflict,
    /// SQLite error; see \ref VersionStore::last_error.
    Error,
};

/// One committed revision of a card. Append-only.
struct CardVersion final {
    std::string id;
    std::string card_id;
    CardJson card_data;
    std::vector<SavedAsset> saved_assets;
    /// Lower-case hex SHA-256 of the uploaded bundle.
    std::string content_hash;
    /// `png`, `json` or `charx`.
    std::string source_format;
    /// `v2` or `v3`.
    std::string spec_version;
    /// Storage URL of the original upload.
    std::string storage_url;
    /// Public URL of the portrait; empty when the bundle had none.
    std::string image_url;
    /// Public URL of the WebP portrait thumbnail; empty when none was made.
    std::string thumbnail_url;
    int64_t created_at = 0;
};

enum class UnitState : uint8_t {
    Pending,
    Resolved,
    Failed,
};

/// One external reference awaiting resolution.
struct WorkUnit final {
    std::string reference;
    UnitState state   = UnitState::Pending;
    uint32_t attempts = 0;
    std::string resolved_url;
    std::string error;
};

struct PostProcessTask final {
    std::string version_id;
    std::string card_id;
    std::vector<WorkUnit> units;
    /// Set once every unit is terminal; retired tasks are never re-run.
    bool retired       = false;
    int64_t updated_at = 0;
};

/**
 * \brief Thread-safe store over one SQLite connection.
 *
 * The database runs in WAL mode with a busy timeout so several processes
 * can share one file.
 */
class VersionStore final {
    /// Restricts construction to \ref open while allowing make_unique.
    struct OpenTag final {
        explicit OpenTag() = default;
    };

public:
    VersionStore(OpenTag, sqlite3* db);
    ~VersionStore();

    VersionStore(const VersionStore&)            = delete;
    VersionStore& operator=(const VersionStore&) = delete;

    /// Opens (creating if needed) \p path; `:memory:` is accepted.
    static StoreStatus open(const std::string& path,
                            std::unique_ptr<VersionStore>* out,
                            std::string* error = nullptr);

    /// Inserts a new version; `Conflict` if the id exists.
    StoreStatus insert_version(const CardVersion& version);
    StoreStatus get_version(std::string_view id, CardVersion* out);
    /// Versions of \p card_id, oldest first.
    StoreStatus list_versions(std::string_view card_id,
                              std::vector<CardVersion>* out);

    /**
     * \brief Replaces every whole-token occurrence of \p token in the
     * stored card data, in one immediate transaction.
     *
     * \p replaced receives the number of replacements (zero is not an
     * error).
     */
    StoreStatus rewrite_reference(std::string_view version_id,
                                  std::string_view token,
                                  std::string_view replacement,
                                  size_t* replaced);

    /// Inserts or replaces the task for its version.
    StoreStatus put_task(const PostProcessTask& task);
    StoreStatus get_task(std::string_view version_id, PostProcessTask* out);
    /// Tasks not yet retired, oldest update first.
    StoreStatus list_open_tasks(std::vector<PostProcessTask>* out);

    std::string last_error() const;

private:
    StoreStatus exec(const char* sql);
    StoreStatus fail(const char* what);

    sqlite3* db_;
    mutable std::mutex mutex_;
    std::string last_error_;
};

const char*
store_status_name(StoreStatus status) noexcept;

const char*
unit_state_name(UnitState state) noexcept;

}  // namespace cardpack
