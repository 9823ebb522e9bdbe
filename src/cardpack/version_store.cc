#include "cardpack/version_store.h"

#include "cardpack/card_refs.h"
#include "cardpack/log.h"

#include <sqlite3.h>

namespace cardpack {
namespace {

    static constexpr const char* kSchema = R"SQL(
        CREATE TABLE IF NOT EXISTS card_versions (
            id            TEXT PRIMARY KEY,
            card_id       TEXT NOT NULL,
            card_data     TEXT NOT NULL,
            saved_assets  TEXT NOT NULL,
            content_hash  TEXT NOT NULL,
            source_format TEXT NOT NULL,
            spec_version  TEXT NOT NULL,
            storage_url   TEXT NOT NULL,
            image_url     TEXT NOT NULL,
            thumbnail_url TEXT NOT NULL,
            created_at    INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS card_versions_card
            ON card_versions (card_id, created_at);
        CREATE TABLE IF NOT EXISTS post_process_tasks (
            version_id TEXT PRIMARY KEY,
            card_id    TEXT NOT NULL,
            units      TEXT NOT NULL,
            retired    INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )SQL";

    static constexpr const char* kVersionColumns
        = "id, card_id, card_data, saved_assets, content_hash, source_format, "
          "spec_version, storage_url, image_url, thumbnail_url, created_at";

    // Finalizes on scope exit.
    class Statement final {
    public:
        Statement(sqlite3* db, const char* sql)
        {
            if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr)
                != SQLITE_OK) {
                stmt_ = nullptr;
            }
        }
        ~Statement() { sqlite3_finalize(stmt_); }

        Statement(const Statement&)            = delete;
        Statement& operator=(const Statement&) = delete;

        explicit operator bool() const noexcept { return stmt_ != nullptr; }
        sqlite3_stmt* get() const noexcept { return stmt_; }

        void bind(int index, std::string_view text)
        {
            sqlite3_bind_text(stmt_, index, text.data(),
                              static_cast<int>(text.size()),
                              SQLITE_TRANSIENT);
        }
        void bind(int index, int64_t value)
        {
            sqlite3_bind_int64(stmt_, index, value);
        }

        std::string text(int column) const
        {
            const unsigned char* p = sqlite3_column_text(stmt_, column);
            const int n            = sqlite3_column_bytes(stmt_, column);
            if (!p) {
                return {};
            }
            return std::string(reinterpret_cast<const char*>(p),
                               static_cast<size_t>(n));
        }
        int64_t integer(int column) const
        {
            return sqlite3_column_int64(stmt_, column);
        }

    private:
        sqlite3_stmt* stmt_ = nullptr;
    };


    static std::string assets_to_text(const std::vector<SavedAsset>& assets)
    {
        CardJson arr = CardJson::array();
        for (const SavedAsset& a : assets) {
            arr.push_back(saved_asset_to_json(a));
        }
        return dump_card_json(arr);
    }


    static bool assets_from_text(std::string_view text,
                                 std::vector<SavedAsset>* out)
    {
        CardJson arr;
        if (!parse_card_json(text, &arr) || !arr.is_array()) {
            return false;
        }
        out->clear();
        for (const CardJson& item : arr) {
            SavedAsset a;
            if (!saved_asset_from_json(item, &a)) {
                return false;
            }
            out->push_back(std::move(a));
        }
        return true;
    }


    static bool read_version(const Statement& st, CardVersion* out)
    {
        CardVersion v;
        v.id      = st.text(0);
        v.card_id = st.text(1);
        if (!parse_card_json(st.text(2), &v.card_data)
            || !assets_from_text(st.text(3), &v.saved_assets)) {
            return false;
        }
        v.content_hash  = st.text(4);
        v.source_format = st.text(5);
        v.spec_version  = st.text(6);
        v.storage_url   = st.text(7);
        v.image_url     = st.text(8);
        v.thumbnail_url = st.text(9);
        v.created_at    = st.integer(10);
        *out            = std::move(v);
        return true;
    }


    static bool unit_state_from_name(std::string_view name, UnitState* out)
    {
        if (name == "pending") {
            *out = UnitState::Pending;
        } else if (name == "resolved") {
            *out = UnitState::Resolved;
        } else if (name == "failed") {
            *out = UnitState::Failed;
        } else {
            return false;
        }
        return true;
    }


    static std::string units_to_text(const std::vector<WorkUnit>& units)
    {
        CardJson arr = CardJson::array();
        for (const WorkUnit& u : units) {
            CardJson j         = CardJson::object();
            j["reference"]     = u.reference;
            j["state"]         = unit_state_name(u.state);
            j["attempts"]      = u.attempts;
            j["resolved_url"]  = u.resolved_url;
            j["error"]         = u.error;
            arr.push_back(std::move(j));
        }
        return dump_card_json(arr);
    }


    static bool units_from_text(std::string_view text,
                                std::vector<WorkUnit>* out)
    {
        CardJson arr;
        if (!parse_card_json(text, &arr) || !arr.is_array()) {
            return false;
        }
        out->clear();
        for (const CardJson& item : arr) {
            if (!item.is_object()) {
                return false;
            }
            WorkUnit u;
            u.reference = item.value("reference", std::string());
            if (!unit_state_from_name(item.value("state", std::string()),
                                      &u.state)) {
                return false;
            }
            u.attempts     = item.value("attempts", 0u);
            u.resolved_url = item.value("resolved_url", std::string());
            u.error        = item.value("error", std::string());
            out->push_back(std::move(u));
        }
        return true;
    }


    static bool read_task(const Statement& st, PostProcessTask* out)
    {
        PostProcessTask t;
        t.version_id = st.text(0);
        t.card_id    = st.text(1);
        if (!units_from_text(st.text(2), &t.units)) {
            return false;
        }
        t.retired    = st.integer(3) != 0;
        t.updated_at = st.integer(4);
        *out         = std::move(t);
        return true;
    }

}  // namespace

VersionStore::VersionStore(OpenTag, sqlite3* db)
    : db_(db)
{
}


VersionStore::~VersionStore() { sqlite3_close(db_); }


StoreStatus
VersionStore::open(const std::string& path,
                   std::unique_ptr<VersionStore>* out, std::string* error)
{
    sqlite3* db     = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
                      | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        const std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        logger()->error("version store {}: open failed: {}", path, msg);
        if (error) {
            *error = msg;
        }
        sqlite3_close(db);
        return StoreStatus::Error;
    }
    sqlite3_busy_timeout(db, 5000);

    auto store = std::make_unique<VersionStore>(OpenTag {}, db);
    if (store->exec("PRAGMA journal_mode=WAL;") != StoreStatus::Ok
        || store->exec("PRAGMA foreign_keys=ON;") != StoreStatus::Ok
        || store->exec(kSchema) != StoreStatus::Ok) {
        if (error) {
            *error = store->last_error_;
        }
        return StoreStatus::Error;
    }
    *out = std::move(store);
    return StoreStatus::Ok;
}


StoreStatus
VersionStore::exec(const char* sql)
{
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        last_error_ = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        logger()->error("version store: {}", last_error_);
        return StoreStatus::Error;
    }
    return StoreStatus::Ok;
}


StoreStatus
VersionStore::fail(const char* what)
{
    last_error_ = std::string(what) + ": " + sqlite3_errmsg(db_);
    logger()->error("version store: {}", last_error_);
    return StoreStatus::Error;
}


StoreStatus
VersionStore::insert_version(const CardVersion& v)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, R"SQL(
        INSERT INTO card_versions
            (id, card_id, card_data, saved_assets, content_hash,
             source_format, spec_version, storage_url, image_url,
             thumbnail_url, created_at)
        VALUES (?,?,?,?,?,?,?,?,?,?,?)
    )SQL");
    if (!st) {
        return fail("insert_version prepare");
    }
    int i = 1;
    st.bind(i++, v.id);
    st.bind(i++, v.card_id);
    st.bind(i++, dump_card_json(v.card_data));
    st.bind(i++, assets_to_text(v.saved_assets));
    st.bind(i++, v.content_hash);
    st.bind(i++, v.source_format);
    st.bind(i++, v.spec_version);
    st.bind(i++, v.storage_url);
    st.bind(i++, v.image_url);
    st.bind(i++, v.thumbnail_url);
    st.bind(i++, v.created_at);
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_CONSTRAINT) {
        return StoreStatus::Conflict;
    }
    if (rc != SQLITE_DONE) {
        return fail("insert_version");
    }
    return StoreStatus::Ok;
}


StoreStatus
VersionStore::get_version(std::string_view id, CardVersion* out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql = std::string("SELECT ") + kVersionColumns
                            + " FROM card_versions WHERE id = ?";
    Statement st(db_, sql.c_str());
    if (!st) {
        return fail("get_version prepare");
    }
    st.bind(1, id);
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) {
        return StoreStatus::NotFound;
    }
    if (rc != SQLITE_ROW) {
        return fail("get_version");
    }
    if (!read_version(st, out)) {
        last_error_ = "get_version: corrupt row " + std::string(id);
        logger()->error("version store: {}", last_error_);
        return StoreStatus::Error;
    }
    return StoreStatus::Ok;
}


StoreStatus
VersionStore::list_versions(std::string_view card_id,
                            std::vector<CardVersion>* out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql = std::string("SELECT ") + kVersionColumns
                            + " FROM card_versions WHERE card_id = ?"
                              " ORDER BY created_at, rowid";
    Statement st(db_, sql.c_str());
    if (!st) {
        return fail("list_versions prepare");
    }
    st.bind(1, card_id);
    out->clear();
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        CardVersion v;
        if (!read_version(st, &v)) {
            last_error_ = "list_versions: corrupt row";
            logger()->error("version store: {}", last_error_);
            return StoreStatus::Error;
        }
        out->push_back(std::move(v));
    }
    if (rc != SQLITE_DONE) {
        return fail("list_versions");
    }
    return StoreStatus::Ok;
}


StoreStatus
VersionStore::rewrite_reference(std::string_view version_id,
                                std::string_view token,
                                std::string_view replacement,
                                size_t* replaced)
{
    std::lock_guard<std::mutex> lock(mutex_);
    *replaced = 0;
    if (exec("BEGIN IMMEDIATE;") != StoreStatus::Ok) {
        return StoreStatus::Error;
    }

    StoreStatus status = StoreStatus::Ok;
    CardJson doc;
    {
        Statement st(db_,
                     "SELECT card_data FROM card_versions WHERE id = ?");
        if (!st) {
            status = fail("rewrite_reference prepare");
        } else {
            st.bind(1, version_id);
            const int rc = sqlite3_step(st.get());
            if (rc == SQLITE_DONE) {
                status = StoreStatus::NotFound;
            } else if (rc != SQLITE_ROW) {
                status = fail("rewrite_reference select");
            } else if (!parse_card_json(st.text(0), &doc)) {
                last_error_ = "rewrite_reference: corrupt card data";
                status      = StoreStatus::Error;
            }
        }
    }

    size_t count = 0;
    if (status == StoreStatus::Ok) {
        RefMapping mapping;
        mapping.emplace(std::string(token), std::string(replacement));
        count = rewrite_refs(&doc, mapping, nullptr);
    }
    if (status == StoreStatus::Ok && count != 0) {
        Statement st(db_,
                     "UPDATE card_versions SET card_data = ? WHERE id = ?");
        if (!st) {
            status = fail("rewrite_reference prepare");
        } else {
            st.bind(1, dump_card_json(doc));
            st.bind(2, version_id);
            if (sqlite3_step(st.get()) != SQLITE_DONE) {
                status = fail("rewrite_reference update");
            }
        }
    }

    if (status != StoreStatus::Ok) {
        if (exec("ROLLBACK;") != StoreStatus::Ok) {
            logger()->error("version store: rollback failed for {}",
                            version_id);
        }
        return status;
    }
    if (exec("COMMIT;") != StoreStatus::Ok) {
        if (exec("ROLLBACK;") != StoreStatus::Ok) {
            logger()->error("version store: rollback failed for {}",
                            version_id);
        }
        return StoreStatus::Error;
    }
    *replaced = count;
    return StoreStatus::Ok;
}


StoreStatus
VersionStore::put_task(const PostProcessTask& t)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, R"SQL(
        INSERT INTO post_process_tasks
            (version_id, card_id, units, retired, updated_at)
        VALUES (?,?,?,?,?)
        ON CONFLICT(version_id) DO UPDATE SET
            card_id = excluded.card_id,
            units = excluded.units,
            retired = excluded.retired,
            updated_at = excluded.updated_at
    )SQL");
    if (!st) {
        return fail("put_task prepare");
    }
    st.bind(1, t.version_id);
    st.bind(2, t.card_id);
    st.bind(3, units_to_text(t.units));
    st.bind(4, int64_t { t.retired ? 1 : 0 });
    st.bind(5, t.updated_at);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        return fail("put_task");
    }
    return StoreStatus::Ok;
}


StoreStatus
VersionStore::get_task(std::string_view version_id, PostProcessTask* out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "SELECT version_id, card_id, units, retired, "
                      "updated_at FROM post_process_tasks "
                      "WHERE version_id = ?");
    if (!st) {
        return fail("get_task prepare");
    }
    st.bind(1, version_id);
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) {
        return StoreStatus::NotFound;
    }
    if (rc != SQLITE_ROW) {
        return fail("get_task");
    }
    if (!read_task(st, out)) {
        last_error_ = "get_task: corrupt row " + std::string(version_id);
        logger()->error("version store: {}", last_error_);
        return StoreStatus::Error;
    }
    return StoreStatus::Ok;
}


StoreStatus
VersionStore::list_open_tasks(std::vector<PostProcessTask>* out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "SELECT version_id, card_id, units, retired, "
                      "updated_at FROM post_process_tasks "
                      "WHERE retired = 0 ORDER BY updated_at, rowid");
    if (!st) {
        return fail("list_open_tasks prepare");
    }
    out->clear();
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        PostProcessTask t;
        if (!read_task(st, &t)) {
            // A corrupt row cannot be resumed; report it and keep going.
            logger()->error("version store: skipping corrupt task {}",
                            st.text(0));
            continue;
        }
        out->push_back(std::move(t));
    }
    if (rc != SQLITE_DONE) {
        return fail("list_open_tasks");
    }
    return StoreStatus::Ok;
}


std::string
VersionStore::last_error() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}


const char*
store_status_name(StoreStatus status) noexcept
{
    switch (status) {
    case StoreStatus::Ok: return "ok";
    case StoreStatus::NotFound: return "not_found";
    case StoreStatus::Conflict: return "conflict";
    case StoreStatus::Error: return "error";
    }
    return "unknown";
}


const char*
unit_state_name(UnitState state) noexcept
{
    switch (state) {
    case UnitState::Pending: return "pending";
    case UnitState::Resolved: return "resolved";
    case UnitState::Failed: return "failed";
    }
    return "unknown";
}

}  // namespace cardpack
