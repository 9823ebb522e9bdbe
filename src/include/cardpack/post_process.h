#pragma once

#include "cardpack/http_client.h"
#include "cardpack/image_transcode.h"
#include "cardpack/storage.h"
#include "cardpack/version_store.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

/**
 * \file post_process.h
 * \brief Out-of-band resolution of external image references.
 *
 * Remote images referenced by a committed card are fetched, stored, and the
 * exact reference token in the stored version is repointed at the stored
 * copy. Progress is persisted per unit in the \ref VersionStore, so a task
 * interrupted by a restart resumes from \ref PostProcessor::recover.
 */

namespace cardpack {

enum class FetchStatus : uint8_t {
    Ok,
    NotFound,
    TooLarge,
    Failed,
};

struct FetchedResource final {
    std::vector<std::byte> bytes;
    std::string content_type;
};

/// Retrieves remote resources. Implementations must be thread-safe.
class ResourceFetcher {
public:
    virtual ~ResourceFetcher() = default;

    virtual FetchStatus fetch(std::string_view url, uint64_t max_bytes,
                              FetchedResource* out)
        = 0;
};

/// GET through an \ref HttpClient.
class HttpResourceFetcher final : public ResourceFetcher {
public:
    /// \p http must outlive the fetcher.
    explicit HttpResourceFetcher(HttpClient& http)
        : http_(http)
    {
    }

    FetchStatus fetch(std::string_view url, uint64_t max_bytes,
                      FetchedResource* out) override;

private:
    HttpClient& http_;
};

struct PostProcessOptions final {
    size_t worker_threads       = 2;
    /// Attempts per unit before it is failed permanently.
    uint32_t max_attempts       = 3;
    uint64_t max_resource_bytes = 10ull * 1024 * 1024;
    /// First path segment of stored copies.
    std::string path_prefix     = "images";
    /// Unix seconds; defaults to the system clock.
    std::function<int64_t()> clock;
    /// When set, fetched PNG and JPEG images are stored as WebP.
    ImageTranscoder* transcoder = nullptr;
};

enum class PostProcessStatus : uint8_t {
    Ok,
    /// Task exists but its version does not.
    VersionNotFound,
    /// The version store failed; progress so far is kept.
    StoreFailed,
};

/// Outcome of one \ref PostProcessor::run.
struct RunReport final {
    size_t resolved = 0;
    size_t failed   = 0;
    /// Units whose reference had already left the card.
    size_t skipped  = 0;
    /// Units still pending after this run.
    size_t pending  = 0;
    bool retired    = false;
    /// No open task existed for the version.
    bool noop       = false;
};

/**
 * \brief Builds the task for \p version from its external image references.
 *
 * Returns false when the card references no external images.
 */
bool
make_post_process_task(const CardVersion& version, int64_t now,
                       PostProcessTask* out);

/**
 * \brief Worker pool executing post-processing tasks.
 *
 * Dispatches for the same version coalesce while queued, and executions
 * for one version never overlap. Shutting down drops queued work; the
 * persisted tasks are picked up again by \ref recover.
 */
class PostProcessor final {
public:
    /// Every reference must outlive the processor.
    PostProcessor(VersionStore& store, Storage& storage,
                  ResourceFetcher& fetcher, PostProcessOptions options = {});
    ~PostProcessor();

    PostProcessor(const PostProcessor&)            = delete;
    PostProcessor& operator=(const PostProcessor&) = delete;

    /// Queues \p version_id unless it is already queued.
    void dispatch(std::string_view version_id);

    /// Executes the task for \p version_id on the calling thread.
    PostProcessStatus run(std::string_view version_id, RunReport* report);

    /// Dispatches every task that is not retired; returns how many.
    size_t recover();

    /// Blocks until the queue is empty and no execution is running.
    void wait_idle();

    /// Stops the workers after their current execution.
    void shutdown();

    /// Versions with an execution running or waiting to run.
    size_t locked_versions() const;

private:
    /// Per-version execution lock; dropped once no run holds it.
    struct VersionLock final {
        std::mutex mutex;
        size_t users = 0;
    };

    void worker_loop();
    VersionLock* acquire_version_lock(const std::string& version_id);
    void release_version_lock(const std::string& version_id);
    PostProcessStatus run_locked(const std::string& version_id,
                                 RunReport* report);
    int64_t now() const;

    /// Attempts one unit until it resolves or becomes terminal.
    StoreStatus process_unit(const CardVersion& version,
                             PostProcessTask* task, size_t index,
                             RunReport* report);
    bool resolve_once(const CardVersion& version, WorkUnit* unit,
                      bool* permanent);

    VersionStore& store_;
    Storage& storage_;
    ResourceFetcher& fetcher_;
    PostProcessOptions options_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::string> queue_;
    std::set<std::string, std::less<>> queued_;
    size_t active_ = 0;
    bool shutdown_ = false;
    std::vector<std::thread> workers_;

    mutable std::mutex locks_mutex_;
    std::map<std::string, VersionLock, std::less<>> locks_;
};

/// Storage path of the copy of \p url for \p card_id.
std::string
embedded_image_path(std::string_view prefix, std::string_view card_id,
                    std::string_view url, std::string_view ext);

const char*
fetch_status_name(FetchStatus status) noexcept;

const char*
post_process_status_name(PostProcessStatus status) noexcept;

}  // namespace cardpack
