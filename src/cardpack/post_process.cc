#include "cardpack/post_process.h"

#include "cardpack/card_refs.h"
#include "cardpack/digest.h"
#include "cardpack/image_probe.h"
#include "cardpack/log.h"

#include <chrono>

namespace cardpack {
namespace {

    static bool all_terminal(const PostProcessTask& task) noexcept
    {
        for (const WorkUnit& u : task.units) {
            if (u.state == UnitState::Pending) {
                return false;
            }
        }
        return true;
    }

}  // namespace

FetchStatus
HttpResourceFetcher::fetch(std::string_view url, uint64_t max_bytes,
                           FetchedResource* out)
{
    HttpRequest req;
    req.method = "GET";
    req.url    = std::string(url);
    set_header(&req.headers, "Accept", "image/*");
    const HttpResponse res = http_.execute(req);
    if (!res.error.empty()) {
        logger()->warn("fetch {}: {}", url, res.error);
        return FetchStatus::Failed;
    }
    if (res.status == 404 || res.status == 410) {
        return FetchStatus::NotFound;
    }
    if (!res.ok()) {
        logger()->warn("fetch {}: HTTP {}", url, res.status);
        return FetchStatus::Failed;
    }
    if (res.body.size() > max_bytes) {
        return FetchStatus::TooLarge;
    }
    const std::byte* p = reinterpret_cast<const std::byte*>(res.body.data());
    out->bytes.assign(p, p + res.body.size());
    out->content_type = std::string(find_header(res.headers, "Content-Type"));
    return FetchStatus::Ok;
}


bool
make_post_process_task(const CardVersion& version, int64_t now,
                       PostProcessTask* out)
{
    const std::vector<std::string> refs = find_external_image_refs(
        version.card_data);
    if (refs.empty()) {
        return false;
    }
    PostProcessTask task;
    task.version_id = version.id;
    task.card_id    = version.card_id;
    task.updated_at = now;
    for (const std::string& ref : refs) {
        WorkUnit unit;
        unit.reference = ref;
        task.units.push_back(std::move(unit));
    }
    *out = std::move(task);
    return true;
}


std::string
embedded_image_path(std::string_view prefix, std::string_view card_id,
                    std::string_view url, std::string_view ext)
{
    std::string path(prefix);
    path.push_back('/');
    path.append(card_id);
    path.append("/embedded/");
    path.append(sha256_hex(url).substr(0, 16));
    path.push_back('.');
    path.append(ext);
    return path;
}


PostProcessor::PostProcessor(VersionStore& store, Storage& storage,
                             ResourceFetcher& fetcher,
                             PostProcessOptions options)
    : store_(store)
    , storage_(storage)
    , fetcher_(fetcher)
    , options_(std::move(options))
{
    if (options_.max_attempts == 0) {
        options_.max_attempts = 1;
    }
    for (size_t i = 0; i < options_.worker_threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}


PostProcessor::~PostProcessor() { shutdown(); }


int64_t
PostProcessor::now() const
{
    if (options_.clock) {
        return options_.clock();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}


void
PostProcessor::dispatch(std::string_view version_id)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_) {
            logger()->warn("post-process {}: dispatch after shutdown",
                           version_id);
            return;
        }
        if (!queued_.emplace(version_id).second) {
            return;
        }
        queue_.emplace_back(version_id);
    }
    queue_cv_.notify_one();
}


size_t
PostProcessor::recover()
{
    std::vector<PostProcessTask> tasks;
    if (store_.list_open_tasks(&tasks) != StoreStatus::Ok) {
        logger()->error("post-process recover: {}", store_.last_error());
        return 0;
    }
    for (const PostProcessTask& task : tasks) {
        dispatch(task.version_id);
    }
    if (!tasks.empty()) {
        logger()->info("post-process: recovered {} open task(s)",
                       tasks.size());
    }
    return tasks.size();
}


void
PostProcessor::wait_idle()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() {
        return (queue_.empty() || shutdown_) && active_ == 0;
    });
}


void
PostProcessor::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        queue_.clear();
        queued_.clear();
    }
    queue_cv_.notify_all();
    idle_cv_.notify_all();
    for (std::thread& w : workers_) {
        if (w.joinable()) {
            w.join();
        }
    }
}


void
PostProcessor::worker_loop()
{
    while (true) {
        std::string version_id;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock,
                           [this]() { return !queue_.empty() || shutdown_; });
            if (shutdown_) {
                return;
            }
            version_id = std::move(queue_.front());
            queue_.pop_front();
            queued_.erase(version_id);
            active_ += 1;
        }

        RunReport report;
        const PostProcessStatus st = run(version_id, &report);
        if (st != PostProcessStatus::Ok) {
            logger()->error("post-process {}: {}", version_id,
                            post_process_status_name(st));
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_ -= 1;
            if (queue_.empty() && active_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}


PostProcessor::VersionLock*
PostProcessor::acquire_version_lock(const std::string& version_id)
{
    std::lock_guard<std::mutex> lock(locks_mutex_);
    VersionLock& entry = locks_[version_id];
    ++entry.users;
    return &entry;
}


void
PostProcessor::release_version_lock(const std::string& version_id)
{
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto it = locks_.find(version_id);
    if (it != locks_.end() && --it->second.users == 0) {
        locks_.erase(it);
    }
}


size_t
PostProcessor::locked_versions() const
{
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return locks_.size();
}


PostProcessStatus
PostProcessor::run(std::string_view version_id, RunReport* report)
{
    const std::string id(version_id);
    VersionLock* entry = acquire_version_lock(id);
    PostProcessStatus status;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        status = run_locked(id, report);
    }
    release_version_lock(id);
    return status;
}


PostProcessStatus
PostProcessor::run_locked(const std::string& version_id, RunReport* report)
{
    *report = RunReport();

    PostProcessTask task;
    const StoreStatus ts = store_.get_task(version_id, &task);
    if (ts == StoreStatus::NotFound) {
        report->noop = true;
        return PostProcessStatus::Ok;
    }
    if (ts != StoreStatus::Ok) {
        return PostProcessStatus::StoreFailed;
    }
    if (task.retired) {
        report->noop    = true;
        report->retired = true;
        return PostProcessStatus::Ok;
    }

    CardVersion version;
    const StoreStatus vs = store_.get_version(version_id, &version);
    if (vs == StoreStatus::NotFound) {
        logger()->error("post-process {}: version missing", version_id);
        return PostProcessStatus::VersionNotFound;
    }
    if (vs != StoreStatus::Ok) {
        return PostProcessStatus::StoreFailed;
    }

    for (size_t i = 0; i < task.units.size(); ++i) {
        if (task.units[i].state != UnitState::Pending) {
            continue;
        }
        if (process_unit(version, &task, i, report) != StoreStatus::Ok) {
            return PostProcessStatus::StoreFailed;
        }
    }

    for (const WorkUnit& u : task.units) {
        if (u.state == UnitState::Pending) {
            report->pending += 1;
        }
    }
    if (all_terminal(task)) {
        task.retired    = true;
        task.updated_at = now();
        if (store_.put_task(task) != StoreStatus::Ok) {
            return PostProcessStatus::StoreFailed;
        }
        report->retired = true;
        logger()->info("post-process {}: retired ({} resolved, {} failed)",
                       version_id, report->resolved, report->failed);
    }
    return PostProcessStatus::Ok;
}


StoreStatus
PostProcessor::process_unit(const CardVersion& version,
                            PostProcessTask* task, size_t index,
                            RunReport* report)
{
    WorkUnit& unit = task->units[index];
    if (count_ref(version.card_data, unit.reference) == 0) {
        unit.state = UnitState::Resolved;
        unit.error.clear();
        report->skipped += 1;
        task->updated_at = now();
        return store_.put_task(*task);
    }

    while (unit.state == UnitState::Pending) {
        bool permanent = false;
        unit.attempts += 1;
        if (resolve_once(version, &unit, &permanent)) {
            unit.state = UnitState::Resolved;
            unit.error.clear();
            report->resolved += 1;
        } else if (permanent || unit.attempts >= options_.max_attempts) {
            unit.state = UnitState::Failed;
            report->failed += 1;
            logger()->warn("post-process {}: giving up on {} after {} "
                           "attempt(s): {}",
                           version.id, unit.reference, unit.attempts,
                           unit.error);
        }
        task->updated_at      = now();
        const StoreStatus st = store_.put_task(*task);
        if (st != StoreStatus::Ok) {
            return st;
        }
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (shutdown_ && unit.state == UnitState::Pending) {
                break;
            }
        }
    }
    return StoreStatus::Ok;
}


bool
PostProcessor::resolve_once(const CardVersion& version, WorkUnit* unit,
                            bool* permanent)
{
    FetchedResource resource;
    const FetchStatus fs = fetcher_.fetch(unit->reference,
                                          options_.max_resource_bytes,
                                          &resource);
    if (fs != FetchStatus::Ok) {
        unit->error = std::string("fetch: ") + fetch_status_name(fs);
        *permanent  = fs == FetchStatus::NotFound
                     || fs == FetchStatus::TooLarge;
        return false;
    }
    if (resource.bytes.size() > options_.max_resource_bytes) {
        unit->error = "fetch: too_large";
        *permanent  = true;
        return false;
    }
    const ImageInfo info = probe_image(resource.bytes);
    if (info.format == ImageFormat::Unknown) {
        unit->error = "not an image";
        *permanent  = true;
        return false;
    }

    std::span<const std::byte> stored = resource.bytes;
    ImageFormat format                = info.format;
    EncodedImage webp;
    if (options_.transcoder
        && (format == ImageFormat::Png || format == ImageFormat::Jpeg)) {
        const TranscodeStatus ts = options_.transcoder->to_webp(
            resource.bytes, kWebpCopyQuality, &webp);
        if (ts == TranscodeStatus::Ok) {
            stored = webp.bytes;
            format = ImageFormat::Webp;
        } else {
            logger()->warn("post-process {}: {} stored as {}: {}", version.id,
                           unit->reference, image_extension(format),
                           transcode_status_name(ts));
        }
    }

    const std::string path = embedded_image_path(
        options_.path_prefix, version.card_id, unit->reference,
        image_extension(format));
    StoreOptions opts;
    opts.content_type = std::string(image_content_type(format));
    std::string url;
    const StorageStatus ss = storage_.store(stored, path, &url, opts);
    if (ss != StorageStatus::Ok) {
        unit->error = std::string("store: ") + storage_status_name(ss);
        return false;
    }
    const std::string public_url = storage_.public_url(url);

    size_t replaced      = 0;
    const StoreStatus rs = store_.rewrite_reference(version.id,
                                                    unit->reference,
                                                    public_url, &replaced);
    if (rs != StoreStatus::Ok) {
        unit->error = std::string("rewrite: ") + store_status_name(rs);
        return false;
    }
    unit->resolved_url = public_url;
    logger()->debug("post-process {}: {} -> {} ({} occurrence(s))",
                    version.id, unit->reference, public_url, replaced);
    return true;
}


const char*
fetch_status_name(FetchStatus status) noexcept
{
    switch (status) {
    case FetchStatus::Ok: return "ok";
    case FetchStatus::NotFound: return "not_found";
    case FetchStatus::TooLarge: return "too_large";
    case FetchStatus::Failed: return "failed";
    }
    return "unknown";
}


const char*
post_process_status_name(PostProcessStatus status) noexcept
{
    switch (status) {
    case PostProcessStatus::Ok: return "ok";
    case PostProcessStatus::VersionNotFound: return "version_not_found";
    case PostProcessStatus::StoreFailed: return "store_failed";
    }
    return "unknown";
}

}  // namespace cardpack
