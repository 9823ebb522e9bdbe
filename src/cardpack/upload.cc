#include "cardpack/upload.h"

#include "cardpack/asset_extract.h"
#include "cardpack/card_bundle.h"
#include "cardpack/digest.h"
#include "cardpack/image_probe.h"
#include "cardpack/log.h"
#include "cardpack/post_process.h"

#include <algorithm>
#include <chrono>

namespace cardpack {
namespace {

    static constexpr size_t kMaxKeyLength      = 50;
    static constexpr size_t kMaxFilenameLength = 255;
    static constexpr size_t kMaxCardIdLength   = 64;

    static bool is_id_char(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
               || (c >= '0' && c <= '9') || c == '_' || c == '-';
    }


    static bool is_identifier(std::string_view s, size_t max_len) noexcept
    {
        if (s.empty() || s.size() > max_len) {
            return false;
        }
        return std::all_of(s.begin(), s.end(), is_id_char);
    }


    // Lower-cased media type without parameters.
    static std::string media_type(std::string_view content_type)
    {
        const size_t semi = content_type.find(';');
        std::string_view t = content_type.substr(0, semi);
        while (!t.empty() && t.back() == ' ') {
            t.remove_suffix(1);
        }
        while (!t.empty() && t.front() == ' ') {
            t.remove_prefix(1);
        }
        std::string out(t);
        for (char& c : out) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return out;
    }


    static std::string pending_key(std::string_view session_id,
                                   std::string_view key,
                                   std::string_view filename)
    {
        std::string out = "uploads/pending/";
        out.append(session_id).append("/").append(key).append("/");
        out += sanitize_asset_name(filename);
        return out;
    }


    static UploadStatus from_storage(StorageStatus st) noexcept
    {
        switch (st) {
        case StorageStatus::Ok: return UploadStatus::Ok;
        case StorageStatus::UnknownScheme: return UploadStatus::UnknownScheme;
        case StorageStatus::InvalidPart: return UploadStatus::IncompleteParts;
        default: return UploadStatus::StorageFailed;
        }
    }


    static const char* bundle_extension(BundleFormat format) noexcept
    {
        switch (format) {
        case BundleFormat::Png: return "png";
        case BundleFormat::Json: return "json";
        case BundleFormat::CharX: return "charx";
        case BundleFormat::Unknown: break;
        }
        return "bin";
    }


    static const char* bundle_content_type(BundleFormat format) noexcept
    {
        switch (format) {
        case BundleFormat::Png: return "image/png";
        case BundleFormat::Json: return "application/json";
        case BundleFormat::CharX: return "application/zip";
        case BundleFormat::Unknown: break;
        }
        return "application/octet-stream";
    }

}  // namespace

uint32_t
part_count_for(uint64_t size, uint64_t part_size) noexcept
{
    if (part_size == 0 || size <= part_size) {
        return 1;
    }
    return static_cast<uint32_t>((size + part_size - 1) / part_size);
}


std::string
portrait_thumbnail_path(std::string_view card_id, std::string_view version_id)
{
    std::string path = "images/";
    path.append(card_id).append("/thumbnails/").append(version_id);
    path.append(".webp");
    return path;
}


UploadCoordinator::UploadCoordinator(Storage& storage, VersionStore& store,
                                     UploadPolicy policy,
                                     PostProcessor* post_processor,
                                     std::function<int64_t()> clock,
                                     ImageTranscoder* transcoder)
    : storage_(storage)
    , store_(store)
    , policy_(std::move(policy))
    , post_processor_(post_processor)
    , clock_(std::move(clock))
    , transcoder_(transcoder)
{
    for (std::string& t : policy_.allowed_content_types) {
        t = media_type(t);
    }
}


int64_t
UploadCoordinator::now() const
{
    if (clock_) {
        return clock_();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}


UploadStatus
UploadCoordinator::begin_session(std::string_view card_id,
                                 std::string* session_id)
{
    if (!is_identifier(card_id, kMaxCardIdLength)) {
        return UploadStatus::InvalidRequest;
    }
    Session session;
    session.id = random_hex_id(16);
    if (session.id.empty()) {
        logger()->error("upload: random source failed");
        return UploadStatus::StorageFailed;
    }
    session.card_id    = std::string(card_id);
    session.expires_at = now() + policy_.session_ttl_seconds;
    *session_id        = session.id;

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.emplace(session.id, std::move(session));
    return UploadStatus::Ok;
}


UploadStatus
UploadCoordinator::validate(const Session& session,
                            std::span<const FileDescriptor> files) const
{
    if (files.empty()
        || session.files.size() + files.size() > policy_.max_files) {
        return UploadStatus::InvalidRequest;
    }
    uint64_t total = session.total_bytes;
    std::vector<std::string_view> keys;
    for (const FileDescriptor& f : files) {
        if (!is_identifier(f.key, kMaxKeyLength) || f.filename.empty()
            || f.filename.size() > kMaxFilenameLength
            || f.filename.find('\0') != std::string::npos || f.size == 0) {
            return UploadStatus::InvalidRequest;
        }
        // "." and ".." survive sanitizing but not as a path segment.
        if (!is_safe_storage_path(pending_key(session.id, f.key, f.filename))) {
            return UploadStatus::InvalidRequest;
        }
        if (session.files.count(f.key) != 0
            || std::find(keys.begin(), keys.end(), f.key) != keys.end()) {
            return UploadStatus::InvalidRequest;
        }
        keys.push_back(f.key);
        const std::string type = media_type(f.content_type);
        if (std::find(policy_.allowed_content_types.begin(),
                      policy_.allowed_content_types.end(), type)
            == policy_.allowed_content_types.end()) {
            return UploadStatus::UnsupportedContentType;
        }
        if (f.size > policy_.max_file_bytes) {
            return UploadStatus::FileTooLarge;
        }
        total += f.size;
        if (total > policy_.max_session_bytes) {
            return UploadStatus::FileTooLarge;
        }
    }
    return UploadStatus::Ok;
}


UploadStatus
UploadCoordinator::request_grants(std::string_view session_id,
                                  std::span<const FileDescriptor> files,
                                  std::vector<Grant>* out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return UploadStatus::UnknownSession;
    }
    Session& session = it->second;
    if (session.state != SessionState::Requested
        && session.state != SessionState::PartsGranted) {
        return UploadStatus::InvalidState;
    }
    const int64_t t = now();
    if (session.expires_at <= t) {
        return UploadStatus::InvalidState;
    }
    const UploadStatus vs = validate(session, files);
    if (vs != UploadStatus::Ok) {
        return vs;
    }

    StorageDriver* driver = storage_.default_driver();
    if (!driver) {
        return UploadStatus::UnknownScheme;
    }

    std::vector<Grant> grants;
    std::vector<FileSlot> slots;
    for (const FileDescriptor& f : files) {
        FileSlot slot;
        slot.descriptor              = f;
        slot.descriptor.content_type = media_type(f.content_type);
        slot.backend_key = pending_key(session.id, f.key, f.filename);
        slot.storage_url = format_storage_url(storage_.default_scheme(),
                                              slot.backend_key);
        slot.part_count  = part_count_for(f.size, policy_.part_size);

        StorageStatus st = StorageStatus::Ok;
        if (slot.part_count > 1) {
            st = driver->create_multipart(slot.backend_key,
                                          slot.descriptor.content_type,
                                          &slot.upload_id);
        }
        for (uint32_t part = 1;
             st == StorageStatus::Ok && part <= slot.part_count; ++part) {
            GrantRequest req;
            req.path         = slot.backend_key;
            req.content_type = slot.descriptor.content_type;
            req.size         = slot.part_count > 1
                                   ? std::min<uint64_t>(
                                         policy_.part_size,
                                         f.size - (part - 1) * policy_.part_size)
                                   : f.size;
            req.expires_at   = t + policy_.grant_ttl_seconds;
            req.upload_id    = slot.upload_id;
            req.part_number  = slot.part_count > 1 ? part : 0;

            UploadGrant ug;
            st = driver->grant_put(req, &ug);
            if (st != StorageStatus::Ok) {
                break;
            }
            Grant g;
            g.key         = f.key;
            g.upload_url  = std::move(ug.url);
            g.backend_key = slot.backend_key;
            g.upload_id   = slot.upload_id;
            g.part_number = part;
            g.expires_at  = ug.expires_at;
            g.headers     = std::move(ug.headers);
            grants.push_back(std::move(g));
        }
        if (st != StorageStatus::Ok) {
            logger()->error("upload {}: grant for '{}' failed: {}",
                            session.id, f.key, storage_status_name(st));
            if (!slot.upload_id.empty()) {
                const StorageStatus as = driver->abort_multipart(
                    slot.backend_key, slot.upload_id);
                if (as != StorageStatus::Ok) {
                    logger()->warn("upload {}: abort of {} failed: {}",
                                   session.id, slot.backend_key,
                                   storage_status_name(as));
                }
            }
            for (const FileSlot& s : slots) {
                if (!s.upload_id.empty()
                    && driver->abort_multipart(s.backend_key, s.upload_id)
                           != StorageStatus::Ok) {
                    logger()->warn("upload {}: abort of {} failed",
                                   session.id, s.backend_key);
                }
            }
            return from_storage(st);
        }
        slots.push_back(std::move(slot));
    }

    for (FileSlot& slot : slots) {
        session.total_bytes += slot.descriptor.size;
        std::string key = slot.descriptor.key;
        session.files.emplace(std::move(key), std::move(slot));
    }
    session.state = SessionState::PartsGranted;
    *out          = std::move(grants);
    return UploadStatus::Ok;
}


UploadStatus
UploadCoordinator::finalize_object(FileSlot* slot,
                                   std::span<const PartReceipt> parts)
{
    if (parts.size() != slot->part_count) {
        return UploadStatus::IncompleteParts;
    }
    std::vector<CompletedPart> completed;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].part_number != i + 1 || parts[i].etag.empty()) {
            return UploadStatus::IncompleteParts;
        }
        completed.push_back(CompletedPart { parts[i].part_number,
                                            parts[i].etag });
    }

    if (slot->upload_id.empty()) {
        std::string etag;
        const StorageStatus st = storage_.object_etag(slot->storage_url,
                                                      &etag);
        if (st == StorageStatus::NotFound) {
            return UploadStatus::IncompleteParts;
        }
        if (st != StorageStatus::Ok) {
            return from_storage(st);
        }
        if (!etags_match(etag, parts[0].etag)) {
            logger()->warn("upload {}: etag {} does not match object {}",
                           slot->backend_key, parts[0].etag, etag);
            return UploadStatus::IncompleteParts;
        }
        return UploadStatus::Ok;
    }

    StorageUrl parsed;
    StorageStatus st      = StorageStatus::Ok;
    StorageDriver* driver = storage_.driver_for(slot->storage_url, &parsed,
                                                &st);
    if (!driver) {
        return from_storage(st);
    }
    st = driver->complete_multipart(parsed.path, slot->upload_id, completed);
    if (st == StorageStatus::InvalidPart || st == StorageStatus::NotFound) {
        logger()->warn("upload {}: multipart completion rejected: {}",
                       slot->backend_key, storage_status_name(st));
        return UploadStatus::IncompleteParts;
    }
    return from_storage(st);
}


UploadStatus
UploadCoordinator::complete(std::string_view session_id, std::string_view key,
                            std::span<const PartReceipt> parts,
                            CommitResult* out)
{
    Session snapshot;
    FileSlot slot;
    SessionState previous = SessionState::PartsGranted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return UploadStatus::UnknownSession;
        }
        Session& session = it->second;
        if (session.state == SessionState::Committed
            && session.committed_key == key) {
            *out = session.commit;
            return UploadStatus::Ok;
        }
        if (session.state != SessionState::PartsGranted
            && session.state != SessionState::PartsUploaded) {
            return UploadStatus::InvalidState;
        }
        if (session.expires_at <= now()) {
            return UploadStatus::InvalidState;
        }
        auto fit = session.files.find(key);
        if (fit == session.files.end()) {
            return UploadStatus::NotFound;
        }
        previous      = session.state;
        session.state = SessionState::Finalizing;
        snapshot      = session;
        slot          = fit->second;
    }

    auto settle = [&](SessionState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return;
        }
        it->second.state = state;
        auto fit         = it->second.files.find(key);
        if (fit != it->second.files.end()) {
            fit->second.finalized = slot.finalized;
        }
    };

    if (!slot.finalized) {
        const UploadStatus fs = finalize_object(&slot, parts);
        if (fs != UploadStatus::Ok) {
            settle(previous);
            return fs;
        }
        slot.finalized = true;
    }

    CommitResult result;
    const UploadStatus cs = commit(snapshot, slot, &result);
    if (cs == UploadStatus::BundleRejected) {
        settle(SessionState::Abandoned);
        snapshot.files[std::string(key)] = slot;
        discard(snapshot);
        return cs;
    }
    if (cs != UploadStatus::Ok) {
        if (cs == UploadStatus::IncompleteParts && slot.upload_id.empty()) {
            // The client may re-upload; verify the new object next time.
            slot.finalized = false;
        }
        settle(SessionState::PartsUploaded);
        return cs;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            it->second.state         = SessionState::Committed;
            it->second.committed_key = std::string(key);
            it->second.commit        = result;
        }
    }
    *out = std::move(result);
    return UploadStatus::Ok;
}


UploadStatus
UploadCoordinator::report_uploaded(std::string_view session_id,
                                   std::string_view key,
                                   std::span<const PartReceipt> parts)
{
    FileSlot slot;
    SessionState previous = SessionState::PartsGranted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return UploadStatus::UnknownSession;
        }
        Session& session = it->second;
        if (session.state != SessionState::PartsGranted
            && session.state != SessionState::PartsUploaded) {
            return UploadStatus::InvalidState;
        }
        if (session.expires_at <= now()) {
            return UploadStatus::InvalidState;
        }
        auto fit = session.files.find(key);
        if (fit == session.files.end()) {
            return UploadStatus::NotFound;
        }
        if (fit->second.finalized) {
            session.state = SessionState::PartsUploaded;
            return UploadStatus::Ok;
        }
        previous      = session.state;
        session.state = SessionState::Finalizing;
        slot          = fit->second;
    }

    const UploadStatus fs = finalize_object(&slot, parts);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return fs;
    }
    if (fs != UploadStatus::Ok) {
        it->second.state = previous;
        return fs;
    }
    it->second.state = SessionState::PartsUploaded;
    auto fit         = it->second.files.find(key);
    if (fit != it->second.files.end()) {
        fit->second.finalized = true;
    }
    logger()->info("upload {}: {} reported uploaded", session_id, key);
    return UploadStatus::Ok;
}


StorageStatus
UploadCoordinator::store_portrait_thumbnail(std::string_view card_id,
                                            std::string_view version_id,
                                            const Asset& portrait,
                                            std::string* public_url)
{
    if (!transcoder_) {
        return StorageStatus::Ok;
    }
    EncodedImage thumb;
    const TranscodeStatus ts = transcoder_->thumbnail(
        portrait.bytes, kPortraitThumbnail, &thumb);
    if (ts != TranscodeStatus::Ok) {
        logger()->warn("card {}: no portrait thumbnail: {}", card_id,
                       transcode_status_name(ts));
        return StorageStatus::Ok;
    }
    StoreOptions so;
    so.content_type = "image/webp";
    std::string url;
    const StorageStatus st = storage_.store(
        thumb.bytes, portrait_thumbnail_path(card_id, version_id), &url, so);
    if (st == StorageStatus::Ok) {
        *public_url = storage_.public_url(url);
    }
    return st;
}


UploadStatus
UploadCoordinator::commit(const Session& session, const FileSlot& slot,
                          CommitResult* out)
{
    std::vector<std::byte> bytes;
    StorageStatus st = storage_.retrieve(slot.storage_url, &bytes);
    if (st != StorageStatus::Ok) {
        logger()->error("upload {}: retrieve {} failed: {}", session.id,
                        slot.storage_url, storage_status_name(st));
        return from_storage(st);
    }
    if (bytes.size() > policy_.max_file_bytes) {
        return UploadStatus::FileTooLarge;
    }
    if (bytes.size() != slot.descriptor.size) {
        logger()->warn("upload {}: '{}' is {} bytes, {} declared", session.id,
                       slot.descriptor.key, bytes.size(),
                       slot.descriptor.size);
        return UploadStatus::IncompleteParts;
    }

    CardVersion version;
    version.content_hash = sha256_hex(bytes);

    CardBundle bundle;
    const BundleStatus bs = read_card_bundle(bytes, BundleReadOptions(),
                                             &bundle);
    if (bs != BundleStatus::Ok) {
        logger()->warn("upload {}: bundle rejected: {}", session.id,
                       bundle_status_name(bs));
        return UploadStatus::BundleRejected;
    }

    version.id = random_hex_id(16);
    if (version.id.empty()) {
        logger()->error("upload {}: random source failed", session.id);
        return UploadStatus::StorageFailed;
    }
    version.card_id       = session.card_id;
    version.source_format = bundle_extension(bundle.format);
    version.spec_version  = bundle.spec_version;

    PersistOptions persist_opts;
    persist_opts.transcoder = transcoder_;
    if (const Asset* portrait = main_asset(bundle)) {
        const std::string path = "images/" + session.card_id + "/"
                                 + version.id + "." + portrait->ext;
        StoreOptions so;
        so.content_type = std::string(
            image_content_type(probe_image(portrait->bytes).format));
        std::string url;
        st = storage_.store(portrait->bytes, path, &url, so);
        if (st != StorageStatus::Ok) {
            logger()->error("upload {}: portrait store failed: {}",
                            session.id, storage_status_name(st));
            return from_storage(st);
        }
        version.image_url = storage_.public_url(url);
        st = store_portrait_thumbnail(session.card_id, version.id,
                                      *portrait, &version.thumbnail_url);
        if (st != StorageStatus::Ok) {
            logger()->error("upload {}: thumbnail store failed: {}",
                            session.id, storage_status_name(st));
            return from_storage(st);
        }
        if (!portrait->path.empty()) {
            persist_opts.extra_mappings[std::string(kEmbeddedScheme)
                                        + portrait->path]
                = version.image_url;
        }
    }

    ExtractedBundle extracted;
    if (extract_assets(bundle, &extracted) != ExtractStatus::Ok) {
        return UploadStatus::BundleRejected;
    }
    PersistResult persisted;
    const ExtractStatus es = persist_and_rewrite(
        session.card_id, extracted.card_data, extracted.assets, storage_,
        persist_opts, &persisted);
    if (es != ExtractStatus::Ok) {
        logger()->error("upload {}: asset persistence failed after {} of {}",
                        session.id, persisted.saved_assets.size(),
                        extracted.assets.size());
        return es == ExtractStatus::EmptyBundle
                   ? UploadStatus::BundleRejected
                   : from_storage(persisted.storage_status);
    }
    version.card_data    = std::move(persisted.card_data);
    version.saved_assets = std::move(persisted.saved_assets);

    const std::string original = "cards/" + session.card_id + "/" + version.id
                                 + "." + bundle_extension(bundle.format);
    StoreOptions so;
    so.content_type = bundle_content_type(bundle.format);
    st = storage_.store(bytes, original, &version.storage_url, so);
    if (st != StorageStatus::Ok) {
        logger()->error("upload {}: original store failed: {}", session.id,
                        storage_status_name(st));
        return from_storage(st);
    }

    version.created_at   = now();
    const StoreStatus vs = store_.insert_version(version);
    if (vs != StoreStatus::Ok) {
        logger()->error("upload {}: version insert failed: {}", session.id,
                        store_status_name(vs));
        return UploadStatus::StoreFailed;
    }

    st = storage_.remove(slot.storage_url);
    if (st != StorageStatus::Ok) {
        logger()->warn("upload {}: pending object {} not removed: {}",
                       session.id, slot.storage_url, storage_status_name(st));
    }

    CommitResult result;
    result.version_id       = version.id;
    result.card_id          = version.card_id;
    result.storage_url      = version.storage_url;
    result.image_url        = version.image_url;
    result.thumbnail_url    = version.thumbnail_url;
    result.content_hash     = version.content_hash;
    result.extracted_count  = persisted.extracted_count;
    result.referenced_count = persisted.referenced_count;
    result.unresolved_refs  = std::move(persisted.unresolved_refs);

    PostProcessTask task;
    if (make_post_process_task(version, version.created_at, &task)) {
        result.external_refs = task.units.size();
        if (store_.put_task(task) != StoreStatus::Ok) {
            logger()->error("upload {}: post-process task for {} not saved",
                            session.id, version.id);
        } else if (post_processor_) {
            post_processor_->dispatch(version.id);
        }
    }

    logger()->info("card {} committed version {} ({} asset(s), {} external "
                   "ref(s))",
                   version.card_id, version.id, version.saved_assets.size(),
                   result.external_refs);
    *out = std::move(result);
    return UploadStatus::Ok;
}


void
UploadCoordinator::discard(const Session& session)
{
    for (const auto& [key, slot] : session.files) {
        if (!slot.upload_id.empty() && !slot.finalized) {
            StorageUrl parsed;
            StorageStatus st      = StorageStatus::Ok;
            StorageDriver* driver = storage_.driver_for(slot.storage_url,
                                                        &parsed, &st);
            if (driver) {
                st = driver->abort_multipart(parsed.path, slot.upload_id);
            }
            if (st != StorageStatus::Ok && st != StorageStatus::NotFound) {
                logger()->warn("upload {}: abort of '{}' failed: {}",
                               session.id, key, storage_status_name(st));
            }
            continue;
        }
        const StorageStatus st = storage_.remove(slot.storage_url);
        if (st != StorageStatus::Ok) {
            logger()->warn("upload {}: pending '{}' not removed: {}",
                           session.id, key, storage_status_name(st));
        }
    }
}


UploadStatus
UploadCoordinator::abandon(std::string_view session_id)
{
    Session snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return UploadStatus::UnknownSession;
        }
        Session& session = it->second;
        if (session.state == SessionState::Abandoned) {
            return UploadStatus::Ok;
        }
        if (session.state == SessionState::Committed
            || session.state == SessionState::Finalizing) {
            return UploadStatus::InvalidState;
        }
        session.state = SessionState::Abandoned;
        snapshot      = session;
    }
    discard(snapshot);
    logger()->info("upload {}: abandoned", session_id);
    return UploadStatus::Ok;
}


size_t
UploadCoordinator::expire_sessions(int64_t now)
{
    std::vector<Session> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, session] : sessions_) {
            if (session.expires_at > now
                || session.state == SessionState::Committed
                || session.state == SessionState::Abandoned
                || session.state == SessionState::Finalizing) {
                continue;
            }
            session.state = SessionState::Abandoned;
            expired.push_back(session);
        }
    }
    for (const Session& session : expired) {
        discard(session);
    }
    if (!expired.empty()) {
        logger()->info("upload: expired {} session(s)", expired.size());
    }
    return expired.size();
}


UploadStatus
UploadCoordinator::session_state(std::string_view session_id,
                                 SessionState* out) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return UploadStatus::UnknownSession;
    }
    *out = it->second.state;
    return UploadStatus::Ok;
}


const char*
upload_status_name(UploadStatus status) noexcept
{
    switch (status) {
    case UploadStatus::Ok: return "ok";
    case UploadStatus::UnknownSession: return "unknown_session";
    case UploadStatus::InvalidState: return "invalid_state";
    case UploadStatus::InvalidRequest: return "invalid_request";
    case UploadStatus::UnsupportedContentType:
        return "unsupported_content_type";
    case UploadStatus::FileTooLarge: return "file_too_large";
    case UploadStatus::IncompleteParts: return "incomplete_parts";
    case UploadStatus::NotFound: return "not_found";
    case UploadStatus::UnknownScheme: return "unknown_scheme";
    case UploadStatus::StorageFailed: return "storage_failed";
    case UploadStatus::BundleRejected: return "bundle_rejected";
    case UploadStatus::StoreFailed: return "store_failed";
    }
    return "unknown";
}


const char*
session_state_name(SessionState state) noexcept
{
    switch (state) {
    case SessionState::Requested: return "requested";
    case SessionState::PartsGranted: return "parts_granted";
    case SessionState::PartsUploaded: return "parts_uploaded";
    case SessionState::Finalizing: return "finalizing";
    case SessionState::Committed: return "committed";
    case SessionState::Abandoned: return "abandoned";
    }
    return "unknown";
}

}  // namespace cardpack
