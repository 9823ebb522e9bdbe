#pragma once

#include "cardpack/image_transcode.h"
#include "cardpack/storage.h"
#include "cardpack/version_store.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * \file upload.h
 * \brief Resumable direct-to-storage upload sessions.
 *
 * Clients request grants, upload bytes straight to the storage backend,
 * and signal completion. Completion finalizes the backend object, reads
 * the card bundle, persists its assets, and commits a \ref CardVersion.
 *
 * Session states advance `Requested -> PartsGranted -> PartsUploaded ->
 * Finalizing -> Committed`; `Abandoned` is terminal.
 */

namespace cardpack {

class PostProcessor;

enum class SessionState : uint8_t {
    Requested,
    PartsGranted,
    /// Client reported the parts and the backend object is finalized, or
    /// a commit attempt after finalizing failed and may be retried.
    PartsUploaded,
    Finalizing,
    Committed,
    Abandoned,
};

enum class UploadStatus : uint8_t {
    Ok,
    UnknownSession,
    /// Operation not allowed in the session's current state.
    InvalidState,
    /// Malformed descriptor, key, filename or card id.
    InvalidRequest,
    UnsupportedContentType,
    FileTooLarge,
    /// Part list does not match what was granted or uploaded.
    IncompleteParts,
    /// No grant was issued for the key.
    NotFound,
    UnknownScheme,
    StorageFailed,
    /// The uploaded bytes are not a readable card bundle.
    BundleRejected,
    /// The version store refused the commit.
    StoreFailed,
};

struct UploadPolicy final {
    std::vector<std::string> allowed_content_types = {
        "image/png",        "image/jpeg",      "image/webp",
        "image/gif",        "application/json", "application/zip",
        "application/octet-stream",
    };
    uint64_t max_file_bytes     = 50ull * 1024 * 1024;
    uint64_t max_session_bytes  = 1024ull * 1024 * 1024;
    /// Files larger than this are uploaded in parts of this size.
    uint64_t part_size          = 8ull * 1024 * 1024;
    int64_t grant_ttl_seconds   = 3600;
    int64_t session_ttl_seconds = 86400;
    size_t max_files            = 250;
};

/// Client description of one file to upload.
struct FileDescriptor final {
    /// Client-chosen identifier, `[A-Za-z0-9_-]{1,50}`.
    std::string key;
    std::string filename;
    uint64_t size = 0;
    std::string content_type;
};

struct Grant final {
    std::string key;
    std::string upload_url;
    /// Storage-relative path the bytes land at.
    std::string backend_key;
    /// Empty for single-PUT files.
    std::string upload_id;
    /// 1-based; 1 for single-PUT files.
    uint32_t part_number = 1;
    int64_t expires_at   = 0;
    /// Headers the client must send with the PUT.
    std::vector<std::pair<std::string, std::string>> headers;
};

struct PartReceipt final {
    uint32_t part_number = 0;
    std::string etag;
};

struct CommitResult final {
    std::string version_id;
    std::string card_id;
    std::string storage_url;
    std::string image_url;
    /// Empty when no transcoder is configured or the portrait is unreadable.
    std::string thumbnail_url;
    std::string content_hash;
    size_t extracted_count = 0;
    size_t referenced_count = 0;
    std::vector<std::string> unresolved_refs;
    /// External image references handed to the post-processor.
    size_t external_refs = 0;
};

/**
 * \brief Owns in-flight upload sessions.
 *
 * All methods are thread-safe. Sessions live in memory; committed versions
 * and post-processing tasks are durable in the \ref VersionStore.
 */
class UploadCoordinator final {
public:
    /// References must outlive the coordinator; \p post_processor may be
    /// null, in which case tasks are persisted but not dispatched. Without
    /// \p transcoder no thumbnails are made.
    UploadCoordinator(Storage& storage, VersionStore& store,
                      UploadPolicy policy = {},
                      PostProcessor* post_processor = nullptr,
                      std::function<int64_t()> clock = {},
                      ImageTranscoder* transcoder = nullptr);

    /// Opens a session for \p card_id (`[A-Za-z0-9_-]{1,64}`).
    UploadStatus begin_session(std::string_view card_id,
                               std::string* session_id);

    /**
     * \brief Validates every descriptor, then issues grants.
     *
     * Nothing is granted when any descriptor is rejected. A file larger
     * than the part size gets a backend multipart upload and one grant
     * per part.
     */
    UploadStatus request_grants(std::string_view session_id,
                                std::span<const FileDescriptor> files,
                                std::vector<Grant>* out);

    /**
     * \brief Client report that every part of \p key is uploaded.
     *
     * Checks \p parts like \ref complete and finalizes the backend object,
     * moving the session to `PartsUploaded`. A later \ref complete commits
     * without finalizing again. Reporting a finalized file again is a no-op.
     */
    UploadStatus report_uploaded(std::string_view session_id,
                                 std::string_view key,
                                 std::span<const PartReceipt> parts);

    /**
     * \brief Finalizes the upload for \p key and commits a card version.
     *
     * Part numbers must run from 1 without gaps up to the granted count,
     * each with a non-empty etag. Repeating a successful completion
     * returns the same result.
     */
    UploadStatus complete(std::string_view session_id, std::string_view key,
                          std::span<const PartReceipt> parts,
                          CommitResult* out);

    /// Abandons the session and discards its pending objects.
    UploadStatus abandon(std::string_view session_id);

    /// Abandons every open session whose expiry is at or before \p now.
    size_t expire_sessions(int64_t now);

    UploadStatus session_state(std::string_view session_id,
                               SessionState* out) const;

    const UploadPolicy& policy() const noexcept { return policy_; }

private:
    struct FileSlot final {
        FileDescriptor descriptor;
        std::string backend_key;
        std::string storage_url;
        std::string upload_id;
        uint32_t part_count = 1;
        /// Backend object is complete (multipart finished or verified).
        bool finalized = false;
    };

    struct Session final {
        std::string id;
        std::string card_id;
        SessionState state = SessionState::Requested;
        std::map<std::string, FileSlot, std::less<>> files;
        uint64_t total_bytes = 0;
        int64_t expires_at   = 0;
        std::string committed_key;
        CommitResult commit;
    };

    int64_t now() const;
    UploadStatus validate(const Session& session,
                          std::span<const FileDescriptor> files) const;
    UploadStatus finalize_object(FileSlot* slot,
                                 std::span<const PartReceipt> parts);
    UploadStatus commit(const Session& session, const FileSlot& slot,
                        CommitResult* out);
    void discard(const Session& session);
    StorageStatus store_portrait_thumbnail(std::string_view card_id,
                                           std::string_view version_id,
                                           const Asset& portrait,
                                           std::string* public_url);

    Storage& storage_;
    VersionStore& store_;
    UploadPolicy policy_;
    PostProcessor* post_processor_;
    std::function<int64_t()> clock_;
    ImageTranscoder* transcoder_;

    mutable std::mutex mutex_;
    std::map<std::string, Session, std::less<>> sessions_;
};

/// Number of parts \p size is split into (at least 1).
uint32_t
part_count_for(uint64_t size, uint64_t part_size) noexcept;

/// `images/{card_id}/thumbnails/{version_id}.webp`.
std::string
portrait_thumbnail_path(std::string_view card_id, std::string_view version_id);

const char*
upload_status_name(UploadStatus status) noexcept;

const char*
session_state_name(SessionState state) noexcept;

}  // namespace cardpack
