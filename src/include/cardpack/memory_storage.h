#pragma once

#include "cardpack/storage.h"

#include <map>
#include <mutex>

/**
 * \file memory_storage.h
 * \brief In-process driver (`mem://`), used by tests and dry runs.
 */

namespace cardpack {

class MemoryStorageDriver final : public StorageDriver {
public:
    explicit MemoryStorageDriver(std::string scheme = "mem");

    std::string_view scheme() const noexcept override { return scheme_; }

    StorageStatus store(std::span<const std::byte> bytes,
                        std::string_view path,
                        const StoreOptions& options) override;
    StorageStatus retrieve(std::string_view path,
                           std::vector<std::byte>* out) override;
    StorageStatus remove(std::string_view path) override;
    StorageStatus exists(std::string_view path, bool* out) override;
    /// Hex crc32 of the object, the same form part etags take.
    StorageStatus object_etag(std::string_view path,
                              std::string* out) override;

    /// Grants point at `mem://` and are only meaningful to tests.
    StorageStatus grant_put(const GrantRequest& request,
                            UploadGrant* out) override;
    StorageStatus create_multipart(std::string_view path,
                                   std::string_view content_type,
                                   std::string* upload_id) override;
    StorageStatus upload_part(std::string_view path,
                              std::string_view upload_id,
                              uint32_t part_number,
                              std::span<const std::byte> bytes,
                              std::string* etag) override;
    StorageStatus complete_multipart(
        std::string_view path, std::string_view upload_id,
        std::span<const CompletedPart> parts) override;
    StorageStatus abort_multipart(std::string_view path,
                                  std::string_view upload_id) override;

    size_t object_count() const;
    /// Number of successful `store` calls (including overwrites).
    size_t store_calls() const;
    /// Makes the next \p n `store` calls fail with `IoError` (0 disables).
    void fail_next_stores(size_t n);

private:
    struct Multipart final {
        std::string path;
        std::map<uint32_t, std::vector<std::byte>> parts;
    };

    std::string scheme_;
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::byte>, std::less<>> objects_;
    std::map<std::string, Multipart, std::less<>> uploads_;
    uint64_t next_upload_ = 1;
    size_t store_calls_   = 0;
    size_t fail_stores_   = 0;
};

}  // namespace cardpack
