#pragma once

#include "cardpack/storage.h"

#include <filesystem>
#include <mutex>

/**
 * \file file_storage.h
 * \brief Local filesystem driver with signed direct-upload grants.
 */

namespace cardpack {

struct FileStorageOptions final {
    std::filesystem::path root;
    std::string scheme = "file";
    /// HMAC-SHA256 key for direct-upload grants. Grants are refused when
    /// empty.
    std::string grant_secret;
    /// Route prefix of signed upload URLs.
    std::string direct_prefix = "/api/uploads/direct/";
};

/// What a verified grant allows.
struct GrantScope final {
    std::string path;
    std::string content_type;
    std::string upload_id;
    uint32_t part_number = 0;
    int64_t expires_at   = 0;
};

/**
 * \brief Stores objects as files below a root directory.
 *
 * Writes go to a temporary sibling and are renamed into place. Multipart
 * parts are staged under `.multipart/<upload_id>/<n>`; their etag is the
 * hex CRC-32 of the part.
 */
class FileStorageDriver final : public StorageDriver {
public:
    explicit FileStorageDriver(FileStorageOptions options);

    std::string_view scheme() const noexcept override
    {
        return options_.scheme;
    }

    StorageStatus store(std::span<const std::byte> bytes,
                        std::string_view path,
                        const StoreOptions& options) override;
    StorageStatus retrieve(std::string_view path,
                           std::vector<std::byte>* out) override;
    StorageStatus remove(std::string_view path) override;
    StorageStatus exists(std::string_view path, bool* out) override;
    StorageStatus object_etag(std::string_view path,
                              std::string* out) override;

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

    /**
     * \brief Checks a signed upload target (`<direct_prefix><path>?...`).
     *
     * \p content_type is the request's Content-Type and must equal the one
     * the grant was issued for. \p now is unix seconds.
     */
    StorageStatus verify_grant(std::string_view target,
                               std::string_view content_type, int64_t now,
                               GrantScope* out) const;

    /// Writes the body of a verified direct upload; returns its etag.
    StorageStatus accept_upload(const GrantScope& scope,
                                std::span<const std::byte> bytes,
                                std::string* etag);

    const std::filesystem::path& root() const noexcept
    {
        return options_.root;
    }

private:
    bool resolve(std::string_view path, std::filesystem::path* out) const;
    std::filesystem::path staging_dir(std::string_view upload_id) const;
    std::string sign(std::string_view path, std::string_view content_type,
                     int64_t expires_at, std::string_view upload_id,
                     uint32_t part_number) const;

    FileStorageOptions options_;
    std::mutex mutex_;
};

/// Hex CRC-32 etag used by the local drivers.
std::string
crc32_etag(std::span<const std::byte> bytes);

}  // namespace cardpack
