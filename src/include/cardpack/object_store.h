#pragma once

#include "cardpack/http_client.h"
#include "cardpack/sigv4.h"
#include "cardpack/storage.h"

#include <functional>

/**
 * \file object_store.h
 * \brief S3-compatible object store driver (Cloudflare R2, MinIO, S3).
 */

namespace cardpack {

struct ObjectStoreOptions final {
    std::string scheme = "r2";
    /// Service endpoint, e.g. `https://<account>.r2.cloudflarestorage.com`.
    std::string endpoint;
    std::string bucket;
    SigV4Credentials credentials;
    /// Absolute public base URL of the bucket. When empty, public URLs use
    /// the serving prefix like every other driver.
    std::string public_base;
    /// Unix seconds; defaults to the system clock.
    std::function<int64_t()> clock;
};

/**
 * \brief Path-style S3 REST driver over an \ref HttpClient.
 *
 * Server-side calls are SigV4 header-signed; grants are presigned PUT
 * URLs scoped to the object path and content type.
 */
class ObjectStoreDriver final : public StorageDriver {
public:
    /// \p http must outlive the driver.
    ObjectStoreDriver(ObjectStoreOptions options, HttpClient& http);

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
    /// The `ETag` of a HEAD request.
    StorageStatus object_etag(std::string_view path,
                              std::string* out) override;

    std::string public_url(std::string_view path,
                           std::string_view prefix) const override;

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

private:
    std::string object_url(std::string_view path) const;
    int64_t now() const;
    HttpResponse send(HttpRequest request);
    StorageStatus failure(std::string_view op, std::string_view path,
                          const HttpResponse& response) const;

    ObjectStoreOptions options_;
    HttpClient& http_;
};

}  // namespace cardpack
