#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * \file storage.h
 * \brief Scheme-dispatched blob storage (`scheme://path` URLs).
 *
 * A \ref DriverRegistry maps URL schemes to \ref StorageDriver instances.
 * \ref Storage writes to one default driver, chosen once at construction,
 * and resolves every other operation by the scheme of the URL it is given,
 * so objects written under an earlier default stay readable.
 */

namespace cardpack {

enum class StorageStatus : uint8_t {
    Ok,
    NotFound,
    /// No driver is registered for the URL's scheme.
    UnknownScheme,
    /// Text is not `scheme://path`.
    InvalidUrl,
    /// Empty path, absolute path, or a `..` segment.
    InvalidPath,
    /// Conditional write refused, or scheme already registered.
    Conflict,
    /// Multipart part missing or its etag does not match.
    InvalidPart,
    /// Signed grant is malformed, expired, or does not match the request.
    InvalidGrant,
    /// The driver does not implement this capability.
    Unsupported,
    IoError,
};

/// A parsed storage URL.
struct StorageUrl final {
    std::string scheme;
    std::string path;
};

/**
 * \brief Splits `scheme://path`.
 *
 * The scheme must match `[a-z][a-z0-9+.-]*`. Leading `/` characters of the
 * path are dropped, so `file:///a/b` and `file://a/b` both yield `a/b`.
 */
bool
parse_storage_url(std::string_view url, StorageUrl* out);

std::string
format_storage_url(std::string_view scheme, std::string_view path);

/// Compares two etags, ignoring surrounding quotes and hex letter case.
bool
etags_match(std::string_view a, std::string_view b) noexcept;

/// True for a non-empty relative path with no empty, `.` or `..` segment.
bool
is_safe_storage_path(std::string_view path) noexcept;

struct StoreOptions final {
    std::string content_type = "application/octet-stream";
    /// Fail with `Conflict` instead of overwriting an existing object.
    bool if_absent = false;
};

/// Parameters for a direct-upload authorization.
struct GrantRequest final {
    std::string path;
    std::string content_type;
    uint64_t size = 0;
    /// Absolute expiry (unix seconds).
    int64_t expires_at = 0;
    /// Set for a multipart part grant (part numbers start at 1).
    std::string upload_id;
    uint32_t part_number = 0;
};

/// A short-lived authorization for one PUT.
struct UploadGrant final {
    std::string method = "PUT";
    std::string url;
    /// Headers the client must send verbatim.
    std::vector<std::pair<std::string, std::string>> headers;
    int64_t expires_at = 0;
};

struct CompletedPart final {
    uint32_t part_number = 0;
    std::string etag;
};

/**
 * \brief Backend interface.
 *
 * Paths are driver-relative and already validated by the caller.
 * Implementations must be safe to call from multiple threads.
 */
class StorageDriver {
public:
    virtual ~StorageDriver() = default;

    virtual std::string_view scheme() const noexcept = 0;

    virtual StorageStatus store(std::span<const std::byte> bytes,
                                std::string_view path,
                                const StoreOptions& options)
        = 0;
    virtual StorageStatus retrieve(std::string_view path,
                                   std::vector<std::byte>* out)
        = 0;
    /// Removing a missing object is not an error.
    virtual StorageStatus remove(std::string_view path) = 0;
    virtual StorageStatus exists(std::string_view path, bool* out) = 0;
    /// Etag of the stored object, as a single PUT would have reported it.
    /// The default returns `Unsupported`.
    virtual StorageStatus object_etag(std::string_view path,
                                      std::string* out);

    /// Public route for \p path. Defaults to `prefix + path`.
    virtual std::string public_url(std::string_view path,
                                   std::string_view prefix) const;

    // Direct-upload capabilities. The defaults return `Unsupported`.

    virtual StorageStatus grant_put(const GrantRequest& request,
                                    UploadGrant* out);
    virtual StorageStatus create_multipart(std::string_view path,
                                           std::string_view content_type,
                                           std::string* upload_id);
    /// Server-side part upload; returns the part etag.
    virtual StorageStatus upload_part(std::string_view path,
                                      std::string_view upload_id,
                                      uint32_t part_number,
                                      std::span<const std::byte> bytes,
                                      std::string* etag);
    virtual StorageStatus complete_multipart(
        std::string_view path, std::string_view upload_id,
        std::span<const CompletedPart> parts);
    virtual StorageStatus abort_multipart(std::string_view path,
                                          std::string_view upload_id);
};

/// Scheme to driver map owned by the composition root.
class DriverRegistry final {
public:
    /// Returns `Conflict` if the scheme is taken, `InvalidUrl` for null.
    StorageStatus add(std::unique_ptr<StorageDriver> driver);

    StorageDriver* find(std::string_view scheme) const noexcept;

    std::vector<std::string> schemes() const;

private:
    std::map<std::string, std::unique_ptr<StorageDriver>, std::less<>>
        drivers_;
};

class Storage final {
public:
    static constexpr std::string_view kDefaultPublicPrefix = "/api/uploads/";

    /// \p registry must outlive this object.
    Storage(const DriverRegistry& registry, std::string default_scheme,
            std::string public_prefix = std::string(kDefaultPublicPrefix));

    /// Writes to the default driver and returns `default_scheme://path`.
    StorageStatus store(std::span<const std::byte> bytes,
                        std::string_view path, std::string* url,
                        const StoreOptions& options = {});

    StorageStatus retrieve(std::string_view url,
                           std::vector<std::byte>* out) const;
    StorageStatus remove(std::string_view url) const;
    StorageStatus exists(std::string_view url, bool* out) const;
    StorageStatus object_etag(std::string_view url, std::string* out) const;

    /// Pure mapping to a routable path; never fails.
    std::string public_url(std::string_view url) const;

    /// Resolves the driver for \p url; on failure sets \p status.
    StorageDriver* driver_for(std::string_view url, StorageUrl* parsed,
                              StorageStatus* status) const;

    StorageDriver* default_driver() const noexcept;
    const std::string& default_scheme() const noexcept
    {
        return default_scheme_;
    }
    const std::string& public_prefix() const noexcept
    {
        return public_prefix_;
    }

private:
    const DriverRegistry& registry_;
    std::string default_scheme_;
    std::string public_prefix_;
};

const char*
storage_status_name(StorageStatus status) noexcept;

}  // namespace cardpack
