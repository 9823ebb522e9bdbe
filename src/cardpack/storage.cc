#include "cardpack/storage.h"

namespace cardpack {
namespace {

    static bool is_scheme_char(char c, bool first) noexcept
    {
        if (c >= 'a' && c <= 'z') {
            return true;
        }
        if (first) {
            return false;
        }
        return (c >= '0' && c <= '9') || c == '+' || c == '.' || c == '-';
    }


    static std::string_view unquote(std::string_view s) noexcept
    {
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            return s.substr(1, s.size() - 2);
        }
        return s;
    }


    static char lower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

}  // namespace

bool
parse_storage_url(std::string_view url, StorageUrl* out)
{
    const size_t sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0) {
        return false;
    }
    for (size_t i = 0; i < sep; ++i) {
        if (!is_scheme_char(url[i], i == 0)) {
            return false;
        }
    }
    std::string_view path = url.substr(sep + 3);
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    if (path.empty()) {
        return false;
    }
    if (out) {
        out->scheme.assign(url.substr(0, sep));
        out->path.assign(path);
    }
    return true;
}


std::string
format_storage_url(std::string_view scheme, std::string_view path)
{
    std::string url;
    url.reserve(scheme.size() + 3 + path.size());
    url.append(scheme);
    url.append("://");
    url.append(path);
    return url;
}


bool
etags_match(std::string_view a, std::string_view b) noexcept
{
    a = unquote(a);
    b = unquote(b);
    if (a.empty() || a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (lower(a[i]) != lower(b[i])) {
            return false;
        }
    }
    return true;
}


bool
is_safe_storage_path(std::string_view path) noexcept
{
    if (path.empty() || path.front() == '/' || path.back() == '/') {
        return false;
    }
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }
        const std::string_view seg = path.substr(pos, slash - pos);
        if (seg.empty() || seg == "." || seg == "..") {
            return false;
        }
        if (seg.find('\\') != std::string_view::npos
            || seg.find('\0') != std::string_view::npos) {
            return false;
        }
        pos = slash + 1;
    }
    return true;
}


std::string
StorageDriver::public_url(std::string_view path, std::string_view prefix) const
{
    std::string url(prefix);
    url.append(path);
    return url;
}


StorageStatus
StorageDriver::object_etag(std::string_view, std::string*)
{
    return StorageStatus::Unsupported;
}


StorageStatus
StorageDriver::grant_put(const GrantRequest&, UploadGrant*)
{
    return StorageStatus::Unsupported;
}


StorageStatus
StorageDriver::create_multipart(std::string_view, std::string_view,
                                std::string*)
{
    return StorageStatus::Unsupported;
}


StorageStatus
StorageDriver::upload_part(std::string_view, std::string_view, uint32_t,
                           std::span<const std::byte>, std::string*)
{
    return StorageStatus::Unsupported;
}


StorageStatus
StorageDriver::complete_multipart(std::string_view, std::string_view,
                                  std::span<const CompletedPart>)
{
    return StorageStatus::Unsupported;
}


StorageStatus
StorageDriver::abort_multipart(std::string_view, std::string_view)
{
    return StorageStatus::Unsupported;
}


StorageStatus
DriverRegistry::add(std::unique_ptr<StorageDriver> driver)
{
    if (!driver) {
        return StorageStatus::InvalidUrl;
    }
    std::string scheme(driver->scheme());
    if (drivers_.find(scheme) != drivers_.end()) {
        return StorageStatus::Conflict;
    }
    drivers_.emplace(std::move(scheme), std::move(driver));
    return StorageStatus::Ok;
}


StorageDriver*
DriverRegistry::find(std::string_view scheme) const noexcept
{
    const auto it = drivers_.find(scheme);
    return (it == drivers_.end()) ? nullptr : it->second.get();
}


std::vector<std::string>
DriverRegistry::schemes() const
{
    std::vector<std::string> out;
    out.reserve(drivers_.size());
    for (const auto& [scheme, driver] : drivers_) {
        out.push_back(scheme);
    }
    return out;
}


Storage::Storage(const DriverRegistry& registry, std::string default_scheme,
                 std::string public_prefix)
    : registry_(registry)
    , default_scheme_(std::move(default_scheme))
    , public_prefix_(std::move(public_prefix))
{
}


StorageDriver*
Storage::default_driver() const noexcept
{
    return registry_.find(default_scheme_);
}


StorageDriver*
Storage::driver_for(std::string_view url, StorageUrl* parsed,
                    StorageStatus* status) const
{
    StorageUrl u;
    if (!parse_storage_url(url, &u)) {
        *status = StorageStatus::InvalidUrl;
        return nullptr;
    }
    StorageDriver* driver = registry_.find(u.scheme);
    if (!driver) {
        *status = StorageStatus::UnknownScheme;
        return nullptr;
    }
    if (!is_safe_storage_path(u.path)) {
        *status = StorageStatus::InvalidPath;
        return nullptr;
    }
    if (parsed) {
        *parsed = std::move(u);
    }
    *status = StorageStatus::Ok;
    return driver;
}


StorageStatus
Storage::store(std::span<const std::byte> bytes, std::string_view path,
               std::string* url, const StoreOptions& options)
{
    StorageDriver* driver = default_driver();
    if (!driver) {
        return StorageStatus::UnknownScheme;
    }
    if (!is_safe_storage_path(path)) {
        return StorageStatus::InvalidPath;
    }
    const StorageStatus st = driver->store(bytes, path, options);
    if (st != StorageStatus::Ok) {
        return st;
    }
    if (url) {
        *url = format_storage_url(default_scheme_, path);
    }
    return StorageStatus::Ok;
}


StorageStatus
Storage::retrieve(std::string_view url, std::vector<std::byte>* out) const
{
    StorageStatus st = StorageStatus::Ok;
    StorageUrl u;
    StorageDriver* driver = driver_for(url, &u, &st);
    if (!driver) {
        return st;
    }
    return driver->retrieve(u.path, out);
}


StorageStatus
Storage::remove(std::string_view url) const
{
    StorageStatus st = StorageStatus::Ok;
    StorageUrl u;
    StorageDriver* driver = driver_for(url, &u, &st);
    if (!driver) {
        return st;
    }
    return driver->remove(u.path);
}


StorageStatus
Storage::exists(std::string_view url, bool* out) const
{
    StorageStatus st = StorageStatus::Ok;
    StorageUrl u;
    StorageDriver* driver = driver_for(url, &u, &st);
    if (!driver) {
        return st;
    }
    return driver->exists(u.path, out);
}


StorageStatus
Storage::object_etag(std::string_view url, std::string* out) const
{
    StorageStatus st = StorageStatus::Ok;
    StorageUrl u;
    StorageDriver* driver = driver_for(url, &u, &st);
    if (!driver) {
        return st;
    }
    return driver->object_etag(u.path, out);
}


std::string
Storage::public_url(std::string_view url) const
{
    StorageUrl u;
    if (!parse_storage_url(url, &u)) {
        std::string out(public_prefix_);
        out.append(url);
        return out;
    }
    const StorageDriver* driver = registry_.find(u.scheme);
    if (!driver) {
        std::string out(public_prefix_);
        out.append(u.path);
        return out;
    }
    return driver->public_url(u.path, public_prefix_);
}


const char*
storage_status_name(StorageStatus status) noexcept
{
    switch (status) {
    case StorageStatus::Ok: return "ok";
    case StorageStatus::NotFound: return "not_found";
    case StorageStatus::UnknownScheme: return "unknown_scheme";
    case StorageStatus::InvalidUrl: return "invalid_url";
    case StorageStatus::InvalidPath: return "invalid_path";
    case StorageStatus::Conflict: return "conflict";
    case StorageStatus::InvalidPart: return "invalid_part";
    case StorageStatus::InvalidGrant: return "invalid_grant";
    case StorageStatus::Unsupported: return "unsupported";
    case StorageStatus::IoError: return "io_error";
    }
    return "unknown";
}

}  // namespace cardpack
