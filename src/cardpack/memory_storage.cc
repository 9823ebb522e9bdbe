#include "cardpack/memory_storage.h"

#include "cardpack/file_storage.h"

#include <string>

namespace cardpack {

MemoryStorageDriver::MemoryStorageDriver(std::string scheme)
    : scheme_(std::move(scheme))
{
}


StorageStatus
MemoryStorageDriver::store(std::span<const std::byte> bytes,
                           std::string_view path, const StoreOptions& options)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_stores_ > 0) {
        fail_stores_ -= 1;
        return StorageStatus::IoError;
    }
    const auto it = objects_.find(path);
    if (it != objects_.end()) {
        if (options.if_absent) {
            return StorageStatus::Conflict;
        }
        it->second.assign(bytes.begin(), bytes.end());
    } else {
        objects_.emplace(std::string(path),
                         std::vector<std::byte>(bytes.begin(), bytes.end()));
    }
    store_calls_ += 1;
    return StorageStatus::Ok;
}


StorageStatus
MemoryStorageDriver::retrieve(std::string_view path,
                              std::vector<std::byte>* out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = objects_.find(path);
    if (it == objects_.end()) {
        return StorageStatus::NotFound;
    }
    *out = it->second;
    return StorageStatus::Ok;
}


StorageStatus
MemoryStorageDriver::remove(std::string_view path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = objects_.find(path);
    if (it != objects_.end()) {
        objects_.erase(it);
    }
    return StorageStatus::Ok;
}


StorageStatus
MemoryStorageDriver::exists(std::string_view path, bool* out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    *out = objects_.find(path) != objects_.end();
    return StorageStatus::Ok;
}


StorageStatus
MemoryStorageDriver::object_etag(std::string_view path, std::string* out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = objects_.find(path);
    if (it == objects_.end()) {
        return StorageStatus::NotFound;
    }
    *out = crc32_etag(it->second);
    return StorageStatus::Ok;
}


StorageStatus
MemoryStorageDriver::grant_put(const GrantRequest& request, UploadGrant* out)
{
    UploadGrant grant;
    grant.url = format_storage_url(scheme_, request.path);
    if (!request.upload_id.empty()) {
        grant.url.append("?upload=");
        grant.url.append(request.upload_id);
        grant.url.append("&part=");
        grant.url.append(std::to_string(request.part_number));
    }
    grant.expires_at = request.expires_at;
    grant.headers.emplace_back("Content-Type", request.content_type);
    *out = std::move(grant);
    return StorageStatus::Ok;
}


StorageStatus
MemoryStorageDriver::create_multipart(std::string_view path, std::string_view,
                                      std::string* upload_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = "mp" + std::to_string(next_upload_++);
    Multipart mp;
    mp.path.assign(path);
    uploads_.emplace(id, std::move(mp));
    *upload_id = std::move(id);
    return StorageStatus::Ok;
}


StorageStatus
MemoryStorageDriver::upload_part(std::string_view path,
                                 std::string_view upload_id,
                                 uint32_t part_number,
                                 std::span<const std::byte> bytes,
                                 std::string* etag)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.path != path) {
        return StorageStatus::NotFound;
    }
    if (part_number == 0) {
        return StorageStatus::InvalidPart;
    }
    it->second.parts[part_number].assign(bytes.begin(), bytes.end());
    if (etag) {
        *etag = crc32_etag(bytes);
    }
    return StorageStatus::Ok;
}


StorageStatus
MemoryStorageDriver::complete_multipart(std::string_view path,
                                        std::string_view upload_id,
                                        std::span<const CompletedPart> parts)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.path != path) {
        return StorageStatus::NotFound;
    }
    if (parts.empty()) {
        return StorageStatus::InvalidPart;
    }
    std::vector<std::byte> assembled;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].part_number != i + 1) {
            return StorageStatus::InvalidPart;
        }
        const auto p = it->second.parts.find(parts[i].part_number);
        if (p == it->second.parts.end()) {
            return StorageStatus::InvalidPart;
        }
        std::string_view etag = parts[i].etag;
        if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
            etag = etag.substr(1, etag.size() - 2);
        }
        if (crc32_etag(p->second) != etag) {
            return StorageStatus::InvalidPart;
        }
        assembled.insert(assembled.end(), p->second.begin(), p->second.end());
    }
    objects_[std::string(path)] = std::move(assembled);
    uploads_.erase(it);
    store_calls_ += 1;
    return StorageStatus::Ok;
}


StorageStatus
MemoryStorageDriver::abort_multipart(std::string_view,
                                     std::string_view upload_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = uploads_.find(upload_id);
    if (it == uploads_.end()) {
        return StorageStatus::NotFound;
    }
    uploads_.erase(it);
    return StorageStatus::Ok;
}


size_t
MemoryStorageDriver::object_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}


size_t
MemoryStorageDriver::store_calls() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return store_calls_;
}


void
MemoryStorageDriver::fail_next_stores(size_t n)
{
    std::lock_guard<std::mutex> lock(mutex_);
    fail_stores_ = n;
}

}  // namespace cardpack
