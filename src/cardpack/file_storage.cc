#include "cardpack/file_storage.h"

#include "cardpack/crc32.h"
#include "cardpack/digest.h"
#include "cardpack/log.h"
#include "cardpack/url.h"

#include <array>
#include <charconv>
#include <fstream>
#include <string>

namespace cardpack {
namespace fs = std::filesystem;

namespace {

    static constexpr std::string_view kStagingDir = ".multipart";
    static constexpr std::string_view kTargetFile = "target";
    static constexpr uint32_t kMaxParts           = 10000;

    static bool valid_upload_id(std::string_view id) noexcept
    {
        if (id.empty() || id.size() > 64) {
            return false;
        }
        for (char c : id) {
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
                return false;
            }
        }
        return true;
    }


    static std::string_view strip_quotes(std::string_view etag) noexcept
    {
        if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
            return etag.substr(1, etag.size() - 2);
        }
        return etag;
    }


    static bool read_file(const fs::path& p, std::vector<std::byte>* out)
    {
        std::ifstream in(p, std::ios::binary | std::ios::ate);
        if (!in) {
            return false;
        }
        const std::streamoff size = in.tellg();
        if (size < 0) {
            return false;
        }
        std::vector<std::byte> buf(static_cast<size_t>(size));
        in.seekg(0);
        in.read(reinterpret_cast<char*>(buf.data()),
                static_cast<std::streamsize>(buf.size()));
        if (!in) {
            return false;
        }
        *out = std::move(buf);
        return true;
    }


    // Writes to a temporary sibling then renames over \p target.
    static StorageStatus write_atomic(const fs::path& target,
                                      std::span<const std::byte> bytes)
    {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return StorageStatus::IoError;
        }
        fs::path tmp = target;
        tmp += ".tmp." + random_hex_id(8);
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return StorageStatus::IoError;
            }
            out.write(reinterpret_cast<const char*>(bytes.data()),
                      static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                out.close();
                fs::remove(tmp, ec);
                return StorageStatus::IoError;
            }
        }
        fs::rename(tmp, target, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return StorageStatus::IoError;
        }
        return StorageStatus::Ok;
    }


    static bool parse_i64(std::string_view s, int64_t* out) noexcept
    {
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
                                               *out);
        return ec == std::errc() && ptr == s.data() + s.size();
    }

}  // namespace

std::string
crc32_etag(std::span<const std::byte> bytes)
{
    const uint32_t c = crc32(bytes);
    const std::array<std::byte, 4> be = {
        std::byte { static_cast<uint8_t>((c >> 24) & 0xFFU) },
        std::byte { static_cast<uint8_t>((c >> 16) & 0xFFU) },
        std::byte { static_cast<uint8_t>((c >> 8) & 0xFFU) },
        std::byte { static_cast<uint8_t>((c >> 0) & 0xFFU) },
    };
    return hex_encode(be);
}


FileStorageDriver::FileStorageDriver(FileStorageOptions options)
    : options_(std::move(options))
{
    std::error_code ec;
    fs::create_directories(options_.root, ec);
    if (ec) {
        logger()->error("file storage root '{}' unavailable: {}",
                        options_.root.string(), ec.message());
    }
}


bool
FileStorageDriver::resolve(std::string_view path, fs::path* out) const
{
    if (!is_safe_storage_path(path)) {
        return false;
    }
    const size_t slash = path.find('/');
    if (path.substr(0, slash) == kStagingDir) {
        return false;
    }
    *out = options_.root / fs::path(std::string(path));
    return true;
}


fs::path
FileStorageDriver::staging_dir(std::string_view upload_id) const
{
    return options_.root / std::string(kStagingDir) / std::string(upload_id);
}


StorageStatus
FileStorageDriver::store(std::span<const std::byte> bytes,
                         std::string_view path, const StoreOptions& options)
{
    fs::path target;
    if (!resolve(path, &target)) {
        return StorageStatus::InvalidPath;
    }
    if (!options.if_absent) {
        return write_atomic(target, bytes);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (fs::exists(target, ec)) {
        return StorageStatus::Conflict;
    }
    return write_atomic(target, bytes);
}


StorageStatus
FileStorageDriver::retrieve(std::string_view path, std::vector<std::byte>* out)
{
    fs::path target;
    if (!resolve(path, &target)) {
        return StorageStatus::InvalidPath;
    }
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        return StorageStatus::NotFound;
    }
    if (!read_file(target, out)) {
        return StorageStatus::IoError;
    }
    return StorageStatus::Ok;
}


StorageStatus
FileStorageDriver::remove(std::string_view path)
{
    fs::path target;
    if (!resolve(path, &target)) {
        return StorageStatus::InvalidPath;
    }
    std::error_code ec;
    fs::remove(target, ec);
    return ec ? StorageStatus::IoError : StorageStatus::Ok;
}


StorageStatus
FileStorageDriver::exists(std::string_view path, bool* out)
{
    fs::path target;
    if (!resolve(path, &target)) {
        return StorageStatus::InvalidPath;
    }
    std::error_code ec;
    const bool present = fs::is_regular_file(target, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return StorageStatus::IoError;
    }
    *out = present;
    return StorageStatus::Ok;
}


StorageStatus
FileStorageDriver::object_etag(std::string_view path, std::string* out)
{
    std::vector<std::byte> bytes;
    const StorageStatus st = retrieve(path, &bytes);
    if (st != StorageStatus::Ok) {
        return st;
    }
    *out = crc32_etag(bytes);
    return StorageStatus::Ok;
}


std::string
FileStorageDriver::sign(std::string_view path, std::string_view content_type,
                        int64_t expires_at, std::string_view upload_id,
                        uint32_t part_number) const
{
    std::string msg;
    msg.append("PUT\n");
    msg.append(path);
    msg.push_back('\n');
    msg.append(content_type);
    msg.push_back('\n');
    msg.append(std::to_string(expires_at));
    msg.push_back('\n');
    msg.append(upload_id);
    msg.push_back('\n');
    msg.append(std::to_string(part_number));
    return hex_encode(hmac_sha256(options_.grant_secret, msg));
}


StorageStatus
FileStorageDriver::grant_put(const GrantRequest& request, UploadGrant* out)
{
    if (options_.grant_secret.empty()) {
        return StorageStatus::Unsupported;
    }
    fs::path target;
    if (!resolve(request.path, &target)) {
        return StorageStatus::InvalidPath;
    }
    if (!request.upload_id.empty() && request.part_number == 0) {
        return StorageStatus::InvalidPart;
    }

    UploadGrant grant;
    grant.expires_at = request.expires_at;
    grant.url        = options_.direct_prefix;
    grant.url.append(url_encode(request.path, true));
    grant.url.append("?expires=");
    grant.url.append(std::to_string(request.expires_at));
    grant.url.append("&ct=");
    grant.url.append(url_encode(request.content_type));
    if (!request.upload_id.empty()) {
        grant.url.append("&upload=");
        grant.url.append(request.upload_id);
        grant.url.append("&part=");
        grant.url.append(std::to_string(request.part_number));
    }
    grant.url.append("&sig=");
    grant.url.append(sign(request.path, request.content_type,
                          request.expires_at, request.upload_id,
                          request.part_number));
    grant.headers.emplace_back("Content-Type", request.content_type);
    *out = std::move(grant);
    return StorageStatus::Ok;
}


StorageStatus
FileStorageDriver::verify_grant(std::string_view target,
                                std::string_view content_type, int64_t now,
                                GrantScope* out) const
{
    if (options_.grant_secret.empty()) {
        return StorageStatus::Unsupported;
    }
    const size_t q = target.find('?');
    if (q == std::string_view::npos) {
        return StorageStatus::InvalidGrant;
    }
    std::string_view raw_path = target.substr(0, q);
    if (raw_path.substr(0, options_.direct_prefix.size())
        != options_.direct_prefix) {
        return StorageStatus::InvalidGrant;
    }
    raw_path.remove_prefix(options_.direct_prefix.size());

    GrantScope scope;
    if (!url_decode(raw_path, &scope.path)) {
        return StorageStatus::InvalidGrant;
    }
    fs::path resolved;
    if (!resolve(scope.path, &resolved)) {
        return StorageStatus::InvalidPath;
    }

    const QueryParams params = parse_query(target.substr(q + 1));
    if (!parse_i64(query_value(params, "expires"), &scope.expires_at)) {
        return StorageStatus::InvalidGrant;
    }
    scope.content_type.assign(query_value(params, "ct"));
    scope.upload_id.assign(query_value(params, "upload"));
    const std::string_view part = query_value(params, "part");
    if (!part.empty()) {
        int64_t n = 0;
        if (!parse_i64(part, &n) || n < 1 || n > kMaxParts) {
            return StorageStatus::InvalidGrant;
        }
        scope.part_number = static_cast<uint32_t>(n);
    }
    if (scope.upload_id.empty() != (scope.part_number == 0)) {
        return StorageStatus::InvalidGrant;
    }

    const std::string expected = sign(scope.path, scope.content_type,
                                      scope.expires_at, scope.upload_id,
                                      scope.part_number);
    if (!constant_time_equal(expected, query_value(params, "sig"))) {
        return StorageStatus::InvalidGrant;
    }
    if (now > scope.expires_at) {
        return StorageStatus::InvalidGrant;
    }
    if (content_type != scope.content_type) {
        return StorageStatus::InvalidGrant;
    }
    *out = std::move(scope);
    return StorageStatus::Ok;
}


StorageStatus
FileStorageDriver::accept_upload(const GrantScope& scope,
                                 std::span<const std::byte> bytes,
                                 std::string* etag)
{
    if (scope.upload_id.empty()) {
        StoreOptions opts;
        opts.content_type      = scope.content_type;
        const StorageStatus st = store(bytes, scope.path, opts);
        if (st == StorageStatus::Ok && etag) {
            *etag = crc32_etag(bytes);
        }
        return st;
    }
    return upload_part(scope.path, scope.upload_id, scope.part_number, bytes,
                       etag);
}


StorageStatus
FileStorageDriver::create_multipart(std::string_view path, std::string_view,
                                    std::string* upload_id)
{
    fs::path target;
    if (!resolve(path, &target)) {
        return StorageStatus::InvalidPath;
    }
    const std::string id = random_hex_id(16);
    if (id.empty()) {
        return StorageStatus::IoError;
    }
    const fs::path dir = staging_dir(id);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return StorageStatus::IoError;
    }
    const StorageStatus st = write_atomic(dir / std::string(kTargetFile),
                                          as_bytes(path));
    if (st != StorageStatus::Ok) {
        return st;
    }
    *upload_id = id;
    return StorageStatus::Ok;
}


StorageStatus
FileStorageDriver::upload_part(std::string_view path,
                               std::string_view upload_id,
                               uint32_t part_number,
                               std::span<const std::byte> bytes,
                               std::string* etag)
{
    fs::path target;
    if (!resolve(path, &target)) {
        return StorageStatus::InvalidPath;
    }
    if (!valid_upload_id(upload_id)) {
        return StorageStatus::NotFound;
    }
    if (part_number < 1 || part_number > kMaxParts) {
        return StorageStatus::InvalidPart;
    }
    const fs::path dir = staging_dir(upload_id);
    std::vector<std::byte> recorded;
    if (!read_file(dir / std::string(kTargetFile), &recorded)) {
        return StorageStatus::NotFound;
    }
    if (std::string_view(reinterpret_cast<const char*>(recorded.data()),
                         recorded.size())
        != path) {
        return StorageStatus::NotFound;
    }
    const StorageStatus st = write_atomic(dir / std::to_string(part_number),
                                          bytes);
    if (st == StorageStatus::Ok && etag) {
        *etag = crc32_etag(bytes);
    }
    return st;
}


StorageStatus
FileStorageDriver::complete_multipart(std::string_view path,
                                      std::string_view upload_id,
                                      std::span<const CompletedPart> parts)
{
    fs::path target;
    if (!resolve(path, &target)) {
        return StorageStatus::InvalidPath;
    }
    if (!valid_upload_id(upload_id)) {
        return StorageStatus::NotFound;
    }
    const fs::path dir = staging_dir(upload_id);
    std::vector<std::byte> recorded;
    if (!read_file(dir / std::string(kTargetFile), &recorded)
        || std::string_view(reinterpret_cast<const char*>(recorded.data()),
                            recorded.size())
               != path) {
        return StorageStatus::NotFound;
    }
    if (parts.empty()) {
        return StorageStatus::InvalidPart;
    }

    std::vector<std::byte> assembled;
    for (size_t i = 0; i < parts.size(); ++i) {
        const CompletedPart& part = parts[i];
        if (part.part_number != i + 1) {
            return StorageStatus::InvalidPart;
        }
        std::vector<std::byte> data;
        if (!read_file(dir / std::to_string(part.part_number), &data)) {
            return StorageStatus::InvalidPart;
        }
        if (crc32_etag(data) != strip_quotes(part.etag)) {
            return StorageStatus::InvalidPart;
        }
        assembled.insert(assembled.end(), data.begin(), data.end());
    }

    const StorageStatus st = write_atomic(target, assembled);
    if (st != StorageStatus::Ok) {
        return st;
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        logger()->warn("multipart staging '{}' not removed: {}", dir.string(),
                       ec.message());
    }
    return StorageStatus::Ok;
}


StorageStatus
FileStorageDriver::abort_multipart(std::string_view, std::string_view upload_id)
{
    if (!valid_upload_id(upload_id)) {
        return StorageStatus::NotFound;
    }
    std::error_code ec;
    fs::remove_all(staging_dir(upload_id), ec);
    return ec ? StorageStatus::IoError : StorageStatus::Ok;
}

}  // namespace cardpack
