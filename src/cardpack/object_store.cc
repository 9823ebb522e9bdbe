#include "cardpack/object_store.h"

#include "cardpack/log.h"
#include "cardpack/url.h"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace cardpack {
namespace {

    static constexpr int64_t kMaxPresignSeconds = 7 * 24 * 3600;

    // Content of the first <tag>...</tag>, or empty.
    static std::string xml_element(std::string_view xml, std::string_view tag)
    {
        const std::string open  = "<" + std::string(tag) + ">";
        const std::string close = "</" + std::string(tag) + ">";
        size_t start            = xml.find(open);
        if (start == std::string_view::npos) {
            return {};
        }
        start += open.size();
        const size_t end = xml.find(close, start);
        if (end == std::string_view::npos) {
            return {};
        }
        return std::string(xml.substr(start, end - start));
    }


    static std::string xml_decode(std::string_view s)
    {
        std::string out;
        out.reserve(s.size());
        size_t i = 0;
        while (i < s.size()) {
            if (s[i] != '&') {
                out.push_back(s[i++]);
                continue;
            }
            if (s.compare(i, 4, "&lt;") == 0) {
                out.push_back('<');
                i += 4;
            } else if (s.compare(i, 4, "&gt;") == 0) {
                out.push_back('>');
                i += 4;
            } else if (s.compare(i, 5, "&amp;") == 0) {
                out.push_back('&');
                i += 5;
            } else if (s.compare(i, 6, "&quot;") == 0) {
                out.push_back('"');
                i += 6;
            } else if (s.compare(i, 6, "&apos;") == 0) {
                out.push_back('\'');
                i += 6;
            } else {
                out.push_back(s[i++]);
            }
        }
        return out;
    }


    static std::string xml_escape(std::string_view s)
    {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            switch (c) {
            case '<': out.append("&lt;"); break;
            case '>': out.append("&gt;"); break;
            case '&': out.append("&amp;"); break;
            case '"': out.append("&quot;"); break;
            case '\'': out.append("&apos;"); break;
            default: out.push_back(c); break;
            }
        }
        return out;
    }


    static std::string quoted_etag(std::string_view etag)
    {
        std::string out(etag);
        if (out.empty()) {
            return out;
        }
        if (out.front() != '"') {
            out.insert(out.begin(), '"');
        }
        if (out.back() != '"' || out.size() == 1) {
            out.push_back('"');
        }
        return out;
    }


    static std::string body_of(std::span<const std::byte> bytes)
    {
        return std::string(reinterpret_cast<const char*>(bytes.data()),
                           bytes.size());
    }

}  // namespace

ObjectStoreDriver::ObjectStoreDriver(ObjectStoreOptions options,
                                     HttpClient& http)
    : options_(std::move(options))
    , http_(http)
{
    while (!options_.endpoint.empty() && options_.endpoint.back() == '/') {
        options_.endpoint.pop_back();
    }
    while (!options_.public_base.empty()
           && options_.public_base.back() == '/') {
        options_.public_base.pop_back();
    }
}


int64_t
ObjectStoreDriver::now() const
{
    if (options_.clock) {
        return options_.clock();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}


std::string
ObjectStoreDriver::object_url(std::string_view path) const
{
    std::string url = options_.endpoint;
    url.push_back('/');
    url.append(url_encode(options_.bucket));
    url.push_back('/');
    url.append(url_encode(path, true));
    return url;
}


HttpResponse
ObjectStoreDriver::send(HttpRequest request)
{
    if (!sigv4_sign_request(options_.credentials, now(), &request)) {
        HttpResponse bad;
        bad.error = "invalid endpoint url";
        return bad;
    }
    return http_.execute(request);
}


StorageStatus
ObjectStoreDriver::failure(std::string_view op, std::string_view path,
                           const HttpResponse& response) const
{
    if (!response.error.empty()) {
        logger()->error("{} {} {}: transport error: {}", options_.scheme, op,
                        path, response.error);
        return StorageStatus::IoError;
    }
    const std::string code = xml_element(response.body, "Code");
    if (response.status == 404 || code == "NoSuchKey"
        || code == "NoSuchUpload") {
        return StorageStatus::NotFound;
    }
    if (response.status == 412 || code == "PreconditionFailed") {
        return StorageStatus::Conflict;
    }
    if (code == "InvalidPart" || code == "InvalidPartOrder") {
        return StorageStatus::InvalidPart;
    }
    logger()->error("{} {} {}: HTTP {} {}", options_.scheme, op, path,
                    response.status, code);
    return StorageStatus::IoError;
}


StorageStatus
ObjectStoreDriver::store(std::span<const std::byte> bytes,
                         std::string_view path, const StoreOptions& options)
{
    HttpRequest req;
    req.method = "PUT";
    req.url    = object_url(path);
    req.body   = body_of(bytes);
    set_header(&req.headers, "Content-Type", options.content_type);
    if (options.if_absent) {
        set_header(&req.headers, "If-None-Match", "*");
    }
    const HttpResponse res = send(std::move(req));
    if (!res.ok()) {
        return failure("store", path, res);
    }
    return StorageStatus::Ok;
}


StorageStatus
ObjectStoreDriver::retrieve(std::string_view path, std::vector<std::byte>* out)
{
    HttpRequest req;
    req.method             = "GET";
    req.url                = object_url(path);
    const HttpResponse res = send(std::move(req));
    if (!res.ok()) {
        return failure("retrieve", path, res);
    }
    const std::byte* p = reinterpret_cast<const std::byte*>(res.body.data());
    out->assign(p, p + res.body.size());
    return StorageStatus::Ok;
}


StorageStatus
ObjectStoreDriver::remove(std::string_view path)
{
    HttpRequest req;
    req.method             = "DELETE";
    req.url                = object_url(path);
    const HttpResponse res = send(std::move(req));
    if (res.ok() || (res.error.empty() && res.status == 404)) {
        return StorageStatus::Ok;
    }
    return failure("remove", path, res);
}


StorageStatus
ObjectStoreDriver::exists(std::string_view path, bool* out)
{
    HttpRequest req;
    req.method             = "HEAD";
    req.url                = object_url(path);
    const HttpResponse res = send(std::move(req));
    if (res.ok()) {
        *out = true;
        return StorageStatus::Ok;
    }
    if (res.error.empty() && res.status == 404) {
        *out = false;
        return StorageStatus::Ok;
    }
    return failure("exists", path, res);
}


StorageStatus
ObjectStoreDriver::object_etag(std::string_view path, std::string* out)
{
    HttpRequest req;
    req.method             = "HEAD";
    req.url                = object_url(path);
    const HttpResponse res = send(std::move(req));
    if (!res.ok()) {
        return failure("head", path, res);
    }
    *out = quoted_etag(find_header(res.headers, "ETag"));
    return StorageStatus::Ok;
}


std::string
ObjectStoreDriver::public_url(std::string_view path,
                              std::string_view prefix) const
{
    if (options_.public_base.empty()) {
        return StorageDriver::public_url(path, prefix);
    }
    std::string url = options_.public_base;
    url.push_back('/');
    url.append(url_encode(path, true));
    return url;
}


StorageStatus
ObjectStoreDriver::grant_put(const GrantRequest& request, UploadGrant* out)
{
    const int64_t ttl = std::clamp<int64_t>(request.expires_at - now(), 1,
                                            kMaxPresignSeconds);
    std::string url   = object_url(request.path);
    if (!request.upload_id.empty()) {
        url.append("?partNumber=");
        url.append(std::to_string(request.part_number));
        url.append("&uploadId=");
        url.append(url_encode(request.upload_id));
    }

    HttpHeaders signed_headers;
    // Parts are raw byte ranges; only whole-object PUTs carry the type.
    if (request.upload_id.empty()) {
        signed_headers.emplace_back("content-type", request.content_type);
    }
    UploadGrant grant;
    if (!sigv4_presign_url(options_.credentials, "PUT", url, signed_headers,
                           now(), ttl, &grant.url)) {
        return StorageStatus::InvalidUrl;
    }
    if (request.upload_id.empty()) {
        grant.headers.emplace_back("Content-Type", request.content_type);
    }
    grant.expires_at = request.expires_at;
    *out             = std::move(grant);
    return StorageStatus::Ok;
}


StorageStatus
ObjectStoreDriver::create_multipart(std::string_view path,
                                    std::string_view content_type,
                                    std::string* upload_id)
{
    HttpRequest req;
    req.method = "POST";
    req.url    = object_url(path) + "?uploads";
    set_header(&req.headers, "Content-Type", std::string(content_type));
    const HttpResponse res = send(std::move(req));
    if (!res.ok()) {
        return failure("create_multipart", path, res);
    }
    std::string id = xml_decode(xml_element(res.body, "UploadId"));
    if (id.empty()) {
        logger()->error("{} create_multipart {}: no UploadId in response",
                        options_.scheme, path);
        return StorageStatus::IoError;
    }
    *upload_id = std::move(id);
    return StorageStatus::Ok;
}


StorageStatus
ObjectStoreDriver::upload_part(std::string_view path,
                               std::string_view upload_id,
                               uint32_t part_number,
                               std::span<const std::byte> bytes,
                               std::string* etag)
{
    HttpRequest req;
    req.method = "PUT";
    req.url    = object_url(path) + "?partNumber="
              + std::to_string(part_number)
              + "&uploadId=" + url_encode(upload_id);
    req.body               = body_of(bytes);
    const HttpResponse res = send(std::move(req));
    if (!res.ok()) {
        return failure("upload_part", path, res);
    }
    if (etag) {
        *etag = quoted_etag(find_header(res.headers, "ETag"));
    }
    return StorageStatus::Ok;
}


StorageStatus
ObjectStoreDriver::complete_multipart(std::string_view path,
                                      std::string_view upload_id,
                                      std::span<const CompletedPart> parts)
{
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml << "<CompleteMultipartUpload "
           "xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
    for (const CompletedPart& part : parts) {
        xml << "  <Part>\n";
        xml << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
        xml << "    <ETag>" << xml_escape(quoted_etag(part.etag))
            << "</ETag>\n";
        xml << "  </Part>\n";
    }
    xml << "</CompleteMultipartUpload>";

    HttpRequest req;
    req.method = "POST";
    req.url    = object_url(path) + "?uploadId=" + url_encode(upload_id);
    req.body   = xml.str();
    set_header(&req.headers, "Content-Type", "application/xml");
    const HttpResponse res = send(std::move(req));
    // S3 may report a failed completion with status 200 and an <Error> body.
    if (!res.ok() || res.body.find("<Error>") != std::string::npos) {
        return failure("complete_multipart", path, res);
    }
    return StorageStatus::Ok;
}


StorageStatus
ObjectStoreDriver::abort_multipart(std::string_view path,
                                   std::string_view upload_id)
{
    HttpRequest req;
    req.method = "DELETE";
    req.url    = object_url(path) + "?uploadId=" + url_encode(upload_id);
    const HttpResponse res = send(std::move(req));
    if (!res.ok()) {
        return failure("abort_multipart", path, res);
    }
    return StorageStatus::Ok;
}

}  // namespace cardpack
