#include "cardpack/inflate.h"

#include <zlib.h>

#include <array>
#include <limits>

namespace cardpack {
namespace {

    static uInt clamp_uint(uint64_t v) noexcept
    {
        const uint64_t max = static_cast<uint64_t>(
            std::numeric_limits<uInt>::max());
        return static_cast<uInt>(v < max ? v : max);
    }

}  // namespace

InflateStatus
inflate_bytes(std::span<const std::byte> in, InflateFormat format,
              uint64_t max_output_bytes, std::vector<std::byte>* out)
{
    if (!out) {
        return InflateStatus::Malformed;
    }
    out->clear();

    z_stream strm {};
    strm.zalloc = Z_NULL;
    strm.zfree  = Z_NULL;
    strm.opaque = Z_NULL;

    const int window = (format == InflateFormat::Raw) ? -MAX_WBITS : MAX_WBITS;
    int ret          = inflateInit2(&strm, window);
    if (ret != Z_OK) {
        return InflateStatus::Malformed;
    }

    std::array<std::byte, 32768> buf {};
    uint64_t in_off = 0;

    for (;;) {
        if (strm.avail_in == 0) {
            if (in_off >= in.size()) {
                (void)inflateEnd(&strm);
                return InflateStatus::Malformed;
            }
            const uInt chunk = clamp_uint(static_cast<uint64_t>(in.size())
                                          - in_off);
            strm.next_in     = reinterpret_cast<Bytef*>(const_cast<std::byte*>(
                in.data() + static_cast<size_t>(in_off)));
            strm.avail_in    = chunk;
            in_off += chunk;
        }

        strm.next_out  = reinterpret_cast<Bytef*>(buf.data());
        strm.avail_out = static_cast<uInt>(buf.size());

        ret                 = inflate(&strm, Z_NO_FLUSH);
        const size_t used   = buf.size() - strm.avail_out;
        if (max_output_bytes != 0U
            && static_cast<uint64_t>(out->size()) + used > max_output_bytes) {
            (void)inflateEnd(&strm);
            return InflateStatus::LimitExceeded;
        }
        out->insert(out->end(), buf.begin(),
                    buf.begin() + static_cast<std::ptrdiff_t>(used));

        if (ret == Z_STREAM_END) {
            break;
        }
        if (ret != Z_OK) {
            (void)inflateEnd(&strm);
            return InflateStatus::Malformed;
        }
    }

    (void)inflateEnd(&strm);
    return InflateStatus::Ok;
}


bool
deflate_zlib(std::span<const std::byte> in, std::vector<std::byte>* out)
{
    if (!out) {
        return false;
    }
    uLongf dest_len = compressBound(static_cast<uLong>(in.size()));
    std::vector<std::byte> dest(static_cast<size_t>(dest_len));
    const int ret = compress2(reinterpret_cast<Bytef*>(dest.data()), &dest_len,
                              reinterpret_cast<const Bytef*>(in.data()),
                              static_cast<uLong>(in.size()),
                              Z_DEFAULT_COMPRESSION);
    if (ret != Z_OK) {
        return false;
    }
    dest.resize(static_cast<size_t>(dest_len));
    *out = std::move(dest);
    return true;
}

}  // namespace cardpack
