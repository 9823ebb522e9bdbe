#include "cardpack/card_bundle.h"
#include "cardpack/zip_archive.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

namespace cardpack {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}

}  // namespace cardpack

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace cardpack;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    ZipLimits limits;
    limits.max_entries     = 64;
    limits.max_entry_bytes = 1U << 20;
    ZipArchive zip;
    if (ZipArchive::open(bytes, limits, &zip) == ZipStatus::Ok) {
        if (zip.entries().size() > limits.max_entries) {
            fuzz_trap();
        }
        for (const ZipEntry& e : zip.entries()) {
            std::vector<std::byte> out;
            if (zip.read(e, &out) == ZipStatus::Ok && out.size() != e.size) {
                fuzz_trap();
            }
        }
    }

    BundleReadOptions opts;
    opts.zip = limits;
    CardBundle bundle;
    if (read_card_bundle(bytes, opts, &bundle) == BundleStatus::Ok
        && !bundle.card_data.is_object()) {
        fuzz_trap();
    }
    return 0;
}
