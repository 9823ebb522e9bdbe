#include "cardpack/build_info.h"

#include "cardpack/build_info_generated.h"

#include <string>

namespace cardpack {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/CARDPACK_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/CARDPACK_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/CARDPACK_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/CARDPACK_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/CARDPACK_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/CARDPACK_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/CARDPACK_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/CARDPACK_BUILDINFO_CXX_COMPILER_VERSION,
        /*has_httplib=*/static_cast<bool>(CARDPACK_BUILDINFO_WITH_HTTPLIB),
        /*has_webp=*/static_cast<bool>(CARDPACK_BUILDINFO_WITH_WEBP),
    };


    static void append_sv(std::string* out, std::string_view s) noexcept
    {
        if (!out) {
            return;
        }
        out->append(s.data(), s.size());
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->reserve(96);
        line1->append("CardPack v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);
        line1->append(" [zlib,openssl,sqlite");
        if (bi.has_httplib) {
            line1->append(",httplib");
        }
        if (bi.has_webp) {
            line1->append(",webp");
        }
        line1->append("]");
    }

    if (line2) {
        line2->clear();
        line2->reserve(160);
        line2->append("built with ");
        append_sv(line2, bi.cxx_compiler_id);
        line2->append("-");
        append_sv(line2, bi.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, bi.system_name);
        line2->append("/");
        append_sv(line2, bi.system_processor);

        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            append_sv(line2, bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace cardpack
