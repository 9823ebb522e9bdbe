#include "cardpack/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace cardpack {

std::shared_ptr<spdlog::logger>
logger()
{
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get("cardpack");
        if (!instance) {
            instance = spdlog::stderr_color_mt("cardpack");
        }
        instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    });
    return instance;
}


bool
set_log_level(std::string_view level)
{
    const spdlog::level::level_enum lvl = spdlog::level::from_str(
        std::string(level));
    // from_str maps unknown names to `off`; only accept an explicit "off".
    if (lvl == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(lvl);
    return true;
}

}  // namespace cardpack
