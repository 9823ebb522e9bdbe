#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

/**
 * \file log.h
 * \brief Process-wide `cardpack` logger.
 */

namespace cardpack {

/// Returns the shared `cardpack` logger, creating a stderr sink on first use.
std::shared_ptr<spdlog::logger>
logger();

/**
 * \brief Sets the logger level from a name (`trace`..`critical`, `off`).
 *
 * Returns false and leaves the level unchanged for unknown names.
 */
bool
set_log_level(std::string_view level);

}  // namespace cardpack
