#pragma once

/** \file logging.hpp
 *  \brief Log level control for the spdlog default logger.
 *
 * Library code logs through spdlog's free functions with a "component: " prefix;
 * this header only lets the configuration layer pick the level.
 */

#include <expected>
#include <string_view>

#include "worldvault/error.hpp"

namespace worldvault::core {

/** Accepts spdlog level names (trace, debug, info, warn, error, critical, off). */
[[nodiscard]] auto apply_log_level(std::string_view level)
    -> std::expected<void, error>;

} // namespace worldvault::core
