#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling by the calling shell.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace worldvault::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,            /**< write/remove/rename failed (disk full, permission denied) */
  access_failed = 1002,        /**< path missing or unreadable */
  source_missing = 1003,       /**< world directory vanished before or during a backup */
  config_invalid = 2001,
  data_integrity = 3001,       /**< archive unreadable, truncated or unsafe */
  precondition_failed = 4001,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "archive.create" */
};

/** \brief Short stable name of a code, for logs and notifications. */
constexpr auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::access_failed: return "access_failed";
    case error_code::source_missing: return "source_missing";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "unknown";
}

} // namespace worldvault::core
