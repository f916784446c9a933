#pragma once

/** \file naming.hpp
 *  \brief Archive file naming.
 *
 * Format:
 *   <worldId>_<YYYYMMDD-HHMMSS>.zip      (UTC, fixed width)
 *   <worldId>_<YYYYMMDD-HHMMSS>.zip.part (in-progress write, never listed)
 *
 * Within one world, lexicographic name order equals creation order. World ids
 * ("<gamemode>/<name>") are stored escaped: '%' -> "%25", '/' -> "%2F",
 * '\\' -> "%5C", so Sandbox/Muldraugh becomes Sandbox%2FMuldraugh. Ids may
 * contain '_'; the timestamp is always the last 15 characters of the stem.
 */

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace worldvault::backup {

using TimePoint = std::chrono::sys_seconds;

inline constexpr std::string_view kArchiveExtension = ".zip";
inline constexpr std::string_view kPartialSuffix = ".part";
inline constexpr std::size_t kTimestampWidth = 15; // YYYYMMDD-HHMMSS

struct ParsedArchiveName {
  std::string world_id;
  TimePoint created;
};

/** "YYYYMMDD-HHMMSS" in UTC. */
std::string format_timestamp(TimePoint t);

/** Strict inverse of format_timestamp; rejects out-of-range fields. */
std::optional<TimePoint> parse_timestamp(std::string_view text);

/** World id as it appears in a file name. */
std::string encode_world_id(std::string_view world_id);

/** Inverse of encode_world_id; nullopt on a malformed escape. */
std::optional<std::string> decode_world_id(std::string_view encoded);

std::string archive_name(std::string_view world_id, TimePoint created);

/** Parses a full file name (with extension); nullopt if it does not follow the format. */
std::optional<ParsedArchiveName> parse_archive_name(std::string_view file_name);

/** Filesystem time converted to system_clock, truncated to whole seconds. */
TimePoint to_time_point(std::filesystem::file_time_type ft);

/** True for names ending in ".zip" (candidates for inventory). */
bool has_archive_extension(std::string_view file_name) noexcept;

/** True for names ending in ".zip.part". */
bool is_partial_name(std::string_view file_name) noexcept;

} // namespace worldvault::backup
