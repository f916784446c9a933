#pragma once

/** \file repository.hpp
 *  \brief Backup inventory derived from a live scan of the backups directory.
 *
 * Notes
 * - There is no index file; every query rescans the directory, so out-of-band
 *   deletions and manual copies are picked up on the next call.
 * - Timestamps come from the archive name. When the name does not parse the
 *   file modification time is used instead and the Backup is flagged
 *   (TimestampSource::modification_time); mtime is rewritten by copies and
 *   moves, so ordering of such backups is approximate.
 * - Deterministic ordering policy (applies to every listing and to eviction):
 *   created ascending, then archive name ascending.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "worldvault/backup/naming.hpp"
#include "worldvault/error.hpp"
#include "worldvault/world/discovery.hpp"

namespace worldvault::backup {

enum class TimestampSource : std::uint8_t { archive_name, modification_time };

struct Backup {
  std::string world_id;
  std::filesystem::path path;
  std::string archive_name;    // file name within the backups root
  TimePoint created{};
  std::uint64_t size_bytes{};
  TimestampSource timestamp_source{TimestampSource::archive_name};

  /** True when `created` is a modification-time fallback. */
  [[nodiscard]] bool approximate_order() const noexcept {
    return timestamp_source == TimestampSource::modification_time;
  }
};

/** Strict weak order: older first, ties by archive name. */
[[nodiscard]] bool older_than(const Backup& a, const Backup& b) noexcept;

/** Backups grouped by owning world id; each group is oldest-first. */
struct Inventory {
  std::map<std::string, std::vector<Backup>> by_world;
  std::uint64_t total_bytes{};

  [[nodiscard]] std::size_t backup_count() const noexcept;
};

class BackupRepository {
public:
  BackupRepository(std::filesystem::path saves_root, std::filesystem::path backups_root);

  [[nodiscard]] auto list_worlds() const -> std::expected<std::vector<world::World>, core::error>;

  /** Backups of one world, oldest-first. Empty if the world has none. */
  [[nodiscard]] auto list_backups(std::string_view world_id) const
      -> std::expected<std::vector<Backup>, core::error>;

  /** Every backup on disk grouped by world; discovered worlds without backups get an empty group. */
  [[nodiscard]] auto inventory() const -> std::expected<Inventory, core::error>;

  /** Sum of all archive sizes, recomputed from disk. */
  [[nodiscard]] auto aggregate_size() const -> std::expected<std::uint64_t, core::error>;

  /**
   * Delete one archive. Returns true if it was removed and false if it was
   * already gone; a missing file is not an error.
   */
  [[nodiscard]] auto remove(const Backup& backup) const -> std::expected<bool, core::error>;

  /** Delete *.zip.part leftovers of interrupted writes; returns how many were removed. */
  [[nodiscard]] auto sweep_partials() const -> std::expected<std::size_t, core::error>;

  /** Create the backups root if needed. */
  [[nodiscard]] auto ensure_backups_root() const -> std::expected<void, core::error>;

  /** Final path an archive of `world_id` created at `created` would have. */
  [[nodiscard]] std::filesystem::path archive_path(std::string_view world_id, TimePoint created) const;

  const std::filesystem::path& saves_root() const noexcept { return saves_root_; }
  const std::filesystem::path& backups_root() const noexcept { return backups_root_; }

private:
  auto scan() const -> std::expected<std::vector<Backup>, core::error>;

  std::filesystem::path saves_root_;
  std::filesystem::path backups_root_;
};

} // namespace worldvault::backup
