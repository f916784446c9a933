#pragma once

/** \file engine.hpp
 *  \brief Zip archive creation and restoration for world save directories.
 *
 * create_backup
 * - Entries are paths relative to the world directory, directories included,
 *   emitted in sorted order. Symbolic links are skipped.
 * - The archive is written to <name>.zip.part and published with
 *   platform::publish_atomic, so an interrupted write is never listed.
 * - If the target name is taken, the timestamp is advanced one second at a
 *   time until a free name is found.
 *
 * restore_backup
 * - Full replacement of the target directory, never a merge. The archive is
 *   extracted into a hidden sibling staging directory first; the target is
 *   only touched after every entry was read and written successfully.
 * - No safety backup of the current state is taken; callers that want one
 *   call create_backup first.
 *
 * Not reentrant for the same world; callers serialize per world.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>

#include "worldvault/backup/repository.hpp"
#include "worldvault/error.hpp"
#include "worldvault/world/discovery.hpp"

namespace worldvault::archive {

struct RestoreReport {
  std::uint64_t files_restored{};
  std::uint64_t bytes_restored{};
  bool replaced_existing{false};
};

struct ArchiveStats {
  std::uint64_t entries{};             // files and directories
  std::uint64_t files{};
  std::uint64_t uncompressed_bytes{};
};

class ArchiveEngine {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  /** An empty clock means std::chrono::system_clock::now. */
  explicit ArchiveEngine(backup::BackupRepository repository, Clock clock = {});

  /** io_failed on write errors, source_missing if the world directory is gone. */
  [[nodiscard]] auto create_backup(const world::World& world)
      -> std::expected<backup::Backup, core::error>;

  /**
   * data_integrity if the archive cannot be fully read (target untouched),
   * io_failed on write errors, not_found if the archive is missing.
   */
  [[nodiscard]] auto restore_backup(const backup::Backup& backup, const std::filesystem::path& target_dir)
      -> std::expected<RestoreReport, core::error>;

  /** Read every entry to the end without extracting. */
  [[nodiscard]] static auto verify_archive(const std::filesystem::path& archive_path)
      -> std::expected<ArchiveStats, core::error>;

  const backup::BackupRepository& repository() const noexcept { return repository_; }

private:
  auto now() const -> backup::TimePoint;

  backup::BackupRepository repository_;
  Clock clock_;
};

} // namespace worldvault::archive
