#pragma once

/** \file service.hpp
 *  \brief Request/response facade called by the shell (UI, tray, timer).
 *
 * The facade holds no timer state. A periodic scheduler lives outside and
 * calls create_backup(), which runs retention afterwards when the
 * configuration asks for it. Operations are blocking; a responsive caller
 * runs them off its interaction thread. Not thread-safe.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "worldvault/archive/engine.hpp"
#include "worldvault/backup/repository.hpp"
#include "worldvault/config.hpp"
#include "worldvault/error.hpp"
#include "worldvault/retention/retention.hpp"
#include "worldvault/world/discovery.hpp"

namespace worldvault {

struct BackupOutcome {
  backup::Backup backup;
  std::optional<retention::EvictionReport> eviction;   // absent when retention did not run or failed
  std::optional<core::error> eviction_error;           // inventory failure of the follow-up pass
};

class BackupService {
public:
  /** Validate, apply the log level, create the backups root, sweep abandoned partials. */
  static auto open(config::Config cfg, archive::ArchiveEngine::Clock clock = {})
      -> std::expected<BackupService, core::error>;

  auto list_worlds() const -> std::expected<std::vector<world::World>, core::error>;
  auto list_backups(std::string_view world_id) const -> std::expected<std::vector<backup::Backup>, core::error>;
  auto aggregate_size() const -> std::expected<std::uint64_t, core::error>;

  /** not_found for an unknown world; a retention failure never undoes the backup. */
  auto create_backup(std::string_view world_id) -> std::expected<BackupOutcome, core::error>;

  /**
   * Replace saves_root/<gamemode>/<world> with the archive contents. invalid_argument
   * unless world_id has that form; precondition_failed
   * while the world is in use (see Config::active_world_guard).
   */
  auto restore_backup(const backup::Backup& backup, std::string_view world_id)
      -> std::expected<archive::RestoreReport, core::error>;

  /** Explicit user delete; ignores the floor. Deleting a missing archive succeeds. */
  auto delete_backup(const backup::Backup& backup) -> std::expected<void, core::error>;

  auto enforce() const -> std::expected<retention::EvictionReport, core::error>;
  auto enforce(const retention::RetentionPolicy& policy) const
      -> std::expected<retention::EvictionReport, core::error>;

  const config::Config& config() const noexcept { return config_; }

private:
  BackupService(config::Config cfg, archive::ArchiveEngine::Clock clock);

  config::Config config_;
  backup::BackupRepository repository_;
  archive::ArchiveEngine engine_;
  retention::RetentionManager retention_;
};

} // namespace worldvault
