#pragma once

/** \file config.hpp
 *  \brief Configuration: defaults, YAML file, environment overrides, validation.
 *
 * YAML keys (all optional):
 *   savesRoot: <path>                  directory holding one subdirectory per world
 *   backupsRoot: <path>                directory holding the archives
 *   maxAggregateBytes: <u64>           budget across all worlds (default 5 GiB)
 *   maxAggregateGiB: <float>           same budget in GiB; ignored if maxAggregateBytes is set
 *   minKeepPerWorld: <u64>             eviction floor (default 3)
 *   activeWorldGuardSeconds: <u64>     refuse restores into a world touched this recently (0 disables)
 *   enforceAfterBackup: <bool>         run retention after every backup (default true)
 *   logLevel: <spdlog level name>
 *
 * Environment overrides, applied after the file:
 *   WORLDVAULT_SAVES_ROOT, WORLDVAULT_BACKUPS_ROOT, WORLDVAULT_MAX_AGGREGATE_BYTES,
 *   WORLDVAULT_MIN_KEEP_PER_WORLD, WORLDVAULT_LOG_LEVEL
 */

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>

#include "worldvault/error.hpp"
#include "worldvault/retention/retention.hpp"

namespace worldvault::config {

struct Config {
  std::filesystem::path saves_root;
  std::filesystem::path backups_root;
  retention::RetentionPolicy retention{};
  std::chrono::seconds active_world_guard{60};
  bool enforce_after_backup{true};
  std::string log_level{"info"};
};

/** Paths under core::default_game_data_dir(); policy defaults. */
[[nodiscard]] Config default_config();

/** default_config() overlaid with the keys present in the YAML file. */
[[nodiscard]] auto load_config(const std::filesystem::path& path)
    -> std::expected<Config, core::error>;

[[nodiscard]] auto apply_env_overrides(Config& cfg) -> std::expected<void, core::error>;

/** Both roots set and distinct; the backups root must not lie anywhere inside the saves root. */
[[nodiscard]] auto validate(const Config& cfg) -> std::expected<void, core::error>;

} // namespace worldvault::config
