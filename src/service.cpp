#include "worldvault/service.hpp"

#include "worldvault/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace worldvault {

using core::error; using core::error_code;

BackupService::BackupService(config::Config cfg, archive::ArchiveEngine::Clock clock)
    : config_(std::move(cfg)),
      repository_(config_.saves_root, config_.backups_root),
      engine_(repository_, std::move(clock)),
      retention_(repository_) {}

auto BackupService::open(config::Config cfg, archive::ArchiveEngine::Clock clock)
    -> std::expected<BackupService, error> {
  if (auto vx = config::validate(cfg); !vx) return std::unexpected(vx.error());
  if (auto lx = core::apply_log_level(cfg.log_level); !lx) return std::unexpected(lx.error());

  BackupService svc(std::move(cfg), std::move(clock));
  if (auto rx = svc.repository_.ensure_backups_root(); !rx) return std::unexpected(rx.error());
  auto sx = svc.repository_.sweep_partials();
  if (!sx) return std::unexpected(sx.error());
  spdlog::debug("service: opened saves={} backups={} (swept {} partial archive(s))",
                svc.config_.saves_root.string(), svc.config_.backups_root.string(), *sx);
  return svc;
}

auto BackupService::list_worlds() const -> std::expected<std::vector<world::World>, error> {
  return repository_.list_worlds();
}

auto BackupService::list_backups(std::string_view world_id) const
    -> std::expected<std::vector<backup::Backup>, error> {
  return repository_.list_backups(world_id);
}

auto BackupService::aggregate_size() const -> std::expected<std::uint64_t, error> {
  return repository_.aggregate_size();
}

auto BackupService::create_backup(std::string_view world_id) -> std::expected<BackupOutcome, error> {
  auto worlds = repository_.list_worlds();
  if (!worlds) return std::unexpected(worlds.error());
  auto it = std::find_if(worlds->begin(), worlds->end(), [&](const world::World& w){ return w.id == world_id; });
  if (it == worlds->end()) {
    return std::unexpected(error{error_code::not_found, "unknown world \"" + std::string(world_id) + "\"", "service.create"});
  }

  auto bx = engine_.create_backup(*it);
  if (!bx) return std::unexpected(bx.error());

  BackupOutcome outcome{std::move(*bx), std::nullopt, std::nullopt};
  if (config_.enforce_after_backup) {
    auto ex = retention_.enforce(config_.retention);
    if (ex) {
      outcome.eviction = std::move(*ex);
    } else {
      outcome.eviction_error = ex.error();
    }
  }
  return outcome;
}

auto BackupService::restore_backup(const backup::Backup& backup, std::string_view world_id)
    -> std::expected<archive::RestoreReport, error> {
  const auto target = world::world_path(config_.saves_root, world_id);
  if (!target) {
    return std::unexpected(error{error_code::invalid_argument,
        "invalid world id \"" + std::string(world_id) + "\" (expected <gamemode>/<world>)", "service.restore"});
  }
  if (config_.active_world_guard.count() > 0 &&
      world::is_world_active(*target, std::filesystem::file_time_type::clock::now(), config_.active_world_guard)) {
    return std::unexpected(error{error_code::precondition_failed,
        "world \"" + std::string(world_id) + "\" is in use; close the game before restoring", "service.restore"});
  }
  return engine_.restore_backup(backup, *target);
}

auto BackupService::delete_backup(const backup::Backup& backup) -> std::expected<void, error> {
  auto rx = repository_.remove(backup);
  if (!rx) return std::unexpected(rx.error());
  return {};
}

auto BackupService::enforce() const -> std::expected<retention::EvictionReport, error> {
  return retention_.enforce(config_.retention);
}

auto BackupService::enforce(const retention::RetentionPolicy& policy) const
    -> std::expected<retention::EvictionReport, error> {
  return retention_.enforce(policy);
}

} // namespace worldvault
