#include "worldvault/backup/repository.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace worldvault::backup {

namespace {

using core::error; using core::error_code;
namespace fs = std::filesystem;

// Owner of an archive whose name carries no parseable timestamp. `stem` is still escaped.
std::string resolve_owner(std::string_view stem, const std::vector<std::string>& known_ids) {
  const std::string* best = nullptr;
  std::size_t best_len = 0;
  for (const auto& id : known_ids) {
    const auto enc = encode_world_id(id);
    if (stem.size() > enc.size() && stem.substr(0, enc.size()) == enc && stem[enc.size()] == '_' &&
        (!best || enc.size() > best_len)) {
      best = &id;
      best_len = enc.size();
    }
  }
  if (best) return *best;
  auto owner = stem;
  if (auto sep = stem.rfind('_'); sep != std::string_view::npos && sep > 0) owner = stem.substr(0, sep);
  if (auto decoded = decode_world_id(owner)) return std::move(*decoded);
  return std::string(owner);
}

} // namespace

bool older_than(const Backup& a, const Backup& b) noexcept {
  if (a.created != b.created) return a.created < b.created;
  return a.archive_name < b.archive_name;
}

std::size_t Inventory::backup_count() const noexcept {
  std::size_t n = 0;
  for (const auto& [id, backups] : by_world) n += backups.size();
  return n;
}

BackupRepository::BackupRepository(fs::path saves_root, fs::path backups_root)
    : saves_root_(std::move(saves_root)), backups_root_(std::move(backups_root)) {}

auto BackupRepository::list_worlds() const -> std::expected<std::vector<world::World>, error> {
  return world::list_worlds(saves_root_);
}

auto BackupRepository::scan() const -> std::expected<std::vector<Backup>, error> {
  std::vector<Backup> out;
  std::error_code ec;
  if (!fs::exists(backups_root_, ec)) return out;

  fs::directory_iterator it(backups_root_, ec);
  if (ec) {
    return std::unexpected(error{error_code::access_failed, "backups root unreadable: " + ec.message(), "backup.repository"});
  }

  // Only needed to attribute archives whose names do not parse.
  std::vector<std::string> known_ids;
  bool have_known = false;

  for (const auto end = fs::directory_iterator{}; it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    std::error_code fec;
    if (!it->is_regular_file(fec) || !has_archive_extension(name)) continue;
    const auto size = it->file_size(fec);
    if (fec) continue; // removed between listing and stat

    Backup b{};
    b.path = it->path();
    b.archive_name = name;
    b.size_bytes = static_cast<std::uint64_t>(size);
    if (auto parsed = parse_archive_name(name)) {
      b.world_id = std::move(parsed->world_id);
      b.created = parsed->created;
      b.timestamp_source = TimestampSource::archive_name;
    } else {
      if (!have_known) {
        have_known = true;
        if (auto wx = list_worlds()) {
          for (auto& w : *wx) known_ids.push_back(std::move(w.id));
        } else {
          spdlog::warn("backup.repository: {}; attributing {} by name only", wx.error().message, name);
        }
      }
      const auto stem = std::string_view(name).substr(0, name.size() - kArchiveExtension.size());
      b.world_id = resolve_owner(stem, known_ids);
      auto ft = it->last_write_time(fec);
      if (fec) continue;
      b.created = to_time_point(ft);
      b.timestamp_source = TimestampSource::modification_time;
      spdlog::warn("backup.repository: {} has no name timestamp; using modification time {} (ordering approximate)",
                   name, format_timestamp(b.created));
    }
    out.push_back(std::move(b));
  }
  if (ec) {
    return std::unexpected(error{error_code::access_failed, "backups root scan failed: " + ec.message(), "backup.repository"});
  }
  std::sort(out.begin(), out.end(), older_than);
  return out;
}

auto BackupRepository::list_backups(std::string_view world_id) const
    -> std::expected<std::vector<Backup>, error> {
  auto all = scan();
  if (!all) return std::unexpected(all.error());
  std::vector<Backup> out;
  for (auto& b : *all) {
    if (b.world_id == world_id) out.push_back(std::move(b));
  }
  return out;
}

auto BackupRepository::inventory() const -> std::expected<Inventory, error> {
  auto all = scan();
  if (!all) return std::unexpected(all.error());
  Inventory inv;
  if (auto wx = list_worlds()) {
    for (const auto& w : *wx) inv.by_world.try_emplace(w.id);
  } else {
    spdlog::debug("backup.repository: inventory without world list: {}", wx.error().message);
  }
  // `all` is globally sorted, so every group stays oldest-first.
  for (auto& b : *all) {
    inv.total_bytes += b.size_bytes;
    inv.by_world[b.world_id].push_back(std::move(b));
  }
  return inv;
}

auto BackupRepository::aggregate_size() const -> std::expected<std::uint64_t, error> {
  auto all = scan();
  if (!all) return std::unexpected(all.error());
  std::uint64_t total = 0;
  for (const auto& b : *all) total += b.size_bytes;
  return total;
}

auto BackupRepository::remove(const Backup& backup) const -> std::expected<bool, error> {
  std::error_code ec;
  const bool removed = fs::remove(backup.path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      spdlog::debug("backup.repository: {} already gone", backup.archive_name);
      return false;
    }
    return std::unexpected(error{error_code::io_failed, "remove " + backup.archive_name + " failed: " + ec.message(), "backup.repository"});
  }
  if (removed) {
    spdlog::info("backup.repository: deleted {} ({} bytes)", backup.archive_name, backup.size_bytes);
  } else {
    spdlog::debug("backup.repository: {} already gone", backup.archive_name);
  }
  return removed;
}

auto BackupRepository::sweep_partials() const -> std::expected<std::size_t, error> {
  std::error_code ec;
  if (!fs::exists(backups_root_, ec)) return std::size_t{0};
  fs::directory_iterator it(backups_root_, ec);
  if (ec) {
    return std::unexpected(error{error_code::access_failed, "backups root unreadable: " + ec.message(), "backup.repository"});
  }
  std::vector<fs::path> partials;
  for (const auto end = fs::directory_iterator{}; it != end; it.increment(ec)) {
    if (is_partial_name(it->path().filename().string())) partials.push_back(it->path());
  }
  if (ec) {
    return std::unexpected(error{error_code::access_failed, "backups root scan failed: " + ec.message(), "backup.repository"});
  }
  std::size_t removed = 0;
  for (const auto& p : partials) {
    std::error_code rec;
    if (fs::remove(p, rec)) {
      ++removed;
      spdlog::info("backup.repository: removed abandoned partial {}", p.filename().string());
    } else if (rec) {
      spdlog::warn("backup.repository: cannot remove partial {}: {}", p.filename().string(), rec.message());
    }
  }
  return removed;
}

auto BackupRepository::ensure_backups_root() const -> std::expected<void, error> {
  std::error_code ec;
  if (fs::is_directory(backups_root_, ec)) return {};
  fs::create_directories(backups_root_, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "cannot create backups root " + backups_root_.string() + ": " + ec.message(), "backup.repository"});
  }
  return {};
}

fs::path BackupRepository::archive_path(std::string_view world_id, TimePoint created) const {
  return backups_root_ / archive_name(world_id, created);
}

} // namespace worldvault::backup
