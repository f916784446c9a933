#include "worldvault/archive/engine.hpp"

#include "worldvault/platform/filesystem.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace worldvault::archive {

namespace {

using core::error; using core::error_code;
namespace fs = std::filesystem;

using WriteHandle = std::unique_ptr<struct archive, int (*)(struct archive*)>;
using ReadHandle = std::unique_ptr<struct archive, int (*)(struct archive*)>;
using EntryHandle = std::unique_ptr<struct archive_entry, void (*)(struct archive_entry*)>;

constexpr std::size_t kReadBlock = 64 * 1024;
constexpr int kMaxNameAttempts = 24 * 60 * 60;

struct SourceEntry {
  std::string rel;   // generic, relative to the world directory
  fs::path abs;
  bool is_dir{};
};

std::string archive_message(struct archive* a, const char* what) {
  const char* detail = a ? archive_error_string(a) : nullptr;
  return std::string(what) + (detail ? std::string(": ") + detail : std::string());
}

// Distinguishes a vanished world from other read failures.
error source_error(const fs::path& world_dir, const std::string& what) {
  std::error_code ec;
  if (!fs::exists(world_dir, ec)) {
    return error{error_code::source_missing, "world directory disappeared: " + world_dir.string(), "archive.create"};
  }
  return error{error_code::io_failed, what, "archive.create"};
}

auto collect_sources(const fs::path& world_dir) -> std::expected<std::vector<SourceEntry>, error> {
  std::vector<SourceEntry> out;
  std::error_code ec;
  fs::recursive_directory_iterator it(world_dir, ec);
  if (ec) return std::unexpected(source_error(world_dir, "cannot read world directory: " + ec.message()));
  for (const auto end = fs::recursive_directory_iterator{}; it != end; it.increment(ec)) {
    std::error_code sec;
    if (it->is_symlink(sec)) {
      spdlog::debug("archive.create: skipping symlink {}", it->path().string());
      continue;
    }
    const bool is_dir = it->is_directory(sec);
    if (!is_dir && !it->is_regular_file(sec)) continue;
    out.push_back(SourceEntry{it->path().lexically_relative(world_dir).generic_string(), it->path(), is_dir});
  }
  if (ec) return std::unexpected(source_error(world_dir, "world directory scan failed: " + ec.message()));
  std::sort(out.begin(), out.end(), [](const SourceEntry& a, const SourceEntry& b){ return a.rel < b.rel; });
  return out;
}

auto read_whole_file(const fs::path& p, const fs::path& world_dir) -> std::expected<std::vector<char>, error> {
  std::ifstream in(p, std::ios::binary);
  if (!in) return std::unexpected(source_error(world_dir, "cannot open " + p.string()));
  std::vector<char> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::unexpected(source_error(world_dir, "read failed: " + p.string()));
  return data;
}

auto write_zip(const fs::path& world_dir, const fs::path& out_path) -> std::expected<ArchiveStats, error> {
  auto sources = collect_sources(world_dir);
  if (!sources) return std::unexpected(sources.error());

  WriteHandle aw(archive_write_new(), &archive_write_free);
  if (!aw) return std::unexpected(error{error_code::internal, "archive_write_new failed", "archive.create"});
  if (archive_write_set_format_zip(aw.get()) != ARCHIVE_OK ||
      archive_write_set_options(aw.get(), "zip:compression=deflate") != ARCHIVE_OK) {
    return std::unexpected(error{error_code::internal, archive_message(aw.get(), "zip writer setup failed"), "archive.create"});
  }
  if (archive_write_open_filename(aw.get(), out_path.string().c_str()) != ARCHIVE_OK) {
    return std::unexpected(error{error_code::io_failed, archive_message(aw.get(), "cannot open archive for writing"), "archive.create"});
  }

  ArchiveStats stats{};
  for (const auto& src : *sources) {
    EntryHandle entry(archive_entry_new(), &archive_entry_free);
    std::error_code tec;
    const auto mtime = fs::last_write_time(src.abs, tec);
    if (!tec) archive_entry_set_mtime(entry.get(), backup::to_time_point(mtime).time_since_epoch().count(), 0);

    std::vector<char> data;
    if (src.is_dir) {
      archive_entry_set_pathname(entry.get(), (src.rel + "/").c_str());
      archive_entry_set_filetype(entry.get(), AE_IFDIR);
      archive_entry_set_perm(entry.get(), 0755);
    } else {
      auto dx = read_whole_file(src.abs, world_dir);
      if (!dx) return std::unexpected(dx.error());
      data = std::move(*dx);
      archive_entry_set_pathname(entry.get(), src.rel.c_str());
      archive_entry_set_filetype(entry.get(), AE_IFREG);
      archive_entry_set_perm(entry.get(), 0644);
      archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
    }
    if (archive_write_header(aw.get(), entry.get()) < ARCHIVE_WARN) {
      return std::unexpected(error{error_code::io_failed, archive_message(aw.get(), "write header failed"), "archive.create"});
    }
    if (!data.empty()) {
      if (archive_write_data(aw.get(), data.data(), data.size()) < 0) {
        return std::unexpected(error{error_code::io_failed, archive_message(aw.get(), "write data failed"), "archive.create"});
      }
    }
    ++stats.entries;
    if (!src.is_dir) ++stats.files;
    stats.uncompressed_bytes += data.size();
  }
  if (archive_write_close(aw.get()) != ARCHIVE_OK) {
    return std::unexpected(error{error_code::io_failed, archive_message(aw.get(), "finalizing archive failed"), "archive.create"});
  }
  return stats;
}

// Rejects absolute paths and any ".." component.
bool is_safe_entry(const fs::path& rel) {
  if (rel.empty() || rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) return false;
  for (const auto& part : rel) {
    if (part == "..") return false;
  }
  return true;
}

// Streams every entry of `archive_path`; extracts under `dest` when it is non-empty.
auto read_zip(const fs::path& archive_path, const fs::path& dest, const char* component)
    -> std::expected<ArchiveStats, error> {
  ReadHandle ar(archive_read_new(), &archive_read_free);
  if (!ar) return std::unexpected(error{error_code::internal, "archive_read_new failed", component});
  archive_read_support_format_zip(ar.get());
  if (archive_read_open_filename(ar.get(), archive_path.string().c_str(), 10240) != ARCHIVE_OK) {
    return std::unexpected(error{error_code::data_integrity, archive_message(ar.get(), "cannot open archive"), component});
  }

  ArchiveStats stats{};
  std::vector<char> buf(kReadBlock);
  for (;;) {
    struct archive_entry* entry = nullptr;
    const int r = archive_read_next_header(ar.get(), &entry);
    if (r == ARCHIVE_EOF) break;
    if (r < ARCHIVE_WARN) {
      return std::unexpected(error{error_code::data_integrity, archive_message(ar.get(), "corrupt archive header"), component});
    }
    const char* name = archive_entry_pathname(entry);
    if (name == nullptr || !is_safe_entry(fs::path(name))) {
      return std::unexpected(error{error_code::data_integrity, std::string("unsafe entry path: ") + (name ? name : "<null>"), component});
    }
    const fs::path rel(name);
    const auto type = archive_entry_filetype(entry);
    ++stats.entries;

    if (type == AE_IFDIR) {
      if (!dest.empty()) {
        std::error_code ec; fs::create_directories(dest / rel, ec);
        if (ec) return std::unexpected(error{error_code::io_failed, "create " + (dest / rel).string() + " failed: " + ec.message(), component});
      }
      continue;
    }
    if (type != AE_IFREG) {
      spdlog::debug("{}: skipping non-regular entry {}", component, name);
      (void)archive_read_data_skip(ar.get());
      continue;
    }

    std::ofstream out;
    if (!dest.empty()) {
      const auto target = dest / rel;
      std::error_code ec; fs::create_directories(target.parent_path(), ec);
      if (ec) return std::unexpected(error{error_code::io_failed, "create " + target.parent_path().string() + " failed: " + ec.message(), component});
      out.open(target, std::ios::binary | std::ios::trunc);
      if (!out) return std::unexpected(error{error_code::io_failed, "cannot write " + target.string(), component});
    }
    for (;;) {
      const auto n = archive_read_data(ar.get(), buf.data(), buf.size());
      if (n == 0) break;
      if (n < 0) {
        return std::unexpected(error{error_code::data_integrity, archive_message(ar.get(), "truncated or corrupt entry"), component});
      }
      stats.uncompressed_bytes += static_cast<std::uint64_t>(n);
      if (out.is_open()) out.write(buf.data(), n);
    }
    if (out.is_open()) {
      out.close();
      if (out.fail()) return std::unexpected(error{error_code::io_failed, "write failed under " + dest.string(), component});
      // Keep the archived mtime; a fresh one would make the world look in use.
      if (archive_entry_mtime_is_set(entry)) {
        const auto sys = std::chrono::system_clock::from_time_t(archive_entry_mtime(entry));
        std::error_code ec;
        fs::last_write_time(dest / rel,
            std::chrono::time_point_cast<fs::file_time_type::duration>(std::chrono::file_clock::from_sys(sys)), ec);
        if (ec) return std::unexpected(error{error_code::io_failed, "set mtime of " + (dest / rel).string() + " failed: " + ec.message(), component});
      }
    }
    ++stats.files;
  }
  return stats;
}

} // namespace

ArchiveEngine::ArchiveEngine(backup::BackupRepository repository, Clock clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {}

auto ArchiveEngine::now() const -> backup::TimePoint {
  return std::chrono::floor<std::chrono::seconds>(clock_ ? clock_() : std::chrono::system_clock::now());
}

auto ArchiveEngine::create_backup(const world::World& world) -> std::expected<backup::Backup, error> {
  std::error_code ec;
  if (!fs::is_directory(world.path, ec)) {
    return std::unexpected(error{error_code::source_missing, "world directory missing: " + world.path.string(), "archive.create"});
  }
  if (auto rx = repository_.ensure_backups_root(); !rx) return std::unexpected(rx.error());

  auto created = now();
  auto final_path = repository_.archive_path(world.id, created);
  auto tmp_path = fs::path(final_path.string() + std::string(backup::kPartialSuffix));
  for (int attempt = 0; fs::exists(final_path, ec) || fs::exists(tmp_path, ec); ++attempt) {
    if (attempt >= kMaxNameAttempts) {
      return std::unexpected(error{error_code::io_failed, "no free archive name for " + world.id, "archive.create"});
    }
    created += std::chrono::seconds{1};
    final_path = repository_.archive_path(world.id, created);
    tmp_path = fs::path(final_path.string() + std::string(backup::kPartialSuffix));
  }

  auto wx = write_zip(world.path, tmp_path);
  if (!wx) {
    std::error_code rec; (void)fs::remove(tmp_path, rec);
    spdlog::error("archive.create: backup of {} failed: {}", world.id, wx.error().message);
    return std::unexpected(wx.error());
  }
  if (auto px = platform::publish_atomic(tmp_path, final_path); !px) {
    spdlog::error("archive.create: publishing {} failed: {}", final_path.filename().string(), px.error().message);
    return std::unexpected(px.error());
  }

  backup::Backup b{};
  b.world_id = world.id;
  b.path = final_path;
  b.archive_name = final_path.filename().string();
  b.created = created;
  b.size_bytes = static_cast<std::uint64_t>(fs::file_size(final_path, ec));
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "stat of new archive failed: " + ec.message(), "archive.create"});
  }
  b.timestamp_source = backup::TimestampSource::archive_name;
  spdlog::info("archive.create: {} ({} entries, {} bytes raw, {} bytes archived)",
               b.archive_name, wx->entries, wx->uncompressed_bytes, b.size_bytes);
  return b;
}

auto ArchiveEngine::restore_backup(const backup::Backup& backup, const fs::path& target_dir)
    -> std::expected<RestoreReport, error> {
  std::error_code ec;
  if (!fs::is_regular_file(backup.path, ec)) {
    return std::unexpected(error{error_code::not_found, "archive missing: " + backup.path.string(), "archive.restore"});
  }
  auto target = fs::absolute(target_dir, ec).lexically_normal();
  if (ec) return std::unexpected(error{error_code::io_failed, "cannot resolve " + target_dir.string(), "archive.restore"});
  if (!target.has_filename()) target = target.parent_path();
  const auto parent = target.parent_path();
  const auto leaf = target.filename().string();
  const auto staging = parent / ("." + leaf + ".worldvault-restore");
  const auto previous = parent / ("." + leaf + ".worldvault-previous");

  fs::create_directories(parent, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "cannot create " + parent.string() + ": " + ec.message(), "archive.restore"});
  fs::remove_all(staging, ec);
  fs::create_directories(staging, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "cannot create staging directory: " + ec.message(), "archive.restore"});

  auto rx = read_zip(backup.path, staging, "archive.restore");
  if (!rx) {
    std::error_code rec; fs::remove_all(staging, rec);
    spdlog::error("archive.restore: {} not applied, target untouched: {}", backup.archive_name, rx.error().message);
    return std::unexpected(rx.error());
  }

  RestoreReport report{};
  report.replaced_existing = fs::exists(target, ec);
  if (report.replaced_existing) {
    fs::remove_all(previous, ec);
    fs::rename(target, previous, ec);
    if (ec) {
      std::error_code rec; fs::remove_all(staging, rec);
      return std::unexpected(error{error_code::io_failed, "cannot move current world aside (target untouched): " + ec.message(), "archive.restore"});
    }
  }
  fs::rename(staging, target, ec);
  if (ec) {
    const auto cause = ec.message();
    if (report.replaced_existing) {
      std::error_code bec; fs::rename(previous, target, bec);
      if (bec) {
        return std::unexpected(error{error_code::io_failed,
            "restore partially applied: previous contents at " + previous.string() + ", extracted archive at " + staging.string() + ": " + cause,
            "archive.restore"});
      }
    }
    std::error_code rec; fs::remove_all(staging, rec);
    return std::unexpected(error{error_code::io_failed, "cannot move restored world into place (target untouched): " + cause, "archive.restore"});
  }
  if (report.replaced_existing) {
    fs::remove_all(previous, ec);
    if (ec) spdlog::warn("archive.restore: leftover {} could not be removed: {}", previous.string(), ec.message());
  }
  platform::sync_directory(parent);

  report.files_restored = rx->files;
  report.bytes_restored = rx->uncompressed_bytes;
  spdlog::info("archive.restore: {} -> {} ({} files, {} bytes)", backup.archive_name, target.string(),
               report.files_restored, report.bytes_restored);
  return report;
}

auto ArchiveEngine::verify_archive(const fs::path& archive_path) -> std::expected<ArchiveStats, error> {
  std::error_code ec;
  if (!fs::is_regular_file(archive_path, ec)) {
    return std::unexpected(error{error_code::not_found, "archive missing: " + archive_path.string(), "archive.verify"});
  }
  return read_zip(archive_path, fs::path{}, "archive.verify");
}

} // namespace worldvault::archive
