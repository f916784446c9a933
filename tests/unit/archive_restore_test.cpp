#include <catch2/catch_all.hpp>
#include <worldvault/archive/engine.hpp>
#include <tests/support/fs_fixtures.hpp>

#include <archive.h>
#include <archive_entry.h>

using namespace worldvault;
namespace fs = std::filesystem;

namespace {

archive::ArchiveEngine make_engine(const fs::path& saves, const fs::path& backups) {
  const auto t = *backup::parse_timestamp("20240601-120000");
  return archive::ArchiveEngine(backup::BackupRepository(saves, backups),
                                [t]{ return std::chrono::system_clock::time_point(t); });
}

backup::Backup backup_of(const fs::path& path) {
  backup::Backup b{};
  b.world_id = "Crafted";
  b.path = path;
  b.archive_name = path.filename().string();
  return b;
}

// Single-entry zip with an arbitrary entry name, bypassing the engine's own path handling.
void write_raw_zip(const fs::path& out, const std::string& entry_name, const std::string& content) {
  struct archive* a = archive_write_new();
  REQUIRE(a != nullptr);
  REQUIRE(archive_write_set_format_zip(a) == ARCHIVE_OK);
  REQUIRE(archive_write_open_filename(a, out.string().c_str()) == ARCHIVE_OK);
  struct archive_entry* e = archive_entry_new();
  archive_entry_set_pathname(e, entry_name.c_str());
  archive_entry_set_filetype(e, AE_IFREG);
  archive_entry_set_perm(e, 0644);
  archive_entry_set_size(e, static_cast<la_int64_t>(content.size()));
  REQUIRE(archive_write_header(a, e) >= ARCHIVE_WARN);
  REQUIRE(archive_write_data(a, content.data(), content.size()) == static_cast<la_ssize_t>(content.size()));
  archive_entry_free(e);
  REQUIRE(archive_write_close(a) == ARCHIVE_OK);
  archive_write_free(a);
}

} // namespace

TEST_CASE("restore into an empty location reproduces the world", "[archive][restore]") {
  test_support::TempDir dir("restore_roundtrip");
  const auto saves = dir / "Saves";
  const auto world_dir = test_support::make_world(saves, "Sandbox/Muldraugh", {
      {"players.db", "players"},
      {"map_meta.bin", test_support::pseudo_random_bytes(3000, 7)},
      {"map/0_0.bin", std::string(10000, 'z')},
      {"map/deep/1_1.bin", ""}});
  auto engine = make_engine(saves, dir / "Backups");
  auto b = engine.create_backup(world::World{"Sandbox/Muldraugh", "Sandbox", "Muldraugh", world_dir});
  REQUIRE(b.has_value());

  const auto target = dir / "Restored" / "Muldraugh";
  auto r = engine.restore_backup(*b, target);
  REQUIRE(r.has_value());
  REQUIRE_FALSE(r->replaced_existing);
  REQUIRE(r->files_restored == 4);
  REQUIRE(r->bytes_restored == 7 + 3000 + 10000);
  REQUIRE(test_support::snapshot_tree(target) == test_support::snapshot_tree(world_dir));
}

TEST_CASE("restore replaces the target instead of merging", "[archive][restore]") {
  test_support::TempDir dir("restore_replace");
  const auto saves = dir / "Saves";
  const auto world_dir = test_support::make_world(saves, "Sandbox/W", {{"players.db", "v1"}, {"map/a.bin", "a1"}});
  auto engine = make_engine(saves, dir / "Backups");
  auto b = engine.create_backup(world::World{"Sandbox/W", "Sandbox", "W", world_dir});
  REQUIRE(b.has_value());
  const auto expected = test_support::snapshot_tree(world_dir);

  test_support::write_file(world_dir / "players.db", "v2");
  test_support::write_file(world_dir / "stale.txt", "created after the backup");
  test_support::write_file(world_dir / "map/b.bin", "b2");

  auto r = engine.restore_backup(*b, world_dir);
  REQUIRE(r.has_value());
  REQUIRE(r->replaced_existing);
  REQUIRE(test_support::snapshot_tree(world_dir) == expected);
  REQUIRE_FALSE(fs::exists(world_dir / "stale.txt"));

  // no staging or previous-state directories left beside the world
  for (const auto& de : fs::directory_iterator(saves / "Sandbox")) {
    REQUIRE(de.path().filename() == "W");
  }
}

TEST_CASE("truncated archive leaves the target untouched", "[archive][restore]") {
  test_support::TempDir dir("restore_truncated");
  const auto saves = dir / "Saves";
  const auto world_dir = test_support::make_world(saves, "Sandbox/W", {{"big.bin", test_support::pseudo_random_bytes(64 * 1024, 42)}});
  auto engine = make_engine(saves, dir / "Backups");
  auto b = engine.create_backup(world::World{"Sandbox/W", "Sandbox", "W", world_dir});
  REQUIRE(b.has_value());
  fs::resize_file(b->path, b->size_bytes / 2);

  test_support::write_file(world_dir / "players.db", "current state");
  const auto before = test_support::snapshot_tree(world_dir);

  auto r = engine.restore_backup(*b, world_dir);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::data_integrity);
  REQUIRE(test_support::snapshot_tree(world_dir) == before);
  for (const auto& de : fs::directory_iterator(saves / "Sandbox")) {
    REQUIRE(de.path().filename() == "W");
  }

  auto v = archive::ArchiveEngine::verify_archive(b->path);
  REQUIRE_FALSE(v.has_value());
  REQUIRE(v.error().code == core::error_code::data_integrity);
}

TEST_CASE("entries escaping the target are rejected", "[archive][restore]") {
  test_support::TempDir dir("restore_unsafe");
  const auto saves = dir / "Saves";
  const auto backups = dir / "Backups";
  const auto world_dir = test_support::make_world(saves, "Sandbox/W", {{"players.db", "keep"}});
  std::error_code ec; fs::create_directories(backups, ec);
  const auto crafted = backups / "W_20240101-000000.zip";
  write_raw_zip(crafted, "../escaped.txt", "payload");

  auto engine = make_engine(saves, backups);
  auto r = engine.restore_backup(backup_of(crafted), world_dir);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::data_integrity);
  REQUIRE_FALSE(fs::exists(saves / "Sandbox" / "escaped.txt"));
  REQUIRE(test_support::read_file(world_dir / "players.db") == "keep");
}

TEST_CASE("restoring a missing archive is not_found", "[archive][restore]") {
  test_support::TempDir dir("restore_missing");
  auto engine = make_engine(dir / "Saves", dir / "Backups");
  auto r = engine.restore_backup(backup_of(dir / "Backups" / "W_20240101-000000.zip"), dir / "Saves" / "W");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::not_found);
  REQUIRE_FALSE(fs::exists(dir / "Saves" / "W"));
}

TEST_CASE("verify reads a healthy archive to the end", "[archive][verify]") {
  test_support::TempDir dir("verify_ok");
  std::error_code ec; fs::create_directories(dir / "Backups", ec);
  const auto zip = dir / "Backups" / "X_20240101-000000.zip";
  write_raw_zip(zip, "players.db", "hello");
  auto v = archive::ArchiveEngine::verify_archive(zip);
  REQUIRE(v.has_value());
  REQUIRE(v->files == 1);
  REQUIRE(v->uncompressed_bytes == 5);

  auto missing = archive::ArchiveEngine::verify_archive(dir / "Backups" / "nope.zip");
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == core::error_code::not_found);
}

TEST_CASE("restored files keep their archived modification times", "[archive][restore]") {
  test_support::TempDir dir("restore_mtime");
  const auto saves = dir / "Saves";
  const auto world_dir = test_support::make_world(saves, "Sandbox/W", {{"players.db", "p"}, {"map_meta.bin", "m"}});
  const auto saved_at = *backup::parse_timestamp("20240115-083000");
  const auto saved_ft = std::chrono::time_point_cast<fs::file_time_type::duration>(std::chrono::file_clock::from_sys(saved_at));
  fs::last_write_time(world_dir / "players.db", saved_ft);
  fs::last_write_time(world_dir / "map_meta.bin", saved_ft);

  auto engine = make_engine(saves, dir / "Backups");
  auto b = engine.create_backup(world::World{"Sandbox/W", "Sandbox", "W", world_dir});
  REQUIRE(b.has_value());
  auto r = engine.restore_backup(*b, world_dir);
  REQUIRE(r.has_value());

  for (const char* f : {"players.db", "map_meta.bin"}) {
    const auto restored = fs::last_write_time(world_dir / f);
    const auto drift = restored > saved_ft ? restored - saved_ft : saved_ft - restored;
    REQUIRE(drift <= std::chrono::seconds{2});
  }
  REQUIRE_FALSE(world::is_world_active(world_dir, fs::file_time_type::clock::now(), std::chrono::seconds{60}));
}
