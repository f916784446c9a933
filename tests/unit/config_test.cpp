#include <catch2/catch_all.hpp>
#include <worldvault/config.hpp>
#include <tests/support/fs_fixtures.hpp>

#include <cstdlib>

using namespace worldvault;
namespace fs = std::filesystem;

namespace {

void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
  _putenv_s(name, value ? value : "");
#else
  if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

void clear_overrides() {
  for (const char* n : {"WORLDVAULT_SAVES_ROOT", "WORLDVAULT_BACKUPS_ROOT", "WORLDVAULT_MAX_AGGREGATE_BYTES",
                        "WORLDVAULT_MIN_KEEP_PER_WORLD", "WORLDVAULT_LOG_LEVEL"}) {
    set_env_var(n, nullptr);
  }
}

} // namespace

TEST_CASE("defaults", "[config]") {
  const auto cfg = config::default_config();
  REQUIRE(cfg.saves_root.filename() == "Saves");
  REQUIRE(cfg.backups_root.filename() == "Backups");
  REQUIRE(cfg.saves_root.parent_path() == cfg.backups_root.parent_path());
  REQUIRE(cfg.retention.max_aggregate_bytes == retention::kDefaultMaxAggregateBytes);
  REQUIRE(cfg.retention.min_keep_per_world == 3);
  REQUIRE(cfg.enforce_after_backup);
  REQUIRE(cfg.log_level == "info");
}

TEST_CASE("yaml keys overlay the defaults", "[config][yaml]") {
  test_support::TempDir dir("config_yaml");
  const auto file = dir / "worldvault.yaml";
  test_support::write_file(file,
      "savesRoot: /games/Zomboid/Saves\n"
      "backupsRoot: /mnt/archive/zomboid\n"
      "maxAggregateBytes: 1048576\n"
      "minKeepPerWorld: 5\n"
      "activeWorldGuardSeconds: 0\n"
      "enforceAfterBackup: false\n"
      "logLevel: debug\n");
  auto cfg = config::load_config(file);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->saves_root == fs::path("/games/Zomboid/Saves"));
  REQUIRE(cfg->backups_root == fs::path("/mnt/archive/zomboid"));
  REQUIRE(cfg->retention.max_aggregate_bytes == 1048576);
  REQUIRE(cfg->retention.min_keep_per_world == 5);
  REQUIRE(cfg->active_world_guard == std::chrono::seconds{0});
  REQUIRE_FALSE(cfg->enforce_after_backup);
  REQUIRE(cfg->log_level == "debug");
}

TEST_CASE("budget may be given in GiB", "[config][yaml]") {
  test_support::TempDir dir("config_gib");
  const auto file = dir / "worldvault.yaml";
  test_support::write_file(file, "maxAggregateGiB: 1.5\n");
  auto cfg = config::load_config(file);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->retention.max_aggregate_bytes == 3ull * 512 * 1024 * 1024);

  test_support::write_file(file, "maxAggregateGiB: 2\nmaxAggregateBytes: 100\n");
  cfg = config::load_config(file);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->retention.max_aggregate_bytes == 100);

  test_support::write_file(file, "maxAggregateGiB: -1\n");
  cfg = config::load_config(file);
  REQUIRE_FALSE(cfg.has_value());
  REQUIRE(cfg.error().code == core::error_code::config_invalid);
}

TEST_CASE("empty file yields the defaults", "[config][yaml]") {
  test_support::TempDir dir("config_empty");
  const auto file = dir / "worldvault.yaml";
  test_support::write_file(file, "");
  auto cfg = config::load_config(file);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->retention.min_keep_per_world == retention::kDefaultMinKeepPerWorld);
}

TEST_CASE("malformed files are config_invalid", "[config][yaml]") {
  test_support::TempDir dir("config_bad");
  const auto file = dir / "worldvault.yaml";

  test_support::write_file(file, "- just\n- a list\n");
  auto cfg = config::load_config(file);
  REQUIRE_FALSE(cfg.has_value());
  REQUIRE(cfg.error().code == core::error_code::config_invalid);

  test_support::write_file(file, "minKeepPerWorld: lots\n");
  cfg = config::load_config(file);
  REQUIRE_FALSE(cfg.has_value());
  REQUIRE(cfg.error().code == core::error_code::config_invalid);

  test_support::write_file(file, "savesRoot: [unterminated\n");
  cfg = config::load_config(file);
  REQUIRE_FALSE(cfg.has_value());
  REQUIRE(cfg.error().code == core::error_code::config_invalid);
}

TEST_CASE("missing file is not_found", "[config][yaml]") {
  test_support::TempDir dir("config_missing");
  auto cfg = config::load_config(dir / "absent.yaml");
  REQUIRE_FALSE(cfg.has_value());
  REQUIRE(cfg.error().code == core::error_code::not_found);
}

TEST_CASE("environment overrides win over the file", "[config][env]") {
  clear_overrides();
  config::Config cfg{};
  cfg.saves_root = "/from/file/Saves";
  cfg.backups_root = "/from/file/Backups";
  set_env_var("WORLDVAULT_BACKUPS_ROOT", "/from/env/Backups");
  set_env_var("WORLDVAULT_MAX_AGGREGATE_BYTES", "4096");
  set_env_var("WORLDVAULT_MIN_KEEP_PER_WORLD", "1");
  set_env_var("WORLDVAULT_LOG_LEVEL", "warn");

  auto rx = config::apply_env_overrides(cfg);
  REQUIRE(rx.has_value());
  REQUIRE(cfg.saves_root == fs::path("/from/file/Saves"));
  REQUIRE(cfg.backups_root == fs::path("/from/env/Backups"));
  REQUIRE(cfg.retention.max_aggregate_bytes == 4096);
  REQUIRE(cfg.retention.min_keep_per_world == 1);
  REQUIRE(cfg.log_level == "warn");
  clear_overrides();
}

TEST_CASE("non-numeric environment values are rejected", "[config][env]") {
  clear_overrides();
  config::Config cfg{};
  set_env_var("WORLDVAULT_MAX_AGGREGATE_BYTES", "5GB");
  auto rx = config::apply_env_overrides(cfg);
  REQUIRE_FALSE(rx.has_value());
  REQUIRE(rx.error().code == core::error_code::config_invalid);
  clear_overrides();
}

TEST_CASE("validate checks the two roots", "[config][validate]") {
  config::Config cfg{};
  cfg.saves_root = "/z/Saves";
  cfg.backups_root = "/z/Backups";
  REQUIRE(config::validate(cfg).has_value());

  cfg.backups_root = "/z/Saves/";
  REQUIRE(config::validate(cfg).error().code == core::error_code::config_invalid);

  cfg.backups_root = "/z/Saves/Backups";
  REQUIRE(config::validate(cfg).error().code == core::error_code::config_invalid);

  cfg.backups_root = "/z/Saves/Sandbox/W/backups";
  REQUIRE(config::validate(cfg).error().code == core::error_code::config_invalid);

  cfg.backups_root = "/z/Saves/.hidden/Backups";
  REQUIRE(config::validate(cfg).error().code == core::error_code::config_invalid);

  cfg.backups_root = "/z/SavesBackup";
  REQUIRE(config::validate(cfg).has_value());

  cfg.backups_root = "/z/Saves/../Backups";
  REQUIRE(config::validate(cfg).has_value());

  cfg.backups_root.clear();
  REQUIRE(config::validate(cfg).error().code == core::error_code::config_invalid);
}
