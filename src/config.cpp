#include "worldvault/config.hpp"

#include "worldvault/core/platform_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cmath>
#include <cstdint>

namespace worldvault::config {

namespace {

using core::error; using core::error_code;
namespace fs = std::filesystem;

constexpr double kBytesPerGiB = 1024.0 * 1024.0 * 1024.0;

bool parse_u64(const std::string& s, std::uint64_t& out) {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end || s.empty()) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

auto env_u64(const char* name, std::uint64_t& out) -> std::expected<bool, error> {
  auto v = core::safe_getenv(name);
  if (!v) return false;
  if (!parse_u64(*v, out)) {
    return std::unexpected(error{error_code::config_invalid, std::string(name) + "=\"" + *v + "\" is not an unsigned integer", "config.env"});
  }
  return true;
}

fs::path normalized(const fs::path& p) {
  std::error_code ec;
  auto abs = fs::absolute(p, ec);
  auto out = (ec ? p : abs).lexically_normal();
  if (!out.has_filename() && out.has_relative_path()) out = out.parent_path();
  return out;
}

// True if `inner` is `outer` or below it; both already normalized.
bool is_within(const fs::path& inner, const fs::path& outer) {
  auto i = inner.begin();
  for (auto o = outer.begin(); o != outer.end(); ++o, ++i) {
    if (i == inner.end() || *i != *o) return false;
  }
  return true;
}

} // namespace

Config default_config() {
  Config cfg{};
  const auto data_dir = core::default_game_data_dir();
  cfg.saves_root = data_dir / "Saves";
  cfg.backups_root = data_dir / "Backups";
  return cfg;
}

auto load_config(const fs::path& path) -> std::expected<Config, error> {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::unexpected(error{error_code::not_found, "config file missing: " + path.string(), "config.file"});
  }
  Config cfg = default_config();
  try {
    YAML::Node root = YAML::LoadFile(path.string());
    if (root.IsNull()) return cfg;
    if (!root.IsMap()) {
      return std::unexpected(error{error_code::config_invalid, "top level must be a mapping", "config.file"});
    }
    if (root["savesRoot"]) cfg.saves_root = root["savesRoot"].as<std::string>();
    if (root["backupsRoot"]) cfg.backups_root = root["backupsRoot"].as<std::string>();
    if (root["maxAggregateBytes"]) {
      cfg.retention.max_aggregate_bytes = root["maxAggregateBytes"].as<std::uint64_t>();
    } else if (root["maxAggregateGiB"]) {
      const double gib = root["maxAggregateGiB"].as<double>();
      if (!(gib >= 0.0) || !std::isfinite(gib)) {
        return std::unexpected(error{error_code::config_invalid, "maxAggregateGiB must be a non-negative number", "config.file"});
      }
      cfg.retention.max_aggregate_bytes = static_cast<std::uint64_t>(std::llround(gib * kBytesPerGiB));
    }
    if (root["minKeepPerWorld"]) cfg.retention.min_keep_per_world = root["minKeepPerWorld"].as<std::size_t>();
    if (root["activeWorldGuardSeconds"]) {
      cfg.active_world_guard = std::chrono::seconds{root["activeWorldGuardSeconds"].as<std::uint32_t>()};
    }
    if (root["enforceAfterBackup"]) cfg.enforce_after_backup = root["enforceAfterBackup"].as<bool>();
    if (root["logLevel"]) cfg.log_level = root["logLevel"].as<std::string>();
  } catch (const YAML::Exception& e) {
    return std::unexpected(error{error_code::config_invalid, path.filename().string() + ": " + e.what(), "config.file"});
  }
  return cfg;
}

auto apply_env_overrides(Config& cfg) -> std::expected<void, error> {
  if (auto v = core::safe_getenv("WORLDVAULT_SAVES_ROOT"); v && !v->empty()) cfg.saves_root = *v;
  if (auto v = core::safe_getenv("WORLDVAULT_BACKUPS_ROOT"); v && !v->empty()) cfg.backups_root = *v;
  if (auto v = core::safe_getenv("WORLDVAULT_LOG_LEVEL"); v && !v->empty()) cfg.log_level = *v;

  std::uint64_t n = 0;
  auto mx = env_u64("WORLDVAULT_MAX_AGGREGATE_BYTES", n);
  if (!mx) return std::unexpected(mx.error());
  if (*mx) cfg.retention.max_aggregate_bytes = n;

  auto kx = env_u64("WORLDVAULT_MIN_KEEP_PER_WORLD", n);
  if (!kx) return std::unexpected(kx.error());
  if (*kx) cfg.retention.min_keep_per_world = static_cast<std::size_t>(n);
  return {};
}

auto validate(const Config& cfg) -> std::expected<void, error> {
  if (cfg.saves_root.empty()) {
    return std::unexpected(error{error_code::config_invalid, "savesRoot is not set", "config.validate"});
  }
  if (cfg.backups_root.empty()) {
    return std::unexpected(error{error_code::config_invalid, "backupsRoot is not set", "config.validate"});
  }
  const auto saves = normalized(cfg.saves_root);
  const auto backups = normalized(cfg.backups_root);
  if (saves == backups) {
    return std::unexpected(error{error_code::config_invalid, "savesRoot and backupsRoot must differ", "config.validate"});
  }
  if (is_within(backups, saves)) {
    return std::unexpected(error{error_code::config_invalid,
        "backupsRoot must not lie inside savesRoot (archives would end up inside world backups)", "config.validate"});
  }
  return {};
}

} // namespace worldvault::config
