#include "worldvault/world/discovery.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace worldvault::world {

namespace {

using core::error; using core::error_code;
namespace fs = std::filesystem;

bool is_plain_component(std::string_view s) {
  return !s.empty() && s.front() != '.' && s.find_first_of("/\\") == std::string_view::npos;
}

// Non-hidden directory; hidden ones hold restore staging and other private state.
bool is_visible_directory(const fs::directory_entry& de) {
  std::error_code ec;
  if (!de.is_directory(ec) || ec) return false;
  return is_plain_component(de.path().filename().string());
}

bool looks_like_world(const fs::directory_entry& de) {
  if (!is_visible_directory(de)) return false;
  std::error_code ec;
  for (const char* marker : kGameBackupMarkers) {
    if (fs::exists(de.path() / marker, ec)) {
      spdlog::debug("world.discovery: skipping game backup folder {}", de.path().string());
      return false;
    }
  }
  fs::directory_iterator it(de.path(), ec);
  if (ec) {
    spdlog::debug("world.discovery: skipping unreadable directory {}", de.path().string());
    return false;
  }
  return it != fs::directory_iterator{};
}

} // namespace

std::string world_id(std::string_view gamemode, std::string_view name) {
  std::string id(gamemode);
  id += '/';
  id += name;
  return id;
}

std::optional<fs::path> world_path(const fs::path& saves_root, std::string_view id) {
  const auto sep = id.find('/');
  if (sep == std::string_view::npos) return std::nullopt;
  const auto gamemode = id.substr(0, sep);
  const auto name = id.substr(sep + 1);
  if (!is_plain_component(gamemode) || !is_plain_component(name)) return std::nullopt;
  return saves_root / fs::path(gamemode) / fs::path(name);
}

auto list_worlds(const fs::path& saves_root) -> std::expected<std::vector<World>, error> {
  std::error_code ec;
  if (!fs::is_directory(saves_root, ec)) {
    return std::unexpected(error{error_code::access_failed, "saves root missing: " + saves_root.string(), "world.discovery"});
  }
  fs::directory_iterator modes(saves_root, ec);
  if (ec) {
    return std::unexpected(error{error_code::access_failed, "saves root unreadable: " + ec.message(), "world.discovery"});
  }
  std::vector<World> worlds;
  for (const auto end = fs::directory_iterator{}; modes != end; modes.increment(ec)) {
    if (!is_visible_directory(*modes)) continue;
    const auto gamemode = modes->path().filename().string();
    std::error_code mec;
    fs::directory_iterator it(modes->path(), mec);
    if (mec) {
      spdlog::debug("world.discovery: skipping unreadable gamemode {}", modes->path().string());
      continue;
    }
    for (; it != end; it.increment(mec)) {
      if (!looks_like_world(*it)) continue;
      std::error_code aec;
      auto abs = fs::absolute(it->path(), aec);
      const auto name = it->path().filename().string();
      worlds.push_back(World{world_id(gamemode, name), gamemode, name, aec ? it->path() : std::move(abs)});
    }
    if (mec) {
      spdlog::warn("world.discovery: scan of gamemode {} incomplete: {}", gamemode, mec.message());
    }
  }
  if (ec) {
    return std::unexpected(error{error_code::access_failed, "saves root scan failed: " + ec.message(), "world.discovery"});
  }
  std::sort(worlds.begin(), worlds.end(), [](const World& a, const World& b){ return a.id < b.id; });
  return worlds;
}

bool is_world_active(const fs::path& world_dir, fs::file_time_type now, std::chrono::seconds threshold) {
  for (const char* marker : kActivityMarkers) {
    std::error_code ec;
    const auto ft = fs::last_write_time(world_dir / marker, ec);
    if (ec) continue;
    if (now - ft < threshold) return true;
  }
  return false;
}

} // namespace worldvault::world
