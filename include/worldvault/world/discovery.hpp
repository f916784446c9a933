#pragma once

/** \file discovery.hpp
 *  \brief World enumeration under a saves root.
 *
 * Layout: <saves_root>/<gamemode>/<world>, e.g. Saves/Sandbox/Muldraugh.
 * A world is a non-hidden, non-empty, readable directory one level below a
 * non-hidden gamemode directory. Directories holding Save.zip or Save.tar are
 * the game's own backup folders and are not worlds. Nothing is cached; every
 * call rescans the directory.
 */

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "worldvault/error.hpp"

namespace worldvault::world {

struct World {
  std::string id;               // "<gamemode>/<name>"
  std::string gamemode;
  std::string name;             // world directory name
  std::filesystem::path path;   // absolute save directory
};

/** "<gamemode>/<name>" */
[[nodiscard]] std::string world_id(std::string_view gamemode, std::string_view name);

/** Location of a world id under saves_root; nullopt unless the id is exactly two plain components. */
[[nodiscard]] std::optional<std::filesystem::path> world_path(const std::filesystem::path& saves_root,
                                                              std::string_view id);

/** Marker files of the game's own backup folders. */
inline constexpr const char* kGameBackupMarkers[] = {"Save.zip", "Save.tar"};

/** Worlds sorted by id. access_failed if the root is missing or unreadable. */
[[nodiscard]] auto list_worlds(const std::filesystem::path& saves_root)
    -> std::expected<std::vector<World>, core::error>;

/** Key files the game rewrites while a world is loaded. */
inline constexpr const char* kActivityMarkers[] = {"players.db", "map_meta.bin", "reanimated.bin"};

/**
 * True if any activity marker in world_dir was modified within `threshold` of `now`.
 * The caller supplies `now` to avoid wall-clock dependencies in tests.
 */
[[nodiscard]] bool is_world_active(const std::filesystem::path& world_dir,
                                   std::filesystem::file_time_type now,
                                   std::chrono::seconds threshold);

} // namespace worldvault::world
