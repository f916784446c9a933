#include "worldvault/core/platform_utils.hpp"

namespace worldvault::core {

std::filesystem::path home_directory() {
#if defined(_WIN32)
  if (auto v = safe_getenv("USERPROFILE"); v && !v->empty()) return *v;
#endif
  if (auto v = safe_getenv("HOME"); v && !v->empty()) return *v;
  return {};
}

std::filesystem::path default_game_data_dir() {
  namespace fs = std::filesystem;
  const auto home = home_directory();
  const auto fallback = home / "Zomboid";
#if defined(_WIN32)
  return fallback;
#else
  std::error_code ec;
#if defined(__APPLE__)
  const auto preferred = home / "Library" / "Application Support" / "Zomboid";
#else
  const auto preferred = home / ".local" / "share" / "Zomboid";
#endif
  return fs::is_directory(preferred, ec) ? preferred : fallback;
#endif
}

} // namespace worldvault::core
