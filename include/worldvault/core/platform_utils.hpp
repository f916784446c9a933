#pragma once

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace worldvault::core {

// Cross-platform getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

/** \brief Current user's home directory (HOME, or USERPROFILE on Windows); empty if unknown. */
std::filesystem::path home_directory();

/**
 * \brief Best-effort location of the game's data directory.
 *
 * Windows: ~/Zomboid. macOS: ~/Library/Application Support/Zomboid when it
 * exists. Linux: ~/.local/share/Zomboid when it exists. Otherwise ~/Zomboid.
 */
std::filesystem::path default_game_data_dir();

} // namespace worldvault::core
