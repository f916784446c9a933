#pragma once

/** \file filesystem.hpp
 *  \brief Durable publish helpers for archive files.
 *
 * Atomic publish (platform-correct):
 * - The caller writes the complete artifact to a temporary sibling (<name>.part)
 * - publish_atomic() makes the temporary durable:
 *     POSIX: fsync(tmp)
 *     Windows: FlushFileBuffers(tmp)
 * - then renames it over the destination:
 *     POSIX: std::filesystem::rename(tmp, dst) (rename(2))
 *     Windows: MoveFileExW(tmp, dst, MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)
 * - then makes the directory entry durable, best-effort:
 *     POSIX: fsync(parent directory)
 *     Windows: FlushFileBuffers(directory handle opened with FILE_FLAG_BACKUP_SEMANTICS)
 * - On failure the temporary is removed and io_failed is returned; there is
 *   no non-atomic fallback.
 */

#include <expected>
#include <filesystem>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

#include "worldvault/error.hpp"

namespace worldvault::platform {

/** \brief Owning wrapper for a native file handle; closes on destruction. */
class FileHandle {
public:
#ifdef _WIN32
    using native_handle_type = HANDLE;
#else
    using native_handle_type = int;
#endif

    FileHandle() noexcept = default;
    explicit FileHandle(native_handle_type handle) noexcept : handle_(handle) {}
    ~FileHandle() { close(); }

    FileHandle(FileHandle&& other) noexcept : handle_(other.handle_) {
        other.handle_ = invalid_handle();
    }
    auto operator=(FileHandle&& other) noexcept -> FileHandle& {
        if (this != &other) {
            close();
            handle_ = other.handle_;
            other.handle_ = invalid_handle();
        }
        return *this;
    }
    FileHandle(const FileHandle&) = delete;
    auto operator=(const FileHandle&) -> FileHandle& = delete;

    [[nodiscard]] auto get() const noexcept -> native_handle_type { return handle_; }
    [[nodiscard]] auto is_valid() const noexcept -> bool { return handle_ != invalid_handle(); }

    auto close() noexcept -> void;

private:
    [[nodiscard]] static auto invalid_handle() noexcept -> native_handle_type {
#ifdef _WIN32
        return INVALID_HANDLE_VALUE;
#else
        return -1;
#endif
    }

    native_handle_type handle_ = invalid_handle();
};

/** Flush a regular file's data to stable storage. */
[[nodiscard]] auto sync_file(const std::filesystem::path& path) -> std::expected<void, core::error>;

/** Flush a directory's entries; best-effort, failures are ignored. */
auto sync_directory(const std::filesystem::path& dir) noexcept -> void;

/** Durably rename a fully written temporary over its final name (see file comment). */
[[nodiscard]] auto publish_atomic(const std::filesystem::path& tmp, const std::filesystem::path& dst)
    -> std::expected<void, core::error>;

} // namespace worldvault::platform
