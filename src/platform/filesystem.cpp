#include "worldvault/platform/filesystem.hpp"

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace worldvault::platform {

using core::error; using core::error_code;

auto FileHandle::close() noexcept -> void {
  if (!is_valid()) return;
#ifdef _WIN32
  ::CloseHandle(handle_);
#else
  ::close(handle_);
#endif
  handle_ = invalid_handle();
}

auto sync_file(const std::filesystem::path& path) -> std::expected<void, error> {
#if defined(_WIN32)
  FileHandle h(::CreateFileW(path.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                             FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                             nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr));
  if (!h.is_valid()) return std::unexpected(error{error_code::io_failed, "open for sync failed: " + path.string(), "platform.fs"});
  if (!::FlushFileBuffers(h.get())) return std::unexpected(error{error_code::io_failed, "FlushFileBuffers failed: " + path.string(), "platform.fs"});
#elif defined(__linux__) || defined(__APPLE__)
  FileHandle h(::open(path.string().c_str(), O_RDONLY));
  if (!h.is_valid()) return std::unexpected(error{error_code::io_failed, "open for sync failed: " + path.string(), "platform.fs"});
  if (::fsync(h.get()) != 0) return std::unexpected(error{error_code::io_failed, "fsync failed: " + path.string(), "platform.fs"});
#else
  (void)path;
#endif
  return {};
}

auto sync_directory(const std::filesystem::path& dir) noexcept -> void {
#if defined(_WIN32)
  FileHandle dh(::CreateFileW(dir.wstring().c_str(), GENERIC_READ,
                              FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                              nullptr, OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr));
  if (dh.is_valid()) (void)::FlushFileBuffers(dh.get());
#elif defined(__linux__) || defined(__APPLE__)
  FileHandle dh(::open(dir.string().c_str(), O_RDONLY));
  if (dh.is_valid()) (void)::fsync(dh.get());
#else
  (void)dir;
#endif
}

auto publish_atomic(const std::filesystem::path& tmp, const std::filesystem::path& dst)
    -> std::expected<void, error> {
  std::error_code rec;
  if (auto sx = sync_file(tmp); !sx) {
    (void)std::filesystem::remove(tmp, rec);
    return std::unexpected(sx.error());
  }
#if defined(_WIN32)
  BOOL ok = ::MoveFileExW(tmp.wstring().c_str(), dst.wstring().c_str(),
                          MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH);
  if (!ok) {
    (void)std::filesystem::remove(tmp, rec);
    return std::unexpected(error{error_code::io_failed, "replace failed: " + dst.string(), "platform.fs"});
  }
#else
  std::error_code ec;
  std::filesystem::rename(tmp, dst, ec);
  if (ec) {
    (void)std::filesystem::remove(tmp, rec);
    return std::unexpected(error{error_code::io_failed, "rename failed: " + ec.message(), "platform.fs"});
  }
#endif
  sync_directory(dst.parent_path());
  return {};
}

} // namespace worldvault::platform
