#pragma once

// concord/file_io.hpp — Durable local file primitives (POSIX).
//
// DESIGN INVARIANTS:
//   - atomic_write() never leaves a partially written target: data goes to a
//     uniquely named temp file in the same directory, is fsync'd, then
//     renamed over the target. On failure the temp file is removed and the
//     previous target content is untouched.
//   - append_line_durable() issues exactly one write() on an O_APPEND
//     descriptor followed by fsync(). A crash can leave at most one truncated
//     trailing line without '\n'.
//   - FileLock is an exclusive advisory flock() on a sidecar lock file. It
//     serialises same-node processes only; it is NOT a cross-host lock.

#include <filesystem>
#include <optional>
#include <string>

namespace concord {

namespace fs = std::filesystem;

// Write `data` to `target` atomically. When `owner_only` is set the file is
// created with mode 0600. Parent directories are created as needed.
bool atomic_write(const fs::path& target, const std::string& data,
                  std::string* error, bool owner_only = false);

// Append one line (a trailing '\n' is added when missing), fsync, mode 0600.
bool append_line_durable(const fs::path& target, const std::string& line,
                         std::string* error);

// Whole-file read. nullopt when the file does not exist or cannot be read.
std::optional<std::string> read_file(const fs::path& path);

// Final byte of a non-empty file. nullopt when missing or empty.
std::optional<char> last_byte(const fs::path& path);

// RAII exclusive advisory lock. Blocks until acquired.
class FileLock {
 public:
  explicit FileLock(const fs::path& lock_path);
  ~FileLock();

  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  bool locked() const { return fd_ >= 0; }
  const std::string& error() const { return error_; }

 private:
  int fd_{-1};
  std::string error_;
};

}  // namespace concord
