#include "concord/file_io.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace concord {

namespace {

// Unique temp name so concurrent writers never share a temp file.
std::string make_tmp_name(const fs::path& target) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (target.parent_path() /
          ("." + target.filename().string() + ".tmp_" + std::to_string(dist(rng))))
      .string();
}

std::string errno_message(const std::string& what, const std::string& path) {
  return what + " " + path + ": " + std::strerror(errno);
}

bool write_all(int fd, const std::string& data) {
  const char* p = data.data();
  size_t left = data.size();
  while (left > 0) {
    const ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  return true;
}

bool ensure_parent(const fs::path& target, std::string* error) {
  std::error_code ec;
  if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
  if (ec) {
    if (error) *error = "create_directories " + target.parent_path().string() + ": " + ec.message();
    return false;
  }
  return true;
}

}  // namespace

bool atomic_write(const fs::path& target, const std::string& data,
                  std::string* error, bool owner_only) {
  if (!ensure_parent(target, error)) return false;
  const std::string tmp = make_tmp_name(target);
  const mode_t mode = owner_only ? 0600 : 0644;

  const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (fd < 0) {
    if (error) *error = errno_message("open", tmp);
    return false;
  }
  if (!write_all(fd, data) || ::fsync(fd) != 0) {
    if (error) *error = errno_message("write", tmp);
    ::close(fd);
    std::remove(tmp.c_str());
    return false;
  }
  if (owner_only) ::fchmod(fd, 0600);
  ::close(fd);

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    if (error) *error = "rename " + tmp + ": " + ec.message();
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

bool append_line_durable(const fs::path& target, const std::string& line,
                         std::string* error) {
  if (!ensure_parent(target, error)) return false;
  std::string data = line;
  if (data.empty() || data.back() != '\n') data.push_back('\n');

  const std::string path = target.string();
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
  if (fd < 0) {
    if (error) *error = errno_message("open", path);
    return false;
  }
  bool ok = write_all(fd, data);
  if (ok && ::fsync(fd) != 0) ok = false;
  if (!ok && error) *error = errno_message("append", path);
  if (ok) ::fchmod(fd, 0600);
  ::close(fd);
  return ok;
}

std::optional<std::string> read_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::ostringstream ss;
  ss << ifs.rdbuf();
  if (ifs.bad()) return std::nullopt;
  return ss.str();
}

std::optional<char> last_byte(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary | std::ios::ate);
  if (!ifs) return std::nullopt;
  if (ifs.tellg() <= 0) return std::nullopt;
  ifs.seekg(-1, std::ios::end);
  char c = 0;
  if (!ifs.get(c)) return std::nullopt;
  return c;
}

FileLock::FileLock(const fs::path& lock_path) {
  std::error_code ec;
  if (lock_path.has_parent_path()) fs::create_directories(lock_path.parent_path(), ec);
  const std::string path = lock_path.string();
  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (fd_ < 0) {
    error_ = errno_message("open lock", path);
    return;
  }
  while (::flock(fd_, LOCK_EX) != 0) {
    if (errno == EINTR) continue;
    error_ = errno_message("flock", path);
    ::close(fd_);
    fd_ = -1;
    return;
  }
}

FileLock::~FileLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

}  // namespace concord
