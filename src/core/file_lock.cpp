#include "core/file_lock.hpp"

#include "core/fs_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace relpack::core {

ScopedFileLock::~ScopedFileLock() {
  Release();
}

bool ScopedFileLock::Acquire(const std::filesystem::path& lock_path, Mode mode,
                             std::string& error) {
  Release();

  const std::filesystem::path parent_dir = lock_path.parent_path();
  if (!parent_dir.empty() && !EnsureDirectory(parent_dir, error)) {
    return false;
  }

  const int fd = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
  if (fd < 0) {
    error = "failed to open lock file '" + lock_path.string() + "': " + std::strerror(errno);
    return false;
  }

  const int operation = mode == Mode::kShared ? LOCK_SH : LOCK_EX;
  int rc = 0;
  do {
    rc = ::flock(fd, operation);
  } while (rc != 0 && errno == EINTR);
  if (rc != 0) {
    error = "failed to lock '" + lock_path.string() + "': " + std::strerror(errno);
    ::close(fd);
    return false;
  }

  fd_ = fd;
  return true;
}

void ScopedFileLock::Release() {
  if (fd_ < 0) {
    return;
  }
  (void)::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

} // namespace relpack::core
