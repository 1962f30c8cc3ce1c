#pragma once

#include <filesystem>
#include <string>

namespace relpack::core {

// Advisory flock(2) lock on a dedicated lock file, held until Release() or
// destruction. flock locks belong to the open file description, so two
// handles in one process exclude each other the same way two processes do.
//
// The lock file is never deleted: removing it while another holder waits
// would let a third party lock a fresh inode.
class ScopedFileLock {
public:
  enum class Mode {
    kShared,
    kExclusive,
  };

  ScopedFileLock() = default;
  ~ScopedFileLock();

  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;

  // Blocks until granted. Creates `lock_path` and its parent directory when
  // missing.
  bool Acquire(const std::filesystem::path& lock_path, Mode mode, std::string& error);

  void Release();

  bool Held() const {
    return fd_ >= 0;
  }

private:
  int fd_ = -1;
};

} // namespace relpack::core
