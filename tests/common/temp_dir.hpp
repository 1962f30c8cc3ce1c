#ifndef RELPACK_TESTS_COMMON_TEMP_DIR_HPP_
#define RELPACK_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace relpack::tests::common {

// Several directories may be requested within the same millisecond, so a
// process-local counter is appended to the timestamp.
inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  static std::atomic<unsigned> sequence{0};
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(now_ms) + "-" +
       std::to_string(sequence.fetch_add(1)));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root: " + root.string());
  }
  return root;
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

// Removes the directory when the test scope ends, including on early return.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) : path_(CreateUniqueTempDir(prefix)) {}
  ~ScopedTempDir() {
    RemovePathBestEffort(path_);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
};

} // namespace relpack::tests::common

#endif // RELPACK_TESTS_COMMON_TEMP_DIR_HPP_
