#ifndef RELPACK_CORE_FS_UTILS_HPP_
#define RELPACK_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace relpack::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create output directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Reads a whole file. A missing file and an unreadable file are reported
// with distinct messages so operators can tell a wrong path from permissions.
inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec) || ec) {
    error = "file not found: " + path.string();
    return false;
  }
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    error = "path must point to a regular file: " + path.string();
    return false;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read file: " + path.string();
    return false;
  }
  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return true;
}

// Writes `text` next to `output_path` and renames it into place, so readers
// never observe a half-written file. Falls back to remove+rename where the
// filesystem refuses rename-over-existing.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }
  const std::filesystem::path parent_dir = output_path.parent_path();
  if (!parent_dir.empty() && !EnsureDirectory(parent_dir, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }
    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace relpack::core

#endif // RELPACK_CORE_FS_UTILS_HPP_
