#ifndef RELPACK_CORE_HASH_UTILS_HPP_
#define RELPACK_CORE_HASH_UTILS_HPP_

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace relpack::core {

constexpr std::uint64_t kFnv1a64OffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnv1a64Prime = 1099511628211ULL;

// Incremental FNV-1a 64-bit hasher. Not cryptographic; used to fingerprint
// build inputs so reruns against unchanged sources are detectable.
class Fnv1a64 {
public:
  void Update(std::string_view bytes) {
    for (const char c : bytes) {
      hash_ ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
      hash_ *= kFnv1a64Prime;
    }
  }

  // Length-prefixed update so ("ab","c") and ("a","bc") hash differently.
  void UpdateField(std::string_view bytes) {
    Update(std::to_string(bytes.size()));
    Update(":");
    Update(bytes);
  }

  bool UpdateFile(const std::filesystem::path& file_path, std::string& error) {
    std::ifstream in_file(file_path, std::ios::binary);
    if (!in_file) {
      error = "failed to open file for hashing: " + file_path.string();
      return false;
    }

    char buffer[4096];
    while (in_file.good()) {
      in_file.read(buffer, sizeof(buffer));
      const std::streamsize read_count = in_file.gcount();
      if (read_count > 0) {
        Update(std::string_view(buffer, static_cast<std::size_t>(read_count)));
      }
    }

    if (!in_file.eof()) {
      error = "failed while reading file for hashing: " + file_path.string();
      return false;
    }
    return true;
  }

  std::uint64_t Value() const {
    return hash_;
  }

  std::string HexDigest() const {
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash_));
    return buffer;
  }

private:
  std::uint64_t hash_ = kFnv1a64OffsetBasis;
};

} // namespace relpack::core

#endif // RELPACK_CORE_HASH_UTILS_HPP_
