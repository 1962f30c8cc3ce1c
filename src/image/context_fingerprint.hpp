#pragma once

#include "image/build_plan.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace relpack::image {

struct ContextFile {
  // Context-relative, '/'-separated.
  std::string relative_path;
  std::uintmax_t size_bytes = 0;
};

struct BuildFingerprint {
  // FNV-1a 64-bit, 16 lowercase hex digits.
  std::string hash_hex;
  std::vector<ContextFile> files;
  std::uintmax_t total_bytes = 0;
};

// Lists every context file the plan copies (kCopy sources; directories are
// walked recursively), sorted by relative path. Fails when a source is
// missing or escapes `context_dir`.
bool CollectContextFiles(const BuildPlan& plan, const std::filesystem::path& context_dir,
                         std::vector<ContextFile>& files, std::string& error);

// Hashes the rendered Dockerfile plus the path, size and bytes of every
// context file. Unchanged plan + unchanged sources => identical hash.
bool ComputeBuildFingerprint(const BuildPlan& plan, std::string_view dockerfile_text,
                             const std::filesystem::path& context_dir,
                             BuildFingerprint& fingerprint, std::string& error);

} // namespace relpack::image
