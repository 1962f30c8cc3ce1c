#include "image/context_fingerprint.hpp"

#include "core/hash_utils.hpp"

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace relpack::image {

namespace {

bool AddContextFile(const fs::path& context_dir, const fs::path& file_path,
                    std::set<std::string>& seen, std::vector<ContextFile>& files,
                    std::string& error) {
  std::error_code ec;
  const fs::path relative = fs::relative(file_path, context_dir, ec);
  if (ec || relative.empty()) {
    error = "failed to compute context-relative path for " + file_path.string();
    return false;
  }
  const std::string relative_text = relative.generic_string();
  if (relative_text.rfind("..", 0) == 0U) {
    error = "build input is outside the build context: " + file_path.string();
    return false;
  }
  if (!seen.insert(relative_text).second) {
    return true;
  }

  ContextFile entry;
  entry.relative_path = relative_text;
  entry.size_bytes = fs::file_size(file_path, ec);
  if (ec) {
    error = "failed to read file size: " + file_path.string();
    return false;
  }
  files.push_back(std::move(entry));
  return true;
}

} // namespace

bool CollectContextFiles(const BuildPlan& plan, const fs::path& context_dir,
                         std::vector<ContextFile>& files, std::string& error) {
  files.clear();
  std::error_code ec;
  if (!fs::is_directory(context_dir, ec) || ec) {
    error = "build context directory not found: " + context_dir.string();
    return false;
  }

  std::set<std::string> seen;
  for (const auto& stage : plan.stages) {
    for (const auto& op : stage.ops) {
      if (op.kind != LayerOpKind::kCopy) {
        continue;
      }
      for (const auto& source : op.sources) {
        const fs::path source_path = context_dir / source;
        if (fs::is_regular_file(source_path, ec) && !ec) {
          if (!AddContextFile(context_dir, source_path, seen, files, error)) {
            return false;
          }
          continue;
        }
        if (!fs::is_directory(source_path, ec) || ec) {
          error = "build context is missing '" + source + "' (required by stage '" +
                  stage.name + "')";
          return false;
        }

        for (fs::recursive_directory_iterator it(source_path, ec), end; !ec && it != end;
             it.increment(ec)) {
          if (it->is_regular_file(ec) && !ec) {
            if (!AddContextFile(context_dir, it->path(), seen, files, error)) {
              return false;
            }
          }
        }
        if (ec) {
          error = "failed to walk build context directory '" + source + "': " + ec.message();
          return false;
        }
      }
    }
  }

  std::sort(files.begin(), files.end(), [](const ContextFile& lhs, const ContextFile& rhs) {
    return lhs.relative_path < rhs.relative_path;
  });
  return true;
}

bool ComputeBuildFingerprint(const BuildPlan& plan, std::string_view dockerfile_text,
                             const fs::path& context_dir, BuildFingerprint& fingerprint,
                             std::string& error) {
  fingerprint = BuildFingerprint{};
  if (!CollectContextFiles(plan, context_dir, fingerprint.files, error)) {
    return false;
  }

  core::Fnv1a64 hasher;
  hasher.UpdateField(dockerfile_text);
  for (const auto& file : fingerprint.files) {
    hasher.UpdateField(file.relative_path);
    hasher.UpdateField(std::to_string(file.size_bytes));
    if (!hasher.UpdateFile(context_dir / file.relative_path, error)) {
      return false;
    }
    fingerprint.total_bytes += file.size_bytes;
  }
  fingerprint.hash_hex = hasher.HexDigest();
  return true;
}

} // namespace relpack::image
