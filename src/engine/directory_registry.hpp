#pragma once

#include "engine/publisher.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace relpack::engine {

// Registry stand-in backed by a local directory, used for dry runs and
// pipeline tests. Each repository keeps one `index.json`:
//
//   {"repository": "...",
//    "tags": {"<tag>": "<digest>", ...},
//    "manifests": {"<digest>": [{"platform": "...", "digest": "..."}, ...]}}
//
// The whole index is rewritten with one atomic rename, so every tag of a
// push moves together. Pushes hold an exclusive lock on `index.json.lock`
// from load to rename and readers hold a shared one, so concurrent runs
// against one directory resolve last-write-wins per tag.
class DirectoryRegistry final : public IPublisher {
public:
  explicit DirectoryRegistry(std::filesystem::path root_dir);

  bool Push(const PublishRequest& request, PublishReceipt& receipt, std::string& error) override;

  // Loads the tag -> digest map for `repository`. An unknown repository
  // yields an empty map.
  bool ListTags(const std::string& repository, std::map<std::string, std::string>& tags,
                std::string& error) const;

  std::filesystem::path IndexPath(const std::string& repository) const;
  std::filesystem::path LockPath(const std::string& repository) const;

  // Deterministic digest of a multi-platform set: `fnv1a64:<hex>` over the
  // platform/digest pairs in platform order.
  static std::string IndexDigest(const std::vector<PlatformImage>& images);

private:
  std::filesystem::path root_dir_;
};

} // namespace relpack::engine
