#include "engine/directory_registry.hpp"

#include "core/file_lock.hpp"
#include "core/fs_utils.hpp"
#include "core/hash_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "image/image_reference.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace relpack::engine {

namespace {

struct ManifestEntry {
  std::string platform;
  std::string digest;
};

struct RepositoryIndex {
  std::map<std::string, std::string> tags;
  std::map<std::string, std::vector<ManifestEntry>> manifests;
};

bool LoadIndex(const fs::path& index_path, RepositoryIndex& index, std::string& error) {
  index = RepositoryIndex{};
  std::error_code ec;
  if (!fs::exists(index_path, ec)) {
    return true;
  }

  std::string text;
  if (!core::ReadTextFile(index_path, text, error)) {
    return false;
  }
  core::json::Value root;
  if (!core::json::Parse(text, root, error)) {
    error = "corrupt registry index " + index_path.string() + ": " + error;
    return false;
  }

  const core::json::Value* tags = root.Find("tags");
  if (tags != nullptr && tags->IsObject()) {
    for (const auto& [tag, digest] : tags->object_value) {
      if (digest.IsString()) {
        index.tags[tag] = digest.string_value;
      }
    }
  }

  const core::json::Value* manifests = root.Find("manifests");
  if (manifests != nullptr && manifests->IsObject()) {
    for (const auto& [digest, entries] : manifests->object_value) {
      std::vector<ManifestEntry>& parsed = index.manifests[digest];
      for (const auto& entry : entries.array_value) {
        const core::json::Value* platform = entry.Find("platform");
        const core::json::Value* entry_digest = entry.Find("digest");
        if (platform != nullptr && platform->IsString() && entry_digest != nullptr &&
            entry_digest->IsString()) {
          parsed.push_back({platform->string_value, entry_digest->string_value});
        }
      }
    }
  }
  return true;
}

std::string SerializeIndex(const std::string& repository, const RepositoryIndex& index) {
  std::ostringstream out;
  out << "{\n  \"repository\":" << core::QuoteJson(repository) << ",\n  \"tags\":{";
  bool first = true;
  for (const auto& [tag, digest] : index.tags) {
    out << (first ? "\n" : ",\n") << "    " << core::QuoteJson(tag) << ":"
        << core::QuoteJson(digest);
    first = false;
  }
  out << "\n  },\n  \"manifests\":{";
  first = true;
  for (const auto& [digest, entries] : index.manifests) {
    out << (first ? "\n" : ",\n") << "    " << core::QuoteJson(digest) << ":[";
    for (std::size_t i = 0; i < entries.size(); ++i) {
      if (i != 0U) {
        out << ',';
      }
      out << "{\"platform\":" << core::QuoteJson(entries[i].platform)
          << ",\"digest\":" << core::QuoteJson(entries[i].digest) << "}";
    }
    out << "]";
    first = false;
  }
  out << "\n  }\n}\n";
  return out.str();
}

} // namespace

DirectoryRegistry::DirectoryRegistry(fs::path root_dir) : root_dir_(std::move(root_dir)) {}

fs::path DirectoryRegistry::IndexPath(const std::string& repository) const {
  std::string relative = repository;
  std::replace(relative.begin(), relative.end(), ':', '_');
  return root_dir_ / relative / "index.json";
}

fs::path DirectoryRegistry::LockPath(const std::string& repository) const {
  fs::path lock_path = IndexPath(repository);
  lock_path += ".lock";
  return lock_path;
}

std::string DirectoryRegistry::IndexDigest(const std::vector<PlatformImage>& images) {
  std::vector<const PlatformImage*> ordered;
  ordered.reserve(images.size());
  for (const auto& image : images) {
    ordered.push_back(&image);
  }
  std::sort(ordered.begin(), ordered.end(), [](const PlatformImage* lhs, const PlatformImage* rhs) {
    return lhs->platform < rhs->platform;
  });

  core::Fnv1a64 hasher;
  for (const PlatformImage* image : ordered) {
    hasher.UpdateField(image->platform);
    hasher.UpdateField(image->digest);
  }
  return "fnv1a64:" + hasher.HexDigest();
}

bool DirectoryRegistry::Push(const PublishRequest& request, PublishReceipt& receipt,
                             std::string& error) {
  receipt = PublishReceipt{};
  if (!image::IsValidRepositoryName(request.repository)) {
    error = "invalid repository '" + request.repository + "'";
    return false;
  }
  if (request.images.empty() || request.tags.empty()) {
    error = "publish request needs at least one image and one tag";
    return false;
  }

  // Held across load and rewrite so concurrent pushes never drop each
  // other's tags.
  core::ScopedFileLock lock;
  if (!lock.Acquire(LockPath(request.repository), core::ScopedFileLock::Mode::kExclusive,
                    error)) {
    return false;
  }

  const fs::path index_path = IndexPath(request.repository);
  RepositoryIndex index;
  if (!LoadIndex(index_path, index, error)) {
    return false;
  }

  const std::string digest = IndexDigest(request.images);
  std::vector<ManifestEntry>& entries = index.manifests[digest];
  entries.clear();
  for (const auto& platform_image : request.images) {
    entries.push_back({platform_image.platform, platform_image.digest});
  }
  std::sort(entries.begin(), entries.end(), [](const ManifestEntry& lhs, const ManifestEntry& rhs) {
    return lhs.platform < rhs.platform;
  });

  for (const auto& tag : request.tags) {
    index.tags[tag] = digest;
  }

  if (!core::WriteTextFileAtomic(index_path, SerializeIndex(request.repository, index), error)) {
    return false;
  }

  receipt.digest = digest;
  for (const auto& tag : request.tags) {
    receipt.references.push_back(image::TaggedReference(request.repository, tag));
  }
  return true;
}

bool DirectoryRegistry::ListTags(const std::string& repository,
                                 std::map<std::string, std::string>& tags,
                                 std::string& error) const {
  tags.clear();
  std::error_code ec;
  if (!fs::exists(IndexPath(repository).parent_path(), ec)) {
    return true;
  }

  core::ScopedFileLock lock;
  if (!lock.Acquire(LockPath(repository), core::ScopedFileLock::Mode::kShared, error)) {
    return false;
  }

  RepositoryIndex index;
  if (!LoadIndex(IndexPath(repository), index, error)) {
    return false;
  }
  tags = std::move(index.tags);
  return true;
}

} // namespace relpack::engine
