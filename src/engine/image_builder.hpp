#pragma once

#include <filesystem>
#include <string>

namespace relpack::engine {

// One engine invocation: build `target_stage` (and the stages it depends on)
// from the rendered Dockerfile for a single platform.
struct BuildRequest {
  std::filesystem::path context_dir;
  std::filesystem::path dockerfile_path;
  std::string target_stage;
  // Engine-local reference prefix; the builder appends a platform suffix.
  std::string staging_reference;
};

// A single-platform image the engine produced.
struct PlatformImage {
  std::string platform;
  std::string reference;
  // Content id, e.g. `sha256:<hex>`.
  std::string digest;
  // Effective user recorded in the image config; empty means root.
  std::string user;
};

// Container engine capability. Implementations must not tag or push
// anything outside `request.staging_reference`.
class IImageBuilder {
public:
  virtual ~IImageBuilder() = default;

  // Returns false with `error` set when any stage of the chain fails.
  virtual bool BuildPlatform(const BuildRequest& request, const std::string& platform,
                             PlatformImage& image, std::string& error) = 0;
};

// `linux/arm64/v8` -> `linux-arm64-v8`.
std::string PlatformSlug(const std::string& platform);

} // namespace relpack::engine
