#pragma once

#include "core/logging/logger.hpp"
#include "engine/image_builder.hpp"

#include <filesystem>
#include <string>

namespace relpack::engine {

struct DockerCliOptions {
  std::string docker_binary = "docker";
  // Scratch directory for `--iidfile` outputs.
  std::filesystem::path scratch_dir;
};

// Builds through `docker buildx build --load`, one platform per call.
// Foreign platforms need QEMU binfmt handlers registered on the host.
class DockerCliBuilder final : public IImageBuilder {
public:
  DockerCliBuilder(DockerCliOptions options, core::logging::Logger& logger);

  bool BuildPlatform(const BuildRequest& request, const std::string& platform,
                     PlatformImage& image, std::string& error) override;

  // Exposed for command-shape tests.
  static std::string BuildCommand(const DockerCliOptions& options, const BuildRequest& request,
                                  const std::string& platform, const std::string& reference,
                                  const std::filesystem::path& iid_path);

private:
  DockerCliOptions options_;
  core::logging::Logger& logger_;
};

} // namespace relpack::engine
