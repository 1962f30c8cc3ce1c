#pragma once

#include "core/logging/logger.hpp"
#include "engine/docker_cli_builder.hpp"
#include "engine/publisher.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace relpack::engine {

// Injected registry credentials. The token is only ever passed on stdin.
struct RegistryCredentials {
  std::string username;
  std::string token;
  // Empty means the engine's default registry.
  std::string registry_host;
};

// Reads RELPACK_REGISTRY_USERNAME / RELPACK_REGISTRY_TOKEN /
// RELPACK_REGISTRY_HOST. Returns false when username or token is unset.
bool LoadRegistryCredentialsFromEnv(RegistryCredentials& credentials, std::string& error);

// Publishes through the docker CLI:
// 1) `docker login --password-stdin`
// 2) `docker push` of each per-platform staging reference, keeping the
//    manifest digest the registry reports back
// 3) one `docker buildx imagetools create` from those `repo@digest`
//    sources carrying every release tag, so the tags are attached to the
//    same multi-arch index in one step
// 4) `docker buildx imagetools inspect` to read back the index digest
class DockerCliPublisher final : public IPublisher {
public:
  DockerCliPublisher(DockerCliOptions options, RegistryCredentials credentials,
                     core::logging::Logger& logger);

  bool Push(const PublishRequest& request, PublishReceipt& receipt, std::string& error) override;

  // Exposed for command-shape tests.
  static std::string LoginCommand(const DockerCliOptions& options,
                                  const RegistryCredentials& credentials);
  static std::string CreateIndexCommand(const DockerCliOptions& options,
                                        const PublishRequest& request,
                                        const std::vector<std::string>& sources);

  // Pulls `sha256:<hex>` out of `docker push` output.
  static bool ParsePushedDigest(std::string_view push_output, std::string& digest);

  // `<repository>@<digest>` for a tagged staging reference.
  static bool PinnedReference(const std::string& reference, const std::string& digest,
                              std::string& pinned, std::string& error);

private:
  bool RunChecked(const std::string& command, std::string_view what, std::string& error);

  DockerCliOptions options_;
  RegistryCredentials credentials_;
  core::logging::Logger& logger_;
};

} // namespace relpack::engine
