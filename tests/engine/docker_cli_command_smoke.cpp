#include "core/time_utils.hpp"
#include "engine/docker_cli_builder.hpp"
#include "engine/docker_cli_publisher.hpp"

#include "../common/assertions.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

using relpack::tests::common::AssertContains;
using relpack::tests::common::AssertEq;
using relpack::tests::common::AssertNotContains;
using relpack::tests::common::Fail;

int main() {
  relpack::engine::DockerCliOptions options;

  relpack::engine::BuildRequest request;
  request.context_dir = "/work/my project";
  request.dockerfile_path = "/work/out/release-1/Dockerfile";
  request.target_stage = "rootless";
  request.staging_reference = "example/demo-bot:relpack-staging-release-1";

  AssertEq(relpack::engine::PlatformSlug("linux/arm64/v8"), "linux-arm64-v8", "slug");

  const std::string build = relpack::engine::DockerCliBuilder::BuildCommand(
      options, request, "linux/arm64",
      "example/demo-bot:relpack-staging-release-1-linux-arm64", "/tmp/iid.txt");
  AssertEq(build,
           "'docker' buildx build --platform 'linux/arm64' "
           "--file '/work/out/release-1/Dockerfile' --target 'rootless' "
           "--tag 'example/demo-bot:relpack-staging-release-1-linux-arm64' "
           "--iidfile '/tmp/iid.txt' --load '/work/my project'",
           "build command");

  relpack::engine::RegistryCredentials credentials;
  credentials.username = "ci-bot";
  credentials.token = "s3cr3t";
  credentials.registry_host = "ghcr.io";
  const std::string login =
      relpack::engine::DockerCliPublisher::LoginCommand(options, credentials);
  AssertEq(login, "'docker' login 'ghcr.io' --username 'ci-bot' --password-stdin", "login");
  AssertNotContains(login, "s3cr3t");

  std::string error;
  relpack::engine::PublishRequest publish;
  publish.repository = "example/demo-bot";
  publish.tags = {"latest", "2.4.1"};
  publish.images = {
      {.platform = "linux/amd64", .reference = "example/demo-bot:staging-amd64",
       .digest = "sha256:a", .user = ""},
      {.platform = "linux/arm64", .reference = "example/demo-bot:staging-arm64",
       .digest = "sha256:b", .user = ""},
  };
  using relpack::engine::DockerCliPublisher;

  std::string pushed_digest;
  if (!DockerCliPublisher::ParsePushedDigest(
          "The push refers to repository [docker.io/example/demo-bot]\n"
          "5f70bf18a086: Pushed\n"
          "staging-amd64: digest: sha256:4d2c9a size: 1570\n",
          pushed_digest)) {
    Fail("push output with a digest line should parse");
  }
  AssertEq(pushed_digest, "sha256:4d2c9a", "pushed digest");
  if (DockerCliPublisher::ParsePushedDigest("5f70bf18a086: Pushed\n", pushed_digest)) {
    Fail("push output without a digest line should not parse");
  }
  if (DockerCliPublisher::ParsePushedDigest("x: digest: sha256: size: 1\n", pushed_digest)) {
    Fail("empty digest should not parse");
  }

  std::string pinned;
  if (!DockerCliPublisher::PinnedReference("ghcr.io/example/demo-bot:staging-amd64",
                                           "sha256:4d2c9a", pinned, error)) {
    Fail("pinning a tagged reference failed: " + error);
  }
  AssertEq(pinned, "ghcr.io/example/demo-bot@sha256:4d2c9a", "pinned reference");

  // Sources are digests, never the mutable staging tags.
  const std::string index_command = DockerCliPublisher::CreateIndexCommand(
      options, publish, {"example/demo-bot@sha256:aaa", "example/demo-bot@sha256:bbb"});
  AssertEq(index_command,
           "'docker' buildx imagetools create --tag 'example/demo-bot:latest' "
           "--tag 'example/demo-bot:2.4.1' 'example/demo-bot@sha256:aaa' "
           "'example/demo-bot@sha256:bbb'",
           "index command");
  AssertNotContains(index_command, "staging-amd64");

  // Two runs started in the same millisecond still get distinct ids.
  const std::chrono::system_clock::time_point instant{
      std::chrono::milliseconds(1700000000123)};
  AssertEq(relpack::core::MakeReleaseRunId(instant, 4242), "release-1700000000123-4242",
           "run id");
  if (relpack::core::MakeReleaseRunId(instant, 4242) ==
      relpack::core::MakeReleaseRunId(instant, 4243)) {
    Fail("run ids from different processes must differ");
  }

  relpack::engine::RegistryCredentials loaded;
  ::unsetenv("RELPACK_REGISTRY_USERNAME");
  ::unsetenv("RELPACK_REGISTRY_TOKEN");
  if (relpack::engine::LoadRegistryCredentialsFromEnv(loaded, error)) {
    Fail("credentials should be reported missing");
  }
  AssertContains(error, "RELPACK_REGISTRY_TOKEN");

  ::setenv("RELPACK_REGISTRY_USERNAME", "ci-bot", 1);
  ::setenv("RELPACK_REGISTRY_TOKEN", "s3cr3t", 1);
  if (!relpack::engine::LoadRegistryCredentialsFromEnv(loaded, error)) {
    Fail("credentials from env should load: " + error);
  }
  AssertEq(loaded.username, "ci-bot", "username");
  AssertEq(loaded.token, "s3cr3t", "token");

  std::cout << "docker_cli_command_smoke: ok\n";
  return 0;
}
