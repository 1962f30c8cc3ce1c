#include "image/build_plan.hpp"
#include "pipeline/release_pipeline.hpp"

#include "../common/release_harness.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using relpack::pipeline::ReleaseOutcome;
using relpack::pipeline::ReleaseState;
using relpack::tests::common::AssertContains;
using relpack::tests::common::AssertEq;
using relpack::tests::common::Fail;
using relpack::tests::common::ReadFileToString;

namespace {

ReleaseOutcome RunOrFail(relpack::tests::common::ReleaseHarness& harness,
                         const relpack::pipeline::ReleaseOptions& options) {
  ReleaseOutcome outcome;
  if (!harness.Run(options, outcome)) {
    Fail("release should publish: " + outcome.error);
  }
  return outcome;
}

} // namespace

int main() {
  relpack::tests::common::ReleaseHarness harness("relpack-release-success");

  const ReleaseOutcome first = RunOrFail(harness, harness.Options("release-1"));
  if (first.state != ReleaseState::kPublished) {
    Fail("state should be published");
  }
  AssertEq(first.version, "2.4.1", "version");
  AssertEq(first.target_stage, "base", "default target");
  if (first.references !=
      std::vector<std::string>{"example/demo-bot:latest", "example/demo-bot:2.4.1"}) {
    Fail("release should be tagged latest and 2.4.1");
  }

  // Both tags resolve to the same digest.
  auto tags = harness.RegistryTags("example/demo-bot");
  AssertEq(tags["latest"], first.published_digest, "latest");
  AssertEq(tags["2.4.1"], first.published_digest, "version tag");

  // One build per platform, one publish carrying both tags.
  if (harness.Builder().BuildCalls() != 2) {
    Fail("expected one build per platform");
  }
  if (harness.Publisher().Requests().size() != 1U ||
      harness.Publisher().Requests().front().tags != std::vector<std::string>{"latest", "2.4.1"}) {
    Fail("expected exactly one publish with both tags");
  }

  // Base runs as root.
  if (first.images.size() != 2U) {
    Fail("expected two platform images");
  }
  for (const auto& image : first.images) {
    if (!relpack::image::IsRootUser(image.user)) {
      Fail("base image should report root, got " + image.user);
    }
  }
  AssertEq(first.images[0].platform, "linux/amd64", "platform order");
  AssertEq(first.images[1].platform, "linux/arm64", "platform order");

  // Bundle artifacts.
  if (first.bundle_dir != harness.Root() / "out" / "release-1") {
    Fail("unexpected bundle dir: " + first.bundle_dir.string());
  }
  AssertContains(ReadFileToString(first.dockerfile_path), "FROM base AS rootless");
  const std::string events = ReadFileToString(first.events_path);
  AssertContains(events, "\"type\":\"RELEASE_TRIGGERED\"");
  AssertContains(events, "\"type\":\"VERSION_RESOLVED\"");
  AssertContains(events, "\"type\":\"PLAN_VALIDATED\"");
  AssertContains(events, "\"type\":\"PLATFORM_BUILT\"");
  AssertContains(events, "\"type\":\"PUBLISH_STARTED\"");
  AssertContains(events, "\"type\":\"PUBLISHED\"");
  const std::string record = ReadFileToString(first.release_json_path);
  AssertContains(record, "\"state\":\"published\"");
  AssertContains(record, "\"version\":\"2.4.1\"");
  AssertContains(record, "\"trigger\":{\"kind\":\"tag_push\",\"ref\":\"refs/tags/v2.4.1\"}");
  AssertContains(record, "\"published_digest\":\"" + first.published_digest + "\"");
  AssertContains(harness.Logs(), "msg=\"release published\"");
  AssertContains(harness.Logs(), "run_id=\"release-1\"");

  // Unchanged manifest and context: identical fingerprint and digest.
  const ReleaseOutcome rerun = RunOrFail(harness, harness.Options("release-2"));
  AssertEq(rerun.build_fingerprint, first.build_fingerprint, "rerun fingerprint");
  AssertEq(rerun.published_digest, first.published_digest, "rerun digest");

  // Rootless variant reports a non-root user and is a separate image.
  relpack::pipeline::ReleaseOptions rootless_options = harness.Options("release-3");
  rootless_options.target_stage = "rootless";
  const ReleaseOutcome rootless = RunOrFail(harness, rootless_options);
  AssertEq(rootless.target_stage, "rootless", "rootless target");
  for (const auto& image : rootless.images) {
    if (relpack::image::IsRootUser(image.user)) {
      Fail("rootless image should not report root");
    }
  }
  if (rootless.published_digest == first.published_digest) {
    Fail("rootless and base should publish different digests");
  }

  // An engine that hands back a root image for the rootless target is a
  // build failure, and nothing is published.
  harness.Builder().SetUserForTarget("rootless", "root");
  const std::size_t publishes_before = harness.Publisher().Requests().size();
  relpack::pipeline::ReleaseOptions mismatched = harness.Options("release-4");
  mismatched.target_stage = "rootless";
  ReleaseOutcome mismatch_outcome;
  if (harness.Run(mismatched, mismatch_outcome)) {
    Fail("identity mismatch should fail the release");
  }
  if (mismatch_outcome.failure_kind != relpack::pipeline::FailureKind::kBuild) {
    Fail("identity mismatch should be a build failure");
  }
  AssertContains(mismatch_outcome.error, "declares a non-root user");
  if (harness.Publisher().Requests().size() != publishes_before) {
    Fail("identity mismatch must not publish");
  }

  // Manual dispatch records an empty ref.
  relpack::pipeline::ReleaseOptions manual = harness.Options("release-5");
  manual.trigger = {relpack::pipeline::TriggerKind::kManual, ""};
  const ReleaseOutcome manual_outcome = RunOrFail(harness, manual);
  AssertContains(ReadFileToString(manual_outcome.release_json_path),
                 "\"trigger\":{\"kind\":\"manual\",\"ref\":\"\"}");

  if (!fs::exists(harness.ProjectDir() / "Cargo.toml")) {
    Fail("release must not modify the project");
  }

  std::cout << "release_success_smoke: ok\n";
  return 0;
}
