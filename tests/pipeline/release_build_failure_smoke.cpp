#include "pipeline/release_pipeline.hpp"

#include "../common/release_harness.hpp"

#include <iostream>
#include <string>

using relpack::pipeline::FailureKind;
using relpack::pipeline::ReleaseOutcome;
using relpack::pipeline::ReleaseState;
using relpack::tests::common::AssertContains;
using relpack::tests::common::AssertNotContains;
using relpack::tests::common::Fail;
using relpack::tests::common::ReadFileToString;

int main() {
  relpack::tests::common::ReleaseHarness harness("relpack-release-build-failure");

  // Publish an earlier release so there are existing tags to protect.
  ReleaseOutcome previous;
  if (!harness.Run(harness.Options("release-1"), previous)) {
    Fail("initial release should publish: " + previous.error);
  }
  const auto tags_before = harness.RegistryTags("example/demo-bot");

  relpack::tests::common::WriteFileOrFail(harness.ProjectDir() / "Cargo.toml",
                                          "[package]\nname = \"demo-bot\"\nversion = \"2.5.0\"\n");
  harness.Builder().FailPlatform("linux/arm64");

  ReleaseOutcome outcome;
  if (harness.Run(harness.Options("release-2"), outcome)) {
    Fail("release should fail when a platform build fails");
  }
  if (outcome.state != ReleaseState::kFailed || outcome.failure_kind != FailureKind::kBuild) {
    Fail("expected a failed run with a build error");
  }
  AssertContains(outcome.error, "linux/arm64: stage 'builder' exited with status 101");
  if (!outcome.images.empty()) {
    Fail("failed run should not report published images");
  }

  // Zero tags pushed or updated.
  if (harness.Publisher().Requests().size() != 1U) {
    Fail("publisher must not be called after a build failure");
  }
  if (harness.RegistryTags("example/demo-bot") != tags_before) {
    Fail("registry tags changed after a failed build");
  }

  const std::string events = ReadFileToString(outcome.events_path);
  AssertContains(events, "\"type\":\"PLATFORM_BUILD_FAILED\"");
  AssertContains(events, "\"type\":\"RELEASE_FAILED\"");
  AssertContains(events, "\"failure_kind\":\"build_error\"");
  AssertNotContains(events, "\"type\":\"PUBLISH_STARTED\"");

  const std::string record = ReadFileToString(outcome.release_json_path);
  AssertContains(record, "\"state\":\"failed\"");
  AssertContains(record, "\"failure_kind\":\"build_error\"");
  AssertContains(record, "\"version\":\"2.5.0\"");
  AssertContains(harness.Logs(), "level=error");

  std::cout << "release_build_failure_smoke: ok\n";
  return 0;
}
