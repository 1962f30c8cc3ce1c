#include "pipeline/release_pipeline.hpp"

#include "../common/release_harness.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using relpack::pipeline::FailureKind;
using relpack::pipeline::ReleaseOutcome;
using relpack::tests::common::AssertContains;
using relpack::tests::common::Fail;
using relpack::tests::common::ReadFileToString;

namespace {

void AssertNothingBuiltOrPublished(relpack::tests::common::ReleaseHarness& harness) {
  if (harness.Builder().BuildCalls() != 0) {
    Fail("engine must not be called before the version resolves");
  }
  if (!harness.Publisher().Requests().empty()) {
    Fail("publisher must not be called before the version resolves");
  }
}

} // namespace

int main() {
  {
    // `version` sits below the five-line window.
    relpack::tests::common::ReleaseHarness harness(
        "relpack-release-no-version", "[package]\n"
                                      "name = \"demo-bot\"\n"
                                      "authors = [\"ops\"]\n"
                                      "edition = \"2021\"\n"
                                      "license = \"MIT\"\n"
                                      "version = \"2.4.1\"\n");
    ReleaseOutcome outcome;
    if (harness.Run(harness.Options("release-1"), outcome)) {
      Fail("release should fail without a version in the window");
    }
    if (outcome.failure_kind != FailureKind::kResolution) {
      Fail("expected a resolution error");
    }
    AssertContains(outcome.error, "no quoted version found within the first 5 lines");
    AssertNothingBuiltOrPublished(harness);
    if (!outcome.dockerfile_path.empty()) {
      Fail("no Dockerfile should be rendered before the version resolves");
    }
    AssertContains(ReadFileToString(outcome.release_json_path),
                   "\"failure_kind\":\"resolution_error\"");
  }

  {
    relpack::tests::common::ReleaseHarness harness("relpack-release-no-manifest");
    fs::remove(harness.ProjectDir() / "Cargo.toml");
    ReleaseOutcome outcome;
    if (harness.Run(harness.Options("release-1"), outcome)) {
      Fail("release should fail without a manifest");
    }
    if (outcome.failure_kind != FailureKind::kResolution) {
      Fail("missing manifest should be a resolution error");
    }
    AssertContains(outcome.error, "manifest unavailable: file not found");
    AssertNothingBuiltOrPublished(harness);
  }

  {
    relpack::tests::common::ReleaseHarness harness("relpack-release-strict");
    relpack::tests::common::WriteFileOrFail(harness.ProjectDir() / "Cargo.toml",
                                            "[package]\nversion = \"nightly\"\n");
    relpack::pipeline::ReleaseOptions options = harness.Options("release-1");
    options.config.strict_version = true;
    ReleaseOutcome outcome;
    if (harness.Run(options, outcome)) {
      Fail("strict mode should reject a non-numeric version");
    }
    AssertContains(outcome.error, "version 'nightly' is not dotted-numeric");
    AssertNothingBuiltOrPublished(harness);
  }

  {
    // A tag push without a ref never leaves Idle.
    relpack::tests::common::ReleaseHarness harness("relpack-release-bad-trigger");
    relpack::pipeline::ReleaseOptions options = harness.Options("release-1");
    options.trigger.ref.clear();
    ReleaseOutcome outcome;
    if (harness.Run(options, outcome)) {
      Fail("tag push without a ref should be rejected");
    }
    if (outcome.failure_kind != FailureKind::kInternal ||
        outcome.state != relpack::pipeline::ReleaseState::kFailed) {
      Fail("rejected trigger should fail the run");
    }
    AssertContains(outcome.error, "tag push trigger requires a tag ref");
    AssertNothingBuiltOrPublished(harness);
  }

  std::cout << "release_resolution_failure_smoke: ok\n";
  return 0;
}
