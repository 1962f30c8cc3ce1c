#pragma once

namespace relpack::core::errors {

// Stable process-exit contract for release automation.
//
// The first three values keep their conventional meanings:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Pipeline failures map onto their own codes so CI jobs can tell a bad
// manifest from a broken build or a registry outage without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kResolutionFailed = 20,
  kBuildFailed = 30,
  kPublishFailed = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace relpack::core::errors
