#pragma once

#include "config/release_config.hpp"
#include "core/logging/logger.hpp"
#include "engine/image_builder.hpp"
#include "engine/publisher.hpp"
#include "pipeline/release_state.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace relpack::pipeline {

struct ReleaseOptions {
  // Validated config with derived defaults applied.
  config::ReleaseConfig config;
  Trigger trigger;
  // Per-run artifacts land in `<output_dir>/<run_id>/`.
  std::filesystem::path output_dir = "out";
  // Overrides `config.publish_target` (e.g. `rootless`).
  std::optional<std::string> target_stage;
  // Empty means the current time.
  std::string run_id;
};

struct ReleaseOutcome {
  std::string run_id;
  ReleaseState state = ReleaseState::kIdle;
  FailureKind failure_kind = FailureKind::kNone;
  std::string error;

  std::string version;
  std::string target_stage;
  std::string build_fingerprint;
  std::vector<engine::PlatformImage> images;
  std::string published_digest;
  std::vector<std::string> references;

  std::filesystem::path bundle_dir;
  std::filesystem::path dockerfile_path;
  std::filesystem::path events_path;
  std::filesystem::path release_json_path;

  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point finished_at{};
};

// Release tags for `version`: the floating tag first, then the version,
// deduplicated.
std::vector<std::string> ReleaseTags(const config::ReleaseConfig& config,
                                     const std::string& version);

// Runs one release end to end:
//   trigger -> resolve version -> validate plan + fingerprint context
//   -> build every platform in parallel -> push under both tags.
//
// Contract:
// - Version resolution happens before anything touches the engine.
// - Any failed platform build fails the run before the publisher is called.
// - The publisher is called at most once, with every release tag.
// - `Dockerfile`, `events.jsonl` and `release.json` are written to the run
//   bundle whatever the outcome (best effort once the bundle exists).
// - Returns true only when the run reached kPublished.
//
// `builder` is called from one thread per platform and must be thread-safe.
bool ExecuteRelease(const ReleaseOptions& options, engine::IImageBuilder& builder,
                    engine::IPublisher& publisher, core::logging::Logger& logger,
                    ReleaseOutcome& outcome);

} // namespace relpack::pipeline
