#include "pipeline/release_pipeline.hpp"

#include "artifacts/release_record_writer.hpp"
#include "core/time_utils.hpp"
#include "events/emitter.hpp"
#include "image/build_plan.hpp"
#include "image/context_fingerprint.hpp"
#include "image/dockerfile_renderer.hpp"
#include "manifest/version_resolver.hpp"

#include <algorithm>
#include <memory>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace relpack::pipeline {

namespace {

using Clock = std::chrono::system_clock;

struct PlatformBuildResult {
  bool ok = false;
  engine::PlatformImage image;
  std::string error;
};

// Carries one run's mutable state so each step can fail the run the same
// way.
class ReleaseRun {
public:
  ReleaseRun(const ReleaseOptions& options, engine::IImageBuilder& builder,
             engine::IPublisher& publisher, core::logging::Logger& logger,
             ReleaseOutcome& outcome)
      : options_(options), builder_(builder), publisher_(publisher), logger_(logger),
        outcome_(outcome) {}

  bool Execute() {
    outcome_ = ReleaseOutcome{};
    outcome_.created_at = Clock::now();
    outcome_.run_id =
        options_.run_id.empty() ? core::MakeReleaseRunId(outcome_.created_at) : options_.run_id;
    outcome_.bundle_dir = options_.output_dir / outcome_.run_id;
    outcome_.target_stage = options_.target_stage.value_or(options_.config.publish_target);
    emitter_ = std::make_unique<events::Emitter>(outcome_.bundle_dir);
    logger_.SetRunId(outcome_.run_id);

    const bool published = Trigger() && ResolveVersion() && PreparePlan() && BuildPlatforms() &&
                           Publish();
    Finish();
    return published;
  }

private:
  bool Fail(FailureKind kind, std::string message) {
    std::string transition_error;
    if (!state_.MarkFailed(kind, transition_error)) {
      logger_.Warn("unexpected release state transition", {{"error", transition_error}});
    }
    outcome_.failure_kind = kind;
    outcome_.error = std::move(message);
    logger_.Error("release failed",
                  {{"failure_kind", ToString(kind)}, {"error", outcome_.error}});

    std::string event_error;
    if (!emitter_->EmitFailed({.ts = Clock::now(),
                               .run_id = outcome_.run_id,
                               .failure_kind = ToString(kind),
                               .error = outcome_.error},
                              event_error)) {
      WarnEventWrite(event_error);
    }
    return false;
  }

  void WarnEventWrite(const std::string& error) {
    logger_.Warn("failed to append release event", {{"error", error}});
  }

  bool Trigger() {
    std::string error;
    if (!state_.Fire(options_.trigger, error)) {
      return Fail(FailureKind::kInternal, error);
    }
    logger_.Info("release triggered", {{"trigger", ToString(options_.trigger.kind)},
                                       {"ref", options_.trigger.ref},
                                       {"image_name", options_.config.image_name}});
    if (!emitter_->EmitTriggered({.ts = Clock::now(),
                                  .run_id = outcome_.run_id,
                                  .trigger = ToString(options_.trigger.kind),
                                  .ref = options_.trigger.ref,
                                  .image_name = options_.config.image_name},
                                 error)) {
      WarnEventWrite(error);
    }
    return true;
  }

  bool ResolveVersion() {
    const fs::path manifest_path = config::ManifestPath(options_.config);
    manifest::VersionResolveOptions resolve_options;
    resolve_options.scan_lines = options_.config.version_scan_lines;
    resolve_options.strict = options_.config.strict_version;

    manifest::ResolvedVersion resolved;
    std::string error;
    if (!manifest::ResolveVersionFromFile(manifest_path, resolve_options, resolved, error)) {
      return Fail(FailureKind::kResolution, error);
    }

    outcome_.version = resolved.version;
    logger_.Info("version resolved", {{"manifest", manifest_path.string()},
                                      {"version", resolved.version}});
    if (!emitter_->EmitVersionResolved({.ts = Clock::now(),
                                        .run_id = outcome_.run_id,
                                        .manifest_path = manifest_path.string(),
                                        .version = resolved.version,
                                        .line_number = resolved.line_number},
                                       error)) {
      WarnEventWrite(error);
    }
    return true;
  }

  bool PreparePlan() {
    std::string error;
    plan_ = image::MakeReleasePlan(options_.config);
    plan_.publish_target = outcome_.target_stage;
    if (!image::ValidateBuildPlan(plan_, error)) {
      return Fail(FailureKind::kBuild, "invalid build plan: " + error);
    }

    std::vector<std::size_t> chain;
    if (!image::ResolveStageChain(plan_, outcome_.target_stage, chain, error)) {
      return Fail(FailureKind::kBuild, error);
    }

    const std::string dockerfile = image::RenderDockerfile(plan_);
    if (!artifacts::WriteDockerfile(dockerfile, outcome_.bundle_dir, outcome_.dockerfile_path,
                                    error)) {
      return Fail(FailureKind::kInternal, error);
    }

    image::BuildFingerprint fingerprint;
    if (!image::ComputeBuildFingerprint(plan_, dockerfile, options_.config.context_dir,
                                        fingerprint, error)) {
      return Fail(FailureKind::kBuild, error);
    }
    outcome_.build_fingerprint = fingerprint.hash_hex;

    std::vector<std::string> chain_names;
    for (const std::size_t index : chain) {
      chain_names.push_back(plan_.stages[index].name);
    }
    logger_.Info("build plan ready", {{"target_stage", outcome_.target_stage},
                                      {"fingerprint", fingerprint.hash_hex},
                                      {"context_files", std::to_string(fingerprint.files.size())}});
    if (!emitter_->EmitPlanValidated({.ts = Clock::now(),
                                      .run_id = outcome_.run_id,
                                      .target_stage = outcome_.target_stage,
                                      .chain = chain_names,
                                      .fingerprint = fingerprint.hash_hex,
                                      .context_files = fingerprint.files.size()},
                                     error)) {
      WarnEventWrite(error);
    }
    return true;
  }

  void BuildOnePlatform(const engine::BuildRequest& request, const std::string& platform,
                        PlatformBuildResult& result) {
    std::string event_error;
    if (!emitter_->EmitPlatformBuildStarted(
            {.ts = Clock::now(), .run_id = outcome_.run_id, .platform = platform}, event_error)) {
      WarnEventWrite(event_error);
    }
    logger_.Info("platform build started", {{"platform", platform}});

    result.ok = builder_.BuildPlatform(request, platform, result.image, result.error);
    if (!result.ok) {
      logger_.Error("platform build failed", {{"platform", platform}, {"error", result.error}});
      if (!emitter_->EmitPlatformBuildFailed({.ts = Clock::now(),
                                              .run_id = outcome_.run_id,
                                              .platform = platform,
                                              .error = result.error},
                                             event_error)) {
        WarnEventWrite(event_error);
      }
      return;
    }

    logger_.Info("platform build finished",
                 {{"platform", platform}, {"digest", result.image.digest}});
    if (!emitter_->EmitPlatformBuilt({.ts = Clock::now(),
                                      .run_id = outcome_.run_id,
                                      .platform = platform,
                                      .reference = result.image.reference,
                                      .digest = result.image.digest,
                                      .user = result.image.user},
                                     event_error)) {
      WarnEventWrite(event_error);
    }
  }

  bool BuildPlatforms() {
    engine::BuildRequest request;
    request.context_dir = options_.config.context_dir;
    request.dockerfile_path = outcome_.dockerfile_path;
    request.target_stage = outcome_.target_stage;
    request.staging_reference =
        options_.config.image_name + ":relpack-staging-" + outcome_.run_id;

    const std::vector<std::string>& platforms = options_.config.platforms;
    std::vector<PlatformBuildResult> results(platforms.size());
    {
      std::vector<std::thread> workers;
      workers.reserve(platforms.size());
      for (std::size_t i = 0; i < platforms.size(); ++i) {
        workers.emplace_back([this, &request, &platforms, &results, i] {
          BuildOnePlatform(request, platforms[i], results[i]);
        });
      }
      for (auto& worker : workers) {
        worker.join();
      }
    }

    for (std::size_t i = 0; i < results.size(); ++i) {
      if (!results[i].ok) {
        return Fail(FailureKind::kBuild, platforms[i] + ": " + results[i].error);
      }
    }

    // The runtime identity must match what the stage chain declares:
    // rootless images never report root and base images always do.
    const std::size_t target_index = *image::FindStage(plan_, outcome_.target_stage);
    const bool expect_root = image::IsRootUser(image::EffectiveIdentity(plan_, target_index).user);
    for (const auto& result : results) {
      if (image::IsRootUser(result.image.user) != expect_root) {
        return Fail(FailureKind::kBuild,
                    result.image.platform + ": image reports user '" +
                        (result.image.user.empty() ? std::string("root") : result.image.user) +
                        "' but stage '" + outcome_.target_stage + "' declares " +
                        (expect_root ? "root" : "a non-root user"));
      }
      outcome_.images.push_back(result.image);
    }
    return true;
  }

  bool Publish() {
    engine::PublishRequest request;
    request.repository = options_.config.image_name;
    request.images = outcome_.images;
    request.tags = ReleaseTags(options_.config, outcome_.version);

    std::vector<std::string> planned_references;
    for (const auto& tag : request.tags) {
      planned_references.push_back(request.repository + ":" + tag);
    }
    std::string error;
    if (!emitter_->EmitPublishStarted(
            {.ts = Clock::now(), .run_id = outcome_.run_id, .references = planned_references},
            error)) {
      WarnEventWrite(error);
    }

    engine::PublishReceipt receipt;
    if (!publisher_.Push(request, receipt, error)) {
      return Fail(FailureKind::kPublish, error);
    }
    if (receipt.digest.empty() || receipt.references.size() != request.tags.size()) {
      return Fail(FailureKind::kPublish, "registry did not confirm every release tag");
    }

    if (!state_.MarkPublished(error)) {
      return Fail(FailureKind::kInternal, error);
    }
    outcome_.published_digest = receipt.digest;
    outcome_.references = receipt.references;
    logger_.Info("release published", {{"version", outcome_.version},
                                       {"digest", receipt.digest}});
    if (!emitter_->EmitPublished({.ts = Clock::now(),
                                  .run_id = outcome_.run_id,
                                  .digest = receipt.digest,
                                  .references = receipt.references},
                                 error)) {
      WarnEventWrite(error);
    }
    return true;
  }

  void Finish() {
    outcome_.state = state_.State();
    outcome_.finished_at = Clock::now();
    outcome_.events_path = emitter_->EventsPath();

    artifacts::ReleaseRecord record;
    record.run_id = outcome_.run_id;
    record.trigger = ToString(options_.trigger.kind);
    record.ref = options_.trigger.ref;
    record.image_name = options_.config.image_name;
    record.version = outcome_.version;
    record.target_stage = outcome_.target_stage;
    record.platforms = options_.config.platforms;
    record.build_fingerprint = outcome_.build_fingerprint;
    for (const auto& image : outcome_.images) {
      record.images.push_back({image.platform, image.reference, image.digest, image.user});
    }
    record.published_digest = outcome_.published_digest;
    record.references = outcome_.references;
    record.state = ToString(outcome_.state);
    record.failure_kind = ToString(outcome_.failure_kind);
    record.error = outcome_.error;
    record.created_at = outcome_.created_at;
    record.finished_at = outcome_.finished_at;

    std::string error;
    if (!artifacts::WriteReleaseJson(record, outcome_.bundle_dir, outcome_.release_json_path,
                                     error)) {
      logger_.Warn("failed to write release record", {{"error", error}});
      outcome_.release_json_path.clear();
    }
  }

  const ReleaseOptions& options_;
  engine::IImageBuilder& builder_;
  engine::IPublisher& publisher_;
  core::logging::Logger& logger_;
  ReleaseOutcome& outcome_;
  std::unique_ptr<events::Emitter> emitter_;
  ReleaseStateMachine state_;
  image::BuildPlan plan_;
};

} // namespace

std::vector<std::string> ReleaseTags(const config::ReleaseConfig& config,
                                     const std::string& version) {
  std::vector<std::string> tags = {config.floating_tag};
  if (std::find(tags.begin(), tags.end(), version) == tags.end()) {
    tags.push_back(version);
  }
  return tags;
}

bool ExecuteRelease(const ReleaseOptions& options, engine::IImageBuilder& builder,
                    engine::IPublisher& publisher, core::logging::Logger& logger,
                    ReleaseOutcome& outcome) {
  ReleaseRun run(options, builder, publisher, logger, outcome);
  return run.Execute();
}

} // namespace relpack::pipeline
