#include "events/emitter.hpp"

#include "events/jsonl_writer.hpp"

#include <utility>

namespace relpack::events {

namespace {

std::string JoinComma(const std::vector<std::string>& values) {
  std::string joined;
  for (const auto& value : values) {
    if (!joined.empty()) {
      joined.push_back(',');
    }
    joined += value;
  }
  return joined;
}

} // namespace

Emitter::Emitter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);

  std::lock_guard<std::mutex> lock(mutex_);
  return AppendEventJsonl(event, output_dir_, events_path_, error);
}

bool Emitter::EmitTriggered(const TriggeredEvent& event, std::string& error) {
  return EmitRaw(EventType::kReleaseTriggered, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"trigger", event.trigger},
                     {"ref", event.ref},
                     {"image_name", event.image_name},
                 },
                 error);
}

bool Emitter::EmitVersionResolved(const VersionResolvedEvent& event, std::string& error) {
  return EmitRaw(EventType::kVersionResolved, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"manifest_path", event.manifest_path},
                     {"version", event.version},
                     {"line", std::to_string(event.line_number)},
                 },
                 error);
}

bool Emitter::EmitPlanValidated(const PlanValidatedEvent& event, std::string& error) {
  return EmitRaw(EventType::kPlanValidated, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"target_stage", event.target_stage},
                     {"chain", JoinComma(event.chain)},
                     {"fingerprint", event.fingerprint},
                     {"context_files", std::to_string(event.context_files)},
                 },
                 error);
}

bool Emitter::EmitPlatformBuildStarted(const PlatformBuildEvent& event, std::string& error) {
  return EmitRaw(EventType::kPlatformBuildStarted, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"platform", event.platform},
                 },
                 error);
}

bool Emitter::EmitPlatformBuilt(const PlatformBuildEvent& event, std::string& error) {
  return EmitRaw(EventType::kPlatformBuilt, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"platform", event.platform},
                     {"reference", event.reference},
                     {"digest", event.digest},
                     {"user", event.user.empty() ? "root" : event.user},
                 },
                 error);
}

bool Emitter::EmitPlatformBuildFailed(const PlatformBuildEvent& event, std::string& error) {
  return EmitRaw(EventType::kPlatformBuildFailed, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"platform", event.platform},
                     {"error", event.error},
                 },
                 error);
}

bool Emitter::EmitPublishStarted(const PublishedEvent& event, std::string& error) {
  return EmitRaw(EventType::kPublishStarted, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"references", JoinComma(event.references)},
                 },
                 error);
}

bool Emitter::EmitPublished(const PublishedEvent& event, std::string& error) {
  return EmitRaw(EventType::kPublished, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"digest", event.digest},
                     {"references", JoinComma(event.references)},
                 },
                 error);
}

bool Emitter::EmitFailed(const FailedEvent& event, std::string& error) {
  return EmitRaw(EventType::kReleaseFailed, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"failure_kind", event.failure_kind},
                     {"error", event.error},
                 },
                 error);
}

} // namespace relpack::events
