#pragma once

#include "events/event_model.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace relpack::events {

// Typed facade over events.jsonl so payload keys stay consistent between
// the pipeline and anything that reads the timeline. Safe to call from the
// per-platform build threads.
class Emitter {
public:
  struct TriggeredEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    std::string trigger;
    std::string ref;
    std::string image_name;
  };

  struct VersionResolvedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    std::string manifest_path;
    std::string version;
    std::size_t line_number = 0;
  };

  struct PlanValidatedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    std::string target_stage;
    std::vector<std::string> chain;
    std::string fingerprint;
    std::size_t context_files = 0;
  };

  struct PlatformBuildEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    std::string platform;
    std::string reference;
    std::string digest;
    std::string user;
    std::string error;
  };

  struct PublishedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    std::string digest;
    std::vector<std::string> references;
  };

  struct FailedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    std::string failure_kind;
    std::string error;
  };

  explicit Emitter(std::filesystem::path output_dir);

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitTriggered(const TriggeredEvent& event, std::string& error);
  bool EmitVersionResolved(const VersionResolvedEvent& event, std::string& error);
  bool EmitPlanValidated(const PlanValidatedEvent& event, std::string& error);
  bool EmitPlatformBuildStarted(const PlatformBuildEvent& event, std::string& error);
  bool EmitPlatformBuilt(const PlatformBuildEvent& event, std::string& error);
  bool EmitPlatformBuildFailed(const PlatformBuildEvent& event, std::string& error);
  bool EmitPublishStarted(const PublishedEvent& event, std::string& error);
  bool EmitPublished(const PublishedEvent& event, std::string& error);
  bool EmitFailed(const FailedEvent& event, std::string& error);

  // Empty until the first successful emit.
  const std::filesystem::path& EventsPath() const {
    return events_path_;
  }

private:
  std::filesystem::path output_dir_;
  std::filesystem::path events_path_;
  std::mutex mutex_;
};

} // namespace relpack::events
