#pragma once

#include <chrono>
#include <map>
#include <string>

namespace relpack::events {

// Release timeline categories. Names are part of the events.jsonl contract.
enum class EventType {
  kReleaseTriggered,
  kVersionResolved,
  kPlanValidated,
  kPlatformBuildStarted,
  kPlatformBuilt,
  kPlatformBuildFailed,
  kPublishStarted,
  kPublished,
  kReleaseFailed,
};

// One timeline entry. `payload` is a std::map so serialized key order is
// stable.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kReleaseTriggered;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace relpack::events
