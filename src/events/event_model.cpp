#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace relpack::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kReleaseTriggered:
    return "RELEASE_TRIGGERED";
  case EventType::kVersionResolved:
    return "VERSION_RESOLVED";
  case EventType::kPlanValidated:
    return "PLAN_VALIDATED";
  case EventType::kPlatformBuildStarted:
    return "PLATFORM_BUILD_STARTED";
  case EventType::kPlatformBuilt:
    return "PLATFORM_BUILT";
  case EventType::kPlatformBuildFailed:
    return "PLATFORM_BUILD_FAILED";
  case EventType::kPublishStarted:
    return "PUBLISH_STARTED";
  case EventType::kPublished:
    return "PUBLISHED";
  case EventType::kReleaseFailed:
    return "RELEASE_FAILED";
  }

  return "UNKNOWN";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(key) << ':' << core::QuoteJson(value);
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace relpack::events
