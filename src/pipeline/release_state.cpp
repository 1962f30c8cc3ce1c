#include "pipeline/release_state.hpp"

namespace relpack::pipeline {

const char* ToString(ReleaseState state) {
  switch (state) {
  case ReleaseState::kIdle:
    return "idle";
  case ReleaseState::kTriggered:
    return "triggered";
  case ReleaseState::kPublished:
    return "published";
  case ReleaseState::kFailed:
    return "failed";
  }
  return "idle";
}

const char* ToString(FailureKind kind) {
  switch (kind) {
  case FailureKind::kNone:
    return "none";
  case FailureKind::kResolution:
    return "resolution_error";
  case FailureKind::kBuild:
    return "build_error";
  case FailureKind::kPublish:
    return "publish_error";
  case FailureKind::kInternal:
    return "internal_error";
  }
  return "none";
}

const char* ToString(TriggerKind kind) {
  switch (kind) {
  case TriggerKind::kTagPush:
    return "tag_push";
  case TriggerKind::kManual:
    return "manual";
  }
  return "manual";
}

bool IsTerminal(ReleaseState state) {
  return state == ReleaseState::kPublished || state == ReleaseState::kFailed;
}

bool ReleaseStateMachine::Transition(ReleaseState to, std::string& error) {
  // A rejected trigger fails straight out of Idle.
  const bool allowed = (state_ == ReleaseState::kIdle && to == ReleaseState::kTriggered) ||
                       (state_ == ReleaseState::kTriggered && IsTerminal(to)) ||
                       (state_ == ReleaseState::kIdle && to == ReleaseState::kFailed);
  if (!allowed) {
    error = std::string("invalid release state transition ") + ToString(state_) + " -> " +
            ToString(to);
    return false;
  }
  state_ = to;
  return true;
}

bool ReleaseStateMachine::Fire(const Trigger& trigger, std::string& error) {
  if (trigger.kind == TriggerKind::kTagPush && trigger.ref.empty()) {
    error = "tag push trigger requires a tag ref";
    return false;
  }
  return Transition(ReleaseState::kTriggered, error);
}

bool ReleaseStateMachine::MarkPublished(std::string& error) {
  return Transition(ReleaseState::kPublished, error);
}

bool ReleaseStateMachine::MarkFailed(FailureKind kind, std::string& error) {
  if (kind == FailureKind::kNone) {
    error = "failed release needs a failure kind";
    return false;
  }
  if (!Transition(ReleaseState::kFailed, error)) {
    return false;
  }
  failure_ = kind;
  return true;
}

} // namespace relpack::pipeline
