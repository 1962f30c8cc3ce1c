#pragma once

#include <string>
#include <string_view>

namespace relpack::pipeline {

// Idle -> Triggered -> Published. Failed is reachable from Triggered, and
// from Idle when the trigger itself is rejected.
// Published and Failed are terminal; a new run needs a new trigger.
enum class ReleaseState {
  kIdle,
  kTriggered,
  kPublished,
  kFailed,
};

// Why a run ended in kFailed. Each kind maps to its own CLI exit code.
enum class FailureKind {
  kNone,
  kResolution,
  kBuild,
  kPublish,
  kInternal,
};

enum class TriggerKind {
  kTagPush,
  kManual,
};

// What started the run. For tag pushes `ref` is recorded as-is; the version
// always comes from the manifest, never from the tag name.
struct Trigger {
  TriggerKind kind = TriggerKind::kManual;
  std::string ref;
};

const char* ToString(ReleaseState state);
const char* ToString(FailureKind kind);
const char* ToString(TriggerKind kind);

bool IsTerminal(ReleaseState state);

class ReleaseStateMachine {
public:
  ReleaseState State() const {
    return state_;
  }

  FailureKind Failure() const {
    return failure_;
  }

  // Idle -> Triggered. Rejects tag pushes without a ref.
  bool Fire(const Trigger& trigger, std::string& error);

  // Triggered -> Published.
  bool MarkPublished(std::string& error);

  // Idle|Triggered -> Failed. `kind` must not be kNone.
  bool MarkFailed(FailureKind kind, std::string& error);

private:
  bool Transition(ReleaseState to, std::string& error);

  ReleaseState state_ = ReleaseState::kIdle;
  FailureKind failure_ = FailureKind::kNone;
};

} // namespace relpack::pipeline
