#include "pulse/flow/status.hpp"

#include <cstdlib>
#include <exception>

#include "pulse/obs/observability.hpp"

namespace pulse::flow {

std::string_view to_string(PushStatus s) noexcept {
  switch (s) {
    case PushStatus::Accepted: return "accepted";
    case PushStatus::Full:     return "full";
    case PushStatus::Closed:   return "closed";
  }
  return "unknown";
}

std::string_view to_string(PullStatus s) noexcept {
  switch (s) {
    case PullStatus::Ready:  return "ready";
    case PullStatus::Empty:  return "empty";
    case PullStatus::Closed: return "closed";
  }
  return "unknown";
}

std::string_view to_string(ProcessorKind k) noexcept {
  return k == ProcessorKind::Sync ? "sync" : "async";
}

std::string_view to_string(ProcessorState s) noexcept {
  switch (s) {
    case ProcessorState::Running: return "running";
    case ProcessorState::Closed:  return "closed";
    case ProcessorState::Failed:  return "failed";
  }
  return "unknown";
}

void invariant_violation(std::string_view what, obs::Observer* observer) noexcept {
  try {
    if (observer != nullptr) {
      observer->record(obs::EngineEvent{obs::EventKind::InvariantViolation, {}, 1,
                                        std::string(what)});
    } else {
      obs::report_violation(what);
    }
  } catch (const std::exception&) {
    // Reporting is best-effort; the abort below is not.
  }
  std::abort();
}

} // namespace pulse::flow
