#include "engine/supervision.hpp"

#include <utility>

namespace fey::engine {

auto to_string(WorkerState state) -> std::string_view {
  switch (state) {
    case WorkerState::Running:
      return "running";
    case WorkerState::Restarting:
      return "restarting";
    case WorkerState::Dead:
      return "dead";
    case WorkerState::Stopped:
      return "stopped";
  }
  return "unknown";
}

auto to_string(EnsemblePhase phase) -> std::string_view {
  switch (phase) {
    case EnsemblePhase::Idle:
      return "idle";
    case EnsemblePhase::Building:
      return "building";
    case EnsemblePhase::Running:
      return "running";
    case EnsemblePhase::Escalating:
      return "escalating";
    case EnsemblePhase::TornDown:
      return "torn_down";
  }
  return "unknown";
}

RestartWindow::RestartWindow(RestartPolicy policy, ClockFn clock)
    : policy_(policy), clock_(std::move(clock)) {
  if (policy_.max_restarts > 0) {
    ring_.resize(static_cast<std::size_t>(policy_.max_restarts));
  }
}

auto RestartWindow::now() const -> SteadyClock::time_point {
  return clock_ ? clock_() : SteadyClock::now();
}

auto RestartWindow::evict_expired_locked(SteadyClock::time_point now) const -> void {
  while (count_ > 0 && now - ring_[head_] >= policy_.window) {
    head_ = (head_ + 1) % ring_.size();
    --count_;
  }
}

auto RestartWindow::record_failure() -> bool {
  if (policy_.max_restarts < 0) {
    return true;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (ring_.empty()) {
    return false;
  }
  auto ts = now();
  evict_expired_locked(ts);
  if (count_ == ring_.size()) {
    return false;
  }
  ring_[(head_ + count_) % ring_.size()] = ts;
  ++count_;
  return true;
}

auto RestartWindow::failures_in_window() const -> int {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ring_.empty()) {
    return 0;
  }
  evict_expired_locked(now());
  return static_cast<int>(count_);
}

}  // namespace fey::engine
