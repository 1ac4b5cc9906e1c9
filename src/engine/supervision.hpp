#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace fey::engine {

enum class WorkerState {
  Running,
  Restarting,
  Dead,
  Stopped,
};

enum class EnsemblePhase {
  Idle,
  Building,
  Running,
  Escalating,
  TornDown,
};

auto to_string(WorkerState state) -> std::string_view;
auto to_string(EnsemblePhase phase) -> std::string_view;

/// At most `max_restarts` restarts inside `window`; a negative limit never
/// gives up.
struct RestartPolicy {
  int max_restarts = 3;
  std::chrono::milliseconds window{std::chrono::minutes(1)};
};

using ClockFn = std::function<SteadyClock::time_point()>;

/// Sliding window of failure timestamps kept in a fixed ring buffer sized to
/// the restart limit.
class RestartWindow {
 public:
  explicit RestartWindow(RestartPolicy policy, ClockFn clock = {});

  /// Record a failure. Returns true when the worker may be restarted, false
  /// when the limit inside the window is exhausted.
  auto record_failure() -> bool;
  auto failures_in_window() const -> int;
  auto policy() const -> const RestartPolicy& { return policy_; }

 private:
  auto now() const -> SteadyClock::time_point;
  auto evict_expired_locked(SteadyClock::time_point now) const -> void;

  RestartPolicy policy_;
  ClockFn clock_;
  mutable std::mutex mutex_;
  mutable std::vector<SteadyClock::time_point> ring_;
  mutable std::size_t head_ = 0;
  mutable std::size_t count_ = 0;
};

/// Receives lifecycle notifications from supervised workers. Calls arrive on
/// worker threads.
class WorkerWatcher {
 public:
  virtual ~WorkerWatcher() = default;

  virtual auto on_worker_restarted(std::string_view worker_path, const EngineError& cause,
                                   std::uint64_t generation) -> void = 0;
  /// The worker exhausted its restart budget and will not run again.
  virtual auto on_worker_dead(std::string_view worker_path, const EngineError& cause,
                              std::uint64_t generation) -> void = 0;
};

/// Raised by an ensemble to its owner when it cannot recover on its own.
struct EnsembleRestartRequired {
  std::string ensemble_id;
  /// Identifies the ensemble object that raised the signal; a replacement
  /// under the same id carries a different value.
  std::uint64_t instance = 0;
  std::uint64_t generation = 0;
  EngineError cause;
  /// Address of the dead worker, empty when the build itself failed.
  std::string dead_worker;
  std::int64_t ts = 0;
};

class EnsembleParent {
 public:
  virtual ~EnsembleParent() = default;

  virtual auto on_restart_required(EnsembleRestartRequired signal) -> void = 0;
};

}  // namespace fey::engine
