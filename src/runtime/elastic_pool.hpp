#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/performer.hpp"
#include "engine/supervision.hpp"
#include "runtime/worker.hpp"

namespace fey::engine {

struct ResizerConfig {
  int lower_bound = 1;
  int upper_bound = 1;
  /// Dispatched messages between two resize evaluations.
  int messages_per_resize = 500;
  /// Pending messages at which a routee counts as busy.
  std::size_t pressure_threshold = 1;
  /// Grow when the busy fraction exceeds this.
  double backlog_threshold = 0.4;
  /// Shrink when the busy fraction falls below this.
  double backoff_threshold = 0.1;
};

/// +1 to grow, -1 to shrink, 0 to keep, given each routee's pending count.
/// `pending` holds at least one entry; bounds are not applied here.
auto resize_delta(const std::vector<std::size_t>& pending, const ResizerConfig& config) -> int;

/// One logical performer backed by a resizable set of identical routees.
/// Work goes to the routee with the fewest pending messages (lowest index on
/// ties). A routee retired by a shrink leaves the routing table first and
/// drains its mailbox before it stops.
class ElasticPool final : public Worker, public std::enable_shared_from_this<ElasticPool> {
 public:
  static auto create(PerformerInit init, PerformerFactory factory, PerformerWorkerOptions options,
                     ResizerConfig resizer, std::shared_ptr<RestartWindow> window, WorkerEnv env)
    -> Expected<std::shared_ptr<ElasticPool>>;

  auto start() -> void override;

  auto id() const -> const std::string& override { return init_.id; }
  auto path() const -> const std::string& override { return options_.path; }
  auto tell(Message message) -> void override;
  auto stop() -> void override;
  auto terminate() -> void override;
  auto pending() const -> std::size_t override;
  auto state() const -> WorkerState override;

  auto size() const -> std::size_t;
  auto routee_paths() const -> std::vector<std::string>;
  auto resizer() const -> const ResizerConfig& { return resizer_; }

  /// Evaluate routee pressure once and grow or shrink by at most one routee.
  /// Returns the applied change.
  auto resize() -> int;

 private:
  class RouteeWatcher;

  ElasticPool(PerformerInit init, PerformerFactory factory, PerformerWorkerOptions options, ResizerConfig resizer,
              std::shared_ptr<RestartWindow> window, WorkerEnv env);

  auto spawn_routee_locked() -> Expected<std::shared_ptr<PerformerWorker>>;
  auto select_locked() const -> std::size_t;
  auto schedule_resize() -> void;
  auto on_routee_restarted(std::string_view routee_path, const EngineError& cause) -> void;
  auto on_routee_dead(std::string_view routee_path, const EngineError& cause) -> void;

  PerformerInit init_;
  PerformerFactory factory_;
  PerformerWorkerOptions options_;
  ResizerConfig resizer_;
  std::shared_ptr<RestartWindow> window_;
  WorkerEnv env_;
  std::shared_ptr<WorkerWatcher> routee_watcher_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<PerformerWorker>> routees_;
  int next_routee_ = 0;
  bool stopped_ = false;
  bool dead_ = false;

  std::atomic<std::uint64_t> dispatched_{0};
  std::atomic<bool> resize_in_flight_{false};
};

}  // namespace fey::engine
