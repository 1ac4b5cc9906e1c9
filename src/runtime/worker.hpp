#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <exec/async_scope.hpp>

#include "engine/error.hpp"
#include "engine/performer.hpp"
#include "engine/supervision.hpp"
#include "engine/types.hpp"
#include "runtime/dispatcher.hpp"

namespace fey::engine {

/// Where a worker runs and who watches it. The dispatcher and scope must
/// outlive every task the worker spawns.
struct WorkerEnv {
  Dispatcher* dispatcher = nullptr;
  exec::async_scope* scope = nullptr;
  std::shared_ptr<WorkerWatcher> watcher;
  std::uint64_t generation = 0;
};

/// Live concurrent unit addressed by its path. Every operation is
/// non-blocking.
class Worker {
 public:
  virtual ~Worker() = default;

  virtual auto id() const -> const std::string& = 0;
  virtual auto path() const -> const std::string& = 0;
  /// Begin processing and arm schedule ticks. Called once after creation.
  virtual auto start() -> void = 0;
  virtual auto tell(Message message) -> void = 0;
  /// Ordered stop: messages queued before it are still processed.
  virtual auto stop() -> void = 0;
  /// Immediate stop: queued messages are dropped.
  virtual auto terminate() -> void = 0;
  /// Queued plus in-flight messages.
  virtual auto pending() const -> std::size_t = 0;
  virtual auto state() const -> WorkerState = 0;

  auto is_alive() const -> bool {
    auto current = state();
    return current == WorkerState::Running || current == WorkerState::Restarting;
  }
};

struct PerformerWorkerOptions {
  std::string path;
  Lane lane = Lane::Worker;
  bool control_aware = false;
};

/// Runs one performer instance behind a private mailbox. At most one drain
/// task per worker is in flight, so the performer is never entered
/// concurrently.
class PerformerWorker final : public Worker,
                              public PerformerContext,
                              public std::enable_shared_from_this<PerformerWorker> {
 public:
  /// Invoke the factory and wire the worker. Fails with the factory error;
  /// nothing is scheduled until start().
  static auto create(PerformerInit init, PerformerFactory factory, PerformerWorkerOptions options,
                     std::shared_ptr<RestartWindow> window, WorkerEnv env)
    -> Expected<std::shared_ptr<PerformerWorker>>;

  ~PerformerWorker() override;

  /// Run the performer's on_start on its lane and arm the schedule timer.
  auto start() -> void override;

  auto id() const -> const std::string& override { return init_.id; }
  auto path() const -> const std::string& override { return options_.path; }
  auto tell(Message message) -> void override;
  auto stop() -> void override;
  auto terminate() -> void override;
  auto pending() const -> std::size_t override { return pending_.load(std::memory_order_acquire); }
  auto state() const -> WorkerState override { return state_.load(std::memory_order_acquire); }

  auto init() const -> const PerformerInit& override { return init_; }
  auto propagate(Json payload) -> void override;
  auto start_backoff() -> void override;
  auto in_backoff() const -> bool override;

  auto lane() const -> Lane { return options_.lane; }
  auto restarts() const -> int { return restarts_.load(std::memory_order_acquire); }

 private:
  PerformerWorker(PerformerInit init, PerformerFactory factory, PerformerWorkerOptions options,
                  std::shared_ptr<RestartWindow> window, WorkerEnv env);

  auto schedule_drain_locked() -> void;
  auto post_drain() -> void;
  auto drain() -> void;
  auto pop_locked(Message& out) -> bool;
  auto handle(const Message& message) -> void;
  template <typename Fn>
  auto invoke(const char* hook, Fn&& fn) -> Expected<void>;
  auto fail(EngineError error) -> void;
  auto restart_in_place() -> Expected<void>;
  auto instantiate() -> Expected<std::unique_ptr<Performer>>;
  auto finish(WorkerState final_state) -> void;
  auto discard_queued(std::string_view reason) -> void;
  auto arm_tick() -> void;

  PerformerInit init_;
  PerformerFactory factory_;
  PerformerWorkerOptions options_;
  std::shared_ptr<RestartWindow> window_;
  WorkerEnv env_;

  // touched only from the drain task
  std::unique_ptr<Performer> performer_;
  bool started_ = false;
  SteadyClock::time_point backoff_until_{};

  std::mutex mutex_;
  std::deque<Message> control_queue_;
  std::deque<Message> data_queue_;
  bool scheduled_ = false;
  bool terminate_requested_ = false;

  std::atomic<std::size_t> pending_{0};
  std::atomic<WorkerState> state_{WorkerState::Running};
  std::atomic<int> restarts_{0};
};

}  // namespace fey::engine
