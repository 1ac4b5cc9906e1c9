#pragma once

#include <memory>
#include <utility>

#include <exec/static_thread_pool.hpp>
#include <exec/timed_thread_scheduler.hpp>

namespace fey::engine {

enum class Lane {
  Worker,
  Control,
};

struct DispatcherConfig {
  /// Threads for ordinary performers (0 = hardware concurrency).
  int worker_threads = 0;
  /// Threads reserved for control-priority performers.
  int control_threads = 1;
};

/// Thread lanes shared by every worker of an orchestration, plus the timer
/// that drives performer schedule ticks.
class Dispatcher {
 public:
  using Scheduler = decltype(std::declval<exec::static_thread_pool&>().get_scheduler());

  explicit Dispatcher(DispatcherConfig config = {});
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  auto operator=(const Dispatcher&) -> Dispatcher& = delete;

  auto scheduler(Lane lane) -> Scheduler;
  auto timer() -> exec::timed_thread_scheduler;
  auto worker_threads() const -> int { return worker_threads_; }
  auto control_threads() const -> int { return control_threads_; }

 private:
  int worker_threads_ = 0;
  int control_threads_ = 0;
  exec::static_thread_pool worker_pool_;
  exec::static_thread_pool control_pool_;
  std::unique_ptr<exec::timed_thread_context> timer_context_;
};

}  // namespace fey::engine
