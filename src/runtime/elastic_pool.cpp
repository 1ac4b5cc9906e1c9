#include "runtime/elastic_pool.hpp"

#include <algorithm>
#include <cassert>
#include <format>
#include <utility>

#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace fey::engine {

class ElasticPool::RouteeWatcher final : public WorkerWatcher {
 public:
  explicit RouteeWatcher(std::weak_ptr<ElasticPool> pool) : pool_(std::move(pool)) {}

  auto on_worker_restarted(std::string_view worker_path, const EngineError& cause, std::uint64_t generation)
    -> void override {
    (void)generation;
    if (auto pool = pool_.lock()) {
      pool->on_routee_restarted(worker_path, cause);
    }
  }

  auto on_worker_dead(std::string_view worker_path, const EngineError& cause, std::uint64_t generation)
    -> void override {
    (void)generation;
    if (auto pool = pool_.lock()) {
      pool->on_routee_dead(worker_path, cause);
    }
  }

 private:
  std::weak_ptr<ElasticPool> pool_;
};

auto resize_delta(const std::vector<std::size_t>& pending, const ResizerConfig& config) -> int {
  auto busy = std::count_if(pending.begin(), pending.end(), [&config](std::size_t count) {
    return count >= config.pressure_threshold;
  });
  const double fraction = static_cast<double>(busy) / static_cast<double>(pending.size());
  if (fraction > config.backlog_threshold) {
    return 1;
  }
  if (fraction < config.backoff_threshold) {
    return -1;
  }
  return 0;
}

auto ElasticPool::create(PerformerInit init, PerformerFactory factory, PerformerWorkerOptions options,
                         ResizerConfig resizer, std::shared_ptr<RestartWindow> window, WorkerEnv env)
  -> Expected<std::shared_ptr<ElasticPool>> {
  resizer.lower_bound = std::max(resizer.lower_bound, 1);
  resizer.upper_bound = std::max(resizer.upper_bound, resizer.lower_bound);
  resizer.messages_per_resize = std::max(resizer.messages_per_resize, 1);
  init.autoscale = true;

  std::shared_ptr<ElasticPool> pool(new ElasticPool(std::move(init), std::move(factory), std::move(options),
                                                    resizer, std::move(window), std::move(env)));
  pool->routee_watcher_ = std::make_shared<RouteeWatcher>(pool);

  std::lock_guard<std::mutex> lock(pool->mutex_);
  while (pool->routees_.size() < static_cast<std::size_t>(pool->resizer_.lower_bound)) {
    auto routee = pool->spawn_routee_locked();
    if (!routee) {
      return tl::unexpected(routee.error());
    }
    pool->routees_.push_back(std::move(*routee));
  }
  return pool;
}

ElasticPool::ElasticPool(PerformerInit init, PerformerFactory factory, PerformerWorkerOptions options,
                         ResizerConfig resizer, std::shared_ptr<RestartWindow> window, WorkerEnv env)
    : init_(std::move(init)),
      factory_(std::move(factory)),
      options_(std::move(options)),
      resizer_(resizer),
      window_(std::move(window)),
      env_(std::move(env)) {}

auto ElasticPool::spawn_routee_locked() -> Expected<std::shared_ptr<PerformerWorker>> {
  PerformerWorkerOptions routee_options = options_;
  routee_options.path = std::format("{}/routee-{}", options_.path, next_routee_++);
  WorkerEnv routee_env = env_;
  routee_env.watcher = routee_watcher_;
  return PerformerWorker::create(init_, factory_, std::move(routee_options), window_, std::move(routee_env));
}

auto ElasticPool::start() -> void {
  std::vector<std::shared_ptr<PerformerWorker>> routees;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    routees = routees_;
  }
  for (auto& routee : routees) {
    routee->start();
  }
}

auto ElasticPool::select_locked() const -> std::size_t {
  std::size_t best = 0;
  std::size_t best_pending = routees_[0]->pending();
  for (std::size_t i = 1; i < routees_.size(); ++i) {
    auto count = routees_[i]->pending();
    if (count < best_pending) {
      best = i;
      best_pending = count;
    }
  }
  return best;
}

auto ElasticPool::tell(Message message) -> void {
  if (message.kind == MessageKind::Stop) {
    stop();
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || dead_ || routees_.empty()) {
      fey::log::warn("dead letter to {}: {} message dropped", options_.path, to_string(message.kind));
      return;
    }
    if (message.kind == MessageKind::PrintPath) {
      fey::log::info("** {} **", options_.path);
      for (auto& routee : routees_) {
        routee->tell(message);
      }
      return;
    }
    // routing under the pool lock keeps a retiring routee's Stop behind
    // every message already assigned to it
    routees_[select_locked()]->tell(std::move(message));
  }
  auto count = dispatched_.fetch_add(1, std::memory_order_acq_rel) + 1;
  if (count % static_cast<std::uint64_t>(resizer_.messages_per_resize) == 0) {
    schedule_resize();
  }
}

auto ElasticPool::schedule_resize() -> void {
  if (resize_in_flight_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  auto self = shared_from_this();
  auto task = stdexec::schedule(env_.dispatcher->scheduler(Lane::Worker))
            | stdexec::then([self]() noexcept {
                self->resize();
                self->resize_in_flight_.store(false, std::memory_order_release);
              });
  env_.scope->spawn(std::move(task));
}

auto ElasticPool::resize() -> int {
  std::shared_ptr<PerformerWorker> added;
  int applied = 0;
  std::size_t size_after = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || dead_) {
      return 0;
    }
    std::vector<std::size_t> pending;
    pending.reserve(routees_.size());
    for (const auto& routee : routees_) {
      pending.push_back(routee->pending());
    }
    const auto delta = resize_delta(pending, resizer_);
    const auto size = routees_.size();
    if (delta > 0 && size < static_cast<std::size_t>(resizer_.upper_bound)) {
      auto routee = spawn_routee_locked();
      if (routee) {
        added = *routee;
        routees_.push_back(added);
        applied = 1;
      } else {
        fey::log::error("pool {} could not grow: {}", options_.path, routee.error().message);
      }
    } else if (delta < 0 && size > static_cast<std::size_t>(resizer_.lower_bound)) {
      // retire the least loaded routee, preferring the newest on ties
      std::size_t victim = size - 1;
      for (std::size_t i = size - 1; i-- > 0;) {
        if (routees_[i]->pending() < routees_[victim]->pending()) {
          victim = i;
        }
      }
      auto retired = routees_[victim];
      routees_.erase(routees_.begin() + static_cast<std::ptrdiff_t>(victim));
      retired->stop();
      applied = -1;
    }
    size_after = routees_.size();
    assert(size_after >= static_cast<std::size_t>(resizer_.lower_bound));
    assert(size_after <= static_cast<std::size_t>(resizer_.upper_bound));
  }
  if (added) {
    added->start();
  }
  if (applied != 0) {
    fey::log::debug("pool {} resized by {} to {} routees", options_.path, applied, size_after);
  }
  return applied;
}

auto ElasticPool::stop() -> void {
  std::vector<std::shared_ptr<PerformerWorker>> routees;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || dead_) {
      return;
    }
    stopped_ = true;
    routees = routees_;
  }
  for (auto& routee : routees) {
    routee->stop();
  }
}

auto ElasticPool::terminate() -> void {
  std::vector<std::shared_ptr<PerformerWorker>> routees;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    routees = routees_;
  }
  for (auto& routee : routees) {
    routee->terminate();
  }
}

auto ElasticPool::pending() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto& routee : routees_) {
    total += routee->pending();
  }
  return total;
}

auto ElasticPool::state() const -> WorkerState {
  std::lock_guard<std::mutex> lock(mutex_);
  if (dead_) {
    return WorkerState::Dead;
  }
  if (stopped_) {
    return WorkerState::Stopped;
  }
  for (const auto& routee : routees_) {
    if (routee->state() == WorkerState::Restarting) {
      return WorkerState::Restarting;
    }
  }
  return WorkerState::Running;
}

auto ElasticPool::size() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return routees_.size();
}

auto ElasticPool::routee_paths() const -> std::vector<std::string> {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> paths;
  paths.reserve(routees_.size());
  for (const auto& routee : routees_) {
    paths.push_back(routee->path());
  }
  return paths;
}

auto ElasticPool::on_routee_restarted(std::string_view routee_path, const EngineError& cause) -> void {
  if (env_.watcher) {
    env_.watcher->on_worker_restarted(routee_path, cause, env_.generation);
  }
}

auto ElasticPool::on_routee_dead(std::string_view routee_path, const EngineError& cause) -> void {
  std::vector<std::shared_ptr<PerformerWorker>> survivors;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dead_ || stopped_) {
      return;
    }
    dead_ = true;
    survivors = routees_;
  }
  fey::log::error("pool {} lost routee {}, stopping the pool", options_.path, routee_path);
  for (auto& routee : survivors) {
    routee->terminate();
  }
  if (env_.watcher) {
    env_.watcher->on_worker_dead(
      options_.path, make_error(cause.code, std::format("routee {}: {}", routee_path, cause.message)),
      env_.generation);
  }
}

}  // namespace fey::engine
