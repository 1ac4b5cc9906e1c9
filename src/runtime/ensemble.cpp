#include "runtime/ensemble.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <thread>
#include <utility>

#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace fey::engine {

namespace {

std::atomic<std::uint64_t> g_next_instance{1};

}  // namespace

/// Forwards worker notifications to the ensemble until it detaches. Workers
/// keep the relay alive, so a late notification never reaches a destroyed
/// ensemble. No lock is held while the ensemble handles a notification.
class Ensemble::Relay final : public WorkerWatcher {
 public:
  explicit Relay(Ensemble* owner) : owner_(owner) {}

  auto on_worker_restarted(std::string_view worker_path, const EngineError& cause, std::uint64_t generation)
    -> void override {
    Visit visit(*this);
    if (visit.owner != nullptr) {
      visit.owner->on_worker_restarted(worker_path, cause, generation);
    }
  }

  auto on_worker_dead(std::string_view worker_path, const EngineError& cause, std::uint64_t generation)
    -> void override {
    Visit visit(*this);
    if (visit.owner != nullptr) {
      visit.owner->on_worker_dead(worker_path, cause, generation);
    }
  }

  /// Stop forwarding and wait for notifications still running on other
  /// threads. One running on the calling thread is not waited for.
  auto detach() -> void {
    std::unique_lock<std::mutex> lock(mutex_);
    owner_ = nullptr;
    const auto self = std::this_thread::get_id();
    idle_.wait(lock, [this, self] {
      return std::all_of(active_.begin(), active_.end(), [self](std::thread::id id) { return id == self; });
    });
  }

 private:
  struct Visit {
    explicit Visit(Relay& relay) : relay(relay) {
      std::lock_guard<std::mutex> lock(relay.mutex_);
      owner = relay.owner_;
      if (owner != nullptr) {
        relay.active_.push_back(std::this_thread::get_id());
      }
    }

    ~Visit() {
      if (owner == nullptr) {
        return;
      }
      std::lock_guard<std::mutex> lock(relay.mutex_);
      auto it = std::find(relay.active_.begin(), relay.active_.end(), std::this_thread::get_id());
      if (it != relay.active_.end()) {
        relay.active_.erase(it);
      }
      relay.idle_.notify_all();
    }

    Visit(const Visit&) = delete;
    auto operator=(const Visit&) -> Visit& = delete;

    Relay& relay;
    Ensemble* owner = nullptr;
  };

  std::mutex mutex_;
  std::condition_variable idle_;
  std::vector<std::thread::id> active_;
  Ensemble* owner_ = nullptr;
};

auto to_string(const EnsembleDescription& description) -> std::string {
  return format_graph(description.edges, description.performer_ids, description.worker_paths);
}

Ensemble::Ensemble(EnsembleConfig config, EnsembleServices services)
    : config_(std::move(config)),
      services_(std::move(services)),
      instance_(g_next_instance.fetch_add(1, std::memory_order_relaxed)),
      relay_(std::make_shared<Relay>(this)),
      ensemble_id_(config_.ensemble_id) {}

Ensemble::~Ensemble() {
  std::vector<WorkerHandle> handles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handles = teardown_locked();
    phase_ = EnsemblePhase::TornDown;
  }
  for (auto& handle : handles) {
    handle->terminate();
  }
  relay_->detach();
  scope_.request_stop();
  stdexec::sync_wait(scope_.on_empty());
}

auto Ensemble::start(Json spec) -> Expected<void> {
  Outcome outcome;
  Expected<void> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == EnsemblePhase::Building || phase_ == EnsemblePhase::Running) {
      return tl::unexpected(make_error(std::format("ensemble {} is already running", ensemble_id_)));
    }
    if (services_.dispatcher == nullptr || !services_.loader) {
      return tl::unexpected(make_error("ensemble needs a dispatcher and a plugin loader"));
    }
    // workers of a stopped or escalated generation may still be draining
    if (phase_ != EnsemblePhase::Idle) {
      ++generation_;
    }
    spec_ = std::move(spec);
    result = build_locked(outcome);
  }
  deliver(std::move(outcome));
  return result;
}

auto Ensemble::build_locked(Outcome& outcome) -> Expected<void> {
  phase_ = EnsemblePhase::Building;
  auto escalate = [this, &outcome](const EngineError& cause) {
    phase_ = EnsemblePhase::Escalating;
    EnsembleRestartRequired signal;
    signal.ensemble_id = ensemble_id_;
    signal.instance = instance_;
    signal.generation = generation_;
    signal.cause = cause;
    signal.ts = timestamp_ms();
    outcome.ensemble_id = ensemble_id_;
    outcome.escalation = std::move(signal);
  };

  auto graph = parse_graph_model(*spec_, config_.repositories);
  if (!graph) {
    fey::log::error("ensemble {} document rejected: {}", ensemble_id_, graph.error().message);
    escalate(graph.error());
    return tl::unexpected(graph.error());
  }
  graph_ = std::move(*graph);
  if (!graph_.ensemble_id.empty()) {
    ensemble_id_ = graph_.ensemble_id;
  } else {
    graph_.ensemble_id = ensemble_id_;
  }

  InstantiatorOptions options;
  options.orchestration_name = config_.orchestration_name;
  options.path_prefix = std::format("{}/{}", config_.orchestration_name, ensemble_id_);
  options.restart_policy = config_.restart_policy;
  options.messages_per_resize = config_.messages_per_resize;
  options.clock = config_.clock;

  WorkerEnv env;
  env.dispatcher = services_.dispatcher;
  env.scope = &scope_;
  env.watcher = relay_;
  env.generation = generation_;

  WorkerInstantiator instantiator(graph_, *services_.loader, std::move(options), std::move(env));
  auto handles = instantiator.materialize_all();
  if (!handles) {
    for (const auto& handle : instantiator.created()) {
      handle->terminate();
    }
    handles_.clear();
    fey::log::error("ensemble {} generation {} could not create its performers: {}", ensemble_id_, generation_,
                    handles.error().message);
    escalate(handles.error());
    return tl::unexpected(handles.error());
  }

  handles_ = std::move(*handles);
  phase_ = EnsemblePhase::Running;
  outcome.ensemble_id = ensemble_id_;
  outcome.started = true;
  fey::log::info("{}", format_graph(graph_.connections, performer_ids(graph_), worker_paths_locked()));
  return {};
}

auto Ensemble::deliver(Outcome outcome) -> void {
  const auto ts = timestamp_ms();
  if (outcome.restart_reason) {
    monitor::emit(services_.monitor, monitor::Restart{outcome.ensemble_id, *outcome.restart_reason, ts});
  }
  if (outcome.started) {
    monitor::emit(services_.monitor, monitor::Start{outcome.ensemble_id, ts});
  }
  if (!outcome.escalation) {
    return;
  }
  if (services_.parent == nullptr) {
    fey::log::critical("ensemble {} is down and has no parent to rebuild it", outcome.ensemble_id);
    return;
  }
  // the parent may release this ensemble; nothing below touches members
  services_.parent->on_restart_required(std::move(*outcome.escalation));
}

auto Ensemble::teardown_locked() -> std::vector<WorkerHandle> {
  std::vector<WorkerHandle> handles;
  handles.reserve(handles_.size());
  for (auto& [id, handle] : handles_) {
    handles.push_back(std::move(handle));
  }
  handles_.clear();
  return handles;
}

auto Ensemble::stop() -> void {
  std::vector<WorkerHandle> handles;
  std::string ensemble_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == EnsemblePhase::Idle || phase_ == EnsemblePhase::TornDown) {
      return;
    }
    handles = teardown_locked();
    graph_ = GraphModel{};
    phase_ = EnsemblePhase::TornDown;
    ensemble_id = ensemble_id_;
  }
  for (auto& handle : handles) {
    handle->stop();
  }
  monitor::emit(services_.monitor, monitor::Stop{ensemble_id, timestamp_ms()});
  fey::log::info("ensemble.stop", {{"ensemble", ensemble_id}, {"workers", std::to_string(handles.size())}});
}

auto Ensemble::restart(std::string_view reason) -> Expected<void> {
  Outcome outcome;
  Expected<void> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!spec_) {
      return tl::unexpected(make_error("ensemble was never started"));
    }
    for (auto& handle : teardown_locked()) {
      handle->terminate();
    }
    ++generation_;
    outcome.ensemble_id = ensemble_id_;
    outcome.restart_reason = std::string(reason);
    fey::log::warn("restarting ensemble {} as generation {}: {}", ensemble_id_, generation_, reason);
    result = build_locked(outcome);
  }
  deliver(std::move(outcome));
  return result;
}

auto Ensemble::on_worker_dead(std::string_view worker_path, const EngineError& cause, std::uint64_t generation)
  -> void {
  std::vector<WorkerHandle> survivors;
  EnsembleRestartRequired signal;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || phase_ != EnsemblePhase::Running) {
      fey::log::debug("ignoring death of {} from generation {}", worker_path, generation);
      return;
    }
    phase_ = EnsemblePhase::Escalating;
    survivors = teardown_locked();
    signal.ensemble_id = ensemble_id_;
    signal.instance = instance_;
    signal.generation = generation_;
    signal.cause =
      make_error(ErrorCode::RestartRequired, std::format("DEAD performer {}: {}", worker_path, cause.message));
    signal.dead_worker = std::string(worker_path);
    signal.ts = timestamp_ms();
  }

  monitor::emit(services_.monitor, monitor::Terminate{worker_path, signal.ts});
  fey::log::error("DEAD performer {} in ensemble {}: {}", worker_path, signal.ensemble_id, cause.message);
  for (auto& handle : survivors) {
    handle->terminate();
  }
  if (services_.parent == nullptr) {
    fey::log::critical("ensemble {} is down and has no parent to rebuild it", signal.ensemble_id);
    return;
  }
  services_.parent->on_restart_required(std::move(signal));
}

auto Ensemble::on_worker_restarted(std::string_view worker_path, const EngineError& cause,
                                   std::uint64_t generation) -> void {
  std::string ensemble_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
      return;
    }
    ensemble_id = ensemble_id_;
  }
  fey::log::info("performer.restarted",
                 {{"ensemble", ensemble_id}, {"worker", std::string(worker_path)}, {"cause", cause.message}});
}

auto Ensemble::worker_paths_locked() const -> std::vector<std::string> {
  std::vector<std::string> paths;
  paths.reserve(handles_.size());
  for (const auto& [id, handle] : handles_) {
    paths.push_back(handle->path());
  }
  return paths;
}

auto Ensemble::describe() const -> EnsembleDescription {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsembleDescription description;
  description.ensemble_id = ensemble_id_;
  description.generation = generation_;
  description.phase = phase_;
  description.edges = graph_.connections;
  description.performer_ids = performer_ids(graph_);
  description.worker_paths = worker_paths_locked();
  return description;
}

auto Ensemble::print() const -> void {
  std::vector<WorkerHandle> handles;
  auto description = describe();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, handle] : handles_) {
      handles.push_back(handle);
    }
  }
  fey::log::info("{}", to_string(description));
  for (auto& handle : handles) {
    handle->tell(Message{MessageKind::PrintPath, Json(), false});
  }
}

auto Ensemble::send(std::string_view performer_id, Message message) const -> Expected<void> {
  auto target = handle(performer_id);
  if (!target) {
    return tl::unexpected(make_error(ErrorCode::UnknownPerformer,
                                     std::format("performer {} is not running in ensemble {}", performer_id, id())));
  }
  target->tell(std::move(message));
  return {};
}

auto Ensemble::handle(std::string_view performer_id) const -> WorkerHandle {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handles_.find(std::string(performer_id));
  return it == handles_.end() ? nullptr : it->second;
}

auto Ensemble::watcher() const -> std::shared_ptr<WorkerWatcher> {
  return relay_;
}

auto Ensemble::id() const -> std::string {
  std::lock_guard<std::mutex> lock(mutex_);
  return ensemble_id_;
}

auto Ensemble::generation() const -> std::uint64_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

auto Ensemble::phase() const -> EnsemblePhase {
  std::lock_guard<std::mutex> lock(mutex_);
  return phase_;
}

}  // namespace fey::engine
