#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <exec/async_scope.hpp>

#include "engine/error.hpp"
#include "engine/graph_model.hpp"
#include "engine/monitor.hpp"
#include "engine/plugin_loader.hpp"
#include "engine/supervision.hpp"
#include "engine/types.hpp"
#include "runtime/dispatcher.hpp"
#include "runtime/instantiator.hpp"

namespace fey::engine {

struct EnsembleConfig {
  std::string orchestration_name = "fey";
  /// Used when the ensemble document carries no guid.
  std::string ensemble_id;
  RestartPolicy restart_policy;
  int messages_per_resize = 500;
  RepositoryConfig repositories;
  /// Clock for worker restart windows; steady_clock when empty.
  ClockFn clock;
};

/// Collaborators shared with the owning orchestration. The dispatcher and
/// loader must outlive the ensemble; the parent may be null.
struct EnsembleServices {
  Dispatcher* dispatcher = nullptr;
  std::shared_ptr<PluginLoader> loader;
  monitor::MonitorSinkRef monitor;
  EnsembleParent* parent = nullptr;
};

struct EnsembleDescription {
  std::string ensemble_id;
  std::uint64_t generation = 0;
  EnsemblePhase phase = EnsemblePhase::Idle;
  ConnectionMap edges;
  std::vector<std::string> performer_ids;
  std::vector<std::string> worker_paths;
};

auto to_string(const EnsembleDescription& description) -> std::string;

/// Supervises the workers built from one ensemble document. Transient
/// performer failures are handled by the workers' own restart windows; a
/// worker that dies tears down the whole generation and the parent is asked
/// to rebuild it.
class Ensemble {
 public:
  Ensemble(EnsembleConfig config, EnsembleServices services);
  ~Ensemble();

  Ensemble(const Ensemble&) = delete;
  auto operator=(const Ensemble&) -> Ensemble& = delete;

  /// Parse `spec`, materialize every performer and start them. On failure
  /// every worker created so far is terminated, the parent is asked to
  /// rebuild and the error is returned. Starting again after a stop or an
  /// escalation opens a new generation.
  auto start(Json spec) -> Expected<void>;

  /// Ordered stop of every worker. Idempotent.
  auto stop() -> void;

  /// Tear down the current generation and rebuild from the original document.
  auto restart(std::string_view reason) -> Expected<void>;

  auto describe() const -> EnsembleDescription;

  /// Log the graph dump and broadcast PrintPath to every worker.
  auto print() const -> void;

  /// Deliver `message` to the performer named `performer_id`.
  auto send(std::string_view performer_id, Message message) const -> Expected<void>;

  auto handle(std::string_view performer_id) const -> WorkerHandle;
  /// Entry point every worker of this ensemble reports its lifecycle to.
  auto watcher() const -> std::shared_ptr<WorkerWatcher>;
  auto id() const -> std::string;
  /// Process-unique value naming this ensemble object.
  auto instance() const -> std::uint64_t { return instance_; }
  auto generation() const -> std::uint64_t;
  auto phase() const -> EnsemblePhase;

 private:
  class Relay;

  /// Lifecycle events collected under the lock, delivered once it is released.
  struct Outcome {
    std::string ensemble_id;
    std::optional<std::string> restart_reason;
    bool started = false;
    std::optional<EnsembleRestartRequired> escalation;
  };

  auto build_locked(Outcome& outcome) -> Expected<void>;
  auto deliver(Outcome outcome) -> void;
  auto teardown_locked() -> std::vector<WorkerHandle>;
  auto on_worker_dead(std::string_view worker_path, const EngineError& cause, std::uint64_t generation) -> void;
  auto on_worker_restarted(std::string_view worker_path, const EngineError& cause, std::uint64_t generation)
    -> void;
  auto worker_paths_locked() const -> std::vector<std::string>;

  EnsembleConfig config_;
  EnsembleServices services_;
  const std::uint64_t instance_;
  std::shared_ptr<Relay> relay_;

  mutable std::mutex mutex_;
  std::optional<Json> spec_;
  std::string ensemble_id_;
  GraphModel graph_;
  HandleMap handles_;
  std::uint64_t generation_ = 0;
  EnsemblePhase phase_ = EnsemblePhase::Idle;

  // destroyed first; ~Ensemble waits for it to drain
  exec::async_scope scope_;
};

}  // namespace fey::engine
