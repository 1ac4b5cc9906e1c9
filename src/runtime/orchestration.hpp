#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <exec/async_scope.hpp>
#include <exec/static_thread_pool.hpp>

#include "engine/error.hpp"
#include "engine/graph_model.hpp"
#include "engine/monitor.hpp"
#include "engine/plugin_loader.hpp"
#include "engine/supervision.hpp"
#include "runtime/dispatcher.hpp"
#include "runtime/ensemble.hpp"

namespace fey::engine {

/// Configuration for an orchestration and the ensembles it owns.
struct OrchestrationConfig {
  /// Leading segment of every worker path.
  std::string name = "fey";
  /// Thread lanes shared by all ensembles.
  DispatcherConfig dispatcher;
  /// Restart window applied to every performer.
  RestartPolicy worker_restarts;
  /// Rebuilds allowed per ensemble before it is removed.
  RestartPolicy ensemble_restarts;
  int messages_per_resize = 500;
  RepositoryConfig repositories;
  /// Clock for every restart window; steady_clock when empty.
  ClockFn clock;

  /// Read the --fey_* command line flags.
  static auto from_flags() -> OrchestrationConfig;
};

/// Owns the dispatcher lanes and every ensemble of one orchestration, and
/// rebuilds ensembles that escalate.
class Orchestration final : public EnsembleParent {
 public:
  /// Ensembles created here resolve their performers through `loader`.
  /// Lifecycle events go to `monitor` (disabled when empty).
  Orchestration(OrchestrationConfig config, std::shared_ptr<PluginLoader> loader,
                monitor::MonitorSinkRef monitor = {});
  /// Stops every ensemble and waits for pending rebuilds.
  ~Orchestration() override;

  Orchestration(const Orchestration&) = delete;
  auto operator=(const Orchestration&) -> Orchestration& = delete;

  /// Create and start an ensemble from its document. Returns its id. A
  /// failed build returns the error; the ensemble stays registered and is
  /// rebuilt under the ensemble restart window.
  auto add_ensemble(Json spec) -> Expected<std::string>;
  /// Ordered stop of the ensemble, then release it. False when unknown.
  auto remove_ensemble(std::string_view ensemble_id) -> bool;
  /// The returned ensemble must not outlive the orchestration.
  auto ensemble(std::string_view ensemble_id) const -> std::shared_ptr<Ensemble>;
  auto ensemble_ids() const -> std::vector<std::string>;

  /// Schedule a rebuild on the supervision thread; never blocks the caller.
  auto on_restart_required(EnsembleRestartRequired signal) -> void override;

  auto name() const -> const std::string& { return config_.name; }
  auto dispatcher() -> Dispatcher& { return dispatcher_; }
  auto config() const -> const OrchestrationConfig& { return config_; }

 private:
  struct Entry {
    std::shared_ptr<Ensemble> ensemble;
    std::unique_ptr<RestartWindow> rebuilds;
  };

  auto make_ensemble_config() const -> EnsembleConfig;
  auto rebuild(EnsembleRestartRequired signal) -> void;

  OrchestrationConfig config_;
  Dispatcher dispatcher_;
  std::shared_ptr<PluginLoader> loader_;
  monitor::MonitorSinkRef monitor_;

  mutable std::mutex mutex_;
  std::map<std::string, Entry, std::less<>> ensembles_;
  std::uint64_t anonymous_ = 0;
  std::atomic<bool> closing_{false};

  exec::static_thread_pool supervisor_pool_{1};
  exec::async_scope scope_;
};

}  // namespace fey::engine
