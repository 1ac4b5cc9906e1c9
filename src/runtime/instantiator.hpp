#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/graph_model.hpp"
#include "engine/performer.hpp"
#include "engine/plugin_loader.hpp"
#include "engine/supervision.hpp"
#include "runtime/worker.hpp"

namespace fey::engine {

using HandleMap = std::map<std::string, WorkerHandle>;

struct InstantiatorOptions {
  std::string orchestration_name;
  /// Prefix of every worker path, e.g. "orchestration/ensemble".
  std::string path_prefix;
  RestartPolicy restart_policy;
  int messages_per_resize = 500;
  /// Clock for restart windows; steady_clock when empty.
  ClockFn clock;
};

/// Turns a graph model into live workers, dependencies first. Each performer
/// is materialized exactly once; a shared dependency resolves to the same
/// handle for every dependent.
class WorkerInstantiator {
 public:
  WorkerInstantiator(const GraphModel& graph, PluginLoader& loader, InstantiatorOptions options, WorkerEnv env);

  /// Materialize every connected performer, then the standalone ones.
  auto materialize_all() -> Expected<HandleMap>;

  /// Materialize `id` and, before it, everything it connects to.
  auto materialize(std::string_view id) -> Expected<WorkerHandle>;

  /// Handles created so far, in creation order. Still valid after a failure
  /// so the caller can tear them down.
  auto created() const -> const std::vector<WorkerHandle>& { return order_; }
  auto handles() const -> const HandleMap& { return handles_; }

 private:
  auto create_worker(const PerformerSpec& spec, ConnectionHandles connections) -> Expected<WorkerHandle>;

  const GraphModel& graph_;
  PluginLoader& loader_;
  InstantiatorOptions options_;
  WorkerEnv env_;

  HandleMap handles_;
  std::vector<WorkerHandle> order_;
  std::set<std::string, std::less<>> in_progress_;
};

}  // namespace fey::engine
