#include "runtime/instantiator.hpp"

#include <format>
#include <utility>

#include "common/logging/log.hpp"
#include "runtime/elastic_pool.hpp"

namespace fey::engine {
namespace {

const std::vector<std::string> kNoConnections;

}  // namespace

WorkerInstantiator::WorkerInstantiator(const GraphModel& graph, PluginLoader& loader, InstantiatorOptions options,
                                       WorkerEnv env)
    : graph_(graph), loader_(loader), options_(std::move(options)), env_(std::move(env)) {}

auto WorkerInstantiator::materialize_all() -> Expected<HandleMap> {
  for (const auto& [id, targets] : graph_.connections) {
    auto handle = materialize(id);
    if (!handle) {
      return tl::unexpected(handle.error());
    }
  }
  // performers that appear in no connection entry
  for (const auto& [id, spec] : graph_.performers) {
    auto handle = materialize(id);
    if (!handle) {
      return tl::unexpected(handle.error());
    }
  }
  return handles_;
}

auto WorkerInstantiator::materialize(std::string_view id) -> Expected<WorkerHandle> {
  if (auto it = handles_.find(std::string(id)); it != handles_.end()) {
    return it->second;
  }
  auto spec_it = graph_.performers.find(std::string(id));
  if (spec_it == graph_.performers.end()) {
    fey::log::error("performer {} is not defined in the ensemble", id);
    return tl::unexpected(
      make_error(ErrorCode::UnknownPerformer, std::format("performer {} is not defined in the ensemble", id)));
  }
  if (in_progress_.contains(id)) {
    fey::log::error("connection cycle through performer {}", id);
    return tl::unexpected(
      make_error(ErrorCode::ConnectionCycle, std::format("connection cycle through performer {}", id)));
  }
  in_progress_.emplace(id);

  const auto& spec = spec_it->second;
  auto edges_it = graph_.connections.find(spec.id);
  const auto& targets = edges_it == graph_.connections.end() ? kNoConnections : edges_it->second;

  ConnectionHandles connections;
  for (const auto& target : targets) {
    auto dependency = materialize(target);
    if (!dependency) {
      in_progress_.erase(spec.id);
      return tl::unexpected(dependency.error());
    }
    connections.emplace(target, std::move(*dependency));
  }

  auto handle = create_worker(spec, std::move(connections));
  in_progress_.erase(spec.id);
  if (!handle) {
    return tl::unexpected(handle.error());
  }
  handles_.emplace(spec.id, *handle);
  order_.push_back(*handle);
  (*handle)->start();
  return *handle;
}

auto WorkerInstantiator::create_worker(const PerformerSpec& spec, ConnectionHandles connections)
  -> Expected<WorkerHandle> {
  const auto artifact_path = (spec.artifact_location / spec.artifact_name).string();
  auto factory = loader_.load(spec.plugin_ref, spec.artifact_location, spec.artifact_name);
  if (!factory) {
    fey::log::error("could not load {} for performer {} from {}: {}", spec.plugin_ref, spec.id, artifact_path,
                    factory.error().message);
    return tl::unexpected(make_error(
      ErrorCode::PerformerCreationFailed,
      std::format("performer {}: could not load {} from {}: {}", spec.id, spec.plugin_ref, artifact_path,
                  factory.error().message)));
  }

  PerformerInit init;
  init.id = spec.id;
  init.parameters = spec.parameters;
  init.backoff = spec.backoff;
  init.connections = std::move(connections);
  init.schedule = spec.schedule;
  init.ensemble_id = graph_.ensemble_id;
  init.orchestration_name = options_.orchestration_name;
  init.autoscale = spec.pool_upper_bound > 0;

  PerformerWorkerOptions worker_options;
  worker_options.path = options_.path_prefix.empty() ? spec.id : std::format("{}/{}", options_.path_prefix, spec.id);
  worker_options.lane = spec.control_priority ? Lane::Control : Lane::Worker;
  worker_options.control_aware = spec.control_priority;

  auto window = std::make_shared<RestartWindow>(options_.restart_policy, options_.clock);

  auto handle = [&]() -> Expected<WorkerHandle> {
    if (spec.pool_upper_bound > 0) {
      ResizerConfig resizer;
      resizer.lower_bound = 1;
      resizer.upper_bound = spec.pool_upper_bound;
      resizer.messages_per_resize = options_.messages_per_resize;
      auto pool = ElasticPool::create(std::move(init), std::move(*factory), std::move(worker_options), resizer,
                                      std::move(window), env_);
      if (!pool) {
        return tl::unexpected(pool.error());
      }
      return WorkerHandle(std::move(*pool));
    }
    auto worker =
      PerformerWorker::create(std::move(init), std::move(*factory), std::move(worker_options), std::move(window), env_);
    if (!worker) {
      return tl::unexpected(worker.error());
    }
    return WorkerHandle(std::move(*worker));
  }();

  if (!handle) {
    fey::log::error("could not create performer {} ({} from {}): {}", spec.id, spec.plugin_ref, artifact_path,
                    handle.error().message);
    return tl::unexpected(make_error(ErrorCode::PerformerCreationFailed,
                                     std::format("performer {}: {}", spec.id, handle.error().message)));
  }
  return handle;
}

}  // namespace fey::engine
