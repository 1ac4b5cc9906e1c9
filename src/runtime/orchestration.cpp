#include "runtime/orchestration.hpp"

#include <format>
#include <utility>

#include <gflags/gflags.h>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

DECLARE_int32(fey_max_restarts);
DECLARE_int64(fey_restart_window_ms);
DECLARE_int32(fey_ensemble_max_restarts);
DECLARE_int64(fey_ensemble_restart_window_ms);
DECLARE_int32(fey_messages_per_resize);
DECLARE_string(fey_jar_repository);
DECLARE_string(fey_dynamic_jar_repository);
DECLARE_int32(fey_worker_threads);
DECLARE_int32(fey_control_threads);

namespace fey::engine {

auto OrchestrationConfig::from_flags() -> OrchestrationConfig {
  OrchestrationConfig config;
  config.dispatcher.worker_threads = FLAGS_fey_worker_threads;
  config.dispatcher.control_threads = FLAGS_fey_control_threads;
  config.worker_restarts.max_restarts = FLAGS_fey_max_restarts;
  config.worker_restarts.window = std::chrono::milliseconds(FLAGS_fey_restart_window_ms);
  config.ensemble_restarts.max_restarts = FLAGS_fey_ensemble_max_restarts;
  config.ensemble_restarts.window = std::chrono::milliseconds(FLAGS_fey_ensemble_restart_window_ms);
  config.messages_per_resize = FLAGS_fey_messages_per_resize;
  config.repositories.static_root = FLAGS_fey_jar_repository;
  config.repositories.dynamic_root = FLAGS_fey_dynamic_jar_repository;
  return config;
}

Orchestration::Orchestration(OrchestrationConfig config, std::shared_ptr<PluginLoader> loader,
                             monitor::MonitorSinkRef monitor)
    : config_(std::move(config)),
      dispatcher_(config_.dispatcher),
      loader_(std::move(loader)),
      monitor_(monitor) {
  fey::log::init();
}

Orchestration::~Orchestration() {
  closing_.store(true, std::memory_order_release);
  stdexec::sync_wait(scope_.on_empty());

  std::map<std::string, Entry, std::less<>> ensembles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ensembles.swap(ensembles_);
  }
  for (auto& [id, entry] : ensembles) {
    entry.ensemble->stop();
  }
  // ensembles drain their workers on destruction
  ensembles.clear();
  // a worker may have escalated while the ensembles were going down
  stdexec::sync_wait(scope_.on_empty());
}

auto Orchestration::make_ensemble_config() const -> EnsembleConfig {
  EnsembleConfig ensemble_config;
  ensemble_config.orchestration_name = config_.name;
  ensemble_config.restart_policy = config_.worker_restarts;
  ensemble_config.messages_per_resize = config_.messages_per_resize;
  ensemble_config.repositories = config_.repositories;
  ensemble_config.clock = config_.clock;
  return ensemble_config;
}

auto Orchestration::add_ensemble(Json spec) -> Expected<std::string> {
  if (!loader_) {
    return tl::unexpected(make_error("orchestration has no plugin loader"));
  }
  std::string id;
  if (spec.is_object()) {
    if (auto it = spec.find("guid"); it != spec.end() && it->is_string()) {
      id = it->get<std::string>();
    }
  }

  auto ensemble_config = make_ensemble_config();
  EnsembleServices services;
  services.dispatcher = &dispatcher_;
  services.loader = loader_;
  services.monitor = monitor_;
  services.parent = this;

  std::shared_ptr<Ensemble> ensemble;
  std::shared_ptr<Ensemble> replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (id.empty()) {
      id = std::format("ensemble-{}", anonymous_++);
    }
    ensemble_config.ensemble_id = id;
    ensemble = std::make_shared<Ensemble>(std::move(ensemble_config), std::move(services));
    // registered before the build so a failed build is rebuilt under the window
    auto& entry = ensembles_[id];
    replaced = std::move(entry.ensemble);
    entry.ensemble = ensemble;
    entry.rebuilds = std::make_unique<RestartWindow>(config_.ensemble_restarts, config_.clock);
  }
  if (replaced) {
    fey::log::warn("ensemble {} replaced by a new document", id);
    replaced->stop();
    replaced.reset();
  }

  auto started = ensemble->start(std::move(spec));
  if (!started) {
    return tl::unexpected(started.error());
  }
  fey::log::info("ensemble.add", {{"orchestration", config_.name}, {"ensemble", id}});
  return id;
}

auto Orchestration::remove_ensemble(std::string_view ensemble_id) -> bool {
  std::shared_ptr<Ensemble> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ensembles_.find(ensemble_id);
    if (it == ensembles_.end()) {
      return false;
    }
    removed = std::move(it->second.ensemble);
    ensembles_.erase(it);
  }
  removed->stop();
  fey::log::info("ensemble.remove", {{"orchestration", config_.name}, {"ensemble", std::string(ensemble_id)}});
  return true;
}

auto Orchestration::ensemble(std::string_view ensemble_id) const -> std::shared_ptr<Ensemble> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = ensembles_.find(ensemble_id);
  return it == ensembles_.end() ? nullptr : it->second.ensemble;
}

auto Orchestration::ensemble_ids() const -> std::vector<std::string> {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(ensembles_.size());
  for (const auto& [id, entry] : ensembles_) {
    ids.push_back(id);
  }
  return ids;
}

auto Orchestration::on_restart_required(EnsembleRestartRequired signal) -> void {
  if (closing_.load(std::memory_order_acquire)) {
    return;
  }
  auto task = stdexec::schedule(supervisor_pool_.get_scheduler())
            | stdexec::then([this, signal = std::move(signal)]() mutable noexcept { rebuild(std::move(signal)); });
  scope_.spawn(std::move(task));
}

auto Orchestration::rebuild(EnsembleRestartRequired signal) -> void {
  if (closing_.load(std::memory_order_acquire)) {
    return;
  }
  std::shared_ptr<Ensemble> target;
  bool allowed = false;
  int limit = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ensembles_.find(signal.ensemble_id);
    if (it == ensembles_.end()) {
      return;
    }
    const auto& current = it->second.ensemble;
    if (current->instance() != signal.instance || current->generation() != signal.generation) {
      fey::log::debug("ignoring restart request for ensemble {} generation {}", signal.ensemble_id,
                      signal.generation);
      return;
    }
    target = current;
    allowed = it->second.rebuilds->record_failure();
    limit = it->second.rebuilds->policy().max_restarts;
  }

  if (!allowed) {
    fey::log::critical("ensemble {} exceeded {} rebuilds within {}ms, removing it: {}", signal.ensemble_id, limit,
                       config_.ensemble_restarts.window.count(), signal.cause.message);
    target.reset();
    remove_ensemble(signal.ensemble_id);
    return;
  }

  // a failed rebuild escalates again on its own
  auto restarted = target->restart(signal.cause.message);
  if (!restarted) {
    fey::log::error("rebuild of ensemble {} failed: {}", signal.ensemble_id, restarted.error().message);
  }
}

}  // namespace fey::engine
