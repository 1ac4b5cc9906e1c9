#include "runtime/worker.hpp"

#include <exception>
#include <format>
#include <utility>

#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace fey::engine {
namespace {

// messages handled per drain task before yielding the lane thread
constexpr int kThroughput = 16;

auto payload_text(const Json& payload) -> std::string {
  if (payload.is_string()) {
    return payload.get<std::string>();
  }
  return payload.dump();
}

}  // namespace

template <typename Fn>
auto PerformerWorker::invoke(const char* hook, Fn&& fn) -> Expected<void> {
  try {
    auto result = fn();
    if (!result) {
      return tl::unexpected(make_error(ErrorCode::WorkerFailure,
                                       std::format("{} failed: {}", hook, result.error().message)));
    }
    return {};
  } catch (const std::exception& ex) {
    return tl::unexpected(make_error(ErrorCode::WorkerFailure, std::format("{} threw: {}", hook, ex.what())));
  } catch (...) {
    return tl::unexpected(make_error(ErrorCode::WorkerFailure, std::format("{} threw a non-standard exception", hook)));
  }
}

auto PerformerWorker::create(PerformerInit init, PerformerFactory factory, PerformerWorkerOptions options,
                             std::shared_ptr<RestartWindow> window, WorkerEnv env)
  -> Expected<std::shared_ptr<PerformerWorker>> {
  if (!factory) {
    return tl::unexpected(make_error(ErrorCode::PerformerCreationFailed,
                                     std::format("no factory for performer {}", init.id)));
  }
  std::shared_ptr<PerformerWorker> worker(
    new PerformerWorker(std::move(init), std::move(factory), std::move(options), std::move(window), std::move(env)));
  auto performer = worker->instantiate();
  if (!performer) {
    return tl::unexpected(performer.error());
  }
  worker->performer_ = std::move(*performer);
  return worker;
}

PerformerWorker::PerformerWorker(PerformerInit init, PerformerFactory factory, PerformerWorkerOptions options,
                                 std::shared_ptr<RestartWindow> window, WorkerEnv env)
    : init_(std::move(init)),
      factory_(std::move(factory)),
      options_(std::move(options)),
      window_(std::move(window)),
      env_(std::move(env)) {}

PerformerWorker::~PerformerWorker() = default;

auto PerformerWorker::start() -> void {
  bool post = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    post = !scheduled_;
    schedule_drain_locked();
  }
  if (post) {
    post_drain();
  }
  arm_tick();
}

auto PerformerWorker::tell(Message message) -> void {
  bool post = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_alive() || terminate_requested_) {
      fey::log::warn("dead letter to {}: {} message dropped", options_.path, to_string(message.kind));
      return;
    }
    if (options_.control_aware && message.control) {
      control_queue_.push_back(std::move(message));
    } else {
      data_queue_.push_back(std::move(message));
    }
    pending_.fetch_add(1, std::memory_order_acq_rel);
    post = !scheduled_;
    schedule_drain_locked();
  }
  if (post) {
    post_drain();
  }
}

auto PerformerWorker::stop() -> void {
  tell(Message{MessageKind::Stop, Json(), false});
}

auto PerformerWorker::terminate() -> void {
  bool post = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_alive() || terminate_requested_) {
      return;
    }
    terminate_requested_ = true;
    post = !scheduled_;
    schedule_drain_locked();
  }
  if (post) {
    post_drain();
  }
}

auto PerformerWorker::propagate(Json payload) -> void {
  for (const auto& [id, connection] : init_.connections) {
    if (connection) {
      connection->tell(Message::process(payload));
    }
  }
}

auto PerformerWorker::start_backoff() -> void {
  backoff_until_ = SteadyClock::now() + init_.backoff;
}

auto PerformerWorker::in_backoff() const -> bool {
  return SteadyClock::now() < backoff_until_;
}

auto PerformerWorker::schedule_drain_locked() -> void {
  scheduled_ = true;
}

auto PerformerWorker::post_drain() -> void {
  auto self = shared_from_this();
  auto task = stdexec::schedule(env_.dispatcher->scheduler(options_.lane))
            | stdexec::then([self]() noexcept { self->drain(); });
  env_.scope->spawn(std::move(task));
}

auto PerformerWorker::pop_locked(Message& out) -> bool {
  if (!control_queue_.empty()) {
    out = std::move(control_queue_.front());
    control_queue_.pop_front();
    return true;
  }
  if (!data_queue_.empty()) {
    out = std::move(data_queue_.front());
    data_queue_.pop_front();
    return true;
  }
  return false;
}

auto PerformerWorker::drain() -> void {
  if (!started_ && is_alive()) {
    started_ = true;
    auto result = invoke("on_start", [this] { return performer_->on_start(*this); });
    if (!result) {
      fail(std::move(result.error()));
    }
  }

  for (int processed = 0; processed < kThroughput; ++processed) {
    Message message;
    bool terminate_now = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminate_requested_ && is_alive()) {
        terminate_now = true;
      } else if (!pop_locked(message)) {
        scheduled_ = false;
        return;
      }
    }
    if (terminate_now) {
      finish(WorkerState::Stopped);
      continue;
    }
    handle(message);
    pending_.fetch_sub(1, std::memory_order_acq_rel);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (control_queue_.empty() && data_queue_.empty() && !(terminate_requested_ && is_alive())) {
      scheduled_ = false;
      return;
    }
  }
  post_drain();
}

auto PerformerWorker::handle(const Message& message) -> void {
  if (!is_alive()) {
    return;
  }
  switch (message.kind) {
    case MessageKind::Stop:
      finish(WorkerState::Stopped);
      return;
    case MessageKind::PrintPath:
      fey::log::info("** {} **", options_.path);
      return;
    case MessageKind::Exception:
      fail(make_error(ErrorCode::WorkerFailure, std::format("exception requested: {}", payload_text(message.payload))));
      return;
    case MessageKind::Tick: {
      if (in_backoff()) {
        return;
      }
      auto result = invoke("on_tick", [this] { return performer_->on_tick(*this); });
      if (!result) {
        fail(std::move(result.error()));
      }
      return;
    }
    case MessageKind::Process: {
      if (in_backoff()) {
        fey::log::warn("{} in backoff, message dropped", options_.path);
        return;
      }
      auto result = invoke("on_message", [this, &message] { return performer_->on_message(*this, message); });
      if (!result) {
        fail(std::move(result.error()));
      }
      return;
    }
  }
}

auto PerformerWorker::fail(EngineError error) -> void {
  while (true) {
    fey::log::error("performer {} failed: {}", options_.path, error.message);
    if (!window_->record_failure()) {
      fey::log::critical("performer {} exceeded {} restarts within {}ms", options_.path,
                         window_->policy().max_restarts, window_->policy().window.count());
      finish(WorkerState::Dead);
      if (env_.watcher) {
        env_.watcher->on_worker_dead(options_.path, error, env_.generation);
      }
      return;
    }
    state_.store(WorkerState::Restarting, std::memory_order_release);
    restarts_.fetch_add(1, std::memory_order_acq_rel);
    auto restarted = restart_in_place();
    if (restarted) {
      state_.store(WorkerState::Running, std::memory_order_release);
      fey::log::warn("performer {} restarted after: {}", options_.path, error.message);
      if (env_.watcher) {
        env_.watcher->on_worker_restarted(options_.path, error, env_.generation);
      }
      return;
    }
    error = std::move(restarted.error());
  }
}

auto PerformerWorker::instantiate() -> Expected<std::unique_ptr<Performer>> {
  try {
    auto performer = factory_(init_);
    if (!performer) {
      return tl::unexpected(performer.error());
    }
    if (!*performer) {
      return tl::unexpected(make_error(ErrorCode::PerformerCreationFailed,
                                       std::format("factory returned no instance for {}", init_.id)));
    }
    return std::move(*performer);
  } catch (const std::exception& ex) {
    return tl::unexpected(make_error(ErrorCode::PerformerCreationFailed,
                                     std::format("constructing {} threw: {}", init_.id, ex.what())));
  }
}

auto PerformerWorker::restart_in_place() -> Expected<void> {
  if (performer_ && started_) {
    auto stopped = invoke("on_stop", [this] {
      performer_->on_stop(*this);
      return Expected<void>{};
    });
    if (!stopped) {
      fey::log::warn("performer {} {}", options_.path, stopped.error().message);
    }
  }
  performer_.reset();
  backoff_until_ = {};
  auto fresh = instantiate();
  if (!fresh) {
    return tl::unexpected(fresh.error());
  }
  performer_ = std::move(*fresh);
  return invoke("on_start", [this] { return performer_->on_start(*this); });
}

auto PerformerWorker::finish(WorkerState final_state) -> void {
  if (performer_ && started_) {
    auto stopped = invoke("on_stop", [this] {
      performer_->on_stop(*this);
      return Expected<void>{};
    });
    if (!stopped) {
      fey::log::warn("performer {} {}", options_.path, stopped.error().message);
    }
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.store(final_state, std::memory_order_release);
  }
  discard_queued(to_string(final_state));
  fey::log::debug("performer {} {}", options_.path, to_string(final_state));
}

auto PerformerWorker::discard_queued(std::string_view reason) -> void {
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped = control_queue_.size() + data_queue_.size();
    control_queue_.clear();
    data_queue_.clear();
  }
  if (dropped > 0) {
    pending_.fetch_sub(dropped, std::memory_order_acq_rel);
    fey::log::warn("performer {} {}: {} queued messages dropped", options_.path, reason, dropped);
  }
}

auto PerformerWorker::arm_tick() -> void {
  if (init_.schedule.count() <= 0 || !is_alive()) {
    return;
  }
  std::weak_ptr<PerformerWorker> weak = weak_from_this();
  auto task = exec::schedule_after(env_.dispatcher->timer(), init_.schedule)
            | stdexec::then([weak]() noexcept {
                auto self = weak.lock();
                if (self && self->is_alive()) {
                  self->tell(Message{MessageKind::Tick, Json(), false});
                  self->arm_tick();
                }
              });
  env_.scope->spawn(std::move(task));
}

}  // namespace fey::engine
