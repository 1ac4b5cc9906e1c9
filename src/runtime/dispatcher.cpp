#include "runtime/dispatcher.hpp"

#include <thread>

namespace fey::engine {
namespace {

auto resolve_worker_threads(int requested) -> int {
  if (requested > 0) {
    return requested;
  }
  auto hardware = static_cast<int>(std::thread::hardware_concurrency());
  return hardware > 0 ? hardware : 4;
}

auto resolve_control_threads(int requested) -> int {
  return requested > 0 ? requested : 1;
}

}  // namespace

Dispatcher::Dispatcher(DispatcherConfig config)
    : worker_threads_(resolve_worker_threads(config.worker_threads)),
      control_threads_(resolve_control_threads(config.control_threads)),
      worker_pool_(static_cast<std::uint32_t>(worker_threads_)),
      control_pool_(static_cast<std::uint32_t>(control_threads_)),
      timer_context_(std::make_unique<exec::timed_thread_context>()) {}

Dispatcher::~Dispatcher() = default;

auto Dispatcher::scheduler(Lane lane) -> Scheduler {
  if (lane == Lane::Control) {
    return control_pool_.get_scheduler();
  }
  return worker_pool_.get_scheduler();
}

auto Dispatcher::timer() -> exec::timed_thread_scheduler {
  return timer_context_->get_scheduler();
}

}  // namespace fey::engine
