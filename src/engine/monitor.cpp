#include "engine/monitor.hpp"

#include <exception>
#include <string>

#include "common/logging/log.hpp"

namespace fey::engine::monitor {
namespace {

template <typename Event>
auto deliver(void (*fn)(void*, const Event&), void* self, const Event& event, const char* name) -> void {
  if (!fn) {
    return;
  }
  try {
    fn(self, event);
  } catch (const std::exception& ex) {
    fey::log::warn("monitor sink dropped {} event: {}", name, ex.what());
  }
}

}  // namespace

auto emit(MonitorSinkRef sink, const Start& event) -> void {
  deliver(sink.start, sink.self, event, "start");
}

auto emit(MonitorSinkRef sink, const Stop& event) -> void {
  deliver(sink.stop, sink.self, event, "stop");
}

auto emit(MonitorSinkRef sink, const Restart& event) -> void {
  deliver(sink.restart, sink.self, event, "restart");
}

auto emit(MonitorSinkRef sink, const Terminate& event) -> void {
  deliver(sink.terminate, sink.self, event, "terminate");
}

void LogMonitorSink::on_start(const Start& event) {
  fey::log::info("monitor.start", {{"ensemble", std::string(event.ensemble_id)},
                                   {"ts", std::to_string(event.ts)}});
}

void LogMonitorSink::on_stop(const Stop& event) {
  fey::log::info("monitor.stop", {{"ensemble", std::string(event.ensemble_id)},
                                  {"ts", std::to_string(event.ts)}});
}

void LogMonitorSink::on_restart(const Restart& event) {
  fey::log::info("monitor.restart", {{"ensemble", std::string(event.ensemble_id)},
                                     {"reason", std::string(event.reason)},
                                     {"ts", std::to_string(event.ts)}});
}

void LogMonitorSink::on_terminate(const Terminate& event) {
  fey::log::error("monitor.terminate", {{"worker", std::string(event.worker_path)},
                                        {"ts", std::to_string(event.ts)}});
}

}  // namespace fey::engine::monitor
