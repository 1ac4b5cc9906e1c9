#pragma once

#include <cstdint>
#include <string_view>

namespace fey::engine::monitor {

using Timestamp = std::int64_t;

struct Start {
  std::string_view ensemble_id;
  Timestamp ts = 0;
};

struct Stop {
  std::string_view ensemble_id;
  Timestamp ts = 0;
};

struct Restart {
  std::string_view ensemble_id;
  std::string_view reason;
  Timestamp ts = 0;
};

struct Terminate {
  std::string_view worker_path;
  Timestamp ts = 0;
};

struct MonitorSinkRef {
  void* self = nullptr;
  void (*start)(void*, const Start&) = nullptr;
  void (*stop)(void*, const Stop&) = nullptr;
  void (*restart)(void*, const Restart&) = nullptr;
  void (*terminate)(void*, const Terminate&) = nullptr;

  auto enabled() const -> bool {
    return start || stop || restart || terminate;
  }
};

namespace detail {

template <typename Sink>
constexpr bool has_start = requires(Sink& sink, const Start& event) { sink.on_start(event); };

template <typename Sink>
constexpr bool has_stop = requires(Sink& sink, const Stop& event) { sink.on_stop(event); };

template <typename Sink>
constexpr bool has_restart = requires(Sink& sink, const Restart& event) { sink.on_restart(event); };

template <typename Sink>
constexpr bool has_terminate = requires(Sink& sink, const Terminate& event) { sink.on_terminate(event); };

template <typename Sink>
auto bind_start(void (**slot)(void*, const Start&)) -> void {
  if constexpr (has_start<Sink>) {
    *slot = [](void* self, const Start& event) {
      static_cast<Sink*>(self)->on_start(event);
    };
  } else {
    *slot = nullptr;
  }
}

template <typename Sink>
auto bind_stop(void (**slot)(void*, const Stop&)) -> void {
  if constexpr (has_stop<Sink>) {
    *slot = [](void* self, const Stop& event) {
      static_cast<Sink*>(self)->on_stop(event);
    };
  } else {
    *slot = nullptr;
  }
}

template <typename Sink>
auto bind_restart(void (**slot)(void*, const Restart&)) -> void {
  if constexpr (has_restart<Sink>) {
    *slot = [](void* self, const Restart& event) {
      static_cast<Sink*>(self)->on_restart(event);
    };
  } else {
    *slot = nullptr;
  }
}

template <typename Sink>
auto bind_terminate(void (**slot)(void*, const Terminate&)) -> void {
  if constexpr (has_terminate<Sink>) {
    *slot = [](void* self, const Terminate& event) {
      static_cast<Sink*>(self)->on_terminate(event);
    };
  } else {
    *slot = nullptr;
  }
}

}  // namespace detail

template <typename Sink>
auto make_sink(Sink& sink) -> MonitorSinkRef {
  MonitorSinkRef ref;
  ref.self = &sink;
  detail::bind_start<Sink>(&ref.start);
  detail::bind_stop<Sink>(&ref.stop);
  detail::bind_restart<Sink>(&ref.restart);
  detail::bind_terminate<Sink>(&ref.terminate);
  return ref;
}

/// Best effort: a throwing sink is logged and otherwise ignored.
auto emit(MonitorSinkRef sink, const Start& event) -> void;
auto emit(MonitorSinkRef sink, const Stop& event) -> void;
auto emit(MonitorSinkRef sink, const Restart& event) -> void;
auto emit(MonitorSinkRef sink, const Terminate& event) -> void;

/// Sink that writes every lifecycle event to the engine log.
struct LogMonitorSink {
  void on_start(const Start& event);
  void on_stop(const Stop& event);
  void on_restart(const Restart& event);
  void on_terminate(const Terminate& event);
};

}  // namespace fey::engine::monitor
