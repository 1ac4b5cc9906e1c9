#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace fey::engine {

using Json = nlohmann::json;
using SteadyClock = std::chrono::steady_clock;

/// Wall-clock milliseconds since epoch, used for lifecycle timestamps.
inline auto timestamp_ms() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

enum class MessageKind {
  Process,
  Tick,
  PrintPath,
  Exception,
  Stop,
};

struct Message {
  MessageKind kind = MessageKind::Process;
  Json payload;
  bool control = false;

  static auto process(Json payload) -> Message {
    return Message{MessageKind::Process, std::move(payload), false};
  }

  static auto control_message(Json payload) -> Message {
    return Message{MessageKind::Process, std::move(payload), true};
  }

  static auto exception(std::string reason) -> Message {
    return Message{MessageKind::Exception, Json(std::move(reason)), false};
  }
};

constexpr auto to_string(MessageKind kind) -> const char* {
  switch (kind) {
    case MessageKind::Process:
      return "process";
    case MessageKind::Tick:
      return "tick";
    case MessageKind::PrintPath:
      return "print_path";
    case MessageKind::Exception:
      return "exception";
    case MessageKind::Stop:
      return "stop";
  }
  return "unknown";
}

}  // namespace fey::engine
