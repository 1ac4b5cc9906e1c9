#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace fey::engine {

class Worker;
using WorkerHandle = std::shared_ptr<Worker>;
using ConnectionHandles = std::map<std::string, WorkerHandle>;

/// Construction arguments handed to a performer factory.
struct PerformerInit {
  std::string id;
  std::map<std::string, std::string> parameters;
  std::chrono::milliseconds backoff{0};
  ConnectionHandles connections;
  std::chrono::milliseconds schedule{0};
  std::string ensemble_id;
  std::string orchestration_name;
  bool autoscale = false;
};

class PerformerContext {
 public:
  virtual ~PerformerContext() = default;

  virtual auto init() const -> const PerformerInit& = 0;
  /// Address of the worker running this performer.
  virtual auto path() const -> const std::string& = 0;
  /// Deliver a Process message to every connection.
  virtual auto propagate(Json payload) -> void = 0;
  /// Drop incoming Process messages and ticks until the backoff interval elapses.
  virtual auto start_backoff() -> void = 0;
  virtual auto in_backoff() const -> bool = 0;
};

/// User code run by a worker. Returning an error or throwing counts as a
/// worker failure and is handed to supervision.
class Performer {
 public:
  virtual ~Performer() = default;

  virtual auto on_start(PerformerContext& ctx) -> Expected<void> {
    (void)ctx;
    return {};
  }
  virtual auto on_message(PerformerContext& ctx, const Message& message) -> Expected<void> = 0;
  virtual auto on_tick(PerformerContext& ctx) -> Expected<void> {
    (void)ctx;
    return {};
  }
  virtual auto on_stop(PerformerContext& ctx) -> void { (void)ctx; }
};

using PerformerFactory = std::function<Expected<std::unique_ptr<Performer>>(const PerformerInit& init)>;

}  // namespace fey::engine
