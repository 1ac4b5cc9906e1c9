#include "performer/sample_performers.hpp"

#include <format>
#include <string>

#include "common/logging/log.hpp"
#include "engine/error.hpp"
#include "engine/performer.hpp"
#include "engine/types.hpp"

namespace fey::performer {
namespace {

using fey::engine::Expected;
using fey::engine::Json;
using fey::engine::Message;
using fey::engine::PerformerContext;
using fey::engine::PerformerInit;

auto get_param(const PerformerInit& init, const char* key, std::string fallback) -> std::string {
  auto it = init.parameters.find(key);
  return it == init.parameters.end() ? fallback : it->second;
}

/// Emits the current time to its connections on every tick.
class TimestampPerformer final : public fey::engine::Performer {
 public:
  explicit TimestampPerformer(const PerformerInit& init) : label_(get_param(init, "label", init.id)) {}

  auto on_message(PerformerContext& ctx, const Message& message) -> Expected<void> override {
    (void)message;
    return emit(ctx);
  }

  auto on_tick(PerformerContext& ctx) -> Expected<void> override { return emit(ctx); }

 private:
  auto emit(PerformerContext& ctx) -> Expected<void> {
    ctx.propagate(Json{{"source", label_}, {"timestamp", fey::engine::timestamp_ms()}});
    return {};
  }

  std::string label_;
};

/// Passes every payload on, then backs off when a backoff is configured.
class ForwardPerformer final : public fey::engine::Performer {
 public:
  explicit ForwardPerformer(const PerformerInit& init) : tag_(get_param(init, "tag", "")) {}

  auto on_message(PerformerContext& ctx, const Message& message) -> Expected<void> override {
    if (tag_.empty()) {
      ctx.propagate(message.payload);
    } else {
      ctx.propagate(Json{{"tag", tag_}, {"payload", message.payload}});
    }
    if (ctx.init().backoff.count() > 0) {
      ctx.start_backoff();
    }
    return {};
  }

 private:
  std::string tag_;
};

class LoggerPerformer final : public fey::engine::Performer {
 public:
  explicit LoggerPerformer(const PerformerInit& init) { (void)init; }

  auto on_message(PerformerContext& ctx, const Message& message) -> Expected<void> override {
    fey::log::info("{} received {}", ctx.path(), message.payload.dump());
    return {};
  }
};

/// Fails on payloads equal to the `fail_on` parameter; forwards the rest.
class FaultyPerformer final : public fey::engine::Performer {
 public:
  explicit FaultyPerformer(const PerformerInit& init) : fail_on_(get_param(init, "fail_on", "fail")) {}

  auto on_message(PerformerContext& ctx, const Message& message) -> Expected<void> override {
    if (message.payload.is_string() && message.payload.get<std::string>() == fail_on_) {
      return tl::unexpected(fey::engine::make_error(fey::engine::ErrorCode::WorkerFailure,
                                                    std::format("{} rejected '{}'", ctx.path(), fail_on_)));
    }
    ctx.propagate(message.payload);
    return {};
  }

 private:
  std::string fail_on_;
};

}  // namespace

auto register_sample_performers(fey::engine::PerformerRegistry& registry) -> void {
  registry.register_performer<TimestampPerformer>(kTimestamp);
  registry.register_performer<ForwardPerformer>(kForward);
  registry.register_performer<LoggerPerformer>(kLogger);
  registry.register_performer<FaultyPerformer>(kFaulty);
}

}  // namespace fey::performer
