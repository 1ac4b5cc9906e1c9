#include "common/logging/log.hpp"

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <mutex>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_bool(log_to_stderr);

namespace fey::log {
namespace {

constexpr std::size_t kQueueSize = 8192;
constexpr std::size_t kMinFileSize = 1024;

std::mutex g_mutex;
std::shared_ptr<spdlog::async_logger> g_logger;

auto make_sinks(spdlog::level::level_enum level) -> std::vector<spdlog::sink_ptr> {
  std::vector<spdlog::sink_ptr> sinks;
  auto max_size = std::max(static_cast<std::size_t>(std::max(FLAGS_log_max_size, 0)), kMinFileSize);
  auto max_files = static_cast<std::size_t>(std::max(FLAGS_log_max_files, 1));
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(FLAGS_log_file, max_size, max_files));
  if (FLAGS_log_to_stderr) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  for (auto& sink : sinks) {
    sink->set_level(level);
  }
  return sinks;
}

auto render(std::string_view event, const Fields& fields) -> std::string {
  std::string line{event};
  for (const auto& [key, value] : fields) {
    line += " " + key + "=" + value;
  }
  return line;
}

}  // namespace

void init() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    return;
  }

  // unknown names map to off, so fall back to info explicitly
  auto level = spdlog::level::from_str(FLAGS_log_level);
  if (level == spdlog::level::off && FLAGS_log_level != "off") {
    level = spdlog::level::info;
  }

  spdlog::init_thread_pool(kQueueSize, 1);
  auto sinks = make_sinks(level);
  g_logger = std::make_shared<spdlog::async_logger>("fey_engine", sinks.begin(), sinks.end(),
                                                    spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(g_logger);
  spdlog::set_level(level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
  spdlog::info("Logger initialized: file={}, level={}", FLAGS_log_file, FLAGS_log_level);
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_logger) {
    return;
  }
  g_logger->flush();
  g_logger.reset();
  spdlog::shutdown();
}

void info(std::string_view event, Fields fields) {
  spdlog::info(render(event, fields));
}

void error(std::string_view event, Fields fields) {
  spdlog::error(render(event, fields));
}

}  // namespace fey::log
