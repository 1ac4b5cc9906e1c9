#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fey::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

using Fields = std::vector<std::pair<std::string, std::string>>;

void init();

void shutdown();

/// Structured event line rendered as "event key=value ...".
void info(std::string_view event, Fields fields);

void error(std::string_view event, Fields fields);

}  // namespace fey::log
