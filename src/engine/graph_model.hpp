#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace fey::engine {

/// Repository roots that performer artifacts resolve against.
struct RepositoryConfig {
  /// Root used when the performer source names no explicit location.
  std::filesystem::path static_root = "/tmp/fey/jars";
  /// Root used when the performer source carries a `location` field.
  std::filesystem::path dynamic_root = "/tmp/fey/jars/dynamic";
};

struct PerformerSpec {
  std::string id;
  std::string plugin_ref;
  std::string artifact_name;
  std::filesystem::path artifact_location;
  std::map<std::string, std::string> parameters;
  std::chrono::milliseconds schedule{0};
  std::chrono::milliseconds backoff{0};
  int pool_upper_bound = 0;
  bool control_priority = false;
};

using ConnectionMap = std::map<std::string, std::vector<std::string>>;
using PerformerMap = std::map<std::string, PerformerSpec>;

struct GraphModel {
  std::string ensemble_id;
  PerformerMap performers;
  ConnectionMap connections;
};

auto extract_connections(const Json& connections) -> Expected<ConnectionMap>;

auto extract_performers(const Json& performers, const RepositoryConfig& repositories)
  -> Expected<PerformerMap>;

/// Build the graph model from an ensemble document. Cross references are not
/// validated here; unknown connection targets surface at instantiation.
auto parse_graph_model(const Json& json, const RepositoryConfig& repositories) -> Expected<GraphModel>;

auto performer_ids(const GraphModel& graph) -> std::vector<std::string>;

/// Render edges, nodes and the supplied worker paths for diagnostics.
auto format_graph(const ConnectionMap& edges, const std::vector<std::string>& nodes,
                  const std::vector<std::string>& worker_paths) -> std::string;

}  // namespace fey::engine
