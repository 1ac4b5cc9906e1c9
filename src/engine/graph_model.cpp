#include "engine/graph_model.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <string_view>

namespace fey::engine {
namespace {

constexpr std::string_view kGuid = "guid";
constexpr std::string_view kConnections = "connections";
constexpr std::string_view kPerformers = "performers";
constexpr std::string_view kSchedule = "schedule";
constexpr std::string_view kBackoff = "backoff";
constexpr std::string_view kAutoScale = "autoScale";
constexpr std::string_view kControlAware = "controlAware";
constexpr std::string_view kSource = "source";
constexpr std::string_view kSourceName = "name";
constexpr std::string_view kSourceClassPath = "classPath";
constexpr std::string_view kSourceParams = "parameters";
constexpr std::string_view kSourceLocation = "location";

auto spec_error(std::string message) -> EngineError {
  return make_error(ErrorCode::InvalidSpec, std::move(message));
}

auto get_string_field(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_string()) {
    return tl::unexpected(spec_error(std::format("{}: missing or invalid field '{}'", context, field)));
  }
  return it->get<std::string>();
}

auto get_millis_field(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::chrono::milliseconds> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_number_integer()) {
    return tl::unexpected(spec_error(std::format("{}: missing or invalid field '{}'", context, field)));
  }
  auto value = it->get<std::int64_t>();
  if (value < 0) {
    return tl::unexpected(spec_error(std::format("{}: '{}' must not be negative", context, field)));
  }
  return std::chrono::milliseconds(value);
}

auto get_parameters(const Json& source, std::string_view context)
  -> Expected<std::map<std::string, std::string>> {
  std::map<std::string, std::string> params;
  auto it = source.find(std::string(kSourceParams));
  if (it == source.end()) {
    return params;
  }
  if (!it->is_object()) {
    return tl::unexpected(spec_error(std::format("{}: parameters must be an object", context)));
  }
  for (const auto& [key, value] : it->items()) {
    if (!value.is_string()) {
      return tl::unexpected(spec_error(std::format("{}: parameter '{}' must be a string", context, key)));
    }
    params[key] = value.get<std::string>();
  }
  return params;
}

auto parse_performer(const Json& performer_json, const RepositoryConfig& repositories)
  -> Expected<PerformerSpec> {
  if (!performer_json.is_object()) {
    return tl::unexpected(spec_error("performer entry must be an object"));
  }
  auto id = get_string_field(performer_json, kGuid, "performer");
  if (!id) {
    return tl::unexpected(id.error());
  }
  const auto context = std::format("performer '{}'", *id);

  auto schedule = get_millis_field(performer_json, kSchedule, context);
  if (!schedule) {
    return tl::unexpected(schedule.error());
  }
  auto backoff = get_millis_field(performer_json, kBackoff, context);
  if (!backoff) {
    return tl::unexpected(backoff.error());
  }

  PerformerSpec spec;
  spec.id = std::move(*id);
  spec.schedule = *schedule;
  spec.backoff = *backoff;

  if (auto it = performer_json.find(std::string(kAutoScale)); it != performer_json.end()) {
    if (!it->is_number_integer()) {
      return tl::unexpected(spec_error(std::format("{}: autoScale must be a non-negative integer", context)));
    }
    // unsigned json numbers above int64 range wrap negative here and are rejected too
    auto upper = it->get<std::int64_t>();
    if (upper < 0 || upper > std::numeric_limits<int>::max()) {
      return tl::unexpected(spec_error(std::format("{}: autoScale {} is out of range", context, it->dump())));
    }
    spec.pool_upper_bound = static_cast<int>(upper);
  }
  if (auto it = performer_json.find(std::string(kControlAware)); it != performer_json.end()) {
    if (!it->is_boolean()) {
      return tl::unexpected(spec_error(std::format("{}: controlAware must be a boolean", context)));
    }
    spec.control_priority = it->get<bool>();
  }

  auto source_it = performer_json.find(std::string(kSource));
  if (source_it == performer_json.end() || !source_it->is_object()) {
    return tl::unexpected(spec_error(std::format("{}: missing or invalid field 'source'", context)));
  }
  const auto& source = *source_it;
  auto artifact = get_string_field(source, kSourceName, context);
  if (!artifact) {
    return tl::unexpected(artifact.error());
  }
  auto plugin_ref = get_string_field(source, kSourceClassPath, context);
  if (!plugin_ref) {
    return tl::unexpected(plugin_ref.error());
  }
  auto params = get_parameters(source, context);
  if (!params) {
    return tl::unexpected(params.error());
  }
  spec.artifact_name = std::move(*artifact);
  spec.plugin_ref = std::move(*plugin_ref);
  spec.parameters = std::move(*params);
  spec.artifact_location =
    source.contains(std::string(kSourceLocation)) ? repositories.dynamic_root : repositories.static_root;
  return spec;
}

}  // namespace

auto extract_connections(const Json& connections) -> Expected<ConnectionMap> {
  if (!connections.is_array()) {
    return tl::unexpected(spec_error("connections must be an array"));
  }
  ConnectionMap result;
  for (const auto& connection : connections) {
    if (!connection.is_object()) {
      return tl::unexpected(spec_error("connection entry must be an object"));
    }
    for (const auto& [source, targets] : connection.items()) {
      if (!targets.is_array()) {
        return tl::unexpected(spec_error(std::format("connection '{}' must map to an array", source)));
      }
      std::vector<std::string> ids;
      ids.reserve(targets.size());
      for (const auto& target : targets) {
        if (!target.is_string()) {
          return tl::unexpected(spec_error(std::format("connection '{}' has a non-string target", source)));
        }
        ids.push_back(target.get<std::string>());
      }
      // later entries for the same source replace earlier ones
      result[source] = std::move(ids);
    }
  }
  return result;
}

auto extract_performers(const Json& performers, const RepositoryConfig& repositories)
  -> Expected<PerformerMap> {
  if (!performers.is_array()) {
    return tl::unexpected(spec_error("performers must be an array"));
  }
  PerformerMap result;
  for (const auto& performer_json : performers) {
    auto spec = parse_performer(performer_json, repositories);
    if (!spec) {
      return tl::unexpected(spec.error());
    }
    auto id = spec->id;
    result[std::move(id)] = std::move(*spec);
  }
  return result;
}

auto parse_graph_model(const Json& json, const RepositoryConfig& repositories) -> Expected<GraphModel> {
  if (!json.is_object()) {
    return tl::unexpected(spec_error("ensemble json must be an object"));
  }

  GraphModel graph;
  if (auto it = json.find(std::string(kGuid)); it != json.end()) {
    if (!it->is_string()) {
      return tl::unexpected(spec_error("guid must be a string"));
    }
    graph.ensemble_id = it->get<std::string>();
  }

  if (auto it = json.find(std::string(kConnections)); it != json.end()) {
    auto connections = extract_connections(*it);
    if (!connections) {
      return tl::unexpected(connections.error());
    }
    graph.connections = std::move(*connections);
  }

  auto performers_it = json.find(std::string(kPerformers));
  if (performers_it == json.end()) {
    return tl::unexpected(spec_error("performers must be an array"));
  }
  auto performers = extract_performers(*performers_it, repositories);
  if (!performers) {
    return tl::unexpected(performers.error());
  }
  graph.performers = std::move(*performers);
  return graph;
}

auto performer_ids(const GraphModel& graph) -> std::vector<std::string> {
  std::vector<std::string> ids;
  ids.reserve(graph.performers.size());
  for (const auto& [id, spec] : graph.performers) {
    ids.push_back(id);
  }
  return ids;
}

auto format_graph(const ConnectionMap& connections, const std::vector<std::string>& nodes,
                  const std::vector<std::string>& worker_paths) -> std::string {
  std::string edges;
  for (const auto& [source, targets] : connections) {
    std::string joined;
    for (const auto& target : targets) {
      if (!joined.empty()) {
        joined += ",";
      }
      joined += target;
    }
    if (!edges.empty()) {
      edges += "\n";
    }
    edges += std::format(" \t {} : [{}]", source, joined);
  }

  std::string ids;
  for (const auto& id : nodes) {
    if (!ids.empty()) {
      ids += ",";
    }
    ids += id;
  }

  std::string workers;
  for (const auto& path : worker_paths) {
    if (!workers.empty()) {
      workers += " | ";
    }
    workers += path;
  }

  return std::format("Edges: \n{} \nNodes: \n\t[{}] \nPerformers \n\t[{}]", edges, ids, workers);
}

}  // namespace fey::engine
