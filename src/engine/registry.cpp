#include "engine/registry.hpp"

#include <algorithm>

namespace fey::engine {

auto PerformerRegistry::register_factory(std::string plugin_ref, PerformerFactory factory) -> void {
  factories_[std::move(plugin_ref)] = std::move(factory);
}

auto PerformerRegistry::find(std::string_view plugin_ref) const -> const PerformerFactory* {
  auto it = factories_.find(std::string(plugin_ref));
  if (it == factories_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto PerformerRegistry::names() const -> std::vector<std::string> {
  std::vector<std::string> result;
  result.reserve(factories_.size());
  for (const auto& [name, factory] : factories_) {
    result.push_back(name);
  }
  std::sort(result.begin(), result.end());
  return result;
}

}  // namespace fey::engine
