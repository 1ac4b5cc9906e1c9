#pragma once

#include <concepts>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "engine/performer.hpp"

namespace fey::engine {

class PerformerRegistry {
 public:
  auto register_factory(std::string plugin_ref, PerformerFactory factory) -> void;

  template <typename T>
    requires std::derived_from<T, Performer> && std::constructible_from<T, const PerformerInit&>
  auto register_performer(std::string plugin_ref) -> void {
    register_factory(std::move(plugin_ref),
                     [](const PerformerInit& init) -> Expected<std::unique_ptr<Performer>> {
                       return std::make_unique<T>(init);
                     });
  }

  auto find(std::string_view plugin_ref) const -> const PerformerFactory*;
  auto names() const -> std::vector<std::string>;
  auto size() const -> std::size_t { return factories_.size(); }

 private:
  std::unordered_map<std::string, PerformerFactory> factories_;
};

}  // namespace fey::engine
