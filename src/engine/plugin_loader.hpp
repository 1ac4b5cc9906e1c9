#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "engine/error.hpp"
#include "engine/performer.hpp"
#include "engine/registry.hpp"

namespace fey::engine {

/// C entry point every performer library exports. It fills the registry with
/// the factories the library provides.
inline constexpr const char* kRegisterPerformersSymbol = "fey_register_performers";
using RegisterPerformersFn = void (*)(PerformerRegistry*);

class PluginLoader {
 public:
  virtual ~PluginLoader() = default;

  /// Resolve the factory for `plugin_ref` out of `artifact` under `location`.
  /// Fails with ErrorCode::LoadError.
  virtual auto load(std::string_view plugin_ref, const std::filesystem::path& location,
                    std::string_view artifact) -> Expected<PerformerFactory> = 0;
};

/// Resolves plugin references against factories registered in-process. The
/// artifact location is not consulted.
class RegistryPluginLoader final : public PluginLoader {
 public:
  explicit RegistryPluginLoader(std::shared_ptr<const PerformerRegistry> registry);

  auto load(std::string_view plugin_ref, const std::filesystem::path& location,
            std::string_view artifact) -> Expected<PerformerFactory> override;

 private:
  std::shared_ptr<const PerformerRegistry> registry_;
};

/// Loads `<location>/<artifact>` with dlopen and asks its entry point for
/// factories. Opened libraries stay cached until the loader is destroyed, so
/// the loader must outlive every performer it produced.
class SharedLibraryLoader final : public PluginLoader {
 public:
  SharedLibraryLoader() = default;
  ~SharedLibraryLoader() override;

  SharedLibraryLoader(const SharedLibraryLoader&) = delete;
  auto operator=(const SharedLibraryLoader&) -> SharedLibraryLoader& = delete;

  auto load(std::string_view plugin_ref, const std::filesystem::path& location,
            std::string_view artifact) -> Expected<PerformerFactory> override;

 private:
  struct Library {
    void* handle = nullptr;
    PerformerRegistry registry;
  };

  auto open_locked(const std::filesystem::path& path) -> Expected<Library*>;

  std::mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<Library>> libraries_;
};

}  // namespace fey::engine
