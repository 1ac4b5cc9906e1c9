#include "engine/plugin_loader.hpp"

#include <dlfcn.h>

#include <format>
#include <utility>

#include "common/logging/log.hpp"

namespace fey::engine {
namespace {

auto load_error(std::string message) -> EngineError {
  return make_error(ErrorCode::LoadError, std::move(message));
}

auto last_dl_error() -> std::string {
  const char* message = dlerror();
  return message ? std::string(message) : std::string("unknown dl error");
}

}  // namespace

RegistryPluginLoader::RegistryPluginLoader(std::shared_ptr<const PerformerRegistry> registry)
    : registry_(std::move(registry)) {}

auto RegistryPluginLoader::load(std::string_view plugin_ref, const std::filesystem::path& location,
                                std::string_view artifact) -> Expected<PerformerFactory> {
  (void)location;
  if (!registry_) {
    return tl::unexpected(load_error("performer registry is not set"));
  }
  const auto* factory = registry_->find(plugin_ref);
  if (!factory) {
    return tl::unexpected(
      load_error(std::format("performer class not registered: {} (artifact {})", plugin_ref, artifact)));
  }
  return *factory;
}

SharedLibraryLoader::~SharedLibraryLoader() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [path, library] : libraries_) {
    library->registry = PerformerRegistry{};
    if (library->handle && dlclose(library->handle) != 0) {
      fey::log::warn("dlclose failed for {}: {}", path, last_dl_error());
    }
  }
  libraries_.clear();
}

auto SharedLibraryLoader::open_locked(const std::filesystem::path& path) -> Expected<Library*> {
  auto key = path.string();
  if (auto it = libraries_.find(key); it != libraries_.end()) {
    return it->second.get();
  }

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return tl::unexpected(load_error(std::format("artifact not found: {}", key)));
  }

  // clear any stale error before probing
  dlerror();
  void* handle = dlopen(key.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle) {
    return tl::unexpected(load_error(std::format("failed to load artifact {}: {}", key, last_dl_error())));
  }
  auto entry = reinterpret_cast<RegisterPerformersFn>(dlsym(handle, kRegisterPerformersSymbol));
  if (!entry) {
    auto message = std::format("failed to resolve symbol {} in {}: {}", kRegisterPerformersSymbol, key,
                               last_dl_error());
    if (dlclose(handle) != 0) {
      fey::log::warn("dlclose failed for {}: {}", key, last_dl_error());
    }
    return tl::unexpected(load_error(std::move(message)));
  }

  auto library = std::make_unique<Library>();
  library->handle = handle;
  entry(&library->registry);
  fey::log::info("Loaded performer artifact {} ({} performers)", key, library->registry.size());

  auto* raw = library.get();
  libraries_.emplace(std::move(key), std::move(library));
  return raw;
}

auto SharedLibraryLoader::load(std::string_view plugin_ref, const std::filesystem::path& location,
                               std::string_view artifact) -> Expected<PerformerFactory> {
  auto path = location / std::filesystem::path(std::string(artifact));
  std::lock_guard<std::mutex> lock(mutex_);
  auto library = open_locked(path);
  if (!library) {
    return tl::unexpected(library.error());
  }
  const auto* factory = (*library)->registry.find(plugin_ref);
  if (!factory) {
    return tl::unexpected(
      load_error(std::format("class {} not exported by artifact {}", plugin_ref, path.string())));
  }
  return *factory;
}

}  // namespace fey::engine
