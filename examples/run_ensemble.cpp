#include <chrono>
#include <exception>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "engine/monitor.hpp"
#include "engine/plugin_loader.hpp"
#include "engine/registry.hpp"
#include "performer/sample_performers.hpp"
#include "runtime/orchestration.hpp"

DEFINE_string(ensemble_file, "", "Ensemble document to run (built-in demo when empty)");
DEFINE_string(loader, "registry", "Plugin loader: 'registry' for the built-in performers, 'shared' for dlopen");
DEFINE_string(entry, "", "Performer that receives the --messages payloads");
DEFINE_int32(messages, 0, "Number of payloads sent to --entry");
DEFINE_int32(run_seconds, 3, "Seconds to keep the ensemble running before stopping it");

namespace {

constexpr const char* kDemoEnsemble = R"JSON(
{
  "guid": "demo",
  "connections": [
    { "clock": ["relay"] },
    { "relay": ["sink"] }
  ],
  "performers": [
    { "guid": "clock", "schedule": 500, "backoff": 0,
      "source": { "name": "builtin", "classPath": "fey.performer.Timestamp", "parameters": { "label": "demo" } } },
    { "guid": "relay", "schedule": 0, "backoff": 0, "autoScale": 4,
      "source": { "name": "builtin", "classPath": "fey.performer.Forward", "parameters": {} } },
    { "guid": "sink", "schedule": 0, "backoff": 0, "controlAware": true,
      "source": { "name": "builtin", "classPath": "fey.performer.Logger", "parameters": {} } }
  ]
}
)JSON";

struct StdoutMonitorSink {
  std::mutex mutex;

  void on_start(const fey::engine::monitor::Start& event) {
    std::lock_guard<std::mutex> lock(mutex);
    std::cout << std::format("[monitor] start ensemble={} ts={}\n", event.ensemble_id, event.ts);
  }

  void on_stop(const fey::engine::monitor::Stop& event) {
    std::lock_guard<std::mutex> lock(mutex);
    std::cout << std::format("[monitor] stop ensemble={} ts={}\n", event.ensemble_id, event.ts);
  }

  void on_restart(const fey::engine::monitor::Restart& event) {
    std::lock_guard<std::mutex> lock(mutex);
    std::cout << std::format("[monitor] restart ensemble={} reason={} ts={}\n", event.ensemble_id, event.reason,
                             event.ts);
  }

  void on_terminate(const fey::engine::monitor::Terminate& event) {
    std::lock_guard<std::mutex> lock(mutex);
    std::cout << std::format("[monitor] terminate worker={} ts={}\n", event.worker_path, event.ts);
  }
};

auto read_document() -> fey::engine::Expected<fey::engine::Json> {
  std::string text = kDemoEnsemble;
  if (!FLAGS_ensemble_file.empty()) {
    std::ifstream file(FLAGS_ensemble_file);
    if (!file) {
      return tl::unexpected(fey::engine::make_error(std::format("cannot open {}", FLAGS_ensemble_file)));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    text = buffer.str();
  }
  try {
    return fey::engine::Json::parse(text);
  } catch (const std::exception& ex) {
    return tl::unexpected(fey::engine::make_error(fey::engine::ErrorCode::InvalidSpec, ex.what()));
  }
}

auto make_loader() -> std::shared_ptr<fey::engine::PluginLoader> {
  if (FLAGS_loader == "shared") {
    return std::make_shared<fey::engine::SharedLibraryLoader>();
  }
  auto registry = std::make_shared<fey::engine::PerformerRegistry>();
  fey::performer::register_sample_performers(*registry);
  return std::make_shared<fey::engine::RegistryPluginLoader>(registry);
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Run one ensemble document under supervision");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  auto document = read_document();
  if (!document) {
    std::cerr << "Failed to read ensemble: " << document.error().message << "\n";
    return 1;
  }

  StdoutMonitorSink sink;
  int status = 0;
  {
    fey::engine::Orchestration orchestration(fey::engine::OrchestrationConfig::from_flags(), make_loader(),
                                             fey::engine::monitor::make_sink(sink));
    auto id = orchestration.add_ensemble(std::move(*document));
    if (!id) {
      std::cerr << std::format("Failed to start ensemble ({}): {}\n", fey::engine::to_string(id.error().code),
                               id.error().message);
      status = 1;
    } else {
      auto ensemble = orchestration.ensemble(*id);
      std::cout << fey::engine::to_string(ensemble->describe()) << "\n";
      ensemble->print();

      if (!FLAGS_entry.empty()) {
        for (int i = 0; i < FLAGS_messages; ++i) {
          auto sent = ensemble->send(FLAGS_entry, fey::engine::Message::process(fey::engine::Json{{"seq", i}}));
          if (!sent) {
            std::cerr << "Send failed: " << sent.error().message << "\n";
            status = 1;
            break;
          }
        }
      }

      std::this_thread::sleep_for(std::chrono::seconds(FLAGS_run_seconds));
      ensemble.reset();
      orchestration.remove_ensemble(*id);
    }
  }

  fey::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return status;
}
