#include <gtest/gtest.h>

#include <gflags/gflags.h>

#include "runtime/orchestration.hpp"
#include "test_support.hpp"

DECLARE_int32(fey_max_restarts);
DECLARE_int32(fey_messages_per_resize);
DECLARE_string(fey_dynamic_jar_repository);

using fey::engine::EnsemblePhase;
using fey::engine::Json;
using fey::engine::Message;
using fey::engine::Orchestration;
using fey::engine::OrchestrationConfig;

namespace {

auto test_config() -> OrchestrationConfig {
  OrchestrationConfig config;
  config.name = "orch";
  config.dispatcher.worker_threads = 2;
  config.dispatcher.control_threads = 1;
  return config;
}

auto abc_document() -> Json {
  return ensemble_json("ens", {"A", "B", "C"}, Json::parse(R"([{"B": ["C"]}])"));
}

/// Drive performer `id` past its restart budget.
auto kill_performer(Orchestration& orchestration, std::string_view ensemble_id, std::string_view id) -> bool {
  auto ensemble = orchestration.ensemble(ensemble_id);
  if (!ensemble) {
    return false;
  }
  for (int i = 0; i < 4; ++i) {
    if (!ensemble->send(id, Message::process("boom"))) {
      return false;
    }
  }
  return true;
}

auto generation_of(const Orchestration& orchestration, std::string_view ensemble_id) -> std::uint64_t {
  auto ensemble = orchestration.ensemble(ensemble_id);
  return ensemble ? ensemble->generation() : 0;
}

auto phase_of(const Orchestration& orchestration, std::string_view ensemble_id) -> EnsemblePhase {
  auto ensemble = orchestration.ensemble(ensemble_id);
  return ensemble ? ensemble->phase() : EnsemblePhase::TornDown;
}

}  // namespace

TEST(Orchestration, AddsAndRemovesEnsembles) {
  auto probe = std::make_shared<Probe>();
  RecordingMonitorSink sink;
  Orchestration orchestration(test_config(), make_loader(probe), fey::engine::monitor::make_sink(sink));

  auto id = orchestration.add_ensemble(abc_document());
  ASSERT_TRUE(id) << id.error().message;
  EXPECT_EQ(*id, "ens");
  EXPECT_EQ(orchestration.ensemble_ids(), std::vector<std::string>{"ens"});
  ASSERT_NE(orchestration.ensemble("ens"), nullptr);
  EXPECT_EQ(orchestration.ensemble("ens")->describe().worker_paths.front(), "orch/ens/A");

  EXPECT_TRUE(orchestration.remove_ensemble("ens"));
  EXPECT_FALSE(orchestration.remove_ensemble("ens"));
  EXPECT_EQ(orchestration.ensemble("ens"), nullptr);
  EXPECT_EQ(sink.count(sink.stops), 1u);
  EXPECT_TRUE(wait_for_condition([&] { return probe->stops.load() == 3; }));
}

TEST(Orchestration, DocumentWithoutGuidGetsAnId) {
  Orchestration orchestration(test_config(), make_loader(std::make_shared<Probe>()));
  Json document{{"performers", Json::array({performer_json("A")})}};
  auto id = orchestration.add_ensemble(document);
  ASSERT_TRUE(id) << id.error().message;
  EXPECT_EQ(*id, "ensemble-0");
}

TEST(Orchestration, FailedInitialBuildIsRebuiltUnderTheWindow) {
  RecordingMonitorSink sink;
  Orchestration orchestration(test_config(), make_loader(std::make_shared<Probe>()),
                              fey::engine::monitor::make_sink(sink));
  auto id = orchestration.add_ensemble(ensemble_json("ens", {"A"}, Json::parse(R"([{"A": ["B"]}])")));
  ASSERT_FALSE(id);
  EXPECT_EQ(id.error().code, fey::engine::ErrorCode::UnknownPerformer);

  // three rebuilds fail the same way, the fourth request removes the ensemble
  ASSERT_TRUE(wait_for_condition([&] { return orchestration.ensemble_ids().empty(); }));
  EXPECT_EQ(sink.count(sink.restarts), 3u);
  EXPECT_EQ(sink.count(sink.starts), 0u);
}

TEST(Orchestration, SignalFromAReplacedEnsembleIsIgnored) {
  auto probe = std::make_shared<Probe>();
  RecordingMonitorSink sink;
  Orchestration orchestration(test_config(), make_loader(probe), fey::engine::monitor::make_sink(sink));
  ASSERT_TRUE(orchestration.add_ensemble(abc_document()));
  const auto replaced_instance = orchestration.ensemble("ens")->instance();
  ASSERT_TRUE(orchestration.add_ensemble(abc_document()));
  auto current = orchestration.ensemble("ens");
  ASSERT_NE(current->instance(), replaced_instance);
  ASSERT_EQ(current->generation(), 0u);

  fey::engine::EnsembleRestartRequired signal;
  signal.ensemble_id = "ens";
  signal.instance = replaced_instance;
  signal.generation = 0;
  signal.cause = fey::engine::make_error(fey::engine::ErrorCode::RestartRequired, "DEAD performer orch/ens/A");
  orchestration.on_restart_required(signal);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(current->generation(), 0u);
  EXPECT_EQ(current->phase(), EnsemblePhase::Running);
  EXPECT_EQ(sink.count(sink.restarts), 0u);

  signal.instance = current->instance();
  orchestration.on_restart_required(signal);
  ASSERT_TRUE(wait_for_condition([&] { return current->generation() == 1; }));
  EXPECT_TRUE(wait_for_condition([&] { return sink.count(sink.restarts) == 1; }));
  current.reset();
}

TEST(Orchestration, RebuildsAnEscalatedEnsemble) {
  auto probe = std::make_shared<Probe>();
  RecordingMonitorSink sink;
  Orchestration orchestration(test_config(), make_loader(probe), fey::engine::monitor::make_sink(sink));
  ASSERT_TRUE(orchestration.add_ensemble(abc_document()));

  ASSERT_TRUE(kill_performer(orchestration, "ens", "A"));
  ASSERT_TRUE(wait_for_condition([&] {
    return generation_of(orchestration, "ens") == 1 && phase_of(orchestration, "ens") == EnsemblePhase::Running;
  }));
  EXPECT_EQ(sink.count(sink.terminates), 1u);
  EXPECT_EQ(sink.count(sink.restarts), 1u);
  EXPECT_EQ(sink.count(sink.starts), 2u);
  EXPECT_EQ(probe->creation_count("B"), 2);

  // the rebuilt generation works end to end
  ASSERT_TRUE(orchestration.ensemble("ens")->send("B", Message::process("again")));
  EXPECT_TRUE(wait_for_condition([&] { return probe->messages.load() == 2; }));
}

TEST(Orchestration, GivesUpWhenRebuildsExceedTheWindow) {
  auto config = test_config();
  config.ensemble_restarts.max_restarts = 1;
  Orchestration orchestration(std::move(config), make_loader(std::make_shared<Probe>()));
  ASSERT_TRUE(orchestration.add_ensemble(abc_document()));

  ASSERT_TRUE(kill_performer(orchestration, "ens", "A"));
  ASSERT_TRUE(wait_for_condition([&] {
    return generation_of(orchestration, "ens") == 1 && phase_of(orchestration, "ens") == EnsemblePhase::Running;
  }));

  ASSERT_TRUE(kill_performer(orchestration, "ens", "C"));
  EXPECT_TRUE(wait_for_condition([&] { return orchestration.ensemble_ids().empty(); }));
}

TEST(Orchestration, ConfigFromFlags) {
  gflags::FlagSaver saver;
  FLAGS_fey_max_restarts = 7;
  FLAGS_fey_messages_per_resize = 42;
  FLAGS_fey_dynamic_jar_repository = "/opt/fey/dynamic";

  auto config = OrchestrationConfig::from_flags();
  EXPECT_EQ(config.worker_restarts.max_restarts, 7);
  EXPECT_EQ(config.messages_per_resize, 42);
  EXPECT_EQ(config.repositories.dynamic_root, std::filesystem::path("/opt/fey/dynamic"));
  EXPECT_EQ(config.ensemble_restarts.max_restarts, 3);
}
