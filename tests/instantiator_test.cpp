#include <gtest/gtest.h>

#include "engine/graph_model.hpp"
#include "runtime/elastic_pool.hpp"
#include "runtime/instantiator.hpp"
#include "test_support.hpp"

using fey::engine::ErrorCode;
using fey::engine::GraphModel;
using fey::engine::Json;
using fey::engine::WorkerInstantiator;

namespace {

auto make_graph(const Json& document) -> GraphModel {
  auto graph = fey::engine::parse_graph_model(document, fey::engine::RepositoryConfig{});
  EXPECT_TRUE(graph) << graph.error().message;
  return *graph;
}

auto options() -> fey::engine::InstantiatorOptions {
  fey::engine::InstantiatorOptions options;
  options.orchestration_name = "orch";
  options.path_prefix = "orch/ens";
  return options;
}

/// Instantiator plus the harness that owns its workers.
struct Fixture {
  WorkerHarness harness;
  std::shared_ptr<Probe> probe = std::make_shared<Probe>();
  std::shared_ptr<fey::engine::PluginLoader> loader = make_loader(probe);

  auto run(const GraphModel& graph) -> std::pair<fey::engine::Expected<fey::engine::HandleMap>,
                                                 std::vector<fey::engine::WorkerHandle>> {
    WorkerInstantiator instantiator(graph, *loader, options(), harness.env());
    auto handles = instantiator.materialize_all();
    for (const auto& handle : instantiator.created()) {
      harness.track(handle);
    }
    return {std::move(handles), instantiator.created()};
  }
};

}  // namespace

TEST(WorkerInstantiator, BuildsDependenciesFirst) {
  Fixture fixture;
  auto graph = make_graph(ensemble_json("ens", {"A", "B", "C"}, Json::parse(R"([{"B": ["C"]}])")));
  auto [handles, created] = fixture.run(graph);
  ASSERT_TRUE(handles) << handles.error().message;

  auto order = fixture.probe->creations();
  ASSERT_EQ(order.size(), 3u);
  auto position = [&](const std::string& id) { return std::find(order.begin(), order.end(), id) - order.begin(); };
  EXPECT_LT(position("C"), position("B"));
  EXPECT_EQ(handles->size(), 3u);
  EXPECT_EQ(handles->at("B")->path(), "orch/ens/B");
}

TEST(WorkerInstantiator, MaterializesExactlyTheDeclaredPerformers) {
  Fixture fixture;
  auto graph = make_graph(ensemble_json("ens", {"A", "B", "C", "D"}, Json::parse(R"([{"A": ["B"]}, {"B": ["C"]}])")));
  auto [handles, created] = fixture.run(graph);
  ASSERT_TRUE(handles) << handles.error().message;

  std::vector<std::string> ids;
  for (const auto& [id, handle] : *handles) {
    ids.push_back(id);
  }
  EXPECT_EQ(ids, (std::vector<std::string>{"A", "B", "C", "D"}));
  EXPECT_EQ(created.size(), 4u);
  for (const auto& id : ids) {
    EXPECT_EQ(fixture.probe->creation_count(id), 1) << id;
  }
}

TEST(WorkerInstantiator, SharedDependencyResolvesToOneHandle) {
  Fixture fixture;
  auto graph = make_graph(ensemble_json("ens", {"A", "B", "C"}, Json::parse(R"([{"A": ["C"]}, {"B": ["C"]}])")));
  WorkerInstantiator instantiator(graph, *fixture.loader, options(), fixture.harness.env());
  auto a = instantiator.materialize("A");
  auto b = instantiator.materialize("B");
  for (const auto& handle : instantiator.created()) {
    fixture.harness.track(handle);
  }
  ASSERT_TRUE(a && b);
  EXPECT_EQ(fixture.probe->creation_count("C"), 1);
  EXPECT_EQ(instantiator.handles().at("C"), instantiator.materialize("C").value());

  // both dependents forward into the same worker
  (*a)->tell(fey::engine::Message::process("x"));
  (*b)->tell(fey::engine::Message::process("y"));
  ASSERT_TRUE(wait_for_condition([&] { return fixture.probe->messages.load() == 4; }));
  auto payloads = fixture.probe->payloads();
  EXPECT_EQ(std::count(payloads.begin(), payloads.end(), "C:x"), 1);
  EXPECT_EQ(std::count(payloads.begin(), payloads.end(), "C:y"), 1);
}

TEST(WorkerInstantiator, UnknownReferenceFails) {
  Fixture fixture;
  auto graph = make_graph(ensemble_json("ens", {"A"}, Json::parse(R"([{"A": ["B"]}])")));
  auto [handles, created] = fixture.run(graph);
  ASSERT_FALSE(handles);
  EXPECT_EQ(handles.error().code, ErrorCode::UnknownPerformer);
  EXPECT_NE(handles.error().message.find("B"), std::string::npos);
  EXPECT_TRUE(created.empty());
}

TEST(WorkerInstantiator, CyclesAreRejected) {
  Fixture fixture;
  auto graph = make_graph(ensemble_json("ens", {"A", "B"}, Json::parse(R"([{"A": ["B"]}, {"B": ["A"]}])")));
  auto [handles, created] = fixture.run(graph);
  ASSERT_FALSE(handles);
  EXPECT_EQ(handles.error().code, ErrorCode::ConnectionCycle);
  EXPECT_TRUE(created.empty());
}

TEST(WorkerInstantiator, SelfLoopIsACycle) {
  Fixture fixture;
  auto graph = make_graph(ensemble_json("ens", {"A"}, Json::parse(R"([{"A": ["A"]}])")));
  auto [handles, created] = fixture.run(graph);
  ASSERT_FALSE(handles);
  EXPECT_EQ(handles.error().code, ErrorCode::ConnectionCycle);
}

TEST(WorkerInstantiator, LoaderFailureIsCreationFailure) {
  Fixture fixture;
  auto document = ensemble_json("ens", {"A"});
  document["performers"].push_back(performer_json("Z", "test.Missing"));
  auto graph = make_graph(document);
  auto [handles, created] = fixture.run(graph);
  ASSERT_FALSE(handles);
  EXPECT_EQ(handles.error().code, ErrorCode::PerformerCreationFailed);
  EXPECT_NE(handles.error().message.find("test.Missing"), std::string::npos);
  // A was built before Z failed and is left to the caller to tear down
  EXPECT_EQ(created.size(), 1u);
}

TEST(WorkerInstantiator, FactoryFailureIsCreationFailure) {
  Fixture fixture;
  Json document{{"guid", "ens"}, {"performers", Json::array({performer_json("A", kBrokenFactory)})}};
  auto [handles, created] = fixture.run(make_graph(document));
  ASSERT_FALSE(handles);
  EXPECT_EQ(handles.error().code, ErrorCode::PerformerCreationFailed);
}

TEST(WorkerInstantiator, AutoScaleBuildsAPool) {
  Fixture fixture;
  auto document = ensemble_json("ens", {"A"});
  document["performers"][0]["autoScale"] = 3;
  auto [handles, created] = fixture.run(make_graph(document));
  ASSERT_TRUE(handles) << handles.error().message;
  auto pool = std::dynamic_pointer_cast<fey::engine::ElasticPool>(handles->at("A"));
  ASSERT_NE(pool, nullptr);
  EXPECT_EQ(pool->size(), 1u);
  EXPECT_EQ(pool->resizer().upper_bound, 3);
}

TEST(WorkerInstantiator, ControlAwarePerformerRunsOnControlLane) {
  Fixture fixture;
  auto document = ensemble_json("ens", {"A", "B"});
  document["performers"][0]["controlAware"] = true;
  auto [handles, created] = fixture.run(make_graph(document));
  ASSERT_TRUE(handles) << handles.error().message;
  auto a = std::dynamic_pointer_cast<fey::engine::PerformerWorker>(handles->at("A"));
  auto b = std::dynamic_pointer_cast<fey::engine::PerformerWorker>(handles->at("B"));
  ASSERT_TRUE(a && b);
  EXPECT_EQ(a->lane(), fey::engine::Lane::Control);
  EXPECT_EQ(b->lane(), fey::engine::Lane::Worker);
}
