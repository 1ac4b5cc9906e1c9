#include <gtest/gtest.h>

#include <algorithm>

#include "runtime/elastic_pool.hpp"
#include "test_support.hpp"

using fey::engine::ElasticPool;
using fey::engine::Message;
using fey::engine::PerformerInit;
using fey::engine::PerformerWorkerOptions;
using fey::engine::ResizerConfig;
using fey::engine::RestartPolicy;
using fey::engine::RestartWindow;
using fey::engine::WorkerState;

namespace {

auto make_pool_with(WorkerHarness& harness, const std::shared_ptr<Probe>& probe, ResizerConfig resizer,
                    RestartPolicy policy = {}, std::shared_ptr<fey::engine::WorkerWatcher> watcher = nullptr)
  -> std::shared_ptr<ElasticPool> {
  PerformerInit init;
  init.id = "p";
  PerformerWorkerOptions options;
  options.path = "test/p";
  auto pool = ElasticPool::create(std::move(init), recording_factory(probe), std::move(options), resizer,
                                  std::make_shared<RestartWindow>(policy), harness.env(std::move(watcher)));
  EXPECT_TRUE(pool) << pool.error().message;
  harness.track(*pool);
  (*pool)->start();
  return *pool;
}

auto make_pool(WorkerHarness& harness, const std::shared_ptr<Probe>& probe, int upper_bound,
               int messages_per_resize = 500, RestartPolicy policy = {},
               std::shared_ptr<fey::engine::WorkerWatcher> watcher = nullptr) -> std::shared_ptr<ElasticPool> {
  ResizerConfig resizer;
  resizer.upper_bound = upper_bound;
  resizer.messages_per_resize = messages_per_resize;
  return make_pool_with(harness, probe, resizer, policy, std::move(watcher));
}

auto count_of(const std::vector<std::string>& payloads, const std::string& payload) -> long {
  return std::count(payloads.begin(), payloads.end(), payload);
}

}  // namespace

TEST(ResizeDelta, GrowsWhenMostRouteesAreBusy) {
  ResizerConfig config;
  EXPECT_EQ(fey::engine::resize_delta({1}, config), 1);
  EXPECT_EQ(fey::engine::resize_delta({3, 0}, config), 1);
}

TEST(ResizeDelta, ShrinksWhenRoutesAreIdle) {
  ResizerConfig config;
  EXPECT_EQ(fey::engine::resize_delta({0}, config), -1);
  EXPECT_EQ(fey::engine::resize_delta({0, 0, 0, 0}, config), -1);
}

TEST(ResizeDelta, KeepsSizeBetweenThresholds) {
  ResizerConfig config;
  EXPECT_EQ(fey::engine::resize_delta({1, 0, 0, 0, 0}, config), 0);
  EXPECT_EQ(fey::engine::resize_delta({2, 2, 0, 0, 0}, config), 0);
}

TEST(ResizeDelta, PressureThresholdDefinesBusy) {
  ResizerConfig config;
  config.pressure_threshold = 5;
  EXPECT_EQ(fey::engine::resize_delta({4, 4}, config), -1);
  EXPECT_EQ(fey::engine::resize_delta({5, 5}, config), 1);
}

TEST(ElasticPool, StartsWithOneRoutee) {
  WorkerHarness harness;
  auto probe = std::make_shared<Probe>();
  auto pool = make_pool(harness, probe, 3);
  EXPECT_EQ(pool->size(), 1u);
  EXPECT_EQ(pool->routee_paths(), std::vector<std::string>{"test/p/routee-0"});
  EXPECT_EQ(pool->path(), "test/p");
  EXPECT_EQ(pool->state(), WorkerState::Running);
}

TEST(ElasticPool, GrowsUnderPressureAndShrinksWithinBounds) {
  WorkerHarness harness;
  auto probe = std::make_shared<Probe>();
  probe->gate_open = false;
  auto pool = make_pool(harness, probe, 3);

  pool->tell(Message::process("hold"));
  ASSERT_TRUE(wait_for_condition([&] { return probe->holding.load(); }));

  EXPECT_EQ(pool->resize(), 1);
  EXPECT_EQ(pool->size(), 2u);
  // one busy routee out of two is still above the grow threshold
  EXPECT_EQ(pool->resize(), 1);
  EXPECT_EQ(pool->size(), 3u);
  EXPECT_EQ(pool->resize(), 0);
  EXPECT_EQ(pool->size(), 3u);

  probe->gate_open = true;
  ASSERT_TRUE(wait_for_condition([&] { return pool->pending() == 0; }));
  EXPECT_EQ(pool->resize(), -1);
  EXPECT_EQ(pool->resize(), -1);
  EXPECT_EQ(pool->resize(), 0);
  EXPECT_EQ(pool->size(), 1u);
}

TEST(ElasticPool, RoutesToTheSmallestMailbox) {
  WorkerHarness harness;
  auto probe = std::make_shared<Probe>();
  probe->gate_open = false;
  auto pool = make_pool(harness, probe, 2);

  pool->tell(Message::process("hold"));
  ASSERT_TRUE(wait_for_condition([&] { return probe->holding.load(); }));
  ASSERT_EQ(pool->resize(), 1);

  pool->tell(Message::process("free"));
  // the second routee is idle, so it takes the message while the first is blocked
  ASSERT_TRUE(wait_for_condition([&] { return probe->messages.load() == 1; }));
  EXPECT_EQ(probe->payloads(), std::vector<std::string>{"p:free"});
  probe->gate_open = true;
  ASSERT_TRUE(wait_for_condition([&] { return probe->messages.load() == 2; }));
}

TEST(ElasticPool, ResizesAfterConfiguredDispatchCount) {
  WorkerHarness harness;
  auto probe = std::make_shared<Probe>();
  probe->gate_open = false;
  auto pool = make_pool(harness, probe, 4, 2);

  pool->tell(Message::process("hold"));
  ASSERT_TRUE(wait_for_condition([&] { return probe->holding.load(); }));
  pool->tell(Message::process("queued"));
  EXPECT_TRUE(wait_for_condition([&] { return pool->size() == 2u; }));
  probe->gate_open = true;
  ASSERT_TRUE(wait_for_condition([&] { return probe->messages.load() == 2; }));
}

TEST(ElasticPool, NeverGrowsPastUpperBound) {
  WorkerHarness harness;
  auto probe = std::make_shared<Probe>();
  auto pool = make_pool(harness, probe, 2);
  probe->gate_open = false;

  pool->tell(Message::process("hold"));
  ASSERT_TRUE(wait_for_condition([&] { return probe->holding.load(); }));
  ASSERT_EQ(pool->resize(), 1);
  pool->tell(Message::process("second"));
  ASSERT_TRUE(wait_for_condition([&] { return probe->messages.load() == 1; }));

  EXPECT_EQ(pool->resize(), 0);
  EXPECT_EQ(pool->size(), 2u);
  probe->gate_open = true;
  ASSERT_TRUE(wait_for_condition([&] { return pool->pending() == 0; }));
  EXPECT_EQ(pool->resize(), -1);
  EXPECT_EQ(pool->size(), 1u);
  EXPECT_EQ(probe->messages.load(), 2);
}

TEST(ElasticPool, DeadRouteeKillsThePool) {
  WorkerHarness harness;
  auto probe = std::make_shared<Probe>();
  auto watcher = std::make_shared<RecordingWatcher>();
  auto pool = make_pool(harness, probe, 2, 500, RestartPolicy{0, std::chrono::minutes(1)}, watcher);

  pool->tell(Message::process("boom"));
  ASSERT_TRUE(wait_for_condition([&] { return pool->state() == WorkerState::Dead; }));
  EXPECT_EQ(watcher->dead(), std::vector<std::string>{"test/p"});
  EXPECT_NE(watcher->last_cause().find("test/p/routee-0"), std::string::npos);
  EXPECT_FALSE(pool->is_alive());
}

TEST(ElasticPool, RouteeFailureRestartsInPlace) {
  WorkerHarness harness;
  auto probe = std::make_shared<Probe>();
  auto watcher = std::make_shared<RecordingWatcher>();
  auto pool = make_pool(harness, probe, 2, 500, RestartPolicy{}, watcher);

  pool->tell(Message::process("boom"));
  pool->tell(Message::process("ok"));
  ASSERT_TRUE(wait_for_condition([&] { return probe->messages.load() == 1; }));
  EXPECT_EQ(watcher->restarted(), std::vector<std::string>{"test/p/routee-0"});
  EXPECT_EQ(pool->state(), WorkerState::Running);
}

TEST(ElasticPool, StopReachesEveryRoutee) {
  WorkerHarness harness;
  auto probe = std::make_shared<Probe>();
  probe->gate_open = false;
  auto pool = make_pool(harness, probe, 3);
  pool->tell(Message::process("hold"));
  ASSERT_TRUE(wait_for_condition([&] { return probe->holding.load(); }));
  ASSERT_EQ(pool->resize(), 1);
  probe->gate_open = true;

  pool->stop();
  EXPECT_EQ(pool->state(), WorkerState::Stopped);
  ASSERT_TRUE(wait_for_condition([&] { return probe->stops.load() == 2; }));
  pool->tell(Message::process("late"));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(probe->messages.load(), 1);
}

TEST(ElasticPool, ShrinkKeepsWorkQueuedOnTheRetiredRoutee) {
  WorkerHarness harness;
  auto probe = std::make_shared<Probe>();
  probe->gate_open = false;
  probe->park_open = false;
  ResizerConfig resizer;
  resizer.upper_bound = 2;
  resizer.pressure_threshold = 3;
  auto pool = make_pool_with(harness, probe, resizer);

  // routee-0: hold, a, b
  pool->tell(Message::process("hold"));
  ASSERT_TRUE(wait_for_condition([&] { return probe->holding.load(); }));
  pool->tell(Message::process("a"));
  pool->tell(Message::process("b"));
  ASSERT_EQ(pool->resize(), 1);

  // routee-1 parks with c queued behind it
  pool->tell(Message::process("park"));
  pool->tell(Message::process("c"));
  ASSERT_TRUE(wait_for_condition([&] { return probe->parked.load() == 1; }));

  // routee-0 drains, then parks with d queued
  probe->gate_open = true;
  ASSERT_TRUE(wait_for_condition([&] { return pool->pending() == 2; }));
  pool->tell(Message::process("park"));
  pool->tell(Message::process("d"));
  ASSERT_TRUE(wait_for_condition([&] { return probe->parked.load() == 2; }));

  // both routees below pressure with equal load: the newer one retires
  ASSERT_EQ(pool->resize(), -1);
  EXPECT_EQ(pool->routee_paths(), std::vector<std::string>{"test/p/routee-0"});

  probe->park_open = true;
  ASSERT_TRUE(wait_for_condition([&] { return probe->messages.load() == 7; }));
  ASSERT_TRUE(wait_for_condition([&] { return probe->stops.load() == 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  auto payloads = probe->payloads();
  EXPECT_EQ(payloads.size(), 7u);
  for (const auto* payload : {"p:hold", "p:a", "p:b", "p:c", "p:d"}) {
    EXPECT_EQ(count_of(payloads, payload), 1) << payload;
  }
  EXPECT_EQ(count_of(payloads, "p:park"), 2);
  EXPECT_EQ(pool->size(), 1u);
}
