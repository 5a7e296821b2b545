/**
 * @file test_pipeline.cpp
 * @brief Tests for pipeline.hpp
 */

#include "dflow/pipeline.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using dflow::ExitReason;
using dflow::HandlerResult;
using dflow::StageFault;
using dflow::StageId;
using dflow::StageRole;
using dflow::SubscribeError;
using dflow::SubscriptionOptions;

// ============================================================================
// Test types
// ============================================================================

namespace {

template <typename Pred>
bool WaitUntil(Pred pred, uint32_t timeout_ms = 3000U) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

std::atomic<uint32_t> g_rejected_events{0U};

class Numbers : public dflow::StageHandler<int> {
 public:
  HandlerResult HandleDemand(uint32_t demand, std::vector<int>& out) override {
    for (uint32_t i = 0U; i < demand; ++i) out.push_back(next_++);
    return HandlerResult::success();
  }

  void HandleDispatchError(dflow::DispatchError err,
                           const std::vector<int>& rejected) override {
    if (err == dflow::DispatchError::kUnboundPartition) {
      g_rejected_events += static_cast<uint32_t>(rejected.size());
    }
  }

 private:
  int next_ = 0;
};

struct Received {
  std::mutex mtx;
  std::vector<int> events;

  size_t Size() {
    std::lock_guard<std::mutex> lock(mtx);
    return events.size();
  }
  std::vector<int> Snapshot() {
    std::lock_guard<std::mutex> lock(mtx);
    return events;
  }
};

class Store : public dflow::StageHandler<int> {
 public:
  explicit Store(std::shared_ptr<Received> rx) : rx_(std::move(rx)) {}

  HandlerResult HandleEvents(StageId, std::vector<int>& in,
                             std::vector<int>&) override {
    std::lock_guard<std::mutex> lock(rx_->mtx);
    rx_->events.insert(rx_->events.end(), in.begin(), in.end());
    return HandlerResult::success();
  }

 private:
  std::shared_ptr<Received> rx_;
};

class Pass : public dflow::StageHandler<int> {
 public:
  HandlerResult HandleEvents(StageId, std::vector<int>& in,
                             std::vector<int>& out) override {
    out = in;
    return HandlerResult::success();
  }
};

dflow::StageConfig<int> Cfg(const char* name, StageRole role) {
  dflow::StageConfig<int> cfg;
  cfg.name.assign(dflow::TruncateToCapacity, name);
  cfg.role = role;
  return cfg;
}

SubscriptionOptions ForPartition(const char* name) {
  SubscriptionOptions opts = SubscriptionOptions::WithMaxDemand(10U);
  opts.partition.assign(dflow::TruncateToCapacity, name);
  return opts;
}

dflow::DispatcherConfig<int> EvenOdd() {
  return dflow::IndexedPartitions<int>(
      2U, [](const int& ev) { return static_cast<uint32_t>(ev % 2); });
}

}  // namespace

// ============================================================================
// Stages
// ============================================================================

TEST_CASE("Pipeline assigns increasing stage ids", "[pipeline]") {
  dflow::Pipeline<int> pipe;
  REQUIRE(pipe.StageCount() == 0U);

  auto a = pipe.Start(Cfg("a", StageRole::kProducer), std::make_unique<Numbers>());
  auto b = pipe.Start(Cfg("b", StageRole::kConsumer),
                      std::make_unique<Store>(std::make_shared<Received>()));
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a.value() == StageId(1U));
  REQUIRE(b.value() == StageId(2U));
  REQUIRE(pipe.StageCount() == 2U);

  REQUIRE(pipe.Find(a.value()) != nullptr);
  REQUIRE(std::string(pipe.Find(b.value())->Name()) == "b");
  REQUIRE(pipe.Find(StageId(42U)) == nullptr);
}

TEST_CASE("Pipeline rejects invalid stages", "[pipeline]") {
  dflow::Pipeline<int> pipe;

  auto missing = pipe.Start(Cfg("x", StageRole::kProducer), nullptr);
  REQUIRE(missing.get_error() == dflow::StageError::kMissingHandler);

  auto cfg = Cfg("p", StageRole::kProducer);
  cfg.dispatcher = EvenOdd();
  cfg.dispatcher.hash = nullptr;
  auto no_hash = pipe.Start(cfg, std::make_unique<Numbers>());
  REQUIRE(no_hash.get_error() == dflow::StageError::kInvalidDispatcherConfig);

  REQUIRE(pipe.StageCount() == 0U);
  // Failed starts do not consume ids.
  REQUIRE(pipe.Start(Cfg("ok", StageRole::kProducer), std::make_unique<Numbers>())
              .value() == StageId(1U));
}

TEST_CASE("Pipeline operations on unknown stages", "[pipeline]") {
  dflow::Pipeline<int> pipe;
  StageId ghost(99U);
  REQUIRE(!pipe.Stop(ghost));
  REQUIRE(!pipe.RequestProduction(ghost));
  REQUIRE(!pipe.WaitTerminated(ghost, 10U));
  REQUIRE(!pipe.GetStatistics(ghost).has_value());
  REQUIRE(pipe.Cancel(ghost, dflow::SubscriptionTag(1U)).get_error() ==
          dflow::CancelError::kStageNotFound);
  REQUIRE(pipe.Subscribe(ghost, ghost, SubscriptionOptions()).get_error() ==
          SubscribeError::kStageNotFound);
  REQUIRE(pipe.AsyncSubscribe(ghost, ghost, SubscriptionOptions()).get_error() ==
          SubscribeError::kStageNotFound);
}

// ============================================================================
// Subscribe errors
// ============================================================================

TEST_CASE("Pipeline subscribe validation", "[pipeline][subscribe]") {
  dflow::Pipeline<int> pipe;
  StageId p = pipe.Start(Cfg("p", StageRole::kProducer),
                         std::make_unique<Numbers>()).value();
  StageId pc = pipe.Start(Cfg("pc", StageRole::kProducerConsumer),
                          std::make_unique<Pass>()).value();
  StageId c = pipe.Start(Cfg("c", StageRole::kConsumer),
                         std::make_unique<Store>(std::make_shared<Received>()))
                  .value();
  SubscriptionOptions ok = SubscriptionOptions::WithMaxDemand(10U);

  SECTION("invalid demand window") {
    SubscriptionOptions bad;
    bad.min_demand = 10U;
    bad.max_demand = 10U;
    REQUIRE(pipe.Subscribe(c, p, bad).get_error() ==
            SubscribeError::kInvalidDemandWindow);
    bad.max_demand = 0U;
    bad.min_demand = 0U;
    REQUIRE(pipe.AsyncSubscribe(c, p, bad).get_error() ==
            SubscribeError::kInvalidDemandWindow);
  }
  SECTION("self subscription") {
    REQUIRE(pipe.Subscribe(pc, pc, ok).get_error() ==
            SubscribeError::kSelfSubscription);
  }
  SECTION("producer cannot consume") {
    REQUIRE(pipe.Subscribe(p, pc, ok).get_error() == SubscribeError::kNotAConsumer);
  }
  SECTION("consumer cannot produce") {
    REQUIRE(pipe.Subscribe(pc, c, ok).get_error() == SubscribeError::kNoDispatcher);
  }
  SECTION("terminated stage") {
    pipe.Stop(p);
    REQUIRE(pipe.WaitTerminated(p, 3000U));
    REQUIRE(pipe.Subscribe(c, p, ok).get_error() ==
            SubscribeError::kStageNotRunning);
  }
  SECTION("valid chain") {
    REQUIRE(pipe.Subscribe(pc, p, ok).has_value());
    REQUIRE(pipe.Subscribe(c, pc, ok).has_value());
  }
}

TEST_CASE("Pipeline enforces subscriber limits", "[pipeline][subscribe]") {
  dflow::Pipeline<int> pipe;
  auto cfg = Cfg("single", StageRole::kProducer);
  cfg.dispatcher.max_subscribers = 1U;
  StageId p = pipe.Start(cfg, std::make_unique<Numbers>()).value();
  StageId c1 = pipe.Start(Cfg("c1", StageRole::kConsumer),
                          std::make_unique<Store>(std::make_shared<Received>()))
                   .value();
  StageId c2 = pipe.Start(Cfg("c2", StageRole::kConsumer),
                          std::make_unique<Store>(std::make_shared<Received>()))
                   .value();

  auto first = pipe.Subscribe(c1, p, SubscriptionOptions::WithMaxDemand(10U));
  REQUIRE(first.has_value());
  REQUIRE(pipe.Subscribe(c2, p, SubscriptionOptions::WithMaxDemand(10U)).get_error() ==
          SubscribeError::kTopologyViolation);

  // Cancelling frees the slot.
  REQUIRE(pipe.Cancel(c1, first.value()).has_value());
  REQUIRE(WaitUntil([&] {
    return pipe.Subscribe(c2, p, SubscriptionOptions::WithMaxDemand(10U)).has_value();
  }));
}

TEST_CASE("Pipeline partition binding errors", "[pipeline][partition]") {
  dflow::Pipeline<int> pipe;
  auto cfg = Cfg("router", StageRole::kProducer);
  cfg.dispatcher = EvenOdd();
  StageId p = pipe.Start(cfg, std::make_unique<Numbers>()).value();
  StageId c1 = pipe.Start(Cfg("c1", StageRole::kConsumer),
                          std::make_unique<Store>(std::make_shared<Received>()))
                   .value();
  StageId c2 = pipe.Start(Cfg("c2", StageRole::kConsumer),
                          std::make_unique<Store>(std::make_shared<Received>()))
                   .value();

  REQUIRE(pipe.Subscribe(c1, p, SubscriptionOptions::WithMaxDemand(10U)).get_error() ==
          SubscribeError::kPartitionRequired);
  REQUIRE(pipe.Subscribe(c1, p, ForPartition("2")).get_error() ==
          SubscribeError::kUnknownPartition);
  REQUIRE(pipe.Subscribe(c1, p, ForPartition("0")).has_value());
  REQUIRE(pipe.Subscribe(c2, p, ForPartition("0")).get_error() ==
          SubscribeError::kPartitionTaken);
  REQUIRE(pipe.Subscribe(c2, p, ForPartition("1")).has_value());
}

// ============================================================================
// Partition delivery
// ============================================================================

TEST_CASE("Pipeline partitions route deterministically", "[pipeline][partition]") {
  dflow::Pipeline<int> pipe;
  auto cfg = Cfg("router", StageRole::kProducer);
  cfg.dispatcher = EvenOdd();
  StageId p = pipe.Start(cfg, std::make_unique<Numbers>()).value();
  auto even = std::make_shared<Received>();
  auto odd = std::make_shared<Received>();
  StageId ce = pipe.Start(Cfg("even", StageRole::kConsumer),
                          std::make_unique<Store>(even)).value();
  StageId co = pipe.Start(Cfg("odd", StageRole::kConsumer),
                          std::make_unique<Store>(odd)).value();

  REQUIRE(pipe.Subscribe(ce, p, ForPartition("0")).has_value());
  REQUIRE(pipe.Subscribe(co, p, ForPartition("1")).has_value());

  REQUIRE(WaitUntil([&] { return even->Size() >= 50U && odd->Size() >= 50U; }));
  std::vector<int> e = even->Snapshot();
  std::vector<int> o = odd->Snapshot();
  for (size_t i = 1U; i < e.size(); ++i) {
    REQUIRE(e[i] % 2 == 0);
    REQUIRE(e[i] > e[i - 1U]);
  }
  for (size_t i = 1U; i < o.size(); ++i) {
    REQUIRE(o[i] % 2 == 1);
    REQUIRE(o[i] > o[i - 1U]);
  }
}

TEST_CASE("Pipeline reports events for unbound partitions",
          "[pipeline][partition]") {
  dflow::FaultRecorder<> faults;
  dflow::Pipeline<int> pipe;
  g_rejected_events.store(0U);

  auto cfg = Cfg("router", StageRole::kProducer);
  cfg.dispatcher = EvenOdd();
  cfg.fault_reporter = faults.AsReporter();
  StageId p = pipe.Start(cfg, std::make_unique<Numbers>()).value();
  auto even = std::make_shared<Received>();
  StageId ce = pipe.Start(Cfg("even", StageRole::kConsumer),
                          std::make_unique<Store>(even)).value();
  REQUIRE(pipe.Subscribe(ce, p, ForPartition("0")).has_value());

  REQUIRE(WaitUntil([&] { return even->Size() >= 20U; }));
  for (int v : even->Snapshot()) {
    REQUIRE(v % 2 == 0);
  }
  REQUIRE(WaitUntil([&] { return g_rejected_events.load() > 0U; }));
  REQUIRE(faults.Count(StageFault::kDispatchRejected) > 0U);

  auto stats = pipe.GetStatistics(p).value();
  REQUIRE(stats.events_rejected > 0U);
  REQUIRE(stats.dispatch_errors > 0U);
}

// ============================================================================
// Control and statistics
// ============================================================================

TEST_CASE("Pipeline statistics track the flow", "[pipeline][stats]") {
  dflow::Pipeline<int> pipe;
  auto rx = std::make_shared<Received>();
  StageId p = pipe.Start(Cfg("p", StageRole::kProducer),
                         std::make_unique<Numbers>()).value();
  StageId c = pipe.Start(Cfg("c", StageRole::kConsumer),
                         std::make_unique<Store>(rx)).value();
  REQUIRE(pipe.Subscribe(c, p, SubscriptionOptions::WithMaxDemand(8U)).has_value());
  REQUIRE(WaitUntil([&] { return rx->Size() >= 64U; }));

  auto cs = pipe.GetStatistics(c).value();
  auto ps = pipe.GetStatistics(p).value();
  REQUIRE(cs.events_in >= 64U);
  REQUIRE(cs.demand_requested >= cs.events_in);
  REQUIRE(ps.demand_received >= ps.events_out);
  REQUIRE(ps.messages_processed > 0U);
  REQUIRE(cs.events_out == 0U);
  REQUIRE(pipe.Find(c)->GetMailboxStatistics().received > 0U);
}

TEST_CASE("Pipeline StopAll terminates every stage", "[pipeline]") {
  dflow::Pipeline<int> pipe;
  auto rx = std::make_shared<Received>();
  StageId p = pipe.Start(Cfg("p", StageRole::kProducer),
                         std::make_unique<Numbers>()).value();
  StageId pc = pipe.Start(Cfg("pc", StageRole::kProducerConsumer),
                          std::make_unique<Pass>()).value();
  StageId c = pipe.Start(Cfg("c", StageRole::kConsumer),
                         std::make_unique<Store>(rx)).value();
  REQUIRE(pipe.Subscribe(pc, p, SubscriptionOptions::WithMaxDemand(10U)).has_value());
  REQUIRE(pipe.Subscribe(c, pc, SubscriptionOptions::WithMaxDemand(10U)).has_value());
  REQUIRE(WaitUntil([&] { return rx->Size() > 0U; }));

  pipe.StopAll();
  pipe.JoinAll();
  for (StageId id : {p, pc, c}) {
    REQUIRE(!pipe.Find(id)->IsAlive());
    REQUIRE(pipe.WaitTerminated(id, 10U));
  }
  REQUIRE(pipe.Find(p)->GetExitReason() == ExitReason::kShutdown);
}
