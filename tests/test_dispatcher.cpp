/**
 * @file test_dispatcher.cpp
 * @brief Tests for dispatcher.hpp
 */

#include "dflow/dispatcher.hpp"

#include <catch2/catch.hpp>

#include <deque>
#include <vector>

using dflow::DispatchError;
using dflow::SubscribeError;
using dflow::SubscriptionOptions;
using dflow::SubscriptionTag;

// ============================================================================
// Test helpers
// ============================================================================

namespace {

struct Out {
  std::vector<dflow::Delivery<int>> deliveries;
  std::vector<dflow::RejectedBatch<int>> rejected;
};

std::deque<int> Range(int first, int count) {
  std::deque<int> d;
  for (int i = 0; i < count; ++i) d.push_back(first + i);
  return d;
}

SubscriptionOptions Window(uint32_t max_demand) {
  return SubscriptionOptions::WithMaxDemand(max_demand);
}

SubscriptionOptions Bound(const char* partition, uint32_t max_demand = 10U) {
  SubscriptionOptions opts = SubscriptionOptions::WithMaxDemand(max_demand);
  opts.partition.assign(dflow::TruncateToCapacity, partition);
  return opts;
}

const SubscriptionTag kA(1U);
const SubscriptionTag kB(2U);
const SubscriptionTag kC(3U);

}  // namespace

// ============================================================================
// DemandDispatcher
// ============================================================================

TEST_CASE("Demand dispatch prefers the highest demand", "[dispatcher][demand]") {
  dflow::DemandDispatcher<int> d;
  REQUIRE(d.Subscribe(kA, Window(10U)).has_value());
  REQUIRE(d.Subscribe(kB, Window(10U)).has_value());
  REQUIRE(d.Ask(kA, 6U).has_value());
  REQUIRE(d.Ask(kB, 2U).has_value());
  REQUIRE(d.Satisfiable() == 8U);

  std::deque<int> buffer = Range(0, 5);
  Out out;
  d.Dispatch(buffer, out.deliveries, out.rejected);

  REQUIRE(out.deliveries.size() == 1U);
  REQUIRE(out.deliveries[0].tag == kA);
  REQUIRE(out.deliveries[0].events == std::vector<int>({0, 1, 2, 3, 4}));
  REQUIRE(buffer.empty());
  REQUIRE(d.Demand(kA) == 1U);
  REQUIRE(d.Demand(kB) == 2U);
}

TEST_CASE("Demand dispatch spills over to the next subscriber",
          "[dispatcher][demand]") {
  dflow::DemandDispatcher<int> d;
  d.Subscribe(kA, Window(10U));
  d.Subscribe(kB, Window(10U));
  d.Ask(kA, 3U);
  d.Ask(kB, 2U);

  std::deque<int> buffer = Range(0, 7);
  Out out;
  d.Dispatch(buffer, out.deliveries, out.rejected);

  REQUIRE(out.deliveries.size() == 2U);
  REQUIRE(out.deliveries[0].tag == kA);
  REQUIRE(out.deliveries[0].events.size() == 3U);
  REQUIRE(out.deliveries[1].tag == kB);
  REQUIRE(out.deliveries[1].events == std::vector<int>({3, 4}));
  // Surplus stays buffered, in order.
  REQUIRE(buffer == std::deque<int>({5, 6}));
  REQUIRE(d.Satisfiable() == 0U);
}

TEST_CASE("Demand dispatch ties go to the earliest subscriber",
          "[dispatcher][demand]") {
  dflow::DemandDispatcher<int> d;
  d.Subscribe(kA, Window(10U));
  d.Subscribe(kB, Window(10U));
  d.Ask(kB, 4U);
  d.Ask(kA, 4U);

  std::deque<int> buffer = Range(0, 2);
  Out out;
  d.Dispatch(buffer, out.deliveries, out.rejected);
  REQUIRE(out.deliveries.size() == 1U);
  REQUIRE(out.deliveries[0].tag == kA);
}

TEST_CASE("Demand dispatch alternates under equal load", "[dispatcher][demand]") {
  dflow::DemandDispatcher<int> d;
  d.Subscribe(kA, Window(4U));
  d.Subscribe(kB, Window(4U));
  d.Ask(kA, 4U);
  d.Ask(kB, 4U);

  std::deque<int> first = Range(0, 2);
  Out out;
  d.Dispatch(first, out.deliveries, out.rejected);
  std::deque<int> second = Range(2, 2);
  d.Dispatch(second, out.deliveries, out.rejected);

  REQUIRE(out.deliveries.size() == 2U);
  REQUIRE(out.deliveries[0].tag == kA);
  REQUIRE(out.deliveries[1].tag == kB);
}

TEST_CASE("Demand dispatch with no demand keeps the buffer",
          "[dispatcher][demand]") {
  dflow::DemandDispatcher<int> d;
  std::deque<int> buffer = Range(0, 3);
  Out out;
  d.Dispatch(buffer, out.deliveries, out.rejected);
  REQUIRE(out.deliveries.empty());
  REQUIRE(buffer.size() == 3U);

  d.Subscribe(kA, Window(10U));
  d.Dispatch(buffer, out.deliveries, out.rejected);
  REQUIRE(out.deliveries.empty());
  REQUIRE(buffer.size() == 3U);
}

TEST_CASE("Demand is clamped to max_demand", "[dispatcher][demand]") {
  dflow::DemandDispatcher<int> d;
  d.Subscribe(kA, Window(5U));
  d.Ask(kA, 4U);
  d.Ask(kA, 4U);
  REQUIRE(d.Demand(kA) == 5U);
}

TEST_CASE("Demand dispatch rejects unknown tags and cancels",
          "[dispatcher][demand]") {
  dflow::DemandDispatcher<int> d;
  REQUIRE(d.Ask(kC, 1U).get_error() == DispatchError::kUnknownSubscription);
  REQUIRE(!d.Cancel(kC));

  d.Subscribe(kA, Window(10U));
  d.Ask(kA, 5U);
  REQUIRE(d.Cancel(kA));
  REQUIRE(!d.Cancel(kA));
  REQUIRE(d.SubscriberCount() == 0U);
  REQUIRE(d.Satisfiable() == 0U);
}

TEST_CASE("Demand dispatch enforces the subscriber limit",
          "[dispatcher][demand]") {
  dflow::DemandDispatcher<int> d(1U);
  REQUIRE(d.Subscribe(kA, Window(10U)).has_value());
  REQUIRE(d.Subscribe(kB, Window(10U)).get_error() ==
          SubscribeError::kTopologyViolation);
  d.Cancel(kA);
  REQUIRE(d.Subscribe(kB, Window(10U)).has_value());
}

// ============================================================================
// BroadcastDispatcher
// ============================================================================

TEST_CASE("Broadcast is paced by the slowest subscriber",
          "[dispatcher][broadcast]") {
  dflow::BroadcastDispatcher<int> d;
  REQUIRE(d.Satisfiable() == 0U);
  d.Subscribe(kA, Window(10U));
  d.Subscribe(kB, Window(10U));
  d.Ask(kA, 10U);
  d.Ask(kB, 3U);
  REQUIRE(d.Satisfiable() == 3U);

  std::deque<int> buffer = Range(0, 5);
  Out out;
  d.Dispatch(buffer, out.deliveries, out.rejected);

  REQUIRE(out.deliveries.size() == 2U);
  for (const auto& del : out.deliveries) {
    REQUIRE(del.events == std::vector<int>({0, 1, 2}));
  }
  REQUIRE(buffer == std::deque<int>({3, 4}));
  REQUIRE(d.Demand(kA) == 7U);
  REQUIRE(d.Demand(kB) == 0U);
}

TEST_CASE("Broadcast resumes after a slow subscriber leaves",
          "[dispatcher][broadcast]") {
  dflow::BroadcastDispatcher<int> d;
  d.Subscribe(kA, Window(10U));
  d.Subscribe(kB, Window(10U));
  d.Ask(kA, 5U);
  REQUIRE(d.Satisfiable() == 0U);
  REQUIRE(d.Cancel(kB));
  REQUIRE(d.Satisfiable() == 5U);
}

// ============================================================================
// PartitionDispatcher
// ============================================================================

TEST_CASE("Partition subscribe validation", "[dispatcher][partition]") {
  auto cfg = dflow::IndexedPartitions<int>(
      2U, [](const int& ev) { return static_cast<uint32_t>(ev % 2); });
  dflow::PartitionDispatcher<int> d(cfg.partitions, cfg.hash);
  REQUIRE(d.PartitionCount() == 2U);

  REQUIRE(d.Subscribe(kA, Window(10U)).get_error() ==
          SubscribeError::kPartitionRequired);
  REQUIRE(d.Subscribe(kA, Bound("7")).get_error() ==
          SubscribeError::kUnknownPartition);
  REQUIRE(d.Subscribe(kA, Bound("0")).has_value());
  REQUIRE(d.Subscribe(kB, Bound("0")).get_error() ==
          SubscribeError::kPartitionTaken);
  REQUIRE(d.Subscribe(kB, Bound("1")).has_value());
  REQUIRE(d.SubscriberCount() == 2U);

  REQUIRE(d.Cancel(kA));
  REQUIRE(d.Subscribe(kC, Bound("0")).has_value());
}

TEST_CASE("Partition routes by hash and keeps order", "[dispatcher][partition]") {
  auto cfg = dflow::IndexedPartitions<int>(
      2U, [](const int& ev) { return static_cast<uint32_t>(ev % 2); });
  dflow::PartitionDispatcher<int> d(cfg.partitions, cfg.hash);
  d.Subscribe(kA, Bound("0"));
  d.Subscribe(kB, Bound("1"));
  d.Ask(kA, 2U);
  d.Ask(kB, 10U);
  REQUIRE(d.Satisfiable() == 12U);

  std::deque<int> buffer = Range(0, 8);
  Out out;
  d.Dispatch(buffer, out.deliveries, out.rejected);

  REQUIRE(out.rejected.empty());
  REQUIRE(out.deliveries.size() == 2U);
  REQUIRE(out.deliveries[0].tag == kA);
  REQUIRE(out.deliveries[0].events == std::vector<int>({0, 2}));
  REQUIRE(out.deliveries[1].tag == kB);
  REQUIRE(out.deliveries[1].events == std::vector<int>({1, 3, 5, 7}));
  // Evens without demand wait in the buffer.
  REQUIRE(buffer == std::deque<int>({4, 6}));

  d.Ask(kA, 1U);
  Out next;
  d.Dispatch(buffer, next.deliveries, next.rejected);
  REQUIRE(next.deliveries.size() == 1U);
  REQUIRE(next.deliveries[0].events == std::vector<int>({4}));
  REQUIRE(buffer == std::deque<int>({6}));
}

TEST_CASE("Partition rejects unbound and unknown partitions",
          "[dispatcher][partition]") {
  auto cfg = dflow::IndexedPartitions<int>(
      2U, [](const int& ev) { return static_cast<uint32_t>(ev); });
  dflow::PartitionDispatcher<int> d(cfg.partitions, cfg.hash);
  d.Subscribe(kA, Bound("0"));
  d.Ask(kA, 10U);

  std::deque<int> buffer{0, 1, 5, 0};
  Out out;
  d.Dispatch(buffer, out.deliveries, out.rejected);

  REQUIRE(buffer.empty());
  REQUIRE(out.deliveries.size() == 1U);
  REQUIRE(out.deliveries[0].events == std::vector<int>({0, 0}));
  REQUIRE(out.rejected.size() == 2U);
  REQUIRE(out.rejected[0].error == DispatchError::kUnknownPartition);
  REQUIRE(out.rejected[0].events == std::vector<int>({5}));
  REQUIRE(out.rejected[1].error == DispatchError::kUnboundPartition);
  REQUIRE(out.rejected[1].events == std::vector<int>({1}));
}

TEST_CASE("Partition subscriber limit", "[dispatcher][partition]") {
  auto cfg = dflow::IndexedPartitions<int>(
      3U, [](const int& ev) { return static_cast<uint32_t>(ev % 3); });
  dflow::PartitionDispatcher<int> d(cfg.partitions, cfg.hash, 1U);
  REQUIRE(d.Subscribe(kA, Bound("0")).has_value());
  REQUIRE(d.Subscribe(kB, Bound("1")).get_error() ==
          SubscribeError::kTopologyViolation);
}

// ============================================================================
// Dispatcher config and variant
// ============================================================================

TEST_CASE("Dispatcher config validation", "[dispatcher][config]") {
  dflow::DispatcherConfig<int> cfg;
  REQUIRE(dflow::IsValidDispatcherConfig(cfg));

  cfg.kind = dflow::DispatcherKind::kPartition;
  REQUIRE(!dflow::IsValidDispatcherConfig(cfg));

  cfg = dflow::IndexedPartitions<int>(2U, [](const int&) { return 0U; });
  REQUIRE(dflow::IsValidDispatcherConfig(cfg));
  REQUIRE(cfg.partitions[1] == "1");

  SECTION("missing hash") {
    cfg.hash = nullptr;
    REQUIRE(!dflow::IsValidDispatcherConfig(cfg));
  }
  SECTION("duplicate names") {
    cfg.partitions[1] = dflow::PartitionName("0");
    REQUIRE(!dflow::IsValidDispatcherConfig(cfg));
  }
  SECTION("empty name") {
    cfg.partitions.push_back(dflow::PartitionName());
    REQUIRE(!dflow::IsValidDispatcherConfig(cfg));
  }
}

TEST_CASE("Dispatcher variant follows its config kind", "[dispatcher]") {
  dflow::DispatcherConfig<int> cfg;
  cfg.kind = dflow::DispatcherKind::kBroadcast;
  dflow::Dispatcher<int> d(cfg);
  REQUIRE(d.Kind() == dflow::DispatcherKind::kBroadcast);

  d.Subscribe(kA, Window(10U));
  d.Subscribe(kB, Window(10U));
  d.Ask(kA, 2U);
  d.Ask(kB, 2U);
  std::deque<int> buffer = Range(0, 2);
  Out out;
  d.Dispatch(buffer, out.deliveries, out.rejected);
  REQUIRE(out.deliveries.size() == 2U);
  REQUIRE(d.SubscriberCount() == 2U);
  REQUIRE(d.Demand(kA) == 0U);
}
