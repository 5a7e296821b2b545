/**
 * @file test_fault.cpp
 * @brief Tests for fault.hpp
 */

#include "dflow/fault.hpp"

#include <catch2/catch.hpp>

#include <thread>
#include <vector>

using dflow::FaultPriority;
using dflow::StageFault;

TEST_CASE("FaultReporter without function is a no-op", "[fault]") {
  dflow::FaultReporter reporter;
  reporter.Report(StageFault::kHandlerFailed, 1U, FaultPriority::kHigh);
  REQUIRE(reporter.fn == nullptr);
}

TEST_CASE("FaultRecorder counts per fault point", "[fault]") {
  dflow::FaultRecorder<> rec;
  dflow::FaultReporter reporter = rec.AsReporter();

  reporter.Report(StageFault::kDispatchRejected, 4U, FaultPriority::kHigh);
  reporter.Report(StageFault::kDispatchRejected, 2U, FaultPriority::kHigh);
  reporter.Report(StageFault::kMailboxFull, 3U, FaultPriority::kMedium);

  REQUIRE(rec.Count(StageFault::kDispatchRejected) == 2U);
  REQUIRE(rec.Count(StageFault::kMailboxFull) == 1U);
  REQUIRE(rec.Count(StageFault::kHandlerFailed) == 0U);
  REQUIRE(rec.Total() == 3U);
}

TEST_CASE("FaultRecorder out-of-range index counts toward total only", "[fault]") {
  dflow::FaultRecorder<> rec;
  rec.Record(99U, 0U, FaultPriority::kLow);
  REQUIRE(rec.Total() == 1U);
  REQUIRE(rec.Count(StageFault::kDispatchRejected) == 0U);
}

TEST_CASE("FaultRecorder recent ring is newest first", "[fault]") {
  dflow::FaultRecorder<4U> rec;
  for (uint32_t i = 0U; i < 6U; ++i) {
    rec.Record(static_cast<uint16_t>(StageFault::kDemandOverrun), i,
               FaultPriority::kMedium);
  }

  std::vector<uint32_t> details;
  rec.ForEachRecent(
      [&](const dflow::RecentFaultInfo& info) { details.push_back(info.detail); });
  REQUIRE(details.size() == 4U);
  REQUIRE(details[0] == 5U);
  REQUIRE(details[3] == 2U);

  SECTION("early stop") {
    uint32_t visited = 0U;
    rec.ForEachRecent([&](const dflow::RecentFaultInfo&) {
      ++visited;
      return false;
    });
    REQUIRE(visited == 1U);
  }
}

TEST_CASE("FaultRecorder hook sees every fault", "[fault]") {
  dflow::FaultRecorder<> rec;
  uint32_t last_detail = 0U;
  FaultPriority last_priority = FaultPriority::kLow;
  rec.SetHook([&last_detail, &last_priority](const dflow::RecentFaultInfo& info) {
    last_detail = info.detail;
    last_priority = info.priority;
  });

  rec.AsReporter().Report(StageFault::kSubscribeRejected, 17U,
                          FaultPriority::kCritical);
  REQUIRE(last_detail == 17U);
  REQUIRE(last_priority == FaultPriority::kCritical);
}

TEST_CASE("FaultRecorder Reset clears state", "[fault]") {
  dflow::FaultRecorder<> rec;
  rec.Record(0U, 1U, FaultPriority::kHigh);
  rec.Reset();
  REQUIRE(rec.Total() == 0U);
  uint32_t visited = 0U;
  rec.ForEachRecent([&](const dflow::RecentFaultInfo&) { ++visited; });
  REQUIRE(visited == 0U);
}

TEST_CASE("FaultRecorder concurrent reports", "[fault][concurrency]") {
  dflow::FaultRecorder<> rec;
  dflow::FaultReporter reporter = rec.AsReporter();
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([reporter]() {
      for (int i = 0; i < 250; ++i) {
        reporter.Report(StageFault::kMailboxFull, 0U, FaultPriority::kMedium);
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(rec.Count(StageFault::kMailboxFull) == 1000U);
}
