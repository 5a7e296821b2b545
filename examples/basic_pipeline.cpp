/**
 * @file basic_pipeline.cpp
 * @brief Counter -> multiplier -> two printers, driven by consumer demand.
 *
 * Demonstrates:
 *   - Producer, producer-consumer and consumer handlers
 *   - Demand dispatch spreading batches across two consumers
 *   - Small demand windows (max_demand 10, min_demand 5)
 *   - Per-stage statistics and orderly shutdown
 */

#include "dflow/log.hpp"
#include "dflow/pipeline.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <thread>
#include <vector>

static constexpr uint32_t kTotalEvents = 200U;

// -- Handlers ----------------------------------------------------------------

class Counter : public dflow::StageHandler<int> {
 public:
  dflow::HandlerResult HandleDemand(uint32_t demand,
                                    std::vector<int>& out) override {
    while (demand > 0U && next_ < static_cast<int>(kTotalEvents)) {
      out.push_back(next_++);
      --demand;
    }
    return dflow::HandlerResult::success();
  }

 private:
  int next_{0};
};

class Multiplier : public dflow::StageHandler<int> {
 public:
  explicit Multiplier(int factor) : factor_(factor) {}

  dflow::HandlerResult HandleEvents(dflow::StageId /*from*/, std::vector<int>& in,
                                    std::vector<int>& out) override {
    for (int v : in) {
      out.push_back(v * factor_);
    }
    return dflow::HandlerResult::success();
  }

 private:
  int factor_;
};

class Printer : public dflow::StageHandler<int> {
 public:
  Printer(const char* tag, std::atomic<uint32_t>& seen) : tag_(tag), seen_(seen) {}

  dflow::HandlerResult HandleEvents(dflow::StageId /*from*/, std::vector<int>& in,
                                    std::vector<int>& /*out*/) override {
    DFLOW_LOG_INFO(tag_, "batch of %u: first=%d last=%d",
                   static_cast<unsigned>(in.size()), in.front(), in.back());
    seen_.fetch_add(static_cast<uint32_t>(in.size()), std::memory_order_relaxed);
    return dflow::HandlerResult::success();
  }

 private:
  const char* tag_;
  std::atomic<uint32_t>& seen_;
};

// ---------------------------------------------------------------------------

static void PrintStats(const dflow::Pipeline<int>& pipe, dflow::StageId id,
                       const char* name) {
  auto stats = pipe.GetStatistics(id);
  if (!stats.has_value()) return;
  std::printf("  %-10s in=%-5lu out=%-5lu demand_rx=%-5lu demand_tx=%lu\n", name,
              static_cast<unsigned long>(stats.value().events_in),
              static_cast<unsigned long>(stats.value().events_out),
              static_cast<unsigned long>(stats.value().demand_received),
              static_cast<unsigned long>(stats.value().demand_requested));
}

int main() {
  dflow::log::Init();
  dflow::log::SetLevel(dflow::log::Level::kInfo);

  std::atomic<uint32_t> seen_a{0U};
  std::atomic<uint32_t> seen_b{0U};

  dflow::Pipeline<int> pipe;

  dflow::StageConfig<int> src_cfg;
  src_cfg.name.assign(dflow::TruncateToCapacity, "counter");
  src_cfg.idle_timeout_ms = 10U;
  auto src = pipe.Start(src_cfg, std::make_unique<Counter>());

  dflow::StageConfig<int> mul_cfg;
  mul_cfg.name.assign(dflow::TruncateToCapacity, "multiplier");
  mul_cfg.role = dflow::StageRole::kProducerConsumer;
  auto mul = pipe.Start(mul_cfg, std::make_unique<Multiplier>(3));

  dflow::StageConfig<int> sink_cfg;
  sink_cfg.role = dflow::StageRole::kConsumer;
  sink_cfg.name.assign(dflow::TruncateToCapacity, "printer_a");
  auto sink_a = pipe.Start(sink_cfg, std::make_unique<Printer>("printer_a", seen_a));
  sink_cfg.name.assign(dflow::TruncateToCapacity, "printer_b");
  auto sink_b = pipe.Start(sink_cfg, std::make_unique<Printer>("printer_b", seen_b));

  if (!src || !mul || !sink_a || !sink_b) {
    DFLOW_LOG_ERROR("main", "failed to start stages");
    return 1;
  }

  // Wire consumers first so the multiplier never buffers without a taker.
  dflow::SubscriptionOptions opts;
  opts.max_demand = 10U;
  opts.min_demand = 5U;
  if (!pipe.Subscribe(sink_a.value(), mul.value(), opts) ||
      !pipe.Subscribe(sink_b.value(), mul.value(), opts) ||
      !pipe.Subscribe(mul.value(), src.value(), opts)) {
    DFLOW_LOG_ERROR("main", "subscription failed");
    return 1;
  }

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (seen_a.load() + seen_b.load() < kTotalEvents &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  std::printf("\n--- Pipeline Statistics ---\n");
  PrintStats(pipe, src.value(), "counter");
  PrintStats(pipe, mul.value(), "multiplier");
  PrintStats(pipe, sink_a.value(), "printer_a");
  PrintStats(pipe, sink_b.value(), "printer_b");
  std::printf("  delivered: a=%u b=%u total=%u/%u\n", seen_a.load(), seen_b.load(),
              seen_a.load() + seen_b.load(), kTotalEvents);

  pipe.StopAll();
  pipe.JoinAll();

  dflow::log::Shutdown();
  return (seen_a.load() + seen_b.load() == kTotalEvents) ? 0 : 1;
}
