/**
 * @file partition_demo.cpp
 * @brief Broadcast audit plus even/odd partition routing, loaded from INI.
 *
 * Topology:
 *   source (broadcast) -> audit
 *                      -> router (partition by value % 2) -> even, odd
 *
 * Usage: partition_demo [pipeline.ini]
 *
 * Without a readable config file the built-in defaults are used.
 */

#include "dflow/config.hpp"
#include "dflow/fault.hpp"
#include "dflow/log.hpp"
#include "dflow/pipeline.hpp"
#include "dflow/pipeline_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <thread>
#include <vector>

static constexpr uint32_t kTotalEvents = 100U;

// -- Handlers ----------------------------------------------------------------

class Sequence : public dflow::StageHandler<int> {
 public:
  dflow::HandlerResult HandleDemand(uint32_t demand,
                                    std::vector<int>& out) override {
    for (; demand > 0U && next_ < static_cast<int>(kTotalEvents); --demand) {
      out.push_back(next_++);
    }
    return dflow::HandlerResult::success();
  }

 private:
  int next_{0};
};

class Forward : public dflow::StageHandler<int> {
 public:
  dflow::HandlerResult HandleEvents(dflow::StageId /*from*/, std::vector<int>& in,
                                    std::vector<int>& out) override {
    out.swap(in);
    return dflow::HandlerResult::success();
  }

  void HandleDispatchError(dflow::DispatchError err,
                           const std::vector<int>& rejected) override {
    DFLOW_LOG_WARN("router", "%u events rejected (error %u)",
                   static_cast<unsigned>(rejected.size()),
                   static_cast<unsigned>(err));
  }
};

class Tally : public dflow::StageHandler<int> {
 public:
  Tally(const char* tag, std::atomic<uint32_t>& count, std::atomic<int64_t>& sum)
      : tag_(tag), count_(count), sum_(sum) {}

  dflow::HandlerResult HandleEvents(dflow::StageId /*from*/, std::vector<int>& in,
                                    std::vector<int>& /*out*/) override {
    int64_t batch_sum = 0;
    for (int v : in) batch_sum += v;
    sum_.fetch_add(batch_sum, std::memory_order_relaxed);
    count_.fetch_add(static_cast<uint32_t>(in.size()), std::memory_order_relaxed);
    DFLOW_LOG_DEBUG(tag_, "%u events, first=%d", static_cast<unsigned>(in.size()),
                    in.front());
    return dflow::HandlerResult::success();
  }

 private:
  const char* tag_;
  std::atomic<uint32_t>& count_;
  std::atomic<int64_t>& sum_;
};

// -- Config ------------------------------------------------------------------

struct Topology {
  dflow::StageConfig<int> source;
  dflow::StageConfig<int> router;
  dflow::StageConfig<int> audit;
  dflow::StageConfig<int> even;
  dflow::StageConfig<int> odd;
  dflow::SubscriptionOptions audit_sub = dflow::SubscriptionOptions::WithMaxDemand(16U);
  dflow::SubscriptionOptions router_sub = dflow::SubscriptionOptions::WithMaxDemand(16U);
  dflow::SubscriptionOptions even_sub = dflow::SubscriptionOptions::WithMaxDemand(8U);
  dflow::SubscriptionOptions odd_sub = dflow::SubscriptionOptions::WithMaxDemand(8U);
};

static void ApplyDefaults(Topology& t) {
  t.source.name.assign(dflow::TruncateToCapacity, "source");
  t.source.dispatcher.kind = dflow::DispatcherKind::kBroadcast;
  t.source.idle_timeout_ms = 10U;

  t.router.name.assign(dflow::TruncateToCapacity, "router");
  t.router.role = dflow::StageRole::kProducerConsumer;
  t.router.dispatcher = dflow::IndexedPartitions<int>(2U, nullptr);

  t.audit.name.assign(dflow::TruncateToCapacity, "audit");
  t.audit.role = dflow::StageRole::kConsumer;
  t.even.name.assign(dflow::TruncateToCapacity, "even");
  t.even.role = dflow::StageRole::kConsumer;
  t.odd.name.assign(dflow::TruncateToCapacity, "odd");
  t.odd.role = dflow::StageRole::kConsumer;

  t.even_sub.partition.assign(dflow::TruncateToCapacity, "0");
  t.odd_sub.partition.assign(dflow::TruncateToCapacity, "1");
}

#ifdef DFLOW_CONFIG_INI_ENABLED
static bool LoadTopology(const char* path, Topology& t) {
  dflow::IniConfig ini;
  if (!ini.LoadFile(path).has_value()) return false;

  bool ok = dflow::LoadStageConfig(ini, "stage.source", t.source).has_value() &&
            dflow::LoadStageConfig(ini, "stage.router", t.router).has_value() &&
            dflow::LoadStageConfig(ini, "stage.audit", t.audit).has_value() &&
            dflow::LoadStageConfig(ini, "stage.even", t.even).has_value() &&
            dflow::LoadStageConfig(ini, "stage.odd", t.odd).has_value();
  if (!ok) return false;

  struct {
    const char* section;
    dflow::SubscriptionOptions* opts;
  } subs[] = {{"subscription.audit", &t.audit_sub},
              {"subscription.router", &t.router_sub},
              {"subscription.even", &t.even_sub},
              {"subscription.odd", &t.odd_sub}};
  for (auto& s : subs) {
    auto r = dflow::LoadSubscriptionOptions(ini, s.section);
    if (!r.has_value()) return false;
    *s.opts = r.value();
  }
  return true;
}
#endif

// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
  dflow::log::Init();
  dflow::log::SetLevel(dflow::log::Level::kInfo);

  Topology topo;
  ApplyDefaults(topo);
#ifdef DFLOW_CONFIG_INI_ENABLED
  const char* path = (argc > 1) ? argv[1] : "examples/pipeline.ini";
  if (!LoadTopology(path, topo)) {
    DFLOW_LOG_WARN("main", "using built-in topology (could not load %s)", path);
    topo = Topology();
    ApplyDefaults(topo);
  }
#else
  (void)argc;
  (void)argv;
#endif
  // The routing function cannot come from a file.
  topo.router.dispatcher.hash = [](const int& v) {
    return static_cast<uint32_t>(v % 2);
  };

  dflow::FaultRecorder<16> faults;
  topo.router.fault_reporter = faults.AsReporter();

  std::atomic<uint32_t> audit_n{0U}, even_n{0U}, odd_n{0U};
  std::atomic<int64_t> audit_sum{0}, even_sum{0}, odd_sum{0};

  dflow::Pipeline<int> pipe;
  auto source = pipe.Start(topo.source, std::make_unique<Sequence>());
  auto router = pipe.Start(topo.router, std::make_unique<Forward>());
  auto audit = pipe.Start(topo.audit, std::make_unique<Tally>("audit", audit_n, audit_sum));
  auto even = pipe.Start(topo.even, std::make_unique<Tally>("even", even_n, even_sum));
  auto odd = pipe.Start(topo.odd, std::make_unique<Tally>("odd", odd_n, odd_sum));
  if (!source || !router || !audit || !even || !odd) {
    DFLOW_LOG_ERROR("main", "failed to start stages");
    return 1;
  }

  if (!pipe.Subscribe(even.value(), router.value(), topo.even_sub) ||
      !pipe.Subscribe(odd.value(), router.value(), topo.odd_sub) ||
      !pipe.Subscribe(audit.value(), source.value(), topo.audit_sub) ||
      !pipe.Subscribe(router.value(), source.value(), topo.router_sub)) {
    DFLOW_LOG_ERROR("main", "subscription failed");
    return 1;
  }

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while ((audit_n.load() < kTotalEvents ||
          even_n.load() + odd_n.load() < kTotalEvents) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  std::printf("\n--- Partition Demo ---\n"
              "  audit : %u events, sum=%lld\n"
              "  even  : %u events, sum=%lld\n"
              "  odd   : %u events, sum=%lld\n"
              "  faults: %lu\n",
              audit_n.load(), static_cast<long long>(audit_sum.load()),
              even_n.load(), static_cast<long long>(even_sum.load()),
              odd_n.load(), static_cast<long long>(odd_sum.load()),
              static_cast<unsigned long>(faults.Total()));

  pipe.StopAll();
  pipe.JoinAll();
  dflow::log::Shutdown();

  bool ok = audit_n.load() == kTotalEvents &&
            even_n.load() + odd_n.load() == kTotalEvents &&
            audit_sum.load() == even_sum.load() + odd_sum.load();
  return ok ? 0 : 1;
}
