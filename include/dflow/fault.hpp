/**
 * @file fault.hpp
 * @brief Fault reporting injection point and an in-process fault recorder.
 *
 * Stages never depend on a concrete fault backend. They carry a POD
 * FaultReporter (function pointer + context) and call Report() when a
 * dispatch, handler or mailbox fault happens. A null reporter costs one
 * branch.
 *
 * Usage:
 *   dflow::FaultRecorder<32> recorder;
 *   dflow::StageConfig<int> cfg;
 *   cfg.fault_reporter = recorder.AsReporter();
 *   ...
 *   recorder.Count(dflow::StageFault::kDispatchRejected);
 */

#ifndef DFLOW_FAULT_HPP_
#define DFLOW_FAULT_HPP_

#include "dflow/platform.hpp"
#include "dflow/vocabulary.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <type_traits>

namespace dflow {

// ============================================================================
// Enumerations
// ============================================================================

/// Fault priority levels (lower value = higher priority).
enum class FaultPriority : uint8_t {
  kCritical = 0U,  ///< Stage lost, pipeline integrity at risk
  kHigh     = 1U,  ///< Events rejected or handler failure
  kMedium   = 2U,  ///< Degradation (mailbox pressure)
  kLow      = 3U   ///< Diagnostics
};

/// Fault points raised by the stage runtime.
enum class StageFault : uint16_t {
  kDispatchRejected = 0U,   ///< Events rejected by the dispatcher
  kHandlerFailed = 1U,      ///< Handler returned an error
  kMailboxFull = 2U,        ///< Send to a peer mailbox failed (full)
  kDemandOverrun = 3U,      ///< More events received than demand declared
  kSubscribeRejected = 4U,  ///< Asynchronous subscription was rejected
};

static constexpr uint16_t kStageFaultCount = 5U;

// ============================================================================
// Lightweight fault reporting injection point
// ============================================================================

/// @param fault_index  Fault point index (StageFault value).
/// @param detail       Fault-specific detail (stage id, event count, ...).
/// @param priority     Fault priority level.
/// @param ctx          User context pointer.
using FaultReportFn = void (*)(uint16_t fault_index, uint32_t detail,
                               FaultPriority priority, void* ctx);

struct FaultReporter {
  FaultReportFn fn = nullptr;  ///< Report function (nullptr = disabled)
  void* ctx = nullptr;         ///< User context (typically FaultRecorder*)

  void Report(uint16_t fault_index, uint32_t detail,
              FaultPriority priority) const noexcept {
    if (fn != nullptr) {
      fn(fault_index, detail, priority, ctx);
    }
  }

  void Report(StageFault fault, uint32_t detail,
              FaultPriority priority) const noexcept {
    Report(static_cast<uint16_t>(fault), detail, priority);
  }
};

/// Recent fault record for diagnostic iteration.
struct RecentFaultInfo {
  uint16_t fault_index;    ///< Fault point index
  uint32_t detail;         ///< Fault detail value
  FaultPriority priority;  ///< Fault priority level
  uint64_t timestamp_us;   ///< Steady-clock timestamp (microseconds)
};

// ============================================================================
// FaultRecorder
// ============================================================================

/**
 * @brief Thread-safe recorder of stage faults.
 *
 * Keeps a per-index occurrence counter and a ring of the last RecentSize
 * faults. An optional hook runs synchronously on the reporting thread, under
 * the recorder lock, so it must not report faults itself.
 *
 * @tparam RecentSize  Number of recent faults retained (ring buffer).
 */
template <uint32_t RecentSize = 32U, uint32_t HookBufSize = 32U>
class FaultRecorder {
  static_assert(RecentSize >= 1U, "RecentSize must be >= 1");

 public:
  using HookFn = FixedFunction<void(const RecentFaultInfo&), HookBufSize>;

  FaultRecorder() noexcept = default;
  FaultRecorder(const FaultRecorder&) = delete;
  FaultRecorder& operator=(const FaultRecorder&) = delete;

  /// Reporter bound to this recorder. The recorder must outlive its users.
  FaultReporter AsReporter() noexcept {
    FaultReporter r;
    r.fn = &FaultRecorder::ReportThunk;
    r.ctx = this;
    return r;
  }

  template <typename Func>
  void SetHook(Func&& hook) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = HookFn(static_cast<Func&&>(hook));
  }

  void Record(uint16_t fault_index, uint32_t detail,
              FaultPriority priority) noexcept {
    RecentFaultInfo info{fault_index, detail, priority, SteadyNowUs()};
    std::lock_guard<std::mutex> lock(mutex_);
    if (fault_index < counts_.size()) {
      ++counts_[fault_index];
    }
    ++total_;
    ring_[head_] = info;
    head_ = (head_ + 1U) % RecentSize;
    if (recent_count_ < RecentSize) {
      ++recent_count_;
    }
    if (hook_) {
      hook_(info);
    }
  }

  uint64_t Count(StageFault fault) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_[static_cast<uint16_t>(fault)];
  }

  uint64_t Total() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
  }

  /// Iterate recent faults newest first. Return false from fn to stop.
  template <typename Fn>
  void ForEachRecent(Fn&& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < recent_count_; ++i) {
      uint32_t idx = (head_ + RecentSize - 1U - i) % RecentSize;
      if constexpr (std::is_same_v<decltype(fn(ring_[idx])), bool>) {
        if (!fn(ring_[idx])) {
          break;
        }
      } else {
        fn(ring_[idx]);
      }
    }
  }

  void Reset() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_.fill(0U);
    total_ = 0U;
    head_ = 0U;
    recent_count_ = 0U;
  }

 private:
  static void ReportThunk(uint16_t fault_index, uint32_t detail,
                          FaultPriority priority, void* ctx) {
    static_cast<FaultRecorder*>(ctx)->Record(fault_index, detail, priority);
  }

  mutable std::mutex mutex_;
  std::array<uint64_t, kStageFaultCount> counts_{};
  uint64_t total_{0U};
  std::array<RecentFaultInfo, RecentSize> ring_{};
  uint32_t head_{0U};
  uint32_t recent_count_{0U};
  HookFn hook_;
};

}  // namespace dflow

#endif  // DFLOW_FAULT_HPP_
