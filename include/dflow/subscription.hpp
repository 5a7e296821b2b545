/**
 * @file subscription.hpp
 * @brief Subscription options, cancel modes and consumer-side demand window.
 *
 * A subscription links one downstream stage to one upstream stage. The
 * downstream side owns a DemandWindow: it asks for max_demand on subscribe
 * and refills back up to max_demand each time the events it received bring
 * its outstanding demand to min_demand or below.
 *
 * Usage:
 *   dflow::SubscriptionOptions opts;
 *   opts.min_demand = 5;
 *   opts.max_demand = 10;
 *   dflow::DemandWindow win(opts.min_demand, opts.max_demand);
 *   uint32_t ask = win.Open();      // 10
 *   ask = win.Consume(3);           // 0, outstanding 7
 *   ask = win.Consume(3);           // 6, outstanding back to 10
 */

#ifndef DFLOW_SUBSCRIPTION_HPP_
#define DFLOW_SUBSCRIPTION_HPP_

#include "dflow/platform.hpp"
#include "dflow/vocabulary.hpp"

#include <cstdint>

namespace dflow {

// ============================================================================
// Enumerations
// ============================================================================

/// How a consumer reacts when its upstream link goes away.
enum class CancelMode : uint8_t {
  kTemporary = 0,  ///< Stay alive
  kTransient,      ///< Terminate only on abnormal reasons
  kPermanent,      ///< Always terminate with the same reason
};

/// Why a stage or subscription ended.
enum class ExitReason : uint8_t {
  kNormal = 0,
  kShutdown,
  kHandlerFailed,
  kInvalidOutput,
  kKilled,
};

inline bool IsAbnormal(ExitReason reason) noexcept {
  return reason != ExitReason::kNormal && reason != ExitReason::kShutdown;
}

inline const char* ExitReasonName(ExitReason reason) noexcept {
  switch (reason) {
    case ExitReason::kNormal:
      return "normal";
    case ExitReason::kShutdown:
      return "shutdown";
    case ExitReason::kHandlerFailed:
      return "handler_failed";
    case ExitReason::kInvalidOutput:
      return "invalid_output";
    case ExitReason::kKilled:
      return "killed";
    default:
      return "unknown";
  }
}

enum class SubscribeError : uint8_t {
  kInvalidDemandWindow = 0,  ///< max_demand == 0 or min_demand >= max_demand
  kNotAConsumer,             ///< Downstream stage is a Producer
  kNoDispatcher,             ///< Upstream stage is a Consumer
  kSelfSubscription,         ///< Upstream and downstream are the same stage
  kTopologyViolation,        ///< Dispatcher subscriber limit reached
  kPartitionRequired,        ///< Partition dispatcher needs a partition name
  kUnknownPartition,         ///< Partition name not configured
  kPartitionTaken,           ///< Partition already bound to a subscriber
  kStageNotRunning,          ///< One endpoint has terminated
  kTimeout,                  ///< Handshake did not finish within timeout_ms
  kMailboxFull,              ///< Handshake message could not be queued
  kCalledFromStage,          ///< Blocking subscribe issued on a stage thread
  kStageNotFound,            ///< Unknown stage id
};

inline const char* SubscribeErrorName(SubscribeError err) noexcept {
  switch (err) {
    case SubscribeError::kInvalidDemandWindow:
      return "invalid_demand_window";
    case SubscribeError::kNotAConsumer:
      return "not_a_consumer";
    case SubscribeError::kNoDispatcher:
      return "no_dispatcher";
    case SubscribeError::kSelfSubscription:
      return "self_subscription";
    case SubscribeError::kTopologyViolation:
      return "topology_violation";
    case SubscribeError::kPartitionRequired:
      return "partition_required";
    case SubscribeError::kUnknownPartition:
      return "unknown_partition";
    case SubscribeError::kPartitionTaken:
      return "partition_taken";
    case SubscribeError::kStageNotRunning:
      return "stage_not_running";
    case SubscribeError::kTimeout:
      return "timeout";
    case SubscribeError::kMailboxFull:
      return "mailbox_full";
    case SubscribeError::kCalledFromStage:
      return "called_from_stage";
    case SubscribeError::kStageNotFound:
      return "stage_not_found";
    default:
      return "unknown";
  }
}

enum class CancelError : uint8_t {
  kStageNotFound = 0,
  kMailboxFull,  ///< Cancel request could not be queued
};

// ============================================================================
// SubscriptionOptions
// ============================================================================

static constexpr uint32_t kDefaultMaxDemand = 1000U;
static constexpr uint32_t kDefaultMinDemand = 750U;
static constexpr uint32_t kDefaultSubscribeTimeoutMs = 5000U;

struct SubscriptionOptions {
  uint32_t min_demand = kDefaultMinDemand;
  uint32_t max_demand = kDefaultMaxDemand;
  CancelMode cancel_mode = CancelMode::kPermanent;
  FixedString<32> partition;  ///< Required by partition dispatchers only
  uint32_t timeout_ms = kDefaultSubscribeTimeoutMs;  ///< 0 = wait forever

  /// Options with the given max_demand and min_demand at three quarters.
  static SubscriptionOptions WithMaxDemand(uint32_t max_demand) noexcept {
    SubscriptionOptions opts;
    opts.max_demand = max_demand;
    opts.min_demand = static_cast<uint32_t>(
        (static_cast<uint64_t>(max_demand) * 3U) / 4U);
    return opts;
  }
};

inline expected<void, SubscribeError> ValidateOptions(
    const SubscriptionOptions& opts) noexcept {
  if (opts.max_demand == 0U || opts.min_demand >= opts.max_demand) {
    return expected<void, SubscribeError>::error(
        SubscribeError::kInvalidDemandWindow);
  }
  return expected<void, SubscribeError>::success();
}

// ============================================================================
// DemandWindow
// ============================================================================

/**
 * @brief Consumer-side accounting of demand declared to one upstream.
 *
 * Outstanding demand stays within [0, max_demand]. Events beyond the
 * declared demand are clamped and counted as overruns.
 */
class DemandWindow {
 public:
  DemandWindow() noexcept = default;

  DemandWindow(uint32_t min_demand, uint32_t max_demand) noexcept
      : min_demand_(min_demand), max_demand_(max_demand) {
    DFLOW_ASSERT(min_demand < max_demand);
  }

  /// Initial request issued right after subscribing.
  uint32_t Open() noexcept {
    outstanding_ = max_demand_;
    return max_demand_;
  }

  /**
   * @brief Account for n received events.
   * @return Demand to request upstream now (0 = above the low-water mark).
   */
  uint32_t Consume(uint32_t n) noexcept {
    if (DFLOW_UNLIKELY(n > outstanding_)) {
      overrun_ += n - outstanding_;
      outstanding_ = 0U;
    } else {
      outstanding_ -= n;
    }
    if (outstanding_ > min_demand_) {
      return 0U;
    }
    uint32_t refill = max_demand_ - outstanding_;
    outstanding_ = max_demand_;
    return refill;
  }

  uint32_t Outstanding() const noexcept { return outstanding_; }
  uint32_t MinDemand() const noexcept { return min_demand_; }
  uint32_t MaxDemand() const noexcept { return max_demand_; }
  uint64_t Overrun() const noexcept { return overrun_; }

 private:
  uint32_t min_demand_{0U};
  uint32_t max_demand_{0U};
  uint32_t outstanding_{0U};
  uint64_t overrun_{0U};
};

}  // namespace dflow

#endif  // DFLOW_SUBSCRIPTION_HPP_
