/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file dispatcher.hpp
 * @brief Demand-aware dispatch strategies owned by producing stages.
 *
 * A dispatcher tracks the outstanding demand of every downstream
 * subscription and decides which buffered events go where:
 *
 *   DemandDispatcher    -- highest outstanding demand first (default)
 *   BroadcastDispatcher -- every event to every subscriber, paced by the
 *                          slowest one
 *   PartitionDispatcher -- hash(event) selects a named partition, each
 *                          partition bound to at most one subscriber
 *
 * Dispatchers are plain state machines: no threads, no locks. The owning
 * stage calls them from its own thread only. Dispatch() consumes events
 * from the front of the stage buffer and leaves the surplus in place.
 *
 * Header-only, C++17.
 */

#ifndef DFLOW_DISPATCHER_HPP_
#define DFLOW_DISPATCHER_HPP_

#include "dflow/log.hpp"
#include "dflow/platform.hpp"
#include "dflow/subscription.hpp"
#include "dflow/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <deque>
#include <functional>
#include <utility>
#include <variant>
#include <vector>

// ============================================================================
// Compile-time configuration
// ============================================================================

#ifndef DFLOW_MAX_PARTITIONS
#define DFLOW_MAX_PARTITIONS 32U
#endif

namespace dflow {

// ============================================================================
// Types
// ============================================================================

enum class DispatcherKind : uint8_t {
  kDemand = 0,
  kBroadcast,
  kPartition,
};

enum class DispatchError : uint8_t {
  kUnknownPartition = 0,  ///< Hash returned an index outside the partition list
  kUnboundPartition,      ///< Partition has no active subscriber
  kUnknownSubscription,   ///< Demand for a tag the dispatcher does not know
};

inline const char* DispatchErrorName(DispatchError err) noexcept {
  switch (err) {
    case DispatchError::kUnknownPartition:
      return "unknown_partition";
    case DispatchError::kUnboundPartition:
      return "unbound_partition";
    case DispatchError::kUnknownSubscription:
      return "unknown_subscription";
    default:
      return "unknown";
  }
}

using PartitionName = FixedString<32>;

template <typename EventT>
using PartitionHashFn = std::function<uint32_t(const EventT&)>;

/**
 * @brief Dispatcher selection and strategy parameters for one stage.
 */
template <typename EventT>
struct DispatcherConfig {
  DispatcherKind kind = DispatcherKind::kDemand;
  FixedVector<PartitionName, DFLOW_MAX_PARTITIONS> partitions;  ///< kPartition only
  PartitionHashFn<EventT> hash;                                 ///< kPartition only
  uint32_t max_subscribers = 0U;  ///< 0 = unlimited
};

/// Events routed to one subscription by a single Dispatch() call.
template <typename EventT>
struct Delivery {
  SubscriptionTag tag;
  std::vector<EventT> events;
};

/// Events the dispatcher refused, grouped by cause.
template <typename EventT>
struct RejectedBatch {
  DispatchError error;
  std::vector<EventT> events;
};

/**
 * @brief Partition dispatcher config with partitions named "0" .. "count-1".
 */
template <typename EventT>
DispatcherConfig<EventT> IndexedPartitions(uint32_t count,
                                           PartitionHashFn<EventT> hash) {
  DispatcherConfig<EventT> cfg;
  cfg.kind = DispatcherKind::kPartition;
  cfg.hash = std::move(hash);
  for (uint32_t i = 0U; i < count && i < DFLOW_MAX_PARTITIONS; ++i) {
    char name[16];
    (void)std::snprintf(name, sizeof(name), "%u", i);
    (void)cfg.partitions.push_back(PartitionName(TruncateToCapacity, name));
  }
  return cfg;
}

template <typename EventT>
bool IsValidDispatcherConfig(const DispatcherConfig<EventT>& cfg) noexcept {
  if (cfg.kind != DispatcherKind::kPartition) {
    return true;
  }
  if (cfg.partitions.empty() || !cfg.hash) {
    return false;
  }
  for (uint32_t i = 0U; i < cfg.partitions.size(); ++i) {
    if (cfg.partitions[i].empty()) {
      return false;
    }
    for (uint32_t j = i + 1U; j < cfg.partitions.size(); ++j) {
      if (cfg.partitions[i] == cfg.partitions[j]) {
        return false;
      }
    }
  }
  return true;
}

namespace detail {

/// Per-subscription demand counter, bounded by the subscriber's max_demand.
struct DemandEntry {
  SubscriptionTag tag;
  uint32_t demand{0U};
  uint32_t max_demand{0U};

  void Add(uint32_t n) noexcept {
    uint64_t sum = static_cast<uint64_t>(demand) + n;
    demand = (sum > max_demand) ? max_demand : static_cast<uint32_t>(sum);
  }
};

template <typename EventT>
void MoveFront(std::deque<EventT>& buffer, uint32_t n,
               std::vector<EventT>& out) {
  out.reserve(out.size() + n);
  for (uint32_t i = 0U; i < n; ++i) {
    out.push_back(std::move(buffer.front()));
    buffer.pop_front();
  }
}

inline int32_t FindEntry(const std::vector<DemandEntry>& entries,
                         SubscriptionTag tag) noexcept {
  for (uint32_t i = 0U; i < entries.size(); ++i) {
    if (entries[i].tag == tag) {
      return static_cast<int32_t>(i);
    }
  }
  return -1;
}

inline bool LimitReached(uint32_t max_subscribers, size_t count) noexcept {
  return max_subscribers != 0U && count >= max_subscribers;
}

}  // namespace detail

// ============================================================================
// DemandDispatcher
// ============================================================================

/**
 * @brief Routes each batch to the subscriber with the highest demand.
 *
 * Ties go to the earliest subscription. A subscriber never receives more
 * than its outstanding demand.
 */
template <typename EventT>
class DemandDispatcher {
 public:
  explicit DemandDispatcher(uint32_t max_subscribers = 0U) noexcept
      : max_subscribers_(max_subscribers) {}

  expected<void, SubscribeError> Subscribe(SubscriptionTag tag,
                                           const SubscriptionOptions& opts) {
    if (detail::LimitReached(max_subscribers_, entries_.size())) {
      return expected<void, SubscribeError>::error(
          SubscribeError::kTopologyViolation);
    }
    if (!entries_.empty() && entries_.front().max_demand != opts.max_demand) {
      DFLOW_LOG_WARN("Dispatch",
                     "subscription %llu max_demand %u differs from %u; "
                     "demand dispatch expects equal windows",
                     static_cast<unsigned long long>(tag.value()),
                     opts.max_demand, entries_.front().max_demand);
    }
    entries_.push_back(detail::DemandEntry{tag, 0U, opts.max_demand});
    return expected<void, SubscribeError>::success();
  }

  bool Cancel(SubscriptionTag tag) {
    int32_t idx = detail::FindEntry(entries_, tag);
    if (idx < 0) {
      return false;
    }
    entries_.erase(entries_.begin() + idx);
    return true;
  }

  expected<void, DispatchError> Ask(SubscriptionTag tag, uint32_t n) noexcept {
    int32_t idx = detail::FindEntry(entries_, tag);
    if (idx < 0) {
      return expected<void, DispatchError>::error(
          DispatchError::kUnknownSubscription);
    }
    entries_[static_cast<uint32_t>(idx)].Add(n);
    return expected<void, DispatchError>::success();
  }

  uint32_t Satisfiable() const noexcept {
    uint64_t sum = 0U;
    for (const auto& e : entries_) {
      sum += e.demand;
    }
    return (sum > UINT32_MAX) ? UINT32_MAX : static_cast<uint32_t>(sum);
  }

  void Dispatch(std::deque<EventT>& buffer,
                std::vector<Delivery<EventT>>& deliveries,
                std::vector<RejectedBatch<EventT>>& /*rejected*/) {
    while (!buffer.empty()) {
      int32_t best = -1;
      uint32_t best_demand = 0U;
      for (uint32_t i = 0U; i < entries_.size(); ++i) {
        if (entries_[i].demand > best_demand) {
          best_demand = entries_[i].demand;
          best = static_cast<int32_t>(i);
        }
      }
      if (best < 0) {
        return;
      }
      auto& entry = entries_[static_cast<uint32_t>(best)];
      uint32_t n = (static_cast<size_t>(entry.demand) < buffer.size())
                       ? entry.demand
                       : static_cast<uint32_t>(buffer.size());
      Delivery<EventT> d;
      d.tag = entry.tag;
      detail::MoveFront(buffer, n, d.events);
      entry.demand -= n;
      deliveries.push_back(std::move(d));
    }
  }

  uint32_t Demand(SubscriptionTag tag) const noexcept {
    int32_t idx = detail::FindEntry(entries_, tag);
    return (idx < 0) ? 0U : entries_[static_cast<uint32_t>(idx)].demand;
  }

  uint32_t SubscriberCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

 private:
  std::vector<detail::DemandEntry> entries_;  ///< Subscription order
  uint32_t max_subscribers_;
};

// ============================================================================
// BroadcastDispatcher
// ============================================================================

/**
 * @brief Delivers every event to every subscriber.
 *
 * Only min(demand) events can be sent, so the slowest subscriber paces the
 * whole fan-out.
 */
template <typename EventT>
class BroadcastDispatcher {
 public:
  explicit BroadcastDispatcher(uint32_t max_subscribers = 0U) noexcept
      : max_subscribers_(max_subscribers) {}

  expected<void, SubscribeError> Subscribe(SubscriptionTag tag,
                                           const SubscriptionOptions& opts) {
    if (detail::LimitReached(max_subscribers_, entries_.size())) {
      return expected<void, SubscribeError>::error(
          SubscribeError::kTopologyViolation);
    }
    entries_.push_back(detail::DemandEntry{tag, 0U, opts.max_demand});
    return expected<void, SubscribeError>::success();
  }

  bool Cancel(SubscriptionTag tag) {
    int32_t idx = detail::FindEntry(entries_, tag);
    if (idx < 0) {
      return false;
    }
    entries_.erase(entries_.begin() + idx);
    return true;
  }

  expected<void, DispatchError> Ask(SubscriptionTag tag, uint32_t n) noexcept {
    int32_t idx = detail::FindEntry(entries_, tag);
    if (idx < 0) {
      return expected<void, DispatchError>::error(
          DispatchError::kUnknownSubscription);
    }
    entries_[static_cast<uint32_t>(idx)].Add(n);
    return expected<void, DispatchError>::success();
  }

  uint32_t Satisfiable() const noexcept {
    if (entries_.empty()) {
      return 0U;
    }
    uint32_t min = UINT32_MAX;
    for (const auto& e : entries_) {
      if (e.demand < min) {
        min = e.demand;
      }
    }
    return min;
  }

  void Dispatch(std::deque<EventT>& buffer,
                std::vector<Delivery<EventT>>& deliveries,
                std::vector<RejectedBatch<EventT>>& /*rejected*/) {
    uint32_t n = Satisfiable();
    if (static_cast<size_t>(n) > buffer.size()) {
      n = static_cast<uint32_t>(buffer.size());
    }
    if (n == 0U) {
      return;
    }
    std::vector<EventT> batch;
    detail::MoveFront(buffer, n, batch);
    for (uint32_t i = 0U; i < entries_.size(); ++i) {
      entries_[i].demand -= n;
      Delivery<EventT> d;
      d.tag = entries_[i].tag;
      if (i + 1U == entries_.size()) {
        d.events = std::move(batch);
      } else {
        d.events = batch;
      }
      deliveries.push_back(std::move(d));
    }
  }

  uint32_t Demand(SubscriptionTag tag) const noexcept {
    int32_t idx = detail::FindEntry(entries_, tag);
    return (idx < 0) ? 0U : entries_[static_cast<uint32_t>(idx)].demand;
  }

  uint32_t SubscriberCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

 private:
  std::vector<detail::DemandEntry> entries_;
  uint32_t max_subscribers_;
};

// ============================================================================
// PartitionDispatcher
// ============================================================================

/**
 * @brief Routes each event to the partition selected by a hash function.
 *
 * Each named partition accepts one subscriber. Events are scanned in
 * buffer order; an event whose partition lacks demand stays buffered, so
 * per-partition order is preserved. Events hashed out of range or to an
 * unbound partition are removed and returned as rejected.
 */
template <typename EventT>
class PartitionDispatcher {
 public:
  PartitionDispatcher(const FixedVector<PartitionName, DFLOW_MAX_PARTITIONS>& names,
                      PartitionHashFn<EventT> hash,
                      uint32_t max_subscribers = 0U)
      : names_(names), hash_(std::move(hash)), max_subscribers_(max_subscribers) {
    slots_.resize(names_.size());
  }

  expected<void, SubscribeError> Subscribe(SubscriptionTag tag,
                                           const SubscriptionOptions& opts) {
    if (opts.partition.empty()) {
      return expected<void, SubscribeError>::error(
          SubscribeError::kPartitionRequired);
    }
    int32_t idx = FindPartition(opts.partition);
    if (idx < 0) {
      return expected<void, SubscribeError>::error(
          SubscribeError::kUnknownPartition);
    }
    Slot& slot = slots_[static_cast<uint32_t>(idx)];
    if (slot.bound) {
      return expected<void, SubscribeError>::error(
          SubscribeError::kPartitionTaken);
    }
    if (detail::LimitReached(max_subscribers_, SubscriberCount())) {
      return expected<void, SubscribeError>::error(
          SubscribeError::kTopologyViolation);
    }
    slot.bound = true;
    slot.entry = detail::DemandEntry{tag, 0U, opts.max_demand};
    return expected<void, SubscribeError>::success();
  }

  bool Cancel(SubscriptionTag tag) noexcept {
    int32_t idx = FindSlot(tag);
    if (idx < 0) {
      return false;
    }
    slots_[static_cast<uint32_t>(idx)] = Slot{};
    return true;
  }

  expected<void, DispatchError> Ask(SubscriptionTag tag, uint32_t n) noexcept {
    int32_t idx = FindSlot(tag);
    if (idx < 0) {
      return expected<void, DispatchError>::error(
          DispatchError::kUnknownSubscription);
    }
    slots_[static_cast<uint32_t>(idx)].entry.Add(n);
    return expected<void, DispatchError>::success();
  }

  uint32_t Satisfiable() const noexcept {
    uint64_t sum = 0U;
    for (const auto& s : slots_) {
      if (s.bound) {
        sum += s.entry.demand;
      }
    }
    return (sum > UINT32_MAX) ? UINT32_MAX : static_cast<uint32_t>(sum);
  }

  void Dispatch(std::deque<EventT>& buffer,
                std::vector<Delivery<EventT>>& deliveries,
                std::vector<RejectedBatch<EventT>>& rejected) {
    if (buffer.empty()) {
      return;
    }
    std::vector<std::vector<EventT>> routed(slots_.size());
    RejectedBatch<EventT> unknown{DispatchError::kUnknownPartition, {}};
    RejectedBatch<EventT> unbound{DispatchError::kUnboundPartition, {}};
    std::deque<EventT> kept;

    while (!buffer.empty()) {
      EventT ev = std::move(buffer.front());
      buffer.pop_front();
      uint32_t idx = hash_(ev);
      if (idx >= slots_.size()) {
        unknown.events.push_back(std::move(ev));
        continue;
      }
      Slot& slot = slots_[idx];
      if (!slot.bound) {
        unbound.events.push_back(std::move(ev));
        continue;
      }
      if (slot.entry.demand == 0U) {
        kept.push_back(std::move(ev));
        continue;
      }
      --slot.entry.demand;
      routed[idx].push_back(std::move(ev));
    }
    buffer.swap(kept);

    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      if (!routed[i].empty()) {
        deliveries.push_back(
            Delivery<EventT>{slots_[i].entry.tag, std::move(routed[i])});
      }
    }
    if (!unknown.events.empty()) {
      rejected.push_back(std::move(unknown));
    }
    if (!unbound.events.empty()) {
      rejected.push_back(std::move(unbound));
    }
  }

  uint32_t Demand(SubscriptionTag tag) const noexcept {
    int32_t idx = FindSlot(tag);
    return (idx < 0) ? 0U : slots_[static_cast<uint32_t>(idx)].entry.demand;
  }

  uint32_t SubscriberCount() const noexcept {
    uint32_t n = 0U;
    for (const auto& s : slots_) {
      if (s.bound) {
        ++n;
      }
    }
    return n;
  }

  uint32_t PartitionCount() const noexcept { return names_.size(); }

 private:
  struct Slot {
    bool bound{false};
    detail::DemandEntry entry;
  };

  int32_t FindPartition(const PartitionName& name) const noexcept {
    for (uint32_t i = 0U; i < names_.size(); ++i) {
      if (names_[i] == name) {
        return static_cast<int32_t>(i);
      }
    }
    return -1;
  }

  int32_t FindSlot(SubscriptionTag tag) const noexcept {
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      if (slots_[i].bound && slots_[i].entry.tag == tag) {
        return static_cast<int32_t>(i);
      }
    }
    return -1;
  }

  FixedVector<PartitionName, DFLOW_MAX_PARTITIONS> names_;
  PartitionHashFn<EventT> hash_;
  std::vector<Slot> slots_;
  uint32_t max_subscribers_;
};

// ============================================================================
// Dispatcher (closed variant)
// ============================================================================

/**
 * @brief One of the three strategies, selected by DispatcherConfig::kind.
 *
 * The config must pass IsValidDispatcherConfig().
 */
template <typename EventT>
class Dispatcher {
 public:
  explicit Dispatcher(const DispatcherConfig<EventT>& cfg)
      : impl_(Make(cfg)), kind_(cfg.kind) {}

  DispatcherKind Kind() const noexcept { return kind_; }

  expected<void, SubscribeError> Subscribe(SubscriptionTag tag,
                                           const SubscriptionOptions& opts) {
    return std::visit([&](auto& d) { return d.Subscribe(tag, opts); }, impl_);
  }

  bool Cancel(SubscriptionTag tag) {
    return std::visit([&](auto& d) { return d.Cancel(tag); }, impl_);
  }

  expected<void, DispatchError> Ask(SubscriptionTag tag, uint32_t n) {
    return std::visit([&](auto& d) { return d.Ask(tag, n); }, impl_);
  }

  uint32_t Satisfiable() const {
    return std::visit([](const auto& d) { return d.Satisfiable(); }, impl_);
  }

  void Dispatch(std::deque<EventT>& buffer,
                std::vector<Delivery<EventT>>& deliveries,
                std::vector<RejectedBatch<EventT>>& rejected) {
    std::visit([&](auto& d) { d.Dispatch(buffer, deliveries, rejected); },
               impl_);
  }

  uint32_t Demand(SubscriptionTag tag) const {
    return std::visit([&](const auto& d) { return d.Demand(tag); }, impl_);
  }

  uint32_t SubscriberCount() const {
    return std::visit([](const auto& d) { return d.SubscriberCount(); }, impl_);
  }

 private:
  using Impl = std::variant<DemandDispatcher<EventT>, BroadcastDispatcher<EventT>,
                            PartitionDispatcher<EventT>>;

  static Impl Make(const DispatcherConfig<EventT>& cfg) {
    switch (cfg.kind) {
      case DispatcherKind::kBroadcast:
        return Impl(std::in_place_index<1>, cfg.max_subscribers);
      case DispatcherKind::kPartition:
        return Impl(std::in_place_index<2>, cfg.partitions, cfg.hash,
                    cfg.max_subscribers);
      case DispatcherKind::kDemand:
      default:
        return Impl(std::in_place_index<0>, cfg.max_subscribers);
    }
  }

  Impl impl_;
  DispatcherKind kind_;
};

}  // namespace dflow

#endif  // DFLOW_DISPATCHER_HPP_
