/**
 * @file mailbox.hpp
 * @brief Bounded MPSC mailbox with ordered delivery and blocking receive.
 *
 * Each stage owns one Mailbox. Any thread may Send(); only the owning stage
 * thread receives. Messages from one sender are received in send order.
 *
 * Ring layout follows the sequence-numbered MPSC scheme: every slot carries
 * a sequence counter, producers claim a position with CAS and publish by
 * storing pos + 1, the consumer releases the slot by storing pos + depth.
 *
 * Receive() spins briefly (AdaptiveBackoff) and then parks on a condition
 * variable in 1 ms slices until a message arrives, the timeout expires or
 * the mailbox is closed.
 *
 * Every Send() that returns success is seen by CloseAndDrain(): senders
 * announce themselves before checking the closed flag, and the drain waits
 * for announced senders to finish publishing.
 */

#ifndef DFLOW_MAILBOX_HPP_
#define DFLOW_MAILBOX_HPP_

#include "dflow/platform.hpp"
#include "dflow/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace dflow {

enum class MailboxError : uint8_t {
  kFull = 0,
  kClosed,
};

struct MailboxStatistics {
  uint64_t sent;
  uint64_t received;
  uint64_t rejected_full;
  uint64_t rejected_closed;
};

namespace detail {

/**
 * @brief Three-phase wait strategy: spin, then yield, then sleep.
 */
class AdaptiveBackoff {
 public:
  void Reset() noexcept { spin_count_ = 0U; }

  void Wait() noexcept {
    if (spin_count_ < kSpinLimit) {
      const uint32_t iters = 1U << spin_count_;
      for (uint32_t i = 0U; i < iters; ++i) {
        CpuRelax();
      }
      ++spin_count_;
    } else if (spin_count_ < kSpinLimit + kYieldLimit) {
      std::this_thread::yield();
      ++spin_count_;
    } else {
      std::this_thread::sleep_for(std::chrono::microseconds(50));
    }
  }

  bool InSpinPhase() const noexcept { return spin_count_ < kSpinLimit; }

 private:
  static constexpr uint32_t kSpinLimit = 6U;   ///< ~1-64 spins
  static constexpr uint32_t kYieldLimit = 4U;  ///< 4 yields before sleep

  uint32_t spin_count_{0U};
};

inline uint32_t RoundUpPow2(uint32_t v) noexcept {
  if (v <= 1U) {
    return 1U;
  }
  --v;
  v |= v >> 1U;
  v |= v >> 2U;
  v |= v >> 4U;
  v |= v >> 8U;
  v |= v >> 16U;
  return v + 1U;
}

}  // namespace detail

/**
 * @brief Bounded multi-producer single-consumer ordered inbox.
 *
 * @tparam T Message type. Must be default constructible and movable.
 */
template <typename T>
class Mailbox {
 public:
  /// @param depth Capacity, rounded up to a power of two (minimum 2).
  explicit Mailbox(uint32_t depth)
      : depth_(detail::RoundUpPow2(depth < 2U ? 2U : depth)),
        mask_(depth_ - 1U),
        slots_(new Slot[depth_]) {
    for (uint32_t i = 0U; i < depth_; ++i) {
      slots_[i].sequence.store(i, std::memory_order_relaxed);
    }
  }

  Mailbox(const Mailbox&) = delete;
  Mailbox& operator=(const Mailbox&) = delete;

  // ======================== Producer API ========================

  /**
   * @brief Enqueue a message. Safe from any thread.
   * @return kClosed after Close(), kFull when no slot is free. msg is left
   *         untouched on error.
   */
  expected<void, MailboxError> Send(T&& msg) noexcept {
    senders_.fetch_add(1U, std::memory_order_seq_cst);
    if (DFLOW_UNLIKELY(closed_.load(std::memory_order_seq_cst))) {
      senders_.fetch_sub(1U, std::memory_order_release);
      rejected_closed_.fetch_add(1U, std::memory_order_relaxed);
      return expected<void, MailboxError>::error(MailboxError::kClosed);
    }

    uint32_t pos = producer_pos_.load(std::memory_order_relaxed);
    Slot* target;
    for (;;) {
      target = &slots_[pos & mask_];
      uint32_t seq = target->sequence.load(std::memory_order_acquire);
      int32_t diff = static_cast<int32_t>(seq - pos);
      if (diff == 0) {
        if (producer_pos_.compare_exchange_weak(pos, pos + 1U,
                                                std::memory_order_acq_rel,
                                                std::memory_order_relaxed)) {
          break;
        }
      } else if (diff < 0) {
        senders_.fetch_sub(1U, std::memory_order_release);
        rejected_full_.fetch_add(1U, std::memory_order_relaxed);
        return expected<void, MailboxError>::error(MailboxError::kFull);
      } else {
        // Another sender claimed this slot; reload.
        pos = producer_pos_.load(std::memory_order_relaxed);
      }
    }

    target->value = std::move(msg);
    target->sequence.store(pos + 1U, std::memory_order_release);
    senders_.fetch_sub(1U, std::memory_order_release);
    sent_.fetch_add(1U, std::memory_order_relaxed);

    { std::lock_guard<std::mutex> lk(mtx_); }
    cv_.notify_one();
    return expected<void, MailboxError>::success();
  }

  // ======================== Consumer API ========================

  /** @brief Non-blocking receive. Owner thread only. */
  bool TryReceive(T& out) noexcept {
    Slot& slot = slots_[consumer_pos_ & mask_];
    uint32_t seq = slot.sequence.load(std::memory_order_acquire);
    if (seq != consumer_pos_ + 1U) {
      return false;
    }
    out = std::move(slot.value);
    slot.value = T{};
    slot.sequence.store(consumer_pos_ + depth_, std::memory_order_release);
    ++consumer_pos_;
    consumed_pos_.store(consumer_pos_, std::memory_order_release);
    received_.fetch_add(1U, std::memory_order_relaxed);
    return true;
  }

  /**
   * @brief Blocking receive. Owner thread only.
   *
   * @param timeout_ms 0 waits indefinitely.
   * @return false on timeout, or when the mailbox is closed and drained.
   */
  bool Receive(T& out, uint32_t timeout_ms = 0U) noexcept {
    const uint64_t deadline_us =
        (timeout_ms == 0U) ? 0U
                           : SteadyNowUs() + static_cast<uint64_t>(timeout_ms) * 1000U;
    detail::AdaptiveBackoff backoff;

    for (;;) {
      if (TryReceive(out)) {
        return true;
      }
      if (closed_.load(std::memory_order_acquire)) {
        return false;
      }
      if (deadline_us != 0U && SteadyNowUs() >= deadline_us) {
        return false;
      }
      if (backoff.InSpinPhase()) {
        backoff.Wait();
        continue;
      }
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait_for(lk, std::chrono::milliseconds(1), [this] {
        return !Empty() || closed_.load(std::memory_order_acquire);
      });
    }
  }

  /** @brief Reject further sends and wake the receiver. */
  void Close() noexcept {
    closed_.store(true, std::memory_order_seq_cst);
    { std::lock_guard<std::mutex> lk(mtx_); }
    cv_.notify_all();
  }

  /**
   * @brief Close, then hand every accepted message to fn. Owner thread only.
   *
   * Waits for senders that passed the closed check before Close() to
   * publish, so no successfully sent message is left behind.
   * @return Number of messages drained.
   */
  template <typename Fn>
  uint32_t CloseAndDrain(Fn&& fn) {
    Close();
    uint32_t drained = 0U;
    detail::AdaptiveBackoff backoff;
    T msg;
    for (;;) {
      while (TryReceive(msg)) {
        fn(msg);
        msg = T{};
        ++drained;
      }
      if (senders_.load(std::memory_order_acquire) == 0U && !HasPublished()) {
        return drained;
      }
      backoff.Wait();
    }
  }

  // ======================== Query API ========================

  bool IsClosed() const noexcept {
    return closed_.load(std::memory_order_acquire);
  }

  bool Empty() const noexcept { return Depth() == 0U; }

  uint32_t Depth() const noexcept {
    uint32_t prod = producer_pos_.load(std::memory_order_acquire);
    uint32_t cons = consumed_pos_.load(std::memory_order_acquire);
    return prod - cons;
  }

  uint32_t Capacity() const noexcept { return depth_; }

  MailboxStatistics GetStatistics() const noexcept {
    return MailboxStatistics{sent_.load(std::memory_order_relaxed),
                             received_.load(std::memory_order_relaxed),
                             rejected_full_.load(std::memory_order_relaxed),
                             rejected_closed_.load(std::memory_order_relaxed)};
  }

 private:
  /// Next slot published but not yet received (owner thread only).
  bool HasPublished() const noexcept {
    const Slot& slot = slots_[consumer_pos_ & mask_];
    return slot.sequence.load(std::memory_order_acquire) == consumer_pos_ + 1U;
  }

  struct alignas(kCacheLineSize) Slot {
    std::atomic<uint32_t> sequence{0U};
    T value{};
  };

  const uint32_t depth_;
  const uint32_t mask_;
  std::unique_ptr<Slot[]> slots_;

  alignas(kCacheLineSize) std::atomic<uint32_t> producer_pos_{0U};
  alignas(kCacheLineSize) uint32_t consumer_pos_{0U};
  std::atomic<uint32_t> consumed_pos_{0U};
  std::atomic<bool> closed_{false};
  std::atomic<uint32_t> senders_{0U};  ///< Send() calls past the closed check

  std::mutex mtx_;
  std::condition_variable cv_;

  std::atomic<uint64_t> sent_{0U};
  std::atomic<uint64_t> received_{0U};
  std::atomic<uint64_t> rejected_full_{0U};
  std::atomic<uint64_t> rejected_closed_{0U};
};

}  // namespace dflow

#endif  // DFLOW_MAILBOX_HPP_
