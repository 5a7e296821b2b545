/**
 * @file message.hpp
 * @brief Messages exchanged between stages through their mailboxes.
 *
 * Subscribe handshake (caller -> producer -> consumer):
 *   caller    --Offer-->  producer   registers downstream link in dispatcher
 *   producer  --Ack---->  consumer   registers upstream link, completes reply
 *   consumer  --Ask---->  producer   initial max_demand
 *
 * Steady state:
 *   consumer  --Ask---->  producer   refill after low-water mark
 *   producer  --Events->  consumer   never more than asked for
 *
 * Teardown:
 *   anyone    --Cancel->  producer   producer drops link, sends PeerCancel
 *   producer  --PeerCancel-> consumer  consumer applies its CancelMode
 */

#ifndef DFLOW_MESSAGE_HPP_
#define DFLOW_MESSAGE_HPP_

#include "dflow/subscription.hpp"
#include "dflow/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

namespace dflow {

template <typename EventT>
class Stage;

// ============================================================================
// Overloaded visitor pattern (C++17)
// ============================================================================

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// ============================================================================
// SubscribeReply - completion channel for a blocking Subscribe()
// ============================================================================

/**
 * @brief One-shot reply slot shared by the subscribing caller and the
 * stage that finishes (or rejects) the handshake.
 *
 * If the caller times out first it marks the slot abandoned; a late
 * Complete() then returns false so the stage can undo the link.
 */
struct SubscribeReply {
  std::mutex mtx;
  std::condition_variable cv;
  bool done{false};
  bool abandoned{false};
  optional<SubscribeError> error;

  /// @return false if the caller already gave up waiting.
  bool Complete(optional<SubscribeError> err) noexcept {
    std::lock_guard<std::mutex> lock(mtx);
    if (abandoned) {
      return false;
    }
    error = err;
    done = true;
    cv.notify_one();
    return true;
  }

  /// @param timeout_ms 0 waits indefinitely.
  /// @return false on timeout (slot is then abandoned).
  bool Wait(uint32_t timeout_ms) noexcept {
    std::unique_lock<std::mutex> lock(mtx);
    if (timeout_ms == 0U) {
      cv.wait(lock, [this] { return done; });
      return true;
    }
    if (!cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return done; })) {
      abandoned = true;
      return false;
    }
    return true;
  }
};

using SubscribeReplyPtr = std::shared_ptr<SubscribeReply>;

// ============================================================================
// Stage protocol messages
// ============================================================================

namespace msg {

/// Caller -> producer: register a new downstream subscription.
template <typename EventT>
struct Offer {
  SubscriptionTag tag;
  Stage<EventT>* consumer;
  SubscriptionOptions opts;
  SubscribeReplyPtr reply;  ///< nullptr for asynchronous subscribe
};

/// Producer -> consumer: producer accepted, consumer registers upstream.
template <typename EventT>
struct Ack {
  SubscriptionTag tag;
  Stage<EventT>* producer;
  SubscriptionOptions opts;
  SubscribeReplyPtr reply;
};

/// Consumer -> producer: n more events may be sent on tag.
struct Ask {
  SubscriptionTag tag;
  uint32_t n;
};

/// Producer -> consumer: events answering earlier demand.
template <typename EventT>
struct Events {
  SubscriptionTag tag;
  std::vector<EventT> events;
};

/// Anyone -> either endpoint: tear the subscription down.
struct Cancel {
  SubscriptionTag tag;
  ExitReason reason;
};

/// Producer -> consumer: the link is gone; apply the cancel mode.
struct PeerCancel {
  SubscriptionTag tag;
  ExitReason reason;
};

/// Run a production round (RequestProduction).
struct Produce {};

/// Terminate the stage.
struct Stop {
  ExitReason reason;
};

}  // namespace msg

template <typename EventT>
using StageMessage =
    std::variant<std::monostate, msg::Offer<EventT>, msg::Ack<EventT>, msg::Ask,
                 msg::Events<EventT>, msg::Cancel, msg::PeerCancel, msg::Produce,
                 msg::Stop>;

}  // namespace dflow

#endif  // DFLOW_MESSAGE_HPP_
