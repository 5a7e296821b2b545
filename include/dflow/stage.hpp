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
 * @file stage.hpp
 * @brief Stage runtime: one thread, one mailbox, one user handler.
 *
 * A stage is a Producer, a ProducerConsumer or a Consumer. Producing
 * stages own a Dispatcher that tracks downstream demand; consuming stages
 * hold one DemandWindow per upstream subscription.
 *
 *   Producer          HandleDemand(demand, out)     -> buffer -> Dispatcher
 *   ProducerConsumer  HandleEvents(from, in, out)   -> buffer -> Dispatcher
 *   Consumer          HandleEvents(from, in, out)   (out must stay empty)
 *
 * Events only move downstream in answer to demand declared upstream, so
 * the number of events in flight on a subscription never exceeds its
 * max_demand. All handler callbacks, dispatcher state and demand windows
 * are touched only by the owning stage thread.
 *
 * Stages reference their peers by raw pointer; the owner (normally a
 * Pipeline) must keep every stage object alive until all of them have
 * been joined.
 *
 * Header-only, C++17, compatible with -fno-exceptions.
 */

#ifndef DFLOW_STAGE_HPP_
#define DFLOW_STAGE_HPP_

#include "dflow/dispatcher.hpp"
#include "dflow/fault.hpp"
#include "dflow/log.hpp"
#include "dflow/mailbox.hpp"
#include "dflow/message.hpp"
#include "dflow/platform.hpp"
#include "dflow/subscription.hpp"
#include "dflow/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace dflow {

// ============================================================================
// Enumerations
// ============================================================================

enum class StageRole : uint8_t {
  kProducer = 0,
  kProducerConsumer,
  kConsumer,
};

inline const char* StageRoleName(StageRole role) noexcept {
  switch (role) {
    case StageRole::kProducer:
      return "producer";
    case StageRole::kProducerConsumer:
      return "producer_consumer";
    case StageRole::kConsumer:
      return "consumer";
    default:
      return "unknown";
  }
}

enum class StageError : uint8_t {
  kMissingHandler = 0,
  kInvalidDispatcherConfig,
  kInvalidMailboxDepth,
  kAlreadyStarted,
};

enum class HandlerError : uint8_t {
  kFailed = 0,
  kNotImplemented,
};

inline const char* HandlerErrorName(HandlerError err) noexcept {
  switch (err) {
    case HandlerError::kFailed:
      return "failed";
    case HandlerError::kNotImplemented:
      return "not_implemented";
    default:
      return "unknown";
  }
}

using HandlerResult = expected<void, HandlerError>;

/// Which end of a subscription a hook is reporting.
enum class LinkSide : uint8_t {
  kUpstream = 0,  ///< This stage consumes from the peer
  kDownstream,    ///< This stage produces for the peer
};

// ============================================================================
// Configuration
// ============================================================================

static constexpr uint32_t kDefaultMailboxDepth = 1024U;

/// Retry period for batches parked behind a full consumer mailbox.
static constexpr uint32_t kRetryIntervalMs = 1U;

template <typename EventT>
struct StageConfig {
  FixedString<32> name{"stage"};
  StageRole role{StageRole::kProducer};
  uint32_t mailbox_depth{kDefaultMailboxDepth};
  uint32_t idle_timeout_ms{0U};  ///< 0 = block until a message arrives
  DispatcherConfig<EventT> dispatcher;  ///< Ignored for consumers
  FaultReporter fault_reporter;
};

struct StageStatistics {
  uint64_t events_in;
  uint64_t events_out;
  uint64_t events_buffered;
  uint64_t events_rejected;
  uint64_t events_discarded;
  uint64_t demand_received;
  uint64_t demand_requested;
  uint64_t dispatch_errors;
  uint64_t mailbox_full;
  uint64_t messages_processed;
};

// ============================================================================
// StageHandler
// ============================================================================

/**
 * @brief User state and callbacks of one stage.
 *
 * Producers override HandleDemand, producer-consumers and consumers
 * override HandleEvents. Returning an error terminates the stage with
 * ExitReason::kHandlerFailed.
 */
template <typename EventT>
class StageHandler {
 public:
  virtual ~StageHandler() = default;

  /// Append up to demand events to out. Extra events are buffered.
  virtual HandlerResult HandleDemand(uint32_t demand, std::vector<EventT>& out) {
    (void)demand;
    (void)out;
    return HandlerResult::error(HandlerError::kNotImplemented);
  }

  /// Process a batch from upstream stage from. Consumers must leave out empty.
  virtual HandlerResult HandleEvents(StageId from, std::vector<EventT>& in,
                                     std::vector<EventT>& out) {
    (void)from;
    (void)in;
    (void)out;
    return HandlerResult::error(HandlerError::kNotImplemented);
  }

  virtual void HandleSubscribe(LinkSide side, SubscriptionTag tag, StageId peer) {
    (void)side;
    (void)tag;
    (void)peer;
  }

  virtual void HandleCancel(LinkSide side, SubscriptionTag tag, ExitReason reason) {
    (void)side;
    (void)tag;
    (void)reason;
  }

  /// Events the dispatcher could not route (partition dispatch only).
  virtual void HandleDispatchError(DispatchError err,
                                   const std::vector<EventT>& rejected) {
    (void)err;
    (void)rejected;
  }

  virtual void HandleTerminate(ExitReason reason) { (void)reason; }
};

namespace detail {

/// Stage running on the calling thread, nullptr outside stage threads.
inline const void*& CurrentStageRef() noexcept {
  static thread_local const void* current = nullptr;
  return current;
}

inline SubscriptionTag NextSubscriptionTag() noexcept {
  static std::atomic<uint64_t> next{1U};
  return SubscriptionTag(next.fetch_add(1U, std::memory_order_relaxed));
}

inline SubscribeError ToSubscribeError(MailboxError err) noexcept {
  return (err == MailboxError::kFull) ? SubscribeError::kMailboxFull
                                      : SubscribeError::kStageNotRunning;
}

}  // namespace detail

// ============================================================================
// Stage
// ============================================================================

template <typename EventT>
class Stage {
 public:
  using Message = StageMessage<EventT>;
  using Handler = StageHandler<EventT>;
  using Config = StageConfig<EventT>;

  /**
   * @brief Validate cfg and build a stage (not yet started).
   */
  static expected<std::unique_ptr<Stage>, StageError> Create(
      StageId id, const Config& cfg, std::unique_ptr<Handler> handler) {
    using R = expected<std::unique_ptr<Stage>, StageError>;
    if (handler == nullptr) {
      return R::error(StageError::kMissingHandler);
    }
    if (cfg.mailbox_depth == 0U) {
      return R::error(StageError::kInvalidMailboxDepth);
    }
    if (cfg.role != StageRole::kConsumer &&
        !IsValidDispatcherConfig(cfg.dispatcher)) {
      return R::error(StageError::kInvalidDispatcherConfig);
    }
    return R::success(
        std::unique_ptr<Stage>(new Stage(id, cfg, std::move(handler))));
  }

  ~Stage() {
    if (thread_.joinable()) {
      Stop(ExitReason::kShutdown);
      Join();
    }
  }

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;
  Stage(Stage&&) = delete;
  Stage& operator=(Stage&&) = delete;

  // ======================== Lifecycle ========================

  expected<void, StageError> Start() {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
      return expected<void, StageError>::error(StageError::kAlreadyStarted);
    }
    alive_.store(true, std::memory_order_release);
    thread_ = std::thread(&Stage::Run, this);
    return expected<void, StageError>::success();
  }

  /**
   * @brief Ask the stage to terminate with reason. Returns immediately.
   */
  void Stop(ExitReason reason) noexcept {
    stop_reason_.store(reason, std::memory_order_relaxed);
    stop_requested_.store(true, std::memory_order_release);
    auto r = mailbox_.Send(Message(msg::Stop{reason}));
    if (!r && r.get_error() == MailboxError::kFull) {
      DFLOW_LOG_DEBUG("Stage", "%s: mailbox full, stop flag picked up later",
                      config_.name.c_str());
    }
  }

  /// @param timeout_ms 0 waits indefinitely.
  /// @return true once the stage has terminated.
  bool WaitTerminated(uint32_t timeout_ms = 0U) {
    std::unique_lock<std::mutex> lk(term_mtx_);
    if (timeout_ms == 0U) {
      term_cv_.wait(lk, [this] { return terminated_; });
      return true;
    }
    return term_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                             [this] { return terminated_; });
  }

  void Join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
      thread_.join();
    }
  }

  // ======================== Requests ========================

  /** @brief Run a production round on the stage thread. */
  expected<void, MailboxError> RequestProduction() {
    return Post(Message(msg::Produce{}));
  }

  /**
   * @brief Cancel subscription tag, where this stage is either endpoint.
   *
   * Returns once the request is queued. Unknown tags are ignored by the
   * stage thread.
   */
  expected<void, MailboxError> Cancel(SubscriptionTag tag, ExitReason reason) {
    return Post(Message(msg::Cancel{tag, reason}));
  }

  /**
   * @brief Subscribe consumer to producer and wait for the handshake.
   *
   * Blocks up to opts.timeout_ms (0 = forever). Must not be called from
   * either stage's own thread.
   */
  static expected<SubscriptionTag, SubscribeError> Subscribe(
      Stage& consumer, Stage& producer, const SubscriptionOptions& opts) {
    using R = expected<SubscriptionTag, SubscribeError>;
    auto pre = Precheck(consumer, producer, opts);
    if (!pre) {
      return R::error(pre.get_error());
    }
    const void* current = detail::CurrentStageRef();
    if (current == &consumer || current == &producer) {
      return R::error(SubscribeError::kCalledFromStage);
    }

    SubscriptionTag tag = detail::NextSubscriptionTag();
    auto reply = std::make_shared<SubscribeReply>();
    auto sent = producer.Post(
        Message(msg::Offer<EventT>{tag, &consumer, opts, reply}));
    if (!sent) {
      return R::error(detail::ToSubscribeError(sent.get_error()));
    }
    if (!reply->Wait(opts.timeout_ms)) {
      DFLOW_LOG_WARN("Stage", "subscribe %s -> %s timed out after %u ms",
                     consumer.Name(), producer.Name(), opts.timeout_ms);
      return R::error(SubscribeError::kTimeout);
    }
    if (reply->error.has_value()) {
      return R::error(reply->error.value());
    }
    return R::success(tag);
  }

  /**
   * @brief Start the subscribe handshake without waiting for it.
   *
   * Safe from stage threads. Local checks fail synchronously; rejections
   * by the producer are logged and reported as kSubscribeRejected faults.
   */
  static expected<SubscriptionTag, SubscribeError> AsyncSubscribe(
      Stage& consumer, Stage& producer, const SubscriptionOptions& opts) {
    using R = expected<SubscriptionTag, SubscribeError>;
    auto pre = Precheck(consumer, producer, opts);
    if (!pre) {
      return R::error(pre.get_error());
    }
    SubscriptionTag tag = detail::NextSubscriptionTag();
    auto sent = producer.Post(
        Message(msg::Offer<EventT>{tag, &consumer, opts, nullptr}));
    if (!sent) {
      return R::error(detail::ToSubscribeError(sent.get_error()));
    }
    return R::success(tag);
  }

  // ======================== Query API ========================

  StageId Id() const noexcept { return id_; }
  const char* Name() const noexcept { return config_.name.c_str(); }
  StageRole Role() const noexcept { return config_.role; }

  bool IsAlive() const noexcept { return alive_.load(std::memory_order_acquire); }

  ExitReason GetExitReason() const noexcept {
    return exit_reason_.load(std::memory_order_acquire);
  }

  StageStatistics GetStatistics() const noexcept {
    return StageStatistics{
        stats_.events_in.load(std::memory_order_relaxed),
        stats_.events_out.load(std::memory_order_relaxed),
        stats_.events_buffered.load(std::memory_order_relaxed),
        stats_.events_rejected.load(std::memory_order_relaxed),
        stats_.events_discarded.load(std::memory_order_relaxed),
        stats_.demand_received.load(std::memory_order_relaxed),
        stats_.demand_requested.load(std::memory_order_relaxed),
        stats_.dispatch_errors.load(std::memory_order_relaxed),
        stats_.mailbox_full.load(std::memory_order_relaxed),
        stats_.messages_processed.load(std::memory_order_relaxed)};
  }

  MailboxStatistics GetMailboxStatistics() const noexcept {
    return mailbox_.GetStatistics();
  }

 private:
  struct UpstreamLink {
    SubscriptionTag tag;
    Stage* producer;
    StageId producer_id;
    DemandWindow window;
    CancelMode cancel_mode;
  };

  /// pending holds batches refused by a full consumer mailbox. Their
  /// demand is already spent, so they are retried in order, never dropped.
  struct DownstreamLink {
    SubscriptionTag tag;
    Stage* consumer;
    std::deque<std::vector<EventT>> pending;
  };

  /// Upstream batch waiting for downstream demand (producer-consumer).
  struct InputBatch {
    SubscriptionTag tag;
    StageId from;
    std::vector<EventT> events;
    size_t pos;
  };

  struct Counters {
    std::atomic<uint64_t> events_in{0U};
    std::atomic<uint64_t> events_out{0U};
    std::atomic<uint64_t> events_buffered{0U};
    std::atomic<uint64_t> events_rejected{0U};
    std::atomic<uint64_t> events_discarded{0U};
    std::atomic<uint64_t> demand_received{0U};
    std::atomic<uint64_t> demand_requested{0U};
    std::atomic<uint64_t> dispatch_errors{0U};
    std::atomic<uint64_t> mailbox_full{0U};
    std::atomic<uint64_t> messages_processed{0U};
  };

  Stage(StageId id, const Config& cfg, std::unique_ptr<Handler> handler)
      : id_(id),
        config_(cfg),
        handler_(std::move(handler)),
        mailbox_(cfg.mailbox_depth) {
    if (config_.role != StageRole::kConsumer) {
      dispatcher_ = std::make_unique<Dispatcher<EventT>>(config_.dispatcher);
    }
  }

  static expected<void, SubscribeError> Precheck(
      const Stage& consumer, const Stage& producer,
      const SubscriptionOptions& opts) noexcept {
    using R = expected<void, SubscribeError>;
    auto valid = ValidateOptions(opts);
    if (!valid) {
      return valid;
    }
    if (&consumer == &producer) {
      return R::error(SubscribeError::kSelfSubscription);
    }
    if (consumer.Role() == StageRole::kProducer) {
      return R::error(SubscribeError::kNotAConsumer);
    }
    if (producer.Role() == StageRole::kConsumer) {
      return R::error(SubscribeError::kNoDispatcher);
    }
    if (!consumer.IsAlive() || !producer.IsAlive()) {
      return R::error(SubscribeError::kStageNotRunning);
    }
    return R::success();
  }

  expected<void, MailboxError> Post(Message&& m) noexcept {
    return mailbox_.Send(std::move(m));
  }

  // ======================== Run loop ========================

  void Run() {
    detail::CurrentStageRef() = this;
    DFLOW_LOG_DEBUG("Stage", "%s started (id=%u role=%s)", Name(), id_.value(),
                    StageRoleName(config_.role));
    Message m;
    while (!finished_) {
      if (stop_requested_.load(std::memory_order_acquire)) {
        Terminate(stop_reason_.load(std::memory_order_relaxed));
        break;
      }
      if (!mailbox_.Receive(m, WaitTimeoutMs())) {
        if (dispatcher_ != nullptr) {
          if (config_.idle_timeout_ms != 0U) {
            Produce();
          } else {
            DispatchBuffered();
          }
        }
        continue;
      }
      stats_.messages_processed.fetch_add(1U, std::memory_order_relaxed);
      Process(m);
      m = Message{};
    }
    detail::CurrentStageRef() = nullptr;
  }

  void Process(Message& m) {
    std::visit(overloaded{
                   [](std::monostate&) {},
                   [this](msg::Offer<EventT>& o) { OnOffer(o); },
                   [this](msg::Ack<EventT>& a) { OnAck(a); },
                   [this](msg::Ask& a) { OnAsk(a); },
                   [this](msg::Events<EventT>& e) { OnEvents(e); },
                   [this](msg::Cancel& c) { OnCancel(c.tag, c.reason); },
                   [this](msg::PeerCancel& c) { OnPeerCancel(c.tag, c.reason); },
                   [this](msg::Produce&) {
                     if (dispatcher_ != nullptr) {
                       Produce();
                     }
                   },
                   [this](msg::Stop& s) { Terminate(s.reason); },
               },
               m);
  }

  // ======================== Subscribe handshake ========================

  void OnOffer(msg::Offer<EventT>& o) {
    if (dispatcher_ == nullptr) {
      RejectOffer(o, SubscribeError::kNoDispatcher);
      return;
    }
    auto r = dispatcher_->Subscribe(o.tag, o.opts);
    if (!r) {
      RejectOffer(o, r.get_error());
      return;
    }
    downstreams_.push_back(DownstreamLink{o.tag, o.consumer, {}});
    auto sent = o.consumer->Post(
        Message(msg::Ack<EventT>{o.tag, this, o.opts, o.reply}));
    if (!sent) {
      (void)dispatcher_->Cancel(o.tag);
      downstreams_.pop_back();
      RejectOffer(o, detail::ToSubscribeError(sent.get_error()));
      return;
    }
    DFLOW_LOG_DEBUG("Stage", "%s: accepted subscriber %s (tag=%llu)", Name(),
                    o.consumer->Name(),
                    static_cast<unsigned long long>(o.tag.value()));
    handler_->HandleSubscribe(LinkSide::kDownstream, o.tag, o.consumer->Id());
  }

  void RejectOffer(msg::Offer<EventT>& o, SubscribeError err) {
    if (o.reply != nullptr) {
      (void)o.reply->Complete(err);
      return;
    }
    DFLOW_LOG_WARN("Stage", "%s: async subscription from %s rejected: %s",
                   Name(), o.consumer->Name(), SubscribeErrorName(err));
    config_.fault_reporter.Report(StageFault::kSubscribeRejected, id_.value(),
                                  FaultPriority::kMedium);
  }

  void OnAck(msg::Ack<EventT>& a) {
    if (a.reply != nullptr && !a.reply->Complete(optional<SubscribeError>())) {
      DFLOW_LOG_WARN("Stage", "%s: subscription %llu to %s completed after "
                     "caller timeout, cancelling",
                     Name(), static_cast<unsigned long long>(a.tag.value()),
                     a.producer->Name());
      (void)a.producer->Post(Message(msg::Cancel{a.tag, ExitReason::kNormal}));
      return;
    }
    UpstreamLink link{a.tag, a.producer, a.producer->Id(),
                      DemandWindow(a.opts.min_demand, a.opts.max_demand),
                      a.opts.cancel_mode};
    uint32_t ask = link.window.Open();
    upstreams_.push_back(link);
    handler_->HandleSubscribe(LinkSide::kUpstream, a.tag, link.producer_id);
    SendAsk(upstreams_.back(), ask);
  }

  // ======================== Demand ========================

  void SendAsk(const UpstreamLink& link, uint32_t n) {
    auto r = link.producer->Post(Message(msg::Ask{link.tag, n}));
    if (r) {
      stats_.demand_requested.fetch_add(n, std::memory_order_relaxed);
      return;
    }
    if (r.get_error() == MailboxError::kFull) {
      ReportMailboxFull(*link.producer);
    }
  }

  void OnAsk(const msg::Ask& a) {
    if (dispatcher_ == nullptr) {
      return;
    }
    stats_.demand_received.fetch_add(a.n, std::memory_order_relaxed);
    auto r = dispatcher_->Ask(a.tag, a.n);
    if (!r) {
      DFLOW_LOG_DEBUG("Stage", "%s: demand for %s subscription %llu ignored",
                      Name(), DispatchErrorName(r.get_error()),
                      static_cast<unsigned long long>(a.tag.value()));
      return;
    }
    Produce();
  }

  void RefillUpstream(SubscriptionTag tag, uint32_t consumed) {
    UpstreamLink* link = FindUpstream(tag);
    if (link == nullptr) {
      return;
    }
    uint64_t overrun_before = link->window.Overrun();
    uint32_t ask = link->window.Consume(consumed);
    if (DFLOW_UNLIKELY(link->window.Overrun() != overrun_before)) {
      DFLOW_LOG_WARN("Stage", "%s: %s sent more events than demanded on %llu",
                     Name(), link->producer->Name(),
                     static_cast<unsigned long long>(tag.value()));
      config_.fault_reporter.Report(
          StageFault::kDemandOverrun,
          static_cast<uint32_t>(link->window.Overrun() - overrun_before),
          FaultPriority::kMedium);
    }
    if (ask > 0U) {
      SendAsk(*link, ask);
    }
  }

  // ======================== Production ========================

  void Produce() {
    DispatchBuffered();
    if (finished_) {
      return;
    }
    if (config_.role == StageRole::kProducerConsumer) {
      DrainInput();
      return;
    }
    uint32_t satisfiable = dispatcher_->Satisfiable();
    if (static_cast<size_t>(satisfiable) <= buffer_.size()) {
      return;
    }
    uint32_t demand = satisfiable - static_cast<uint32_t>(buffer_.size());
    std::vector<EventT> out;
    auto r = handler_->HandleDemand(demand, out);
    if (!r) {
      HandlerFailed(r.get_error());
      return;
    }
    for (auto& ev : out) {
      buffer_.push_back(std::move(ev));
    }
    DispatchBuffered();
  }

  /// Consume queued input only while downstream demand is uncovered.
  void DrainInput() {
    while (!finished_ && !input_.empty()) {
      DispatchBuffered();
      uint32_t satisfiable = dispatcher_->Satisfiable();
      if (static_cast<size_t>(satisfiable) <= buffer_.size()) {
        break;
      }
      size_t uncovered = satisfiable - buffer_.size();

      InputBatch& batch = input_.front();
      size_t left = batch.events.size() - batch.pos;
      size_t take = (uncovered < left) ? uncovered : left;
      std::vector<EventT> in;
      in.reserve(take);
      for (size_t i = 0U; i < take; ++i) {
        in.push_back(std::move(batch.events[batch.pos + i]));
      }
      batch.pos += take;
      SubscriptionTag tag = batch.tag;
      StageId from = batch.from;
      if (batch.pos >= batch.events.size()) {
        input_.pop_front();
      }

      std::vector<EventT> out;
      auto r = handler_->HandleEvents(from, in, out);
      if (!r) {
        HandlerFailed(r.get_error());
        return;
      }
      for (auto& ev : out) {
        buffer_.push_back(std::move(ev));
      }
      RefillUpstream(tag, static_cast<uint32_t>(take));
    }
    DispatchBuffered();
  }

  void OnEvents(msg::Events<EventT>& e) {
    uint32_t n = static_cast<uint32_t>(e.events.size());
    stats_.events_in.fetch_add(n, std::memory_order_relaxed);
    UpstreamLink* link = FindUpstream(e.tag);
    if (link == nullptr) {
      stats_.events_discarded.fetch_add(n, std::memory_order_relaxed);
      DFLOW_LOG_DEBUG("Stage", "%s: %u event(s) on closed subscription %llu",
                      Name(), n, static_cast<unsigned long long>(e.tag.value()));
      return;
    }
    StageId from = link->producer_id;

    if (config_.role == StageRole::kProducerConsumer) {
      input_.push_back(InputBatch{e.tag, from, std::move(e.events), 0U});
      DrainInput();
      return;
    }

    std::vector<EventT> out;
    auto r = handler_->HandleEvents(from, e.events, out);
    if (!r) {
      HandlerFailed(r.get_error());
      return;
    }
    if (!out.empty()) {
      DFLOW_LOG_ERROR("Stage", "%s: consumer emitted %zu event(s)", Name(),
                      out.size());
      Terminate(ExitReason::kInvalidOutput);
      return;
    }
    RefillUpstream(e.tag, n);
  }

  void DispatchBuffered() {
    if (finished_ || dispatcher_ == nullptr) {
      UpdateBufferedStat();
      return;
    }
    FlushPending();
    if (!buffer_.empty()) {
      deliveries_.clear();
      rejected_.clear();
      dispatcher_->Dispatch(buffer_, deliveries_, rejected_);

      for (auto& d : deliveries_) {
        DownstreamLink* link = FindDownstream(d.tag);
        if (link == nullptr) {
          stats_.events_discarded.fetch_add(d.events.size(),
                                            std::memory_order_relaxed);
          continue;
        }
        if (!link->pending.empty()) {
          // Keep per-subscription order behind the batches already waiting.
          pending_events_ += d.events.size();
          link->pending.push_back(std::move(d.events));
          continue;
        }
        (void)Deliver(*link, d.events, false);
      }

      for (auto& rej : rejected_) {
        uint32_t n = static_cast<uint32_t>(rej.events.size());
        stats_.dispatch_errors.fetch_add(1U, std::memory_order_relaxed);
        stats_.events_rejected.fetch_add(n, std::memory_order_relaxed);
        DFLOW_LOG_ERROR("Dispatch", "%s: %u event(s) rejected: %s", Name(), n,
                        DispatchErrorName(rej.error));
        config_.fault_reporter.Report(StageFault::kDispatchRejected, n,
                                      FaultPriority::kHigh);
        handler_->HandleDispatchError(rej.error, rej.events);
      }
      deliveries_.clear();
      rejected_.clear();
    }
    UpdateBufferedStat();
  }

  /**
   * @brief Post one batch to link's consumer.
   *
   * A full mailbox parks the batch at the front of link.pending. A
   * terminated consumer loses it; the peer cancel that follows removes the
   * link.
   * @param retry  The batch came from link.pending (already reported).
   * @return false when the batch was not posted.
   */
  bool Deliver(DownstreamLink& link, std::vector<EventT>& events, bool retry) {
    uint32_t n = static_cast<uint32_t>(events.size());
    Message m(msg::Events<EventT>{link.tag, std::move(events)});
    auto r = link.consumer->Post(std::move(m));
    if (r) {
      stats_.events_out.fetch_add(n, std::memory_order_relaxed);
      return true;
    }
    // Send leaves the message intact on error.
    std::vector<EventT>& back = std::get<msg::Events<EventT>>(m).events;
    if (r.get_error() == MailboxError::kFull) {
      if (!retry) {
        ReportMailboxFull(*link.consumer);
      }
      pending_events_ += back.size();
      link.pending.push_front(std::move(back));
      return false;
    }
    stats_.events_discarded.fetch_add(n, std::memory_order_relaxed);
    DFLOW_LOG_DEBUG("Stage", "%s: %u event(s) lost, %s terminated", Name(), n,
                    link.consumer->Name());
    return false;
  }

  /// Retry parked batches, oldest first, until a consumer refuses again.
  void FlushPending() {
    if (pending_events_ == 0U) {
      return;
    }
    for (auto& link : downstreams_) {
      while (!link.pending.empty()) {
        std::vector<EventT> batch = std::move(link.pending.front());
        link.pending.pop_front();
        pending_events_ -= batch.size();
        if (!Deliver(link, batch, true)) {
          break;
        }
      }
    }
  }

  /// Receive timeout of the run loop: short while batches are parked.
  uint32_t WaitTimeoutMs() const noexcept {
    uint32_t idle = config_.idle_timeout_ms;
    if (pending_events_ == 0U) {
      return idle;
    }
    return (idle == 0U || idle > kRetryIntervalMs) ? kRetryIntervalMs : idle;
  }

  void UpdateBufferedStat() noexcept {
    stats_.events_buffered.store(buffer_.size() + pending_events_,
                                 std::memory_order_relaxed);
  }

  // ======================== Cancellation ========================

  void OnCancel(SubscriptionTag tag, ExitReason reason) {
    for (size_t i = 0U; i < downstreams_.size(); ++i) {
      if (downstreams_[i].tag != tag) {
        continue;
      }
      Stage* consumer = downstreams_[i].consumer;
      (void)dispatcher_->Cancel(tag);
      DiscardPending(downstreams_[i]);
      downstreams_.erase(downstreams_.begin() + static_cast<std::ptrdiff_t>(i));
      DFLOW_LOG_DEBUG("Stage", "%s: subscriber %s cancelled (%s)", Name(),
                      consumer->Name(), ExitReasonName(reason));
      handler_->HandleCancel(LinkSide::kDownstream, tag, reason);
      NotifyPeerCancel(*consumer, tag, reason);
      // The freed demand may unblock a broadcast fan-out.
      Produce();
      return;
    }

    UpstreamLink* link = FindUpstream(tag);
    if (link != nullptr) {
      auto r = link->producer->Post(Message(msg::Cancel{tag, reason}));
      if (!r) {
        if (r.get_error() == MailboxError::kFull) {
          ReportMailboxFull(*link->producer);
        }
        OnPeerCancel(tag, reason);
      }
      return;
    }
    DFLOW_LOG_DEBUG("Stage", "%s: cancel of unknown subscription %llu ignored",
                    Name(), static_cast<unsigned long long>(tag.value()));
  }

  void OnPeerCancel(SubscriptionTag tag, ExitReason reason) {
    CancelMode mode = CancelMode::kTemporary;
    bool found = false;
    for (size_t i = 0U; i < upstreams_.size(); ++i) {
      if (upstreams_[i].tag == tag) {
        mode = upstreams_[i].cancel_mode;
        upstreams_.erase(upstreams_.begin() + static_cast<std::ptrdiff_t>(i));
        found = true;
        break;
      }
    }
    if (!found) {
      return;
    }
    handler_->HandleCancel(LinkSide::kUpstream, tag, reason);

    bool terminate = (mode == CancelMode::kPermanent) ||
                     (mode == CancelMode::kTransient && IsAbnormal(reason));
    if (terminate) {
      DFLOW_LOG_DEBUG("Stage", "%s: upstream %llu gone (%s), terminating",
                      Name(), static_cast<unsigned long long>(tag.value()),
                      ExitReasonName(reason));
      Terminate(reason);
    }
  }

  void NotifyPeerCancel(Stage& consumer, SubscriptionTag tag, ExitReason reason) {
    auto r = consumer.Post(Message(msg::PeerCancel{tag, reason}));
    if (!r && r.get_error() == MailboxError::kFull) {
      ReportMailboxFull(consumer);
    }
  }

  // ======================== Termination ========================

  void HandlerFailed(HandlerError err) {
    DFLOW_LOG_ERROR("Stage", "%s: handler failed: %s", Name(),
                    HandlerErrorName(err));
    config_.fault_reporter.Report(StageFault::kHandlerFailed, id_.value(),
                                  FaultPriority::kHigh);
    Terminate(ExitReason::kHandlerFailed);
  }

  void Terminate(ExitReason reason) {
    if (finished_) {
      return;
    }
    finished_ = true;
    exit_reason_.store(reason, std::memory_order_release);
    (void)mailbox_.CloseAndDrain(
        [this, reason](Message& m) { DrainAfterClose(m, reason); });

    for (auto& d : downstreams_) {
      DiscardPending(d);
      NotifyPeerCancel(*d.consumer, d.tag, reason);
    }
    for (auto& u : upstreams_) {
      auto r = u.producer->Post(Message(msg::Cancel{u.tag, reason}));
      if (!r && r.get_error() == MailboxError::kFull) {
        ReportMailboxFull(*u.producer);
      }
    }
    downstreams_.clear();
    upstreams_.clear();

    uint64_t dropped = buffer_.size();
    for (const auto& b : input_) {
      dropped += b.events.size() - b.pos;
    }
    buffer_.clear();
    input_.clear();
    stats_.events_discarded.fetch_add(dropped, std::memory_order_relaxed);
    stats_.events_buffered.store(0U, std::memory_order_relaxed);

    handler_->HandleTerminate(reason);

    if (IsAbnormal(reason)) {
      DFLOW_LOG_WARN("Stage", "%s terminated: %s", Name(), ExitReasonName(reason));
    } else {
      DFLOW_LOG_DEBUG("Stage", "%s terminated: %s", Name(),
                      ExitReasonName(reason));
    }

    {
      std::lock_guard<std::mutex> lk(term_mtx_);
      terminated_ = true;
      alive_.store(false, std::memory_order_release);
    }
    term_cv_.notify_all();
  }

  void DrainAfterClose(Message& m, ExitReason reason) {
    if (auto* o = std::get_if<msg::Offer<EventT>>(&m)) {
      RejectOffer(*o, SubscribeError::kStageNotRunning);
    } else if (auto* a = std::get_if<msg::Ack<EventT>>(&m)) {
      if (a->reply != nullptr) {
        (void)a->reply->Complete(SubscribeError::kStageNotRunning);
      }
      (void)a->producer->Post(Message(msg::Cancel{a->tag, reason}));
    } else if (auto* e = std::get_if<msg::Events<EventT>>(&m)) {
      stats_.events_discarded.fetch_add(e->events.size(),
                                        std::memory_order_relaxed);
    }
  }

  // ======================== Helpers ========================

  void DiscardPending(DownstreamLink& link) noexcept {
    for (const auto& batch : link.pending) {
      stats_.events_discarded.fetch_add(batch.size(), std::memory_order_relaxed);
      pending_events_ -= batch.size();
    }
    link.pending.clear();
  }

  void ReportMailboxFull(const Stage& peer) {
    stats_.mailbox_full.fetch_add(1U, std::memory_order_relaxed);
    DFLOW_LOG_ERROR("Mailbox", "%s: mailbox of %s is full (depth %u)", Name(),
                    peer.Name(), peer.mailbox_.Capacity());
    config_.fault_reporter.Report(StageFault::kMailboxFull, peer.id_.value(),
                                  FaultPriority::kMedium);
  }

  UpstreamLink* FindUpstream(SubscriptionTag tag) noexcept {
    for (auto& u : upstreams_) {
      if (u.tag == tag) {
        return &u;
      }
    }
    return nullptr;
  }

  DownstreamLink* FindDownstream(SubscriptionTag tag) noexcept {
    for (auto& d : downstreams_) {
      if (d.tag == tag) {
        return &d;
      }
    }
    return nullptr;
  }

  // ======================== Data Members ========================

  const StageId id_;
  const Config config_;
  std::unique_ptr<Handler> handler_;
  Mailbox<Message> mailbox_;
  std::unique_ptr<Dispatcher<EventT>> dispatcher_;  ///< nullptr for consumers
  std::thread thread_;

  std::atomic<bool> started_{false};
  std::atomic<bool> alive_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<ExitReason> stop_reason_{ExitReason::kShutdown};
  std::atomic<ExitReason> exit_reason_{ExitReason::kNormal};

  std::mutex term_mtx_;
  std::condition_variable term_cv_;
  bool terminated_{false};

  // Stage-thread state.
  bool finished_{false};
  std::vector<UpstreamLink> upstreams_;
  std::vector<DownstreamLink> downstreams_;
  std::deque<EventT> buffer_;
  std::deque<InputBatch> input_;
  size_t pending_events_{0U};  ///< Events parked on downstream links
  std::vector<Delivery<EventT>> deliveries_;
  std::vector<RejectedBatch<EventT>> rejected_;

  Counters stats_;
};

}  // namespace dflow

#endif  // DFLOW_STAGE_HPP_
