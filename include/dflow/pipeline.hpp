/**
 * @file pipeline.hpp
 * @brief Owner of a set of stages: start, subscribe, cancel, stop, join.
 *
 * Pipeline keeps every stage object alive until it is destroyed, so
 * stages may hold raw pointers to their peers. Destruction stops all
 * stages with ExitReason::kShutdown and joins their threads.
 *
 * Usage:
 *   dflow::Pipeline<int> pipe;
 *   dflow::StageConfig<int> pcfg;
 *   pcfg.name.assign(dflow::TruncateToCapacity, "source");
 *   auto src = pipe.Start(pcfg, std::make_unique<Counter>());
 *
 *   dflow::StageConfig<int> ccfg;
 *   ccfg.role = dflow::StageRole::kConsumer;
 *   auto sink = pipe.Start(ccfg, std::make_unique<Printer>());
 *
 *   pipe.Subscribe(sink.value(), src.value(),
 *                  dflow::SubscriptionOptions::WithMaxDemand(10));
 */

#ifndef DFLOW_PIPELINE_HPP_
#define DFLOW_PIPELINE_HPP_

#include "dflow/log.hpp"
#include "dflow/stage.hpp"
#include "dflow/subscription.hpp"
#include "dflow/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace dflow {

template <typename EventT>
class Pipeline {
 public:
  using StageType = Stage<EventT>;

  Pipeline() = default;

  ~Pipeline() {
    StopAll(ExitReason::kShutdown);
    JoinAll();
  }

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // ======================== Stages ========================

  /**
   * @brief Create and start a stage owning handler.
   * @return The new stage id (ids start at 1).
   */
  expected<StageId, StageError> Start(
      const StageConfig<EventT>& cfg,
      std::unique_ptr<StageHandler<EventT>> handler) {
    std::lock_guard<std::mutex> lock(mtx_);
    StageId id(next_id_);
    auto created = StageType::Create(id, cfg, std::move(handler));
    if (!created) {
      DFLOW_LOG_ERROR("Pipeline", "stage %s rejected (error %u)",
                      cfg.name.c_str(),
                      static_cast<unsigned>(created.get_error()));
      return expected<StageId, StageError>::error(created.get_error());
    }
    std::unique_ptr<StageType> stage = std::move(created.value());
    auto started = stage->Start();
    if (!started) {
      return expected<StageId, StageError>::error(started.get_error());
    }
    ++next_id_;
    stages_.push_back(std::move(stage));
    DFLOW_LOG_INFO("Pipeline", "stage %s started (id=%u role=%s)",
                   cfg.name.c_str(), id.value(), StageRoleName(cfg.role));
    return expected<StageId, StageError>::success(id);
  }

  /// @return nullptr for unknown ids.
  StageType* Find(StageId id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& s : stages_) {
      if (s->Id() == id) {
        return s.get();
      }
    }
    return nullptr;
  }

  uint32_t StageCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<uint32_t>(stages_.size());
  }

  // ======================== Subscriptions ========================

  /**
   * @brief Subscribe downstream to upstream; blocks until both registered.
   */
  expected<SubscriptionTag, SubscribeError> Subscribe(
      StageId downstream, StageId upstream, const SubscriptionOptions& opts) {
    StageType* consumer = Find(downstream);
    StageType* producer = Find(upstream);
    if (consumer == nullptr || producer == nullptr) {
      return expected<SubscriptionTag, SubscribeError>::error(
          SubscribeError::kStageNotFound);
    }
    auto r = StageType::Subscribe(*consumer, *producer, opts);
    if (r) {
      DFLOW_LOG_INFO("Pipeline", "%s subscribed to %s (tag=%llu demand=%u/%u)",
                     consumer->Name(), producer->Name(),
                     static_cast<unsigned long long>(r.value().value()),
                     opts.min_demand, opts.max_demand);
    } else {
      DFLOW_LOG_WARN("Pipeline", "%s -> %s subscribe failed: %s",
                     consumer->Name(), producer->Name(),
                     SubscribeErrorName(r.get_error()));
    }
    return r;
  }

  /**
   * @brief Subscribe without waiting; usable from stage handlers.
   */
  expected<SubscriptionTag, SubscribeError> AsyncSubscribe(
      StageId downstream, StageId upstream, const SubscriptionOptions& opts) {
    StageType* consumer = Find(downstream);
    StageType* producer = Find(upstream);
    if (consumer == nullptr || producer == nullptr) {
      return expected<SubscriptionTag, SubscribeError>::error(
          SubscribeError::kStageNotFound);
    }
    return StageType::AsyncSubscribe(*consumer, *producer, opts);
  }

  /**
   * @brief Cancel subscription tag on stage (either endpoint).
   *
   * Unknown or already cancelled tags and terminated stages are no-ops.
   */
  expected<void, CancelError> Cancel(StageId stage, SubscriptionTag tag,
                                     ExitReason reason = ExitReason::kNormal) {
    StageType* s = Find(stage);
    if (s == nullptr) {
      return expected<void, CancelError>::error(CancelError::kStageNotFound);
    }
    auto r = s->Cancel(tag, reason);
    if (!r && r.get_error() == MailboxError::kFull) {
      DFLOW_LOG_ERROR("Pipeline", "cancel of %llu on %s dropped: mailbox full",
                      static_cast<unsigned long long>(tag.value()), s->Name());
      return expected<void, CancelError>::error(CancelError::kMailboxFull);
    }
    return expected<void, CancelError>::success();
  }

  // ======================== Control ========================

  /// @return false for unknown ids.
  bool Stop(StageId id, ExitReason reason = ExitReason::kShutdown) {
    StageType* s = Find(id);
    if (s == nullptr) {
      return false;
    }
    s->Stop(reason);
    return true;
  }

  void StopAll(ExitReason reason = ExitReason::kShutdown) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& s : stages_) {
      s->Stop(reason);
    }
  }

  void JoinAll() {
    std::vector<StageType*> snapshot;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      for (auto& s : stages_) {
        snapshot.push_back(s.get());
      }
    }
    for (auto* s : snapshot) {
      s->Join();
    }
  }

  /// @return false for unknown ids or when the request could not be queued.
  bool RequestProduction(StageId id) {
    StageType* s = Find(id);
    if (s == nullptr) {
      return false;
    }
    auto r = s->RequestProduction();
    return r.has_value();
  }

  /// @param timeout_ms 0 waits indefinitely.
  /// @return false for unknown ids or on timeout.
  bool WaitTerminated(StageId id, uint32_t timeout_ms = 0U) {
    StageType* s = Find(id);
    if (s == nullptr) {
      return false;
    }
    return s->WaitTerminated(timeout_ms);
  }

  optional<StageStatistics> GetStatistics(StageId id) const {
    StageType* s = Find(id);
    if (s == nullptr) {
      return optional<StageStatistics>();
    }
    return optional<StageStatistics>(s->GetStatistics());
  }

 private:
  mutable std::mutex mtx_;
  std::vector<std::unique_ptr<StageType>> stages_;
  uint32_t next_id_{1U};
};

}  // namespace dflow

#endif  // DFLOW_PIPELINE_HPP_
