/**
 * @file pipeline_config.hpp
 * @brief Map ConfigStore sections onto StageConfig and SubscriptionOptions.
 *
 * Stage section keys:
 *   name             stage name (default: section name)
 *   role             producer | producer_consumer | consumer
 *   mailbox_depth    mailbox capacity
 *   idle_timeout_ms  production retry interval, 0 = none
 *   dispatcher       demand | broadcast | partition
 *   partitions       partition count (names "0" .. "n-1")
 *   max_subscribers  0 = unlimited
 *
 * Subscription section keys:
 *   min_demand, max_demand, cancel (temporary | transient | permanent),
 *   partition, timeout_ms
 *
 * Missing keys keep the value already present in the target. Present but
 * malformed keys fail with ConfigError::kInvalidValue.
 */

#ifndef DFLOW_PIPELINE_CONFIG_HPP_
#define DFLOW_PIPELINE_CONFIG_HPP_

#include "dflow/config.hpp"
#include "dflow/dispatcher.hpp"
#include "dflow/log.hpp"
#include "dflow/stage.hpp"
#include "dflow/subscription.hpp"
#include "dflow/vocabulary.hpp"

#include <cstdint>
#include <cstdio>

namespace dflow {

namespace detail {

inline optional<StageRole> ParseRole(const char* s) noexcept {
  if (StrCaseEqual(s, "producer")) return StageRole::kProducer;
  if (StrCaseEqual(s, "producer_consumer")) return StageRole::kProducerConsumer;
  if (StrCaseEqual(s, "consumer")) return StageRole::kConsumer;
  return {};
}

inline optional<DispatcherKind> ParseDispatcherKind(const char* s) noexcept {
  if (StrCaseEqual(s, "demand")) return DispatcherKind::kDemand;
  if (StrCaseEqual(s, "broadcast")) return DispatcherKind::kBroadcast;
  if (StrCaseEqual(s, "partition")) return DispatcherKind::kPartition;
  return {};
}

inline optional<CancelMode> ParseCancelMode(const char* s) noexcept {
  if (StrCaseEqual(s, "temporary")) return CancelMode::kTemporary;
  if (StrCaseEqual(s, "transient")) return CancelMode::kTransient;
  if (StrCaseEqual(s, "permanent")) return CancelMode::kPermanent;
  return {};
}

/// Read an unsigned key into out. Absent keys leave out untouched.
inline bool ReadUint(const ConfigStore& store, const char* section,
                     const char* key, uint32_t& out) {
  if (!store.HasKey(section, key)) return true;
  optional<uint32_t> v = store.FindUint(section, key);
  if (!v.has_value()) {
    DFLOW_LOG_ERROR("Config", "[%s] %s = '%s' is not an unsigned integer",
                    section, key, store.GetString(section, key));
    return false;
  }
  out = v.value();
  return true;
}

inline expected<void, ConfigError> Invalid(const char* section, const char* key,
                                           const char* value) {
  DFLOW_LOG_ERROR("Config", "[%s] invalid %s '%s'", section, key, value);
  return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
}

}  // namespace detail

/**
 * @brief Read subscription options from section, starting from defaults.
 */
inline expected<SubscriptionOptions, ConfigError> LoadSubscriptionOptions(
    const ConfigStore& store, const char* section) {
  using R = expected<SubscriptionOptions, ConfigError>;
  SubscriptionOptions opts;
  if (!detail::ReadUint(store, section, "min_demand", opts.min_demand) ||
      !detail::ReadUint(store, section, "max_demand", opts.max_demand) ||
      !detail::ReadUint(store, section, "timeout_ms", opts.timeout_ms)) {
    return R::error(ConfigError::kInvalidValue);
  }
  // Only max_demand given: keep the default three-quarter low-water mark.
  if (store.HasKey(section, "max_demand") && !store.HasKey(section, "min_demand")) {
    opts.min_demand = SubscriptionOptions::WithMaxDemand(opts.max_demand).min_demand;
  }

  optional<const char*> cancel = store.FindString(section, "cancel");
  if (cancel.has_value()) {
    optional<CancelMode> mode = detail::ParseCancelMode(cancel.value());
    if (!mode.has_value()) {
      (void)detail::Invalid(section, "cancel", cancel.value());
      return R::error(ConfigError::kInvalidValue);
    }
    opts.cancel_mode = mode.value();
  }

  optional<const char*> partition = store.FindString(section, "partition");
  if (partition.has_value()) {
    opts.partition.assign(TruncateToCapacity, partition.value());
  }

  if (!ValidateOptions(opts).has_value()) {
    DFLOW_LOG_ERROR("Config", "[%s] demand window min=%u max=%u is invalid",
                    section, opts.min_demand, opts.max_demand);
    return R::error(ConfigError::kInvalidValue);
  }
  return R::success(opts);
}

/**
 * @brief Overlay stage keys from section onto cfg.
 *
 * A partition dispatcher's hash function cannot come from a file; set
 * cfg.dispatcher.hash before or after loading.
 */
template <typename EventT>
expected<void, ConfigError> LoadStageConfig(const ConfigStore& store,
                                            const char* section,
                                            StageConfig<EventT>& cfg) {
  using R = expected<void, ConfigError>;
  if (!store.HasSection(section)) {
    DFLOW_LOG_WARN("Config", "no section [%s]", section);
    return R::error(ConfigError::kSectionNotFound);
  }

  cfg.name.assign(TruncateToCapacity, store.GetString(section, "name", section));

  optional<const char*> role = store.FindString(section, "role");
  if (role.has_value()) {
    optional<StageRole> r = detail::ParseRole(role.value());
    if (!r.has_value()) return detail::Invalid(section, "role", role.value());
    cfg.role = r.value();
  }

  if (!detail::ReadUint(store, section, "mailbox_depth", cfg.mailbox_depth) ||
      !detail::ReadUint(store, section, "idle_timeout_ms", cfg.idle_timeout_ms) ||
      !detail::ReadUint(store, section, "max_subscribers",
                        cfg.dispatcher.max_subscribers)) {
    return R::error(ConfigError::kInvalidValue);
  }
  if (cfg.mailbox_depth == 0U) {
    return detail::Invalid(section, "mailbox_depth", "0");
  }

  optional<const char*> kind = store.FindString(section, "dispatcher");
  if (kind.has_value()) {
    optional<DispatcherKind> k = detail::ParseDispatcherKind(kind.value());
    if (!k.has_value()) return detail::Invalid(section, "dispatcher", kind.value());
    cfg.dispatcher.kind = k.value();
  }

  if (store.HasKey(section, "partitions")) {
    uint32_t count = 0U;
    if (!detail::ReadUint(store, section, "partitions", count) || count == 0U ||
        count > DFLOW_MAX_PARTITIONS) {
      return detail::Invalid(section, "partitions",
                             store.GetString(section, "partitions"));
    }
    cfg.dispatcher.partitions.clear();
    for (uint32_t i = 0U; i < count; ++i) {
      char name[16];
      (void)std::snprintf(name, sizeof(name), "%u", i);
      (void)cfg.dispatcher.partitions.push_back(
          PartitionName(TruncateToCapacity, name));
    }
  }
  return R::success();
}

}  // namespace dflow

#endif  // DFLOW_PIPELINE_CONFIG_HPP_
