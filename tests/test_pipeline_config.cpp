/**
 * @file test_pipeline_config.cpp
 * @brief Tests for pipeline_config.hpp
 */

#include "dflow/pipeline_config.hpp"

#include <catch2/catch.hpp>

#include <cstdint>

using dflow::ConfigError;
using dflow::ConfigStore;

// ============================================================================
// LoadSubscriptionOptions
// ============================================================================

TEST_CASE("LoadSubscriptionOptions with no keys keeps defaults",
          "[pipeline_config][subscription]") {
  ConfigStore store;
  auto r = dflow::LoadSubscriptionOptions(store, "subscription.sink");
  REQUIRE(r.has_value());
  REQUIRE(r.value().max_demand == 1000U);
  REQUIRE(r.value().min_demand == 750U);
  REQUIRE(r.value().cancel_mode == dflow::CancelMode::kPermanent);
  REQUIRE(r.value().partition.empty());
}

TEST_CASE("LoadSubscriptionOptions derives min from max",
          "[pipeline_config][subscription]") {
  ConfigStore store;
  store.Set("subscription.sink", "max_demand", "20");
  auto r = dflow::LoadSubscriptionOptions(store, "subscription.sink");
  REQUIRE(r.has_value());
  REQUIRE(r.value().max_demand == 20U);
  REQUIRE(r.value().min_demand == 15U);
}

TEST_CASE("LoadSubscriptionOptions reads every key",
          "[pipeline_config][subscription]") {
  ConfigStore store;
  store.Set("sub", "min_demand", "2");
  store.Set("sub", "max_demand", "8");
  store.Set("sub", "timeout_ms", "250");
  store.Set("sub", "cancel", "Transient");
  store.Set("sub", "partition", "odd");

  auto r = dflow::LoadSubscriptionOptions(store, "sub");
  REQUIRE(r.has_value());
  const auto& opts = r.value();
  REQUIRE(opts.min_demand == 2U);
  REQUIRE(opts.max_demand == 8U);
  REQUIRE(opts.timeout_ms == 250U);
  REQUIRE(opts.cancel_mode == dflow::CancelMode::kTransient);
  REQUIRE(opts.partition == "odd");
}

TEST_CASE("LoadSubscriptionOptions rejects malformed values",
          "[pipeline_config][subscription]") {
  ConfigStore store;

  SECTION("unknown cancel mode") {
    store.Set("sub", "cancel", "sometimes");
  }
  SECTION("min not below max") {
    store.Set("sub", "min_demand", "10");
    store.Set("sub", "max_demand", "10");
  }
  SECTION("zero max") {
    store.Set("sub", "max_demand", "0");
  }
  SECTION("negative demand") {
    store.Set("sub", "max_demand", "-5");
  }
  SECTION("non-numeric timeout") {
    store.Set("sub", "timeout_ms", "soon");
  }

  auto r = dflow::LoadSubscriptionOptions(store, "sub");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ConfigError::kInvalidValue);
}

// ============================================================================
// LoadStageConfig
// ============================================================================

TEST_CASE("LoadStageConfig missing section", "[pipeline_config][stage]") {
  ConfigStore store;
  dflow::StageConfig<int> cfg;
  auto r = dflow::LoadStageConfig(store, "stage.ghost", cfg);
  REQUIRE(r.get_error() == ConfigError::kSectionNotFound);
}

TEST_CASE("LoadStageConfig name defaults to section name",
          "[pipeline_config][stage]") {
  ConfigStore store;
  store.Set("stage.sink", "role", "consumer");
  dflow::StageConfig<int> cfg;
  REQUIRE(dflow::LoadStageConfig(store, "stage.sink", cfg).has_value());
  REQUIRE(cfg.name == "stage.sink");
  REQUIRE(cfg.role == dflow::StageRole::kConsumer);
  REQUIRE(cfg.mailbox_depth == dflow::kDefaultMailboxDepth);
}

TEST_CASE("LoadStageConfig overlays present keys only",
          "[pipeline_config][stage]") {
  ConfigStore store;
  store.Set("stage.mid", "name", "doubler");
  store.Set("stage.mid", "role", "producer_consumer");
  store.Set("stage.mid", "mailbox_depth", "64");
  store.Set("stage.mid", "dispatcher", "broadcast");
  store.Set("stage.mid", "max_subscribers", "3");

  dflow::StageConfig<int> cfg;
  cfg.idle_timeout_ms = 40U;
  REQUIRE(dflow::LoadStageConfig(store, "stage.mid", cfg).has_value());
  REQUIRE(cfg.name == "doubler");
  REQUIRE(cfg.role == dflow::StageRole::kProducerConsumer);
  REQUIRE(cfg.mailbox_depth == 64U);
  REQUIRE(cfg.idle_timeout_ms == 40U);
  REQUIRE(cfg.dispatcher.kind == dflow::DispatcherKind::kBroadcast);
  REQUIRE(cfg.dispatcher.max_subscribers == 3U);
}

TEST_CASE("LoadStageConfig names partitions by index",
          "[pipeline_config][stage]") {
  ConfigStore store;
  store.Set("stage.router", "dispatcher", "partition");
  store.Set("stage.router", "partitions", "3");

  dflow::StageConfig<int> cfg;
  REQUIRE(dflow::LoadStageConfig(store, "stage.router", cfg).has_value());
  REQUIRE(cfg.dispatcher.kind == dflow::DispatcherKind::kPartition);
  REQUIRE(cfg.dispatcher.partitions.size() == 3U);
  REQUIRE(cfg.dispatcher.partitions[0] == "0");
  REQUIRE(cfg.dispatcher.partitions[2] == "2");
}

TEST_CASE("LoadStageConfig rejects malformed values",
          "[pipeline_config][stage]") {
  ConfigStore store;
  store.Set("stage.x", "name", "x");

  SECTION("unknown role") {
    store.Set("stage.x", "role", "observer");
  }
  SECTION("unknown dispatcher") {
    store.Set("stage.x", "dispatcher", "random");
  }
  SECTION("zero mailbox depth") {
    store.Set("stage.x", "mailbox_depth", "0");
  }
  SECTION("non-numeric mailbox depth") {
    store.Set("stage.x", "mailbox_depth", "deep");
  }
  SECTION("zero partitions") {
    store.Set("stage.x", "partitions", "0");
  }
  SECTION("too many partitions") {
    store.Set("stage.x", "partitions", "33");
  }

  dflow::StageConfig<int> cfg;
  auto r = dflow::LoadStageConfig(store, "stage.x", cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ConfigError::kInvalidValue);
}
