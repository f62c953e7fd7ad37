/**
 * @file test_config.cpp
 * @brief Tests for config::Loader (defaults + PULSE_* overrides).
 */
#include <gtest/gtest.h>
#include <cstring>

#include "pulse/config/config_loader.hpp"
#include "pulse/config/constants.hpp"

using pulse::config::ConfigError;
using pulse::config::EngineConfig;
using pulse::config::Loader;
namespace constants = pulse::config::constants;

namespace {

const char* no_env(const char*) { return nullptr; }

const char* tuned_env(const char* name) {
  if (std::strcmp(name, "PULSE_WORKERS") == 0)       return "3";
  if (std::strcmp(name, "PULSE_LINK_CAPACITY") == 0) return "256";
  if (std::strcmp(name, "PULSE_PULL_BUDGET") == 0)   return "16";
  if (std::strcmp(name, "PULSE_POLL_BUDGET") == 0)   return "32";
  if (std::strcmp(name, "PULSE_PIN_WORKERS") == 0)   return "true";
  return nullptr;
}

} // namespace

TEST(ConfigLoader, Defaults_MatchConstants) {
  const EngineConfig cfg = Loader::defaults();
  EXPECT_EQ(cfg.workers, constants::SCHED_DEFAULT_WORKERS);
  EXPECT_EQ(cfg.default_link_capacity, constants::LINK_DEFAULT_CAPACITY);
  EXPECT_EQ(cfg.pull_budget, constants::PULL_DEFAULT_BUDGET);
  EXPECT_EQ(cfg.poll_budget, constants::POLL_DEFAULT_BUDGET);
  EXPECT_EQ(cfg.pin_workers, constants::PIN_WORKERS_DEFAULT);
  EXPECT_GE(cfg.resolved_workers(), 1u);
}

TEST(ConfigLoader, FromLookup_NoVariables_GivesDefaults) {
  auto cfg = Loader::from_lookup(&no_env);
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->default_link_capacity, constants::LINK_DEFAULT_CAPACITY);
}

TEST(ConfigLoader, FromLookup_AppliesOverrides) {
  auto cfg = Loader::from_lookup(&tuned_env);
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->workers, 3u);
  EXPECT_EQ(cfg->resolved_workers(), 3u);
  EXPECT_EQ(cfg->default_link_capacity, 256u);
  EXPECT_EQ(cfg->pull_budget, 16u);
  EXPECT_EQ(cfg->poll_budget, 32u);
  EXPECT_TRUE(cfg->pin_workers);
}

/**
 * @test ConfigLoader_FromLookup_Rejects
 * @brief Garbage, zero capacity and bad flags come back as ConfigError, not defaults.
 */
TEST(ConfigLoader, FromLookup_Rejects) {
  auto not_number = Loader::from_lookup([](const char* n) -> const char* {
    return std::strcmp(n, "PULSE_WORKERS") == 0 ? "four" : nullptr;
  });
  ASSERT_FALSE(not_number);
  EXPECT_EQ(not_number.error(), ConfigError::NotANumber);

  auto zero_cap = Loader::from_lookup([](const char* n) -> const char* {
    return std::strcmp(n, "PULSE_LINK_CAPACITY") == 0 ? "0" : nullptr;
  });
  ASSERT_FALSE(zero_cap);
  EXPECT_EQ(zero_cap.error(), ConfigError::OutOfRange);

  auto trailing = Loader::from_lookup([](const char* n) -> const char* {
    return std::strcmp(n, "PULSE_PULL_BUDGET") == 0 ? "12x" : nullptr;
  });
  ASSERT_FALSE(trailing);
  EXPECT_EQ(trailing.error(), ConfigError::NotANumber);

  auto flag = Loader::from_lookup([](const char* n) -> const char* {
    return std::strcmp(n, "PULSE_PIN_WORKERS") == 0 ? "maybe" : nullptr;
  });
  ASSERT_FALSE(flag);
  EXPECT_EQ(flag.error(), ConfigError::InvalidFlag);
  EXPECT_FALSE(pulse::config::to_string(ConfigError::InvalidFlag).empty());
}
