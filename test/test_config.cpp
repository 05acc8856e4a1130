#include "gtest/gtest.h"

#include <limits>

#include "config.hpp"
#include "errors.hpp"

using namespace fare;

TEST(OptimizerConfig, Defaults) {
  OptimizerConfig cfg;
  EXPECT_EQ(cfg.mode, VariableMode::Binary);
  EXPECT_FALSE(cfg.max_stops.has_value());
  EXPECT_DOUBLE_EQ(cfg.time_limit_sec, 0.0);
  EXPECT_FALSE(cfg.verbose);
}

TEST(OptimizerConfig, FromJson) {
  auto cfg = config_from_json(nlohmann::json::parse(R"({
    "mode": "continuous", "tolerance": 1e-5, "time_limit_sec": 10,
    "max_stops": 2, "verbose": true, "unrelated": 1})"));
  EXPECT_EQ(cfg.mode, VariableMode::Continuous);
  EXPECT_DOUBLE_EQ(cfg.tolerance, 1e-5);
  EXPECT_DOUBLE_EQ(cfg.time_limit_sec, 10.0);
  ASSERT_TRUE(cfg.max_stops.has_value());
  EXPECT_EQ(*cfg.max_stops, 2);
  EXPECT_TRUE(cfg.verbose);

  auto cleared = config_from_json(nlohmann::json::parse(R"({"max_stops": null})"), cfg);
  EXPECT_FALSE(cleared.max_stops.has_value());
  EXPECT_EQ(cleared.mode, VariableMode::Continuous);
}

TEST(OptimizerConfig, RejectsBadValues) {
  EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"mode": "quantum"})")), ConfigError);
  EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"tolerance": "small"})")), ConfigError);
  EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"tolerance": 0.7})")), ConfigError);
  EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"max_stops": -1})")), ConfigError);
  EXPECT_THROW(config_from_json(nlohmann::json::parse("[1, 2]")), ConfigError);
  EXPECT_THROW(load_config_json("/nonexistent/config.json"), ConfigError);
}

TEST(OptimizerConfig, ParseMode) {
  EXPECT_EQ(parse_mode("MILP"), VariableMode::Binary);
  EXPECT_EQ(parse_mode("lp"), VariableMode::Continuous);
}

TEST(OptimizerConfig, StopLimitMustBeAnIntInRange) {
  auto cfg = config_from_json(nlohmann::json::parse(R"({"max_stops": 2147483647})"));
  ASSERT_TRUE(cfg.max_stops.has_value());
  EXPECT_EQ(*cfg.max_stops, std::numeric_limits<int>::max());

  EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"max_stops": 1.9})")), ConfigError);
  EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"max_stops": "2"})")), ConfigError);
  EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"max_stops": 2147483648})")),
               ConfigError);
  EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"max_stops": 18446744073709551615})")),
               ConfigError);
}
