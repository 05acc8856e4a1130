// src/config.hpp
#pragma once
#ifndef FARE_CONFIG_HPP
#define FARE_CONFIG_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "models.hpp"

namespace fare {

struct OptimizerConfig {
  VariableMode mode{VariableMode::Binary};
  double tolerance{1e-6};          // decoder epsilon around 0 and 1
  double time_limit_sec{0.0};      // 0 = unlimited
  // Added to every objective coefficient. A route is only guaranteed
  // fare-optimal up to hop_penalty * (its legs - legs of the cheapest route);
  // 0 gives exact fares but may admit zero-fare cycles.
  double hop_penalty{1e-7};
  std::optional<int> max_stops;    // legs <= max_stops + 1
  bool verbose{false};
};

// Keys: mode ("binary"|"continuous"), tolerance, time_limit_sec, hop_penalty,
// max_stops (int or null), verbose. Missing keys keep their defaults.
OptimizerConfig config_from_json(const nlohmann::json& j,
                                 const OptimizerConfig& base = OptimizerConfig());

OptimizerConfig load_config_json(const std::string& path);

VariableMode parse_mode(const std::string& s);

} // namespace fare

#endif // FARE_CONFIG_HPP
