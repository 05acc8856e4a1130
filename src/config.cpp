// src/config.cpp
#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <fstream>
#include <sstream>

#include "errors.hpp"

namespace fare {

namespace {

std::string read_all(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw ConfigError("Cannot open: " + path);
  std::ostringstream ss; ss << ifs.rdbuf(); return ss.str();
}

template <typename T>
T get_as(const nlohmann::json& j, const char* key) {
  try {
    return j.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("config key '") + key + "': " + e.what());
  }
}

// Integral and within [0, INT_MAX]; floats are rejected, not truncated.
int stop_limit(const nlohmann::json& v) {
  if (!v.is_number_integer()) throw ConfigError("max_stops must be an integer or null");
  if (v.is_number_unsigned()) {
    if (v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
      throw ConfigError("max_stops out of range");
  } else {
    const std::int64_t k = v.get<std::int64_t>();
    if (k < 0) throw ConfigError("max_stops must be >= 0");
    if (k > std::numeric_limits<int>::max()) throw ConfigError("max_stops out of range");
  }
  return static_cast<int>(v.get<std::int64_t>());
}

} // namespace

VariableMode parse_mode(const std::string& s) {
  std::string m = s;
  std::transform(m.begin(), m.end(), m.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (m == "binary" || m == "milp")     return VariableMode::Binary;
  if (m == "continuous" || m == "lp")   return VariableMode::Continuous;
  throw ConfigError("unknown variable mode: '" + s + "'");
}

OptimizerConfig config_from_json(const nlohmann::json& j, const OptimizerConfig& base) {
  if (!j.is_object()) throw ConfigError("config must be a JSON object");
  OptimizerConfig cfg = base;

  if (j.contains("mode"))           cfg.mode = parse_mode(get_as<std::string>(j, "mode"));
  if (j.contains("tolerance"))      cfg.tolerance = get_as<double>(j, "tolerance");
  if (j.contains("time_limit_sec")) cfg.time_limit_sec = get_as<double>(j, "time_limit_sec");
  if (j.contains("hop_penalty"))    cfg.hop_penalty = get_as<double>(j, "hop_penalty");
  if (j.contains("verbose"))        cfg.verbose = get_as<bool>(j, "verbose");
  if (j.contains("max_stops")) {
    if (j.at("max_stops").is_null()) cfg.max_stops.reset();
    else                             cfg.max_stops = stop_limit(j.at("max_stops"));
  }

  if (!(cfg.tolerance > 0.0 && cfg.tolerance < 0.5))
    throw ConfigError("tolerance must be in (0, 0.5)");
  if (cfg.time_limit_sec < 0.0) throw ConfigError("time_limit_sec must be >= 0");
  if (cfg.hop_penalty < 0.0)    throw ConfigError("hop_penalty must be >= 0");
  if (cfg.max_stops && *cfg.max_stops < 0) throw ConfigError("max_stops must be >= 0");
  return cfg;
}

OptimizerConfig load_config_json(const std::string& path) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(read_all(path));
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("cannot parse " + path + ": " + e.what());
  }
  return config_from_json(j);
}

} // namespace fare
