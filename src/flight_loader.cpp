// src/flight_loader.cpp
#include "flight_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>

#include "errors.hpp"

namespace fare {

namespace {

std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> split_csv(const std::string& line) {
  std::vector<std::string> cols;
  std::stringstream ss(line); std::string tok;
  while (std::getline(ss, tok, ',')) cols.push_back(trim(tok));
  if (!line.empty() && line.back() == ',') cols.push_back("");
  return cols;
}

// Whole-string numeric parse; false on trailing garbage.
bool parse_number(const std::string& s, double* out) {
  if (s.empty()) return false;
  try {
    std::size_t pos = 0;
    *out = std::stod(s, &pos);
    return pos == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

std::string read_all(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw ConfigError("Cannot open: " + path);
  std::ostringstream ss; ss << ifs.rdbuf(); return ss.str();
}

std::optional<std::string> opt_label(const nlohmann::json& o, const char* key) {
  if (!o.contains(key) || o.at(key).is_null()) return std::nullopt;
  if (!o.at(key).is_string()) throw ConfigError(std::string("'") + key + "' must be a string");
  return o.at(key).get<std::string>();
}

std::string id_string(const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_number_integer()) return std::to_string(v.get<long long>());
  throw ConfigError("'flight_id' must be a string or an integer");
}

} // namespace

FlightData read_flights_csv(std::istream& in) {
  FlightData data;
  std::string line;
  if (!std::getline(in, line)) return data;

  std::map<std::string, std::size_t> col;
  const auto header = split_csv(line);
  for (std::size_t i = 0; i < header.size(); ++i) col[lower(header[i])] = i;
  for (const char* need : {"flight_id", "origin", "destination", "fare"}) {
    if (!col.count(need)) throw ConfigError(std::string("CSV header lacks column '") + need + "'");
  }

  auto cell = [&col](const std::vector<std::string>& cols, const char* name) -> std::optional<std::string> {
    auto it = col.find(name);
    if (it == col.end() || it->second >= cols.size() || cols[it->second].empty()) return std::nullopt;
    return cols[it->second];
  };

  std::size_t row = 0;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;
    const auto cols = split_csv(line);

    FlightRecord r;
    r.flight_id   = cell(cols, "flight_id").value_or("");
    r.origin      = cell(cols, "origin").value_or("");
    r.destination = cell(cols, "destination").value_or("");
    r.seat_class     = cell(cols, "seat_class");
    r.departure_time = cell(cols, "departure_time");
    r.arrival_time   = cell(cols, "arrival_time");

    const auto fare = cell(cols, "fare");
    if (!fare || !parse_number(*fare, &r.fare))
      throw InvalidRecordError(r, row, "fare is not a number: '" + fare.value_or("") + "'");
    if (auto dur = cell(cols, "duration_hours")) {
      double h = 0.0;
      if (!parse_number(*dur, &h))
        throw InvalidRecordError(r, row, "duration is not a number: '" + *dur + "'");
      r.duration_hours = h;
    }
    data.records.push_back(std::move(r));
    ++row;
  }
  return data;
}

FlightData load_flights_csv(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw ConfigError("Cannot open: " + path);
  return read_flights_csv(ifs);
}

FlightData flights_from_json(const nlohmann::json& j) {
  FlightData data;
  const nlohmann::json* flights = &j;
  if (j.is_object()) {
    if (!j.contains("flights")) throw ConfigError("JSON object lacks 'flights'");
    flights = &j.at("flights");
    if (j.contains("cities")) {
      for (const auto& c : j.at("cities")) {
        if (!c.is_string()) throw ConfigError("'cities' entries must be strings");
        data.cities.push_back(c.get<std::string>());
      }
    }
  }
  if (!flights->is_array()) throw ConfigError("'flights' must be an array");

  std::size_t row = 0;
  for (const auto& o : *flights) {
    if (!o.is_object()) throw ConfigError("flight entries must be objects");
    FlightRecord r;
    try {
      r.flight_id   = id_string(o.at("flight_id"));
      r.origin      = o.at("origin").get<std::string>();
      r.destination = o.at("destination").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError("flight #" + std::to_string(row) + ": " + e.what());
    }
    r.seat_class     = opt_label(o, "seat_class");
    r.departure_time = opt_label(o, "departure_time");
    r.arrival_time   = opt_label(o, "arrival_time");

    if (!o.contains("fare") || !o.at("fare").is_number())
      throw InvalidRecordError(r, row, "fare is not a number");
    r.fare = o.at("fare").get<double>();
    if (o.contains("duration_hours") && !o.at("duration_hours").is_null()) {
      if (!o.at("duration_hours").is_number())
        throw InvalidRecordError(r, row, "duration is not a number");
      r.duration_hours = o.at("duration_hours").get<double>();
    }
    data.records.push_back(std::move(r));
    ++row;
  }
  return data;
}

FlightData load_flights_json(const std::string& path) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(read_all(path));
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("cannot parse " + path + ": " + e.what());
  }
  return flights_from_json(j);
}

FlightData load_flights(const std::string& path) {
  const auto dot = path.find_last_of('.');
  if (dot != std::string::npos && lower(path.substr(dot)) == ".json") return load_flights_json(path);
  return load_flights_csv(path);
}

} // namespace fare
