// src/flight_loader.hpp
#pragma once
#ifndef FARE_FLIGHT_LOADER_HPP
#define FARE_FLIGHT_LOADER_HPP

#include <istream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "models.hpp"

namespace fare {

struct FlightData {
  std::vector<FlightRecord> records;
  std::vector<City> cities;   // declared nodes, may lack flights
};

// CSV header: flight_id,origin,destination,fare[,seat_class,departure_time,arrival_time,duration_hours]
// Column order follows the header; names are matched case-insensitively.
FlightData read_flights_csv(std::istream& in);
FlightData load_flights_csv(const std::string& path);

// Either an array of flight objects or {"cities": [...], "flights": [...]}.
FlightData flights_from_json(const nlohmann::json& j);
FlightData load_flights_json(const std::string& path);

// Dispatch on extension (.json, otherwise CSV).
FlightData load_flights(const std::string& path);

} // namespace fare

#endif // FARE_FLIGHT_LOADER_HPP
