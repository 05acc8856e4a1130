// src/flight_filter.hpp
#pragma once
#ifndef FARE_FLIGHT_FILTER_HPP
#define FARE_FLIGHT_FILTER_HPP

#include <optional>
#include <string>
#include <vector>

#include "flight_graph.hpp"
#include "models.hpp"

namespace fare {

// Pre-build record selection. Unset criteria are ignored; a record missing an
// attribute that a set criterion constrains does not match.
struct FlightFilter {
  std::optional<std::string> seat_class;
  std::optional<std::string> departure_time;
  std::optional<std::string> arrival_time;
  std::optional<double>      max_duration_hours;
  std::optional<double>      max_fare;

  bool matches(const FlightRecord& r) const;
  std::vector<FlightRecord> apply(const std::vector<FlightRecord>& records) const;
  bool empty() const;
};

// Validates every record (filtered out or not), then builds the graph from the
// matching ones. Cities of dropped flights stay as isolated nodes.
FlightGraph build_filtered(const std::vector<FlightRecord>& records, const FlightFilter& filter,
                           const std::vector<City>& extra_cities = {});

} // namespace fare

#endif // FARE_FLIGHT_FILTER_HPP
