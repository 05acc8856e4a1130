// src/flight_filter.cpp
#include "flight_filter.hpp"

namespace fare {

namespace {

bool label_matches(const std::optional<std::string>& want,
                   const std::optional<std::string>& have) {
  if (!want) return true;
  return have && *have == *want;
}

} // namespace

bool FlightFilter::matches(const FlightRecord& r) const {
  if (!label_matches(seat_class, r.seat_class)) return false;
  if (!label_matches(departure_time, r.departure_time)) return false;
  if (!label_matches(arrival_time, r.arrival_time)) return false;
  if (max_duration_hours) {
    if (!r.duration_hours || *r.duration_hours > *max_duration_hours) return false;
  }
  if (max_fare && r.fare > *max_fare) return false;
  return true;
}

std::vector<FlightRecord> FlightFilter::apply(const std::vector<FlightRecord>& records) const {
  std::vector<FlightRecord> kept;
  kept.reserve(records.size());
  for (const auto& r : records)
    if (matches(r)) kept.push_back(r);
  return kept;
}

bool FlightFilter::empty() const {
  return !seat_class && !departure_time && !arrival_time && !max_duration_hours && !max_fare;
}

FlightGraph build_filtered(const std::vector<FlightRecord>& records, const FlightFilter& filter,
                           const std::vector<City>& extra_cities) {
  const FlightGraph full = FlightGraph::build(records, extra_cities);
  if (filter.empty()) return full;
  const std::vector<City> cities(full.cities().begin(), full.cities().end());
  return FlightGraph::build(filter.apply(records), cities);
}

} // namespace fare
