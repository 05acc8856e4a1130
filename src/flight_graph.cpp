// src/flight_graph.cpp
#include "flight_graph.hpp"

#include <cmath>
#include <utility>

#include "errors.hpp"

namespace fare {

namespace {
const std::vector<int> kNoFlights;
}

FlightGraph FlightGraph::build(const std::vector<FlightRecord>& records,
                               const std::vector<City>& extra_cities) {
  FlightGraph g;
  g.flights_.reserve(records.size());
  for (const auto& c : extra_cities) {
    if (c.empty()) throw ConfigError("empty city name");
    g.cities_.insert(c);
  }

  for (std::size_t i = 0; i < records.size(); ++i) {
    const FlightRecord& r = records[i];
    if (r.flight_id.empty())          throw InvalidRecordError(r, i, "empty flight id");
    if (r.origin.empty() || r.destination.empty())
      throw InvalidRecordError(r, i, "empty origin or destination");
    if (r.origin == r.destination)    throw InvalidRecordError(r, i, "origin equals destination");
    if (!std::isfinite(r.fare))       throw InvalidRecordError(r, i, "fare is not a number");
    if (r.fare < 0.0)                 throw InvalidRecordError(r, i, "negative fare");
    if (r.duration_hours && !(std::isfinite(*r.duration_hours) && *r.duration_hours >= 0.0))
      throw InvalidRecordError(r, i, "invalid duration");

    const int idx = static_cast<int>(g.flights_.size());
    if (!g.by_id_.emplace(r.flight_id, idx).second)
      throw InvalidRecordError(r, i, "duplicate flight id");

    Flight f;
    f.index = idx;
    f.id = r.flight_id;
    f.origin = r.origin;
    f.destination = r.destination;
    f.fare = r.fare;
    f.seat_class = r.seat_class;
    f.departure_time = r.departure_time;
    f.arrival_time = r.arrival_time;
    f.duration_hours = r.duration_hours;

    g.cities_.insert(f.origin);
    g.cities_.insert(f.destination);
    g.out_[f.origin].push_back(idx);
    g.in_[f.destination].push_back(idx);
    g.flights_.push_back(std::move(f));
  }
  return g;
}

const std::vector<int>& FlightGraph::outgoing(const City& c) const {
  auto it = out_.find(c);
  return it == out_.end() ? kNoFlights : it->second;
}

const std::vector<int>& FlightGraph::incoming(const City& c) const {
  auto it = in_.find(c);
  return it == in_.end() ? kNoFlights : it->second;
}

const Flight* FlightGraph::find(const std::string& flight_id) const {
  auto it = by_id_.find(flight_id);
  return it == by_id_.end() ? nullptr : &flights_[it->second];
}

} // namespace fare
