// src/flight_graph.hpp
#pragma once
#ifndef FARE_FLIGHT_GRAPH_HPP
#define FARE_FLIGHT_GRAPH_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

#include "models.hpp"

namespace fare {

// Directed multigraph: parallel flights between one city pair stay distinct.
// Immutable once built; safe to share read-only between concurrent requests.
class FlightGraph {
public:
  // `extra_cities` declares nodes that may have no incident flight at all.
  static FlightGraph build(const std::vector<FlightRecord>& records,
                           const std::vector<City>& extra_cities = {});

  const std::vector<Flight>& flights() const { return flights_; }
  const std::set<City>& cities() const { return cities_; }

  bool has_city(const City& c) const { return cities_.count(c) != 0; }
  std::size_t num_flights() const { return flights_.size(); }
  std::size_t num_cities() const { return cities_.size(); }

  // Flight indices leaving / entering `c` (empty for unknown cities).
  const std::vector<int>& outgoing(const City& c) const;
  const std::vector<int>& incoming(const City& c) const;

  // nullptr when no flight carries this id.
  const Flight* find(const std::string& flight_id) const;

private:
  FlightGraph() = default;

  std::vector<Flight> flights_;
  std::set<City> cities_;
  std::map<City, std::vector<int>> out_;
  std::map<City, std::vector<int>> in_;
  std::map<std::string, int> by_id_;
};

} // namespace fare

#endif // FARE_FLIGHT_GRAPH_HPP
