// src/path_decoder.cpp
#include "path_decoder.hpp"

#include <cmath>
#include <iostream>
#include <map>
#include <sstream>

#include "errors.hpp"

namespace fare {

Itinerary PathDecoder::decode(const City& source, const City& destination,
                              const SolverResult& result, VariableMode mode) const {
  switch (result.status) {
    case SolveStatus::Optimal:
      break;
    case SolveStatus::Infeasible:
      throw InfeasibleRouteError(source, destination, result.status);
    case SolveStatus::Unbounded:
    case SolveStatus::SolverError:
      throw SolverError(result.status, result.status_text);
  }

  const std::vector<bool> selected = select_flights_(source, destination, result, mode);

  // Follow the unique selected flight out of each city.
  Itinerary it;
  std::vector<bool> on_path(G_.num_flights(), false);
  std::set<City> visited{source};
  City cur = source;
  while (cur != destination) {
    int next = -1;
    int n_out = 0;
    for (int j : G_.outgoing(cur)) {
      if (!selected[j]) continue;
      ++n_out;
      next = j;
    }
    if (n_out == 0)
      throw DegenerateSolutionError(source, destination,
                                    "path breaks off at '" + cur + "' (no selected departure)");
    if (n_out > 1) {
      std::ostringstream ss;
      ss << n_out << " selected departures from '" << cur << "'";
      throw DegenerateSolutionError(source, destination, ss.str());
    }

    const Flight& f = G_.flights()[next];
    if (!visited.insert(f.destination).second)
      throw DegenerateSolutionError(source, destination,
                                    "cycle: '" + f.destination + "' revisited via " + f.id);
    on_path[next] = true;
    it.legs.push_back(f);
    it.total_fare += f.fare;
    cur = f.destination;
  }

  prune_detached_cycles_(source, destination, selected, on_path, visited);

  if (verbose_) {
    std::cerr << "[decoder] " << source << " -> " << destination << ": "
              << it.legs.size() << " legs, fare " << it.total_fare
              << " (objective " << result.objective << ")\n";
  }
  return it;
}

std::vector<bool> PathDecoder::select_flights_(const City& source, const City& destination,
                                               const SolverResult& result,
                                               VariableMode mode) const {
  const std::size_t n = G_.num_flights();
  if (result.values.size() != n) {
    std::ostringstream ss;
    ss << "assignment has " << result.values.size() << " values for " << n << " flights";
    throw DegenerateSolutionError(source, destination, ss.str());
  }

  std::vector<bool> selected(n, false);
  for (std::size_t j = 0; j < n; ++j) {
    const double v = result.values[j];
    if (!std::isfinite(v) || v < -eps_ || v > 1.0 + eps_) {
      std::ostringstream ss;
      ss << "value " << v << " of flight " << G_.flights()[j].id << " outside [0,1]";
      throw DegenerateSolutionError(source, destination, ss.str());
    }
    if (v <= eps_) continue;
    if (v >= 1.0 - eps_) { selected[j] = true; continue; }

    // Fractional residue
    std::ostringstream ss;
    ss << "fractional value " << v << " on flight " << G_.flights()[j].id;
    if (mode == VariableMode::Binary) ss << " (integrality violated by the solver)";
    else                              ss << " (LP relaxation returned a fractional vertex)";
    throw DegenerateSolutionError(source, destination, ss.str());
  }
  return selected;
}

// Selected flights off the path must form closed zero-fare cycles that touch
// no city of the path; those are dropped, anything else is rejected.
void PathDecoder::prune_detached_cycles_(const City& source, const City& destination,
                                         const std::vector<bool>& selected,
                                         const std::vector<bool>& on_path,
                                         const std::set<City>& path_cities) const {
  std::map<City, int> balance;
  double fare = 0.0;
  int count = 0;
  for (const auto& f : G_.flights()) {
    if (!selected[f.index] || on_path[f.index]) continue;
    if (path_cities.count(f.origin) || path_cities.count(f.destination))
      throw DegenerateSolutionError(source, destination,
                                    "selected flight " + f.id + " touches the path off-route");
    balance[f.origin] -= 1;
    balance[f.destination] += 1;
    fare += f.fare;
    ++count;
  }
  if (count == 0) return;

  for (const auto& kv : balance) {
    if (kv.second != 0)
      throw DegenerateSolutionError(source, destination,
                                    "stray selected flights unbalanced at '" + kv.first + "'");
  }
  if (fare > eps_ * count) {
    std::ostringstream ss;
    ss << "detached cycle of " << count << " flights with positive fare " << fare;
    throw DegenerateSolutionError(source, destination, ss.str());
  }
  std::cerr << "[decoder] pruned " << count << " flights forming zero-fare cycles\n";
}

} // namespace fare
