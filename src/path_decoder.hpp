// src/path_decoder.hpp
#pragma once
#ifndef FARE_PATH_DECODER_HPP
#define FARE_PATH_DECODER_HPP

#include <set>
#include <vector>

#include "flight_graph.hpp"
#include "models.hpp"

namespace fare {

// Turns a solver assignment back into one simple source -> destination path.
class PathDecoder {
public:
  explicit PathDecoder(const FlightGraph& graph, double tolerance = 1e-6, bool verbose = false)
    : G_(graph), eps_(tolerance), verbose_(verbose) {}

  // Throws InfeasibleRouteError (INFEASIBLE), SolverError (UNBOUNDED,
  // SOLVER_ERROR) or DegenerateSolutionError. `mode` is the formulation's.
  Itinerary decode(const City& source, const City& destination,
                   const SolverResult& result, VariableMode mode) const;

private:
  std::vector<bool> select_flights_(const City& source, const City& destination,
                                    const SolverResult& result, VariableMode mode) const;
  void prune_detached_cycles_(const City& source, const City& destination,
                              const std::vector<bool>& selected,
                              const std::vector<bool>& on_path,
                              const std::set<City>& path_cities) const;

  const FlightGraph& G_;
  double eps_;
  bool verbose_;
};

} // namespace fare

#endif // FARE_PATH_DECODER_HPP
