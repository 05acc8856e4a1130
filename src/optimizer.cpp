// src/optimizer.cpp
#include "optimizer.hpp"

#include <chrono>
#include <iostream>

#include "formulation.hpp"
#include "path_decoder.hpp"

namespace fare {

Itinerary FareOptimizer::optimize(const FlightGraph& graph, const City& source,
                                  const City& destination) const {
  using namespace std::chrono;
  const auto t0 = steady_clock::now();

  Formulator formulator(graph, cfg_);
  const Formulation model = formulator.formulate(source, destination);

  const SolverResult res = solver_.solve(model);
  if (cfg_.verbose) {
    const auto ms = duration_cast<milliseconds>(steady_clock::now() - t0).count();
    std::cerr << "[optimizer] solve " << to_string(res.status) << " (" << res.status_text
              << ") in " << ms << " ms\n";
  }

  PathDecoder decoder(graph, cfg_.tolerance, cfg_.verbose);
  return decoder.decode(source, destination, res, model.mode);
}

Itinerary FareOptimizer::optimize(const std::vector<FlightRecord>& records,
                                  const City& source, const City& destination) const {
  const FlightGraph graph = FlightGraph::build(records);
  if (cfg_.verbose) {
    std::cerr << "[builder] " << graph.num_flights() << " flights, "
              << graph.num_cities() << " cities\n";
  }
  return optimize(graph, source, destination);
}

} // namespace fare
