// src/optimizer.hpp
#pragma once
#ifndef FARE_OPTIMIZER_HPP
#define FARE_OPTIMIZER_HPP

#include <vector>

#include "config.hpp"
#include "flight_graph.hpp"
#include "models.hpp"
#include "solver_adapter.hpp"

namespace fare {

// Builder -> Formulator -> SolverAdapter -> Decoder, synchronously.
// Holds no per-request state; the solver is passed in, not owned.
class FareOptimizer {
public:
  FareOptimizer(const SolverAdapter& solver, const OptimizerConfig& cfg = OptimizerConfig())
    : solver_(solver), cfg_(cfg) {}
  FareOptimizer(SolverAdapter&&, const OptimizerConfig& = OptimizerConfig()) = delete;

  Itinerary optimize(const FlightGraph& graph, const City& source, const City& destination) const;

  Itinerary optimize(const std::vector<FlightRecord>& records,
                     const City& source, const City& destination) const;

  const OptimizerConfig& config() const { return cfg_; }

private:
  const SolverAdapter& solver_;
  OptimizerConfig cfg_;
};

} // namespace fare

#endif // FARE_OPTIMIZER_HPP
