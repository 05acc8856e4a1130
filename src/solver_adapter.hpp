// src/solver_adapter.hpp
#pragma once
#ifndef FARE_SOLVER_ADAPTER_HPP
#define FARE_SOLVER_ADAPTER_HPP

#include "formulation.hpp"
#include "models.hpp"

namespace fare {

// Boundary to an external LP/MILP engine. Implementations hold only settings
// fixed at construction, so one instance may serve concurrent solves.
class SolverAdapter {
public:
  virtual ~SolverAdapter() {}

  // Single blocking call. Never throws for solver-side failures: those come
  // back as SolveStatus::SolverError with status_text set.
  virtual SolverResult solve(const Formulation& model) const = 0;
};

} // namespace fare

#endif // FARE_SOLVER_ADAPTER_HPP
