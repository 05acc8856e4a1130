// src/cbc_solver.hpp
#pragma once
#ifndef FARE_CBC_SOLVER_HPP
#define FARE_CBC_SOLVER_HPP

#include "config.hpp"
#include "solver_adapter.hpp"

namespace fare {

// COIN-OR backend: Clp simplex for continuous models, Cbc branch-and-bound
// when any column is integer.
class CbcSolver : public SolverAdapter {
public:
  struct Options {
    double time_limit_sec{0.0};        // 0 = unlimited
    double integer_tolerance{1e-6};
    int log_level{0};
  };

  CbcSolver() = default;
  explicit CbcSolver(Options opt) : opt_(opt) {}

  // time limit and log level taken from the optimizer settings
  static Options options_from(const OptimizerConfig& cfg) {
    Options o;
    o.time_limit_sec = cfg.time_limit_sec;
    o.integer_tolerance = cfg.tolerance;
    o.log_level = cfg.verbose ? 1 : 0;
    return o;
  }

  SolverResult solve(const Formulation& model) const override;

  const Options& options() const { return opt_; }

private:
  SolverResult solve_trivial_(const Formulation& model) const;

  Options opt_{};
};

} // namespace fare

#endif // FARE_CBC_SOLVER_HPP
