// src/formulation.hpp
#pragma once
#ifndef FARE_FORMULATION_HPP
#define FARE_FORMULATION_HPP

#include <limits>
#include <string>
#include <vector>

#include "config.hpp"
#include "flight_graph.hpp"
#include "models.hpp"

namespace fare {

constexpr double kInf = std::numeric_limits<double>::infinity();

// One sparse constraint row: lower <= Σ coef_k * x[col_k] <= upper.
struct ConstraintRow {
  std::string name;
  std::vector<int> cols;
  std::vector<double> coefs;
  double lower{0.0};
  double upper{0.0};
};

// Solver-neutral model. Column j is the decision variable of flight j.
struct Formulation {
  VariableMode mode{VariableMode::Binary};
  std::vector<double> objective;      // fare(f) + fare_offset
  std::vector<double> col_lower;
  std::vector<double> col_upper;
  std::vector<bool>   is_integer;
  std::vector<ConstraintRow> rows;    // conservation rows first (one per city), then extras
  std::vector<City> row_city;         // city of each conservation row
  double fare_offset{0.0};            // hop penalty folded into every coefficient

  int num_cols() const { return static_cast<int>(objective.size()); }
  int num_rows() const { return static_cast<int>(rows.size()); }
};

// Builds the single-unit min-cost-flow model for one (source, destination).
class Formulator {
public:
  Formulator(const FlightGraph& graph, const OptimizerConfig& cfg);

  // Throws UnknownCityError if an endpoint is not a node of the graph.
  Formulation formulate(const City& source, const City& destination) const;

  // Mode actually used: Binary whenever a stop limit is set.
  VariableMode mode() const { return mode_; }

private:
  void add_conservation_rows_(Formulation& m, const City& source, const City& destination) const;
  void add_stop_limit_row_(Formulation& m) const;

  const FlightGraph& G_;
  OptimizerConfig cfg_;
  VariableMode mode_;
};

} // namespace fare

#endif // FARE_FORMULATION_HPP
