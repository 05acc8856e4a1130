// src/formulation.cpp
#include "formulation.hpp"

#include <iostream>

#include "errors.hpp"

namespace fare {

Formulator::Formulator(const FlightGraph& graph, const OptimizerConfig& cfg)
  : G_(graph), cfg_(cfg), mode_(cfg.mode)
{
  // A stop limit row breaks integrality of the flow polytope.
  if (cfg_.max_stops && mode_ == VariableMode::Continuous) {
    std::cerr << "[formulator] max_stops set; switching continuous -> binary variables\n";
    mode_ = VariableMode::Binary;
  }
}

Formulation Formulator::formulate(const City& source, const City& destination) const {
  if (!G_.has_city(source))      throw UnknownCityError(source);
  if (!G_.has_city(destination)) throw UnknownCityError(destination);

  Formulation m;
  m.mode = mode_;
  m.fare_offset = cfg_.hop_penalty;

  const int ncols = static_cast<int>(G_.num_flights());
  m.objective.assign(ncols, 0.0);
  m.col_lower.assign(ncols, 0.0);
  m.col_upper.assign(ncols, 1.0);
  m.is_integer.assign(ncols, mode_ == VariableMode::Binary);

  // min Σ (fare_f + δ) x_f
  for (const auto& f : G_.flights()) m.objective[f.index] = f.fare + m.fare_offset;

  add_conservation_rows_(m, source, destination);
  if (cfg_.max_stops) add_stop_limit_row_(m);

  if (cfg_.verbose) {
    std::cerr << "[formulator] " << source << " -> " << destination << ": "
              << m.num_cols() << " vars, " << m.num_rows() << " rows, mode="
              << to_string(m.mode) << "\n";
  }
  return m;
}

void Formulator::add_conservation_rows_(Formulation& m, const City& source,
                                        const City& destination) const {
  // inflow - outflow = b(c); b(src) = -1, b(dst) = +1, 0 elsewhere.
  // src == dst folds to 0 everywhere, the zero flow is then the optimum.
  for (const auto& c : G_.cities()) {
    double b = 0.0;
    if (c == source)      b -= 1.0;
    if (c == destination) b += 1.0;

    ConstraintRow row;
    row.name = "flow_" + c;
    for (int j : G_.incoming(c)) { row.cols.push_back(j); row.coefs.push_back(1.0); }
    for (int j : G_.outgoing(c)) { row.cols.push_back(j); row.coefs.push_back(-1.0); }
    row.lower = b;
    row.upper = b;
    m.rows.push_back(std::move(row));
    m.row_city.push_back(c);
  }
}

void Formulator::add_stop_limit_row_(Formulation& m) const {
  // Σ x_f <= max_stops + 1
  ConstraintRow row;
  row.name = "max_legs";
  for (int j = 0; j < m.num_cols(); ++j) { row.cols.push_back(j); row.coefs.push_back(1.0); }
  row.lower = -kInf;
  row.upper = static_cast<double>(*cfg_.max_stops) + 1.0;
  m.rows.push_back(std::move(row));
}

} // namespace fare
