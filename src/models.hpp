// src/models.hpp
#pragma once
#ifndef FARE_MODELS_HPP
#define FARE_MODELS_HPP

#include <optional>
#include <string>
#include <vector>

namespace fare {

using City = std::string;

// Raw input row, as handed over by a loader. Attributes past `fare` are optional.
struct FlightRecord {
  std::string flight_id;
  City origin;
  City destination;
  double fare{0.0};

  std::optional<std::string> seat_class;      // "Economy" / "Business"
  std::optional<std::string> departure_time;  // label, e.g. "Morning"
  std::optional<std::string> arrival_time;
  std::optional<double>      duration_hours;
};

// A directed edge of the flight graph. `index` is its column in the formulation.
struct Flight {
  int index{-1};
  std::string id;
  City origin;
  City destination;
  double fare{0.0};

  std::optional<std::string> seat_class;
  std::optional<std::string> departure_time;
  std::optional<std::string> arrival_time;
  std::optional<double>      duration_hours;
};

struct Itinerary {
  std::vector<Flight> legs;
  double total_fare{0.0};

  bool empty() const { return legs.empty(); }
  std::vector<std::string> flight_ids() const {
    std::vector<std::string> ids;
    ids.reserve(legs.size());
    for (const auto& f : legs) ids.push_back(f.id);
    return ids;
  }
};

// Continuous = LP relaxation (0 <= x <= 1), Binary = MILP (x in {0,1}).
enum class VariableMode { Continuous, Binary };

enum class SolveStatus { Optimal, Infeasible, Unbounded, SolverError };

struct SolverResult {
  SolveStatus status{SolveStatus::SolverError};
  std::vector<double> values;   // one per decision variable, filled when Optimal
  double objective{0.0};
  std::string status_text;
};

inline const char* to_string(VariableMode m) {
  return m == VariableMode::Binary ? "binary" : "continuous";
}

inline const char* to_string(SolveStatus s) {
  switch (s) {
    case SolveStatus::Optimal:     return "OPTIMAL";
    case SolveStatus::Infeasible:  return "INFEASIBLE";
    case SolveStatus::Unbounded:   return "UNBOUNDED";
    case SolveStatus::SolverError: return "SOLVER_ERROR";
  }
  return "UNKNOWN";
}

} // namespace fare

#endif // FARE_MODELS_HPP
