// src/errors.hpp
#pragma once
#ifndef FARE_ERRORS_HPP
#define FARE_ERRORS_HPP

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

#include "models.hpp"

namespace fare {

class FareError : public std::runtime_error {
public:
  explicit FareError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed input record; never reaches the solver.
class InvalidRecordError : public FareError {
public:
  InvalidRecordError(const FlightRecord& rec, std::size_t index, const std::string& reason)
    : FareError(describe_(rec, index, reason)), record_(rec), index_(index), reason_(reason) {}

  const FlightRecord& record() const { return record_; }
  std::size_t index() const { return index_; }
  const std::string& reason() const { return reason_; }

private:
  static std::string describe_(const FlightRecord& r, std::size_t i, const std::string& why) {
    std::ostringstream ss;
    ss << "invalid flight record #" << i << " (id='" << r.flight_id << "', "
       << r.origin << "->" << r.destination << ", fare=" << r.fare << "): " << why;
    return ss.str();
  }

  FlightRecord record_;
  std::size_t index_;
  std::string reason_;
};

class UnknownCityError : public FareError {
public:
  explicit UnknownCityError(const City& city)
    : FareError("unknown city: '" + city + "'"), city_(city) {}
  const City& city() const { return city_; }
private:
  City city_;
};

class InfeasibleRouteError : public FareError {
public:
  InfeasibleRouteError(const City& src, const City& dst, SolveStatus status)
    : FareError("no route from '" + src + "' to '" + dst + "' (solver status "
                + to_string(status) + ")"),
      source_(src), destination_(dst), status_(status) {}

  const City& source() const { return source_; }
  const City& destination() const { return destination_; }
  SolveStatus status() const { return status_; }

private:
  City source_, destination_;
  SolveStatus status_;
};

// Solver returned a numerically valid assignment that is not one simple path.
class DegenerateSolutionError : public FareError {
public:
  DegenerateSolutionError(const City& src, const City& dst, const std::string& reason)
    : FareError("degenerate solution for '" + src + "' -> '" + dst + "': " + reason),
      source_(src), destination_(dst), reason_(reason) {}

  const City& source() const { return source_; }
  const City& destination() const { return destination_; }
  const std::string& reason() const { return reason_; }

private:
  City source_, destination_;
  std::string reason_;
};

// SOLVER_ERROR (including time limit) or UNBOUNDED.
class SolverError : public FareError {
public:
  SolverError(SolveStatus status, const std::string& detail)
    : FareError(std::string("solver failed with status ") + to_string(status)
                + (detail.empty() ? "" : ": " + detail)),
      status_(status) {}
  SolveStatus status() const { return status_; }
private:
  SolveStatus status_;
};

// Bad configuration or data file.
class ConfigError : public FareError {
public:
  explicit ConfigError(const std::string& what) : FareError(what) {}
};

} // namespace fare

#endif // FARE_ERRORS_HPP
