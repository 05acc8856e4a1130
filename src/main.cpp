// src/main.cpp
// Usage: fare_optimizer --flights <csv|json> --from <city> --to <city>
//          [--config <json>] [--mode binary|continuous] [--max-stops N]
//          [--max-fare X] [--class C] [--time-limit S] [--verbose]
#include <cmath>
#include <cstdlib>
#include <limits>
#include <iomanip>
#include <iostream>
#include <string>

#include "cbc_solver.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "flight_filter.hpp"
#include "flight_graph.hpp"
#include "flight_loader.hpp"
#include "optimizer.hpp"

namespace {

void usage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " --flights <csv|json> --from <city> --to <city> [--config <json>]"
               " [--mode binary|continuous] [--max-stops N] [--max-fare X]"
               " [--class C] [--time-limit S] [--verbose]\n";
}

double to_double(const std::string& flag, const std::string& v) {
  try {
    std::size_t pos = 0;
    double d = std::stod(v, &pos);
    if (pos == v.size()) return d;
  } catch (const std::exception&) {}
  throw fare::ConfigError(flag + " expects a number, got '" + v + "'");
}

} // namespace

int main(int argc, char** argv) {
  std::string flights_path, config_path, from, to;
  std::string mode, max_stops, max_fare, seat_class, time_limit;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto next = [&](std::string& dst) {
      if (i + 1 >= argc) { usage(argv[0]); std::exit(2); }
      dst = argv[++i];
    };
    if      (a == "--flights")    next(flights_path);
    else if (a == "--config")     next(config_path);
    else if (a == "--from")       next(from);
    else if (a == "--to")         next(to);
    else if (a == "--mode")       next(mode);
    else if (a == "--max-stops")  next(max_stops);
    else if (a == "--max-fare")   next(max_fare);
    else if (a == "--class")      next(seat_class);
    else if (a == "--time-limit") next(time_limit);
    else if (a == "--verbose" || a == "-v") verbose = true;
    else if (a == "-h" || a == "--help") { usage(argv[0]); return 0; }
    else { std::cerr << "[fatal] unknown argument " << a << "\n"; usage(argv[0]); return 2; }
  }
  if (flights_path.empty() || from.empty() || to.empty()) { usage(argv[0]); return 2; }

  try {
    fare::OptimizerConfig cfg;
    if (!config_path.empty()) cfg = fare::load_config_json(config_path);
    if (!mode.empty())       cfg.mode = fare::parse_mode(mode);
    if (!time_limit.empty()) cfg.time_limit_sec = to_double("--time-limit", time_limit);
    if (!max_stops.empty()) {
      const double k = to_double("--max-stops", max_stops);
      if (!(k >= 0.0 && k <= static_cast<double>(std::numeric_limits<int>::max())) ||
          k != std::floor(k))
        throw fare::ConfigError("--max-stops expects a non-negative integer");
      cfg.max_stops = static_cast<int>(k);
    }
    if (verbose)             cfg.verbose = true;

    fare::FlightFilter filter;
    if (!max_fare.empty())   filter.max_fare = to_double("--max-fare", max_fare);
    if (!seat_class.empty()) filter.seat_class = seat_class;

    const fare::FlightData data = fare::load_flights(flights_path);
    const fare::FlightGraph graph = fare::build_filtered(data.records, filter, data.cities);
    if (cfg.verbose && !filter.empty())
      std::cerr << "[filter] kept " << graph.num_flights() << " of " << data.records.size()
                << " flights\n";
    fare::CbcSolver solver(fare::CbcSolver::options_from(cfg));
    fare::FareOptimizer optimizer(solver, cfg);
    const fare::Itinerary it = optimizer.optimize(graph, from, to);

    std::cout << std::fixed << std::setprecision(2);
    for (const auto& leg : it.legs) {
      std::cout << leg.id << "  " << leg.origin << " -> " << leg.destination
                << "  " << leg.fare << "\n";
    }
    std::cout << "total " << it.total_fare << " (" << it.legs.size() << " legs)\n";
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
