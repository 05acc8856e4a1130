#include "gtest/gtest.h"

#include "errors.hpp"
#include "path_decoder.hpp"

using namespace fare;

namespace {

FlightRecord rec(const std::string& id, const std::string& o, const std::string& d, double fare) {
  FlightRecord r; r.flight_id = id; r.origin = o; r.destination = d; r.fare = fare;
  return r;
}

SolverResult optimal(std::vector<double> values, double obj = 0.0) {
  SolverResult r;
  r.status = SolveStatus::Optimal;
  r.values = std::move(values);
  r.objective = obj;
  r.status_text = "optimal";
  return r;
}

// 0:AB 1:BD 2:AC 3:CD 4:EF 5:FE 6:BC
FlightGraph graph() {
  return FlightGraph::build({rec("AB", "A", "B", 100), rec("BD", "B", "D", 50),
                             rec("AC", "A", "C", 40), rec("CD", "C", "D", 40),
                             rec("EF", "E", "F", 0), rec("FE", "F", "E", 0),
                             rec("BC", "B", "C", 5)});
}

} // namespace

TEST(PathDecoder, FollowsSelectedFlights) {
  auto g = graph();
  PathDecoder dec(g);
  auto it = dec.decode("A", "D", optimal({0, 0, 1, 1, 0, 0, 0}, 80), VariableMode::Binary);
  ASSERT_EQ(it.legs.size(), 2u);
  EXPECT_EQ(it.legs[0].id, "AC");
  EXPECT_EQ(it.legs[1].id, "CD");
  EXPECT_DOUBLE_EQ(it.total_fare, 80.0);
  EXPECT_EQ(it.flight_ids(), (std::vector<std::string>{"AC", "CD"}));
}

TEST(PathDecoder, AbsorbsSolverNoise) {
  auto g = graph();
  PathDecoder dec(g, 1e-6);
  auto it = dec.decode("A", "D", optimal({1e-9, -1e-9, 1.0 - 1e-8, 1.0 + 1e-8, 0, 0, 0}),
                       VariableMode::Continuous);
  ASSERT_EQ(it.legs.size(), 2u);
  EXPECT_EQ(it.legs[0].origin, "A");
  EXPECT_EQ(it.legs[1].destination, "D");
}

TEST(PathDecoder, StatusMapping) {
  auto g = graph();
  PathDecoder dec(g);
  SolverResult r;
  r.status = SolveStatus::Infeasible;
  EXPECT_THROW(dec.decode("A", "D", r, VariableMode::Binary), InfeasibleRouteError);
  r.status = SolveStatus::SolverError;
  r.status_text = "time limit reached";
  EXPECT_THROW(dec.decode("A", "D", r, VariableMode::Binary), SolverError);
  r.status = SolveStatus::Unbounded;
  try {
    dec.decode("A", "D", r, VariableMode::Binary);
    FAIL() << "expected SolverError";
  } catch (const SolverError& e) {
    EXPECT_EQ(e.status(), SolveStatus::Unbounded);
  }
}

TEST(PathDecoder, RejectsFractionalResidue) {
  auto g = graph();
  PathDecoder dec(g);
  // half a unit on each branch of the diamond
  auto r = optimal({0.5, 0.5, 0.5, 0.5, 0, 0, 0});
  EXPECT_THROW(dec.decode("A", "D", r, VariableMode::Continuous), DegenerateSolutionError);
  EXPECT_THROW(dec.decode("A", "D", r, VariableMode::Binary), DegenerateSolutionError);
}

TEST(PathDecoder, RejectsBrokenPath) {
  auto g = graph();
  PathDecoder dec(g);
  EXPECT_THROW(dec.decode("A", "D", optimal({0, 0, 1, 0, 0, 0, 0}), VariableMode::Binary),
               DegenerateSolutionError);
}

TEST(PathDecoder, RejectsAmbiguousBranch) {
  auto g = graph();
  PathDecoder dec(g);
  EXPECT_THROW(dec.decode("A", "D", optimal({1, 1, 1, 1, 0, 0, 0}), VariableMode::Binary),
               DegenerateSolutionError);
}

TEST(PathDecoder, RejectsWrongLengthOrOutOfRange) {
  auto g = graph();
  PathDecoder dec(g);
  EXPECT_THROW(dec.decode("A", "D", optimal({0, 0, 1, 1}), VariableMode::Binary),
               DegenerateSolutionError);
  EXPECT_THROW(dec.decode("A", "D", optimal({0, 0, 2, 1, 0, 0, 0}), VariableMode::Binary),
               DegenerateSolutionError);
}

TEST(PathDecoder, PrunesDetachedZeroFareCycle) {
  auto g = graph();
  PathDecoder dec(g);
  auto it = dec.decode("A", "D", optimal({0, 0, 1, 1, 1, 1, 0}), VariableMode::Binary);
  ASSERT_EQ(it.legs.size(), 2u);
  EXPECT_DOUBLE_EQ(it.total_fare, 80.0);
}

TEST(PathDecoder, RejectsStraySelectedFlight) {
  auto g = graph();
  PathDecoder dec(g);
  // EF alone is not a closed cycle
  EXPECT_THROW(dec.decode("A", "D", optimal({0, 0, 1, 1, 1, 0, 0}), VariableMode::Binary),
               DegenerateSolutionError);
}

TEST(PathDecoder, RejectsSelectedFlightTouchingPath) {
  auto g = graph();
  PathDecoder dec(g);
  // BC ends on the path city C but is not part of the route A-C-D
  EXPECT_THROW(dec.decode("A", "D", optimal({0, 0, 1, 1, 0, 0, 1}), VariableMode::Binary),
               DegenerateSolutionError);
}

TEST(PathDecoder, RejectsRevisitedCity) {
  auto g = FlightGraph::build({rec("AB", "A", "B", 1), rec("BA", "B", "A", 1),
                               rec("BD", "B", "D", 1)});
  PathDecoder dec(g);
  // A -> B -> A revisits the source
  EXPECT_THROW(dec.decode("A", "D", optimal({1, 1, 0}), VariableMode::Binary),
               DegenerateSolutionError);
}

TEST(PathDecoder, SameEndpointsGiveEmptyItinerary) {
  auto g = graph();
  PathDecoder dec(g);
  auto it = dec.decode("B", "B", optimal({0, 0, 0, 0, 0, 0, 0}), VariableMode::Binary);
  EXPECT_TRUE(it.empty());
  EXPECT_DOUBLE_EQ(it.total_fare, 0.0);
}

TEST(PathDecoder, RejectsDetachedPositiveFareCycle) {
  // 0:AB 1:GH 2:HG, the G-H round trip costs 7
  auto g = FlightGraph::build({rec("AB", "A", "B", 10), rec("GH", "G", "H", 3),
                               rec("HG", "H", "G", 4)});
  PathDecoder dec(g);
  try {
    dec.decode("A", "B", optimal({1, 1, 1}), VariableMode::Binary);
    FAIL() << "expected DegenerateSolutionError";
  } catch (const DegenerateSolutionError& e) {
    EXPECT_NE(e.reason().find("positive fare"), std::string::npos) << e.reason();
  }
  auto it = dec.decode("A", "B", optimal({1, 0, 0}), VariableMode::Binary);
  EXPECT_EQ(it.flight_ids(), (std::vector<std::string>{"AB"}));
}
