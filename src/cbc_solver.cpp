// src/cbc_solver.cpp
#include "cbc_solver.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

#include <coin/OsiClpSolverInterface.hpp>
#include <coin/CbcModel.hpp>
#include <coin/CoinPackedMatrix.hpp>
#include <coin/CoinPackedVector.hpp>

namespace fare {

namespace {

double to_coin(double v) {
  if (v == kInf)  return COIN_DBL_MAX;
  if (v == -kInf) return -COIN_DBL_MAX;
  return v;
}

bool any_integer(const Formulation& m) {
  return std::find(m.is_integer.begin(), m.is_integer.end(), true) != m.is_integer.end();
}

} // namespace

SolverResult CbcSolver::solve(const Formulation& model) const {
  const int ncols = model.num_cols();
  if (ncols == 0) return solve_trivial_(model);

  // Row-major matrix
  CoinPackedMatrix mat(false, 0, 0);
  std::vector<double> rowLower, rowUpper;
  rowLower.reserve(model.rows.size());
  rowUpper.reserve(model.rows.size());
  for (const auto& r : model.rows) {
    CoinPackedVector row;
    for (std::size_t k = 0; k < r.cols.size(); ++k) row.insert(r.cols[k], r.coefs[k]);
    mat.appendRow(row);
    rowLower.push_back(to_coin(r.lower));
    rowUpper.push_back(to_coin(r.upper));
  }
  // Columns with no row entry still need to exist in the matrix.
  if (mat.getNumCols() < ncols) mat.setDimensions(mat.getNumRows(), ncols);

  std::vector<double> colLower(ncols), colUpper(ncols);
  for (int j = 0; j < ncols; ++j) {
    colLower[j] = to_coin(model.col_lower[j]);
    colUpper[j] = to_coin(model.col_upper[j]);
  }

  OsiClpSolverInterface si;
  si.messageHandler()->setLogLevel(opt_.log_level);
  si.setObjSense(1.0); // minimize
  si.loadProblem(mat, colLower.data(), colUpper.data(),
                 model.objective.data(), rowLower.data(), rowUpper.data());

  SolverResult out;

  if (!any_integer(model)) {
    if (opt_.time_limit_sec > 0.0) si.getModelPtr()->setMaximumSeconds(opt_.time_limit_sec);
    si.initialSolve();

    if (si.isProvenOptimal()) {
      out.status = SolveStatus::Optimal;
      out.status_text = "optimal";
    } else if (si.isProvenPrimalInfeasible()) {
      out.status = SolveStatus::Infeasible;
      out.status_text = "infeasible";
    } else if (si.isProvenDualInfeasible()) {
      out.status = SolveStatus::Unbounded;
      out.status_text = "unbounded";
    } else {
      out.status = SolveStatus::SolverError;
      out.status_text = si.isIterationLimitReached() ? "iteration/time limit reached"
                                                     : "clp abandoned";
      return out;
    }
    if (out.status == SolveStatus::Optimal) {
      const double* sol = si.getColSolution();
      out.values.assign(sol, sol + ncols);
      out.objective = si.getObjValue();
    }
    return out;
  }

  // Integer columns
  std::vector<int> intIdx;
  intIdx.reserve(ncols);
  for (int j = 0; j < ncols; ++j) if (model.is_integer[j]) intIdx.push_back(j);
  si.setInteger(intIdx.data(), static_cast<int>(intIdx.size()));

  CbcModel cbc(si);
  if (opt_.time_limit_sec > 0.0) cbc.setMaximumSeconds(opt_.time_limit_sec);
  cbc.setLogLevel(opt_.log_level);
  cbc.setIntegerTolerance(opt_.integer_tolerance);
  cbc.branchAndBound();

  if (cbc.isProvenOptimal() && cbc.bestSolution()) {
    out.status = SolveStatus::Optimal;
    out.status_text = "optimal";
    const double* sol = cbc.bestSolution();
    out.values.assign(sol, sol + ncols);
    out.objective = cbc.getObjValue();
  } else if (cbc.isProvenInfeasible()) {
    out.status = SolveStatus::Infeasible;
    out.status_text = "infeasible";
  } else if (cbc.isContinuousUnbounded() || cbc.isProvenDualInfeasible()) {
    out.status = SolveStatus::Unbounded;
    out.status_text = "unbounded";
  } else {
    out.status = SolveStatus::SolverError;
    out.status_text = cbc.isSecondsLimitReached() ? "time limit reached"
                    : cbc.isAbandoned()          ? "cbc abandoned"
                                                 : "cbc stopped without proof of optimality";
  }
  return out;
}

// No variables: feasible iff 0 satisfies every row.
SolverResult CbcSolver::solve_trivial_(const Formulation& model) const {
  SolverResult out;
  for (const auto& r : model.rows) {
    if (r.lower > 0.0 || r.upper < 0.0) {
      out.status = SolveStatus::Infeasible;
      out.status_text = "infeasible (no variables, row " + r.name + ")";
      return out;
    }
  }
  out.status = SolveStatus::Optimal;
  out.status_text = "optimal (empty model)";
  return out;
}

} // namespace fare
