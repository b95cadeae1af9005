/*
  Constrained minimization of a smooth objective over the scaled simplex
  { x in R^n : x >= 0, sum(x) == total }.

  For Python developers:
  - std::function<R(Args)>: any callable (like a Python callable/lambda)
  - An empty std::function behaves like None
*/
#pragma once

#include <functional>
#include <span>
#include <vector>

#include "trafficeq/core/options.hpp"

namespace trafficeq::core {

// Objective passed to the minimizer as plain callables; typically closures
// over immutable problem data. gradient writes df/dx_i into its second
// argument (same length as x). When gradient is empty, central finite
// differences of value are used. hessian, when set, writes the n x n matrix
// of second derivatives row-major and switches the minimizer to the
// active-set Newton method.
struct SimplexObjective {
  std::function<double(std::span<const double>)> value;
  std::function<void(std::span<const double>, std::span<double>)> gradient;
  std::function<void(std::span<const double>, std::span<double>)> hessian;
};

struct MinimizeResult {
  std::vector<double> x;   // last iterate (feasible up to rounding)
  double value {0.0};      // objective at x
  int iterations {0};
  bool converged {false};
};

// Euclidean projection of y onto { x >= 0, sum(x) == total }; total >= 0.
[[nodiscard]] std::vector<double> project_onto_simplex(std::span<const double> y, double total);

// Minimize objective over the scaled simplex starting from x0 (projected
// first). Converged when ||x - P(x - grad f(x))||_inf is at most
// tolerance * (1 + max(1, total) + max|grad f(x)|).
//
// With a hessian: active-set Newton. The equality-constrained KKT system is
// solved on the variables not held at zero; a singular, inconsistent system
// yields a zero-curvature descent direction followed to the boundary. Exact
// for convex quadratics in a number of steps bounded by the active-set
// changes.
// Without: gradient projection with Armijo back-tracking and Barzilai-Borwein
// step lengths, plus an optional Newton polish on the free variables.
//
// Never throws on non-convergence: callers inspect MinimizeResult::converged.
[[nodiscard]] MinimizeResult minimize_on_simplex(const SimplexObjective& objective,
                                                 std::span<const double> x0,
                                                 double total,
                                                 const SolverOptions& opts = {});

} // namespace trafficeq::core
