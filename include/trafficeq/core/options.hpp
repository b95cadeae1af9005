/* Configuration structs for enumeration, the minimizer and a full run. */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace trafficeq::core {

struct PathEnumerationOptions {
  // Stop after this many paths; std::nullopt enumerates every simple path.
  std::optional<std::int64_t> max_paths {};
};

struct SolverOptions {
  // Hard cap on minimizer iterations; exceeding it raises ConvergenceError.
  int max_iterations {1000};
  // Converged when ||x - P(x - gradient)||_inf is at most
  // tolerance * (1 + max(1, total) + max|gradient|), P being the projection
  // onto the feasible simplex.
  double tolerance {1e-10};
  // Armijo sufficient-decrease constant for line searches.
  double armijo {1e-4};
  // Without an objective Hessian: try a Newton step on the free variables
  // after each gradient step.
  bool newton_polish {true};
};

struct AnalysisOptions {
  PathEnumerationOptions enumeration {};
  SolverOptions solver {};
};

// One command-line run: load graph_path, route `vehicles` from start to end.
struct RunConfig {
  std::string graph_path;
  std::int64_t vehicles {0};
  std::string start;
  std::string end;
  bool plot {false};
  // Where --plot writes the DOT document; empty means stdout.
  std::string dot_path;
  AnalysisOptions analysis {};
};

} // namespace trafficeq::core
