#pragma once

#include <stdexcept>
#include <string>

namespace trafficeq::core {

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Start/end node absent from the graph, or a demand that cannot be conserved.
struct NotFoundError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The constrained minimizer did not reach a converged, feasible point.
struct ConvergenceError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Malformed or unreadable graph description.
struct GraphLoadError : public ValueError {
  using ValueError::ValueError;
};

} // namespace trafficeq::core
