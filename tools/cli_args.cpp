/*
  Command-line argument parsing for trafficeq.

  Positional: <graph.gml> <vehicles> <start> <end>. Numbers are parsed with
  strtoll/strtod; trailing garbage and out-of-range values are usage errors.
*/
#include "cli_args.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <vector>

namespace trafficeq::cli {

using namespace trafficeq::core;

void PrintHelp(std::ostream& out)
{
  out
    << "usage: trafficeq <graph.gml> <vehicles> <start> <end> [options]\n"
    << "\n"
    << "Traffic flow equilibrium and social optimum calculator.\n"
    << "\n"
    << "  <graph.gml>                 Directed GML graph; every edge needs 'a' and 'b'\n"
    << "                              (travel time a*x + b for x vehicles).\n"
    << "  <vehicles>                  Number of vehicles (positive integer).\n"
    << "  <start> <end>               Node labels (or ids when unlabelled).\n"
    << "\n"
    << "  --plot                      Also render the comparison as Graphviz DOT.\n"
    << "  --dot <path>                Write the DOT rendering to <path> (implies --plot).\n"
    << "  --max-iterations <n>        Solver iteration cap (default 1000).\n"
    << "  --tolerance <t>             Solver stationarity tolerance (default 1e-10).\n"
    << "  --max-paths <n>             Enumerate at most n simple paths.\n"
    << "  -h, --help                  Show this help.\n";
}

bool ParseI64(const std::string& s, std::int64_t* out)
{
  if (!out) return false;
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno == ERANGE) return false;
  if (!end || *end != '\0') return false;
  *out = static_cast<std::int64_t>(v);
  return true;
}

bool ParseF64(const std::string& s, double* out)
{
  if (!out) return false;
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  double v = std::strtod(s.c_str(), &end);
  if (errno == ERANGE && std::isinf(v)) return false;
  if (!end || *end != '\0') return false;
  *out = v;
  return true;
}

int ParseArgs(int argc, char** argv, RunConfig& cfg, std::ostream& out, std::ostream& err)
{
  std::vector<std::string> positional;

  auto requireValue = [&](int& i, std::string& outVal) -> bool {
    if (i + 1 >= argc) return false;
    outVal = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string val;
    if (arg == "--help" || arg == "-h") {
      PrintHelp(out);
      return 0;
    } else if (arg == "--plot") {
      cfg.plot = true;
    } else if (arg == "--dot") {
      if (!requireValue(i, val)) {
        err << "--dot requires a path\n";
        return 2;
      }
      cfg.plot = true;
      cfg.dot_path = val;
    } else if (arg == "--max-iterations") {
      std::int64_t n = 0;
      if (!requireValue(i, val) || !ParseI64(val, &n) || n < 0 ||
          n > std::numeric_limits<int>::max()) {
        err << "--max-iterations requires a non-negative integer\n";
        return 2;
      }
      cfg.analysis.solver.max_iterations = static_cast<int>(n);
    } else if (arg == "--tolerance") {
      double t = 0.0;
      if (!requireValue(i, val) || !ParseF64(val, &t) || !(t > 0.0)) {
        err << "--tolerance requires a float > 0\n";
        return 2;
      }
      cfg.analysis.solver.tolerance = t;
    } else if (arg == "--max-paths") {
      std::int64_t n = 0;
      if (!requireValue(i, val) || !ParseI64(val, &n) || n <= 0) {
        err << "--max-paths requires an integer > 0\n";
        return 2;
      }
      cfg.analysis.enumeration.max_paths = n;
    } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
      err << "Unknown option: " << arg << "\n";
      return 2;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() != 4) {
    err << "expected 4 positional arguments (graph, vehicles, start, end), got "
        << positional.size() << "\n";
    PrintHelp(err);
    return 2;
  }
  cfg.graph_path = positional[0];
  if (!ParseI64(positional[1], &cfg.vehicles) || cfg.vehicles <= 0) {
    err << "vehicles must be a positive integer, got '" << positional[1] << "'\n";
    return 2;
  }
  cfg.start = positional[2];
  cfg.end = positional[3];
  return -1;
}

} // namespace trafficeq::cli
