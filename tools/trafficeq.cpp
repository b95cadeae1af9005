/*
  trafficeq: command-line front end.

  Loads a GML graph, routes a number of vehicles from a start node to an end
  node under the social optimum and the equal-split Nash assignment, and
  prints the comparison. --plot also emits a Graphviz DOT rendering.

  Exit codes: 0 success (including "no route"), 1 load or core failure,
  2 usage error.
*/
#include "cli_args.hpp"

#include "trafficeq/core/error.hpp"
#include "trafficeq/core/gml_loader.hpp"
#include "trafficeq/core/report.hpp"
#include "trafficeq/core/traffic_analysis.hpp"

#include <fstream>
#include <iostream>

namespace {

using namespace trafficeq::core;

int Run(const RunConfig& cfg)
{
  const CostDiGraph g = load_gml(cfg.graph_path);
  const AnalysisReport report = analyze_traffic(g, cfg.start, cfg.end,
                                                static_cast<Flow>(cfg.vehicles), cfg.analysis);
  write_text_report(std::cout, report, g);

  if (cfg.plot) {
    if (cfg.dot_path.empty()) {
      std::cout << "\n";
      write_dot(std::cout, report, g);
    } else {
      std::ofstream f(cfg.dot_path);
      if (!f) {
        std::cerr << "trafficeq: failed to open DOT output: " << cfg.dot_path << "\n";
        return 1;
      }
      write_dot(f, report, g);
      if (!f) {
        std::cerr << "trafficeq: failed to write DOT output: " << cfg.dot_path << "\n";
        return 1;
      }
      std::cout << "\nWrote DOT: " << cfg.dot_path << "\n";
    }
  }
  return 0;
}

} // namespace

int main(int argc, char** argv)
{
  RunConfig cfg;
  const int parsed = trafficeq::cli::ParseArgs(argc, argv, cfg, std::cout, std::cerr);
  if (parsed >= 0) return parsed;

  try {
    return Run(cfg);
  } catch (const GraphLoadError& e) {
    std::cerr << "trafficeq: error loading graph: " << e.what() << "\n";
  } catch (const NotFoundError& e) {
    std::cerr << "trafficeq: " << e.what() << "\n";
  } catch (const ConvergenceError& e) {
    std::cerr << "trafficeq: solver failed: " << e.what() << "\n";
  } catch (const ValueError& e) {
    std::cerr << "trafficeq: invalid input: " << e.what() << "\n";
  }
  return 1;
}
