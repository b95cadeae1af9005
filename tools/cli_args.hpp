/* Argument parsing for the trafficeq command-line tool. */
#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "trafficeq/core/options.hpp"

namespace trafficeq::cli {

void PrintHelp(std::ostream& out);

// Whole-string integer / float parse. False on empty input, trailing
// characters, or a value outside the representable range.
bool ParseI64(const std::string& s, std::int64_t* out);
bool ParseF64(const std::string& s, double* out);

// Fills cfg from argv. Returns -1 to continue, otherwise the exit code
// (0 after --help, 2 on a usage error reported to err).
int ParseArgs(int argc, char** argv, core::RunConfig& cfg, std::ostream& out, std::ostream& err);

} // namespace trafficeq::cli
