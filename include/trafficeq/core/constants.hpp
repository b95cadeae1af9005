/* Numeric tolerances shared by the assigners and the minimizer. */
#pragma once

namespace trafficeq::core {

// Flows below this magnitude are treated as zero (e.g. solver noise on unused paths).
inline constexpr double kMinFlow = 1e-12;
// Negative noise tolerated from the minimizer before clamping to zero.
inline constexpr double kNegativeFlowNoise = 1e-9;
// Relative tolerance on flow conservation (sum of path flows == demand).
inline constexpr double kConservationRelTol = 1e-6;

} // namespace trafficeq::core
