#ifndef SIPCALC_HEALTH_HPP
#define SIPCALC_HEALTH_HPP

#include "goal.hpp"
#include <string>

namespace sipcalc {

// Coverage cut points. Each tier includes its lower bound.
constexpr double WEAK_COVERAGE = 0.5;
constexpr double NEEDS_WORK_COVERAGE = 0.8;
constexpr double FULL_COVERAGE = 1.0;
constexpr double OVERACHIEVER_COVERAGE = 1.3;

// Map coverage to a tier:
//   effective_target <= 0  -> Undefined
//   coverage is NaN        -> Undefined
//   coverage < 0.5         -> VeryWeak
//   coverage < 0.8         -> NeedsWork
//   coverage < 1.0         -> AlmostThere
//   coverage < 1.3         -> OnTrack
//   otherwise              -> Overachiever
HealthTier classify_coverage(double coverage, double effective_target);

// Tier plus its emoji and label
HealthScore score_health(double coverage, double effective_target);

HealthScore make_health_score(HealthTier tier);

std::string health_tier_to_string(HealthTier tier);

} // namespace sipcalc

#endif // SIPCALC_HEALTH_HPP
