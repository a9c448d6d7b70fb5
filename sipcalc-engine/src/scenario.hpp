#ifndef SIPCALC_SCENARIO_HPP
#define SIPCALC_SCENARIO_HPP

#include "goal.hpp"

namespace sipcalc {

// Size of each what-if perturbation
struct ScenarioAdjustments {
    double extra_years;             // added to the horizon (default 2)
    double extra_contribution;      // added to the monthly contribution (default 2000)
    double target_reduction;        // removed from the base target, floored at 0 (default 200000)

    ScenarioAdjustments();
    ScenarioAdjustments(double years, double contribution, double target);
};

// Three independent re-projections, each with exactly one field perturbed
struct ScenarioSet {
    Results extended_horizon;
    Results increased_contribution;
    Results reduced_target;
};

// Re-run the projection on perturbed copies of the goal.
// The goal passed in, and any Results it holds, are never modified.
ScenarioSet run_scenarios(const NormalizedGoal& goal,
                          const ScenarioAdjustments& adjustments = ScenarioAdjustments());

ScenarioSet run_scenarios(const Goal& goal,
                          const ScenarioAdjustments& adjustments = ScenarioAdjustments());

} // namespace sipcalc

#endif // SIPCALC_SCENARIO_HPP
