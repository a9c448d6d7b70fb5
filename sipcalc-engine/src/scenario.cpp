#include "scenario.hpp"
#include "input_normalizer.hpp"
#include "projection.hpp"
#include <algorithm>

namespace sipcalc {

// ============================================================================
// ScenarioAdjustments Implementation
// ============================================================================

ScenarioAdjustments::ScenarioAdjustments()
    : extra_years(2.0), extra_contribution(2000.0), target_reduction(200000.0) {}

ScenarioAdjustments::ScenarioAdjustments(double years, double contribution, double target)
    : extra_years(years), extra_contribution(contribution), target_reduction(target) {}

// ============================================================================
// Scenario runs
// ============================================================================

ScenarioSet run_scenarios(const NormalizedGoal& goal, const ScenarioAdjustments& adjustments) {
    NormalizedGoal longer = goal;
    longer.years = goal.years + adjustments.extra_years;

    NormalizedGoal richer = goal;
    richer.monthly_contribution = goal.monthly_contribution + adjustments.extra_contribution;

    NormalizedGoal smaller = goal;
    smaller.target_amount = std::max(0.0, goal.target_amount - adjustments.target_reduction);

    ScenarioSet set;
    set.extended_horizon = project_goal(longer);
    set.increased_contribution = project_goal(richer);
    set.reduced_target = project_goal(smaller);
    return set;
}

ScenarioSet run_scenarios(const Goal& goal, const ScenarioAdjustments& adjustments) {
    return run_scenarios(normalize(goal.input), adjustments);
}

} // namespace sipcalc
