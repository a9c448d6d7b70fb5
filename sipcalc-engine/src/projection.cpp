#include "projection.hpp"
#include "format.hpp"
#include "health.hpp"
#include "input_normalizer.hpp"
#include "required_contribution.hpp"
#include <algorithm>
#include <cmath>

namespace sipcalc {

// ============================================================================
// Building blocks
// ============================================================================

double inflation_factor(double years, double inflation_rate) {
    if (years > 0.0 && inflation_rate > 0.0) {
        return std::pow(1.0 + inflation_rate / 100.0, years);
    }
    return 1.0;
}

int projection_months(double years) {
    const double rounded = std::round(years * 12.0);
    if (!(rounded >= 1.0)) {
        return 1;
    }
    if (rounded > MAX_PROJECTION_MONTHS) {
        return MAX_PROJECTION_MONTHS;
    }
    return static_cast<int>(rounded);
}

double monthly_rate(double annual_return) {
    return annual_return / 100.0 / 12.0;
}

double future_value_lump(double current_savings, int months, double monthly_rate) {
    if (monthly_rate == 0.0) {
        return current_savings;
    }
    return current_savings * std::pow(1.0 + monthly_rate, months);
}

double future_value_sip(double monthly_contribution, int months, double monthly_rate) {
    if (monthly_rate == 0.0) {
        return monthly_contribution * months;
    }
    return monthly_contribution * ((std::pow(1.0 + monthly_rate, months) - 1.0) / monthly_rate);
}

std::string month_label(int month) {
    return format_decimal(month / 12.0, 1) + "y";
}

std::vector<ProjectionPoint> sample_trajectory(double current_savings,
                                               double monthly_contribution,
                                               int months,
                                               double monthly_rate) {
    std::vector<ProjectionPoint> points;
    points.reserve(static_cast<size_t>(months / SAMPLE_INTERVAL + 2));

    double value = current_savings;
    for (int month = 1; month <= months; ++month) {
        if (monthly_rate == 0.0) {
            value += monthly_contribution;
        } else {
            value = value * (1.0 + monthly_rate) + monthly_contribution;
        }

        if (month == 1 || month % SAMPLE_INTERVAL == 0 || month == months) {
            points.push_back(ProjectionPoint{month, month_label(month), value});
        }
    }
    return points;
}

// ============================================================================
// Projection
// ============================================================================

Results project_goal(const NormalizedGoal& goal) {
    Results results;

    results.effective_target = goal.target_amount * inflation_factor(goal.years, goal.inflation_rate);
    results.months = projection_months(goal.years);
    results.monthly_rate = monthly_rate(goal.annual_return);

    // Zero return takes the linear branch inside both helpers
    results.fv_lump = future_value_lump(goal.current_savings, results.months, results.monthly_rate);
    results.fv_sip = future_value_sip(goal.monthly_contribution, results.months, results.monthly_rate);
    results.fv_total = results.fv_lump + results.fv_sip;
    results.gap = results.fv_total - results.effective_target;
    results.coverage = results.effective_target > 0.0
        ? results.fv_total / results.effective_target
        : 0.0;

    results.required_contribution = solve_required_contribution(
        results.effective_target, results.fv_lump, results.months, results.monthly_rate);

    results.projection = sample_trajectory(
        goal.current_savings, goal.monthly_contribution, results.months, results.monthly_rate);

    results.health = score_health(results.coverage, results.effective_target);
    return results;
}

Results project_goal(const GoalInput& input) {
    return project_goal(normalize(input));
}

} // namespace sipcalc
