#ifndef SIPCALC_PROJECTION_HPP
#define SIPCALC_PROJECTION_HPP

#include "goal.hpp"
#include <string>
#include <vector>

namespace sipcalc {

// Trajectory points are kept at month 1, every SAMPLE_INTERVAL months and the final month
constexpr int SAMPLE_INTERVAL = 6;

// Horizon cap (1000 years) keeping the month count inside int range
constexpr int MAX_PROJECTION_MONTHS = 12000;

// (1 + inflation/100)^years when both are positive, otherwise 1
double inflation_factor(double years, double inflation_rate);

// max(1, round(years * 12)) for horizons up to MAX_PROJECTION_MONTHS;
// longer horizons return MAX_PROJECTION_MONTHS
int projection_months(double years);

// annual_return / 100 / 12
double monthly_rate(double annual_return);

// Future value of the current savings after `months`.
// A zero rate leaves the savings unchanged.
double future_value_lump(double current_savings, int months, double monthly_rate);

// Future value of a fixed monthly contribution (ordinary annuity).
// A zero rate degenerates to contribution * months.
double future_value_sip(double monthly_contribution, int months, double monthly_rate);

// Label for a month index: months / 12 rounded half-up to one decimal, plus "y"
std::string month_label(int month);

// Walk the balance month by month from the current savings:
//   value = value * (1 + rm) + contribution    (rm != 0)
//   value = value + contribution               (rm == 0)
// and keep the sparse display sample.
std::vector<ProjectionPoint> sample_trajectory(double current_savings,
                                               double monthly_contribution,
                                               int months,
                                               double monthly_rate);

// Project a single goal.
// The projection logic:
// - Inflate the base target over the horizon
// - Compound current savings and the monthly contribution stream
// - Derive gap, coverage, the required contribution and the health tier
// - Sample the growth trajectory for display
// Pure function of its input.
Results project_goal(const NormalizedGoal& goal);

// Normalize then project
Results project_goal(const GoalInput& input);

} // namespace sipcalc

#endif // SIPCALC_PROJECTION_HPP
