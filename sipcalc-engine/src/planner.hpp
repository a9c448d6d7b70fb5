#ifndef SIPCALC_PLANNER_HPP
#define SIPCALC_PLANNER_HPP

#include "goal.hpp"
#include <cstdint>

namespace sipcalc {

// Portfolio transitions.
// Every function takes the prior snapshot by const reference and returns a
// new snapshot; nothing here keeps state between calls.

// "Master's abroad fund": 1500000 over 5 years, 50000 saved, 10000/month,
// 12% return, 5% inflation, priority 3
GoalInput default_goal_input();

// One default goal (id 1), moderate risk, no income
Portfolio default_portfolio();

// Replace the input and keep the last computed Results until recomputation
Goal update_goal_input(const Goal& goal, const GoalInput& input);
Portfolio update_goal_input(const Portfolio& portfolio, uint64_t goal_id, const GoalInput& input);

// Fresh Results derived from the goal's own input
Goal compute_goal(const Goal& goal);
Portfolio compute_goal(const Portfolio& portfolio, uint64_t goal_id);

// Recompute every goal. Goals are independent, so with OpenMP enabled
// they are computed in parallel.
Portfolio compute_all(const Portfolio& portfolio);

// Append a default goal with id max+1 named "New goal {id}"
Portfolio add_goal(const Portfolio& portfolio);
Portfolio add_goal(const Portfolio& portfolio, const GoalInput& input);

// Remove a goal. The last remaining goal is kept; unknown ids are a no-op.
Portfolio remove_goal(const Portfolio& portfolio, uint64_t goal_id);

// Switch the risk profile and write its default return into the goal's input
Portfolio apply_risk_profile(const Portfolio& portfolio, uint64_t goal_id, RiskProfile risk);

Portfolio set_monthly_income(const Portfolio& portfolio, const std::string& income);

} // namespace sipcalc

#endif // SIPCALC_PLANNER_HPP
