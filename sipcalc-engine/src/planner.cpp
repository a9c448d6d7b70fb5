#include "planner.hpp"
#include "format.hpp"
#include "projection.hpp"
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace sipcalc {

GoalInput default_goal_input() {
    GoalInput input;
    input.name = "Master's abroad fund";
    input.category = "Education";
    input.target_amount = "1500000";
    input.years = "5";
    input.current_savings = "50000";
    input.monthly_contribution = "10000";
    input.annual_return = "12";
    input.inflation_rate = "5";
    input.contribution_streak = "0";
    input.priority = "3";
    return input;
}

Portfolio default_portfolio() {
    Portfolio portfolio;
    Goal goal;
    goal.id = 1;
    goal.input = default_goal_input();
    portfolio.add(std::move(goal));
    portfolio.set_risk_profile(RiskProfile::Moderate);
    return portfolio;
}

Goal update_goal_input(const Goal& goal, const GoalInput& input) {
    Goal updated = goal;
    updated.input = input;
    return updated;
}

Portfolio update_goal_input(const Portfolio& portfolio, uint64_t goal_id, const GoalInput& input) {
    Portfolio next = portfolio;
    if (Goal* goal = next.find(goal_id)) {
        *goal = update_goal_input(*goal, input);
    }
    return next;
}

Goal compute_goal(const Goal& goal) {
    Goal computed = goal;
    computed.results = project_goal(goal.input);
    return computed;
}

Portfolio compute_goal(const Portfolio& portfolio, uint64_t goal_id) {
    Portfolio next = portfolio;
    if (Goal* goal = next.find(goal_id)) {
        *goal = compute_goal(*goal);
    }
    return next;
}

Portfolio compute_all(const Portfolio& portfolio) {
    Portfolio next = portfolio;
    std::vector<Goal>& goals = next.goals();
    const long count = static_cast<long>(goals.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
#endif
    for (long i = 0; i < count; ++i) {
        goals[i].results = project_goal(goals[i].input);
    }
    return next;
}

Portfolio add_goal(const Portfolio& portfolio) {
    const uint64_t next_id = portfolio.next_goal_id();
    GoalInput input = default_goal_input();
    input.name = "New goal " + std::to_string(next_id);
    return add_goal(portfolio, input);
}

Portfolio add_goal(const Portfolio& portfolio, const GoalInput& input) {
    Portfolio next = portfolio;
    Goal goal;
    goal.id = portfolio.next_goal_id();
    goal.input = input;
    next.add(std::move(goal));
    return next;
}

Portfolio remove_goal(const Portfolio& portfolio, uint64_t goal_id) {
    if (portfolio.size() <= 1 || portfolio.find(goal_id) == nullptr) {
        return portfolio;
    }
    Portfolio next = portfolio;
    std::vector<Goal>& goals = next.goals();
    for (auto it = goals.begin(); it != goals.end(); ++it) {
        if (it->id == goal_id) {
            goals.erase(it);
            break;
        }
    }
    return next;
}

Portfolio apply_risk_profile(const Portfolio& portfolio, uint64_t goal_id, RiskProfile risk) {
    Portfolio next = portfolio;
    next.set_risk_profile(risk);
    if (Goal* goal = next.find(goal_id)) {
        goal->input.annual_return = format_decimal(default_return(risk), 0);
    }
    return next;
}

Portfolio set_monthly_income(const Portfolio& portfolio, const std::string& income) {
    Portfolio next = portfolio;
    next.set_monthly_income(income);
    return next;
}

} // namespace sipcalc
