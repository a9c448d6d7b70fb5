#ifndef SIPCALC_EXPLANATION_HPP
#define SIPCALC_EXPLANATION_HPP

#include "goal.hpp"
#include <optional>
#include <string>

namespace sipcalc {

// Contribution surplus (required - current) below which an on-track goal
// counts as overfunded
constexpr double OVERFUNDING_MARGIN = -100.0;

// One sentence describing the risk profile
std::string risk_sentence(RiskProfile risk);

// " This single goal currently uses about X% of your monthly income."
// Empty when the income is absent or not positive.
std::string income_note(double monthly_contribution, std::optional<double> monthly_income);

// Plain-language verdict on a computed goal.
// The template is chosen by coverage tier (0.5 / 0.8 / 1.0 / 1.3 cut points)
// and by the sign of required - current contribution. Deterministic.
std::string explain_plan(const NormalizedGoal& goal,
                         const Results& results,
                         RiskProfile risk,
                         std::optional<double> monthly_income);

// Empty string when the goal has not been computed yet
std::string explain_plan(const Goal& goal,
                         RiskProfile risk,
                         std::optional<double> monthly_income);

} // namespace sipcalc

#endif // SIPCALC_EXPLANATION_HPP
