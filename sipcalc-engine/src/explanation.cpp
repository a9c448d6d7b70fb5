#include "explanation.hpp"
#include "format.hpp"
#include "health.hpp"
#include "input_normalizer.hpp"

namespace sipcalc {

std::string risk_sentence(RiskProfile risk) {
    switch (risk) {
        case RiskProfile::Conservative:
            return "You're using a conservative profile, which prioritises stability over high returns.";
        case RiskProfile::Aggressive:
            return "You're using an aggressive profile, which relies on higher market returns and more volatility.";
        case RiskProfile::Moderate:
        default:
            return "You're using a moderate profile, which balances risk and growth.";
    }
}

std::string income_note(double monthly_contribution, std::optional<double> monthly_income) {
    if (!monthly_income || *monthly_income <= 0.0) {
        return "";
    }
    const double percent = monthly_contribution / *monthly_income * 100.0;
    return " This single goal currently uses about " + format_decimal(percent, 1) +
           "% of your monthly income.";
}

std::string explain_plan(const NormalizedGoal& goal,
                         const Results& results,
                         RiskProfile risk,
                         std::optional<double> monthly_income) {
    const double current = goal.monthly_contribution;
    const double diff = results.required_contribution - current;
    const std::string risk_text = risk_sentence(risk);
    const std::string tail = risk_text + income_note(current, monthly_income);

    switch (classify_coverage(results.coverage, results.effective_target)) {
        case HealthTier::Undefined:
            return "You haven't really set a proper inflation-adjusted target yet. "
                   "Define a realistic goal amount and duration so this planner can stop "
                   "guessing and start actually helping you. " + risk_text;

        case HealthTier::VeryWeak:
            return "Right now, your plan is funding less than half of your inflation-adjusted "
                   "target. Either increase your monthly contribution, extend the time horizon, "
                   "or lower the goal. " + tail;

        case HealthTier::NeedsWork:
            if (diff > 0.0) {
                return "You're underfunded: your current SIP of " + format_inr(current) +
                       " gets you partially there, but you need around " + format_inr(diff) +
                       " more per month to fully cover this inflation-adjusted goal. " + tail;
            }
            return "Your plan is underfunded but not hopeless. A mix of slightly higher SIPs, "
                   "a longer duration, or trimming the goal amount can push this into the "
                   "\"on track\" zone. " + tail;

        case HealthTier::AlmostThere:
            if (diff > 0.0) {
                return "You're close to the finish line. Increase your monthly SIP by about " +
                       format_inr(diff) + " or extend the duration a bit to comfortably meet "
                       "the inflation-adjusted target. " + tail;
            }
            return "This plan is almost hitting your inflation-adjusted target. Stay consistent "
                   "and don't panic-sell during market dips. " + tail;

        case HealthTier::OnTrack:
            if (diff < OVERFUNDING_MARGIN) {
                return "You're comfortably on track and maybe even slightly overfunding this "
                       "goal. You could reduce your SIP or redirect some surplus towards "
                       "another goal. " + tail;
            }
            return "You're on track to meet this goal. Just keep the SIP going and avoid "
                   "impulsive changes. " + tail;

        case HealthTier::Overachiever:
        default:
            return "You're massively overfunding this goal relative to the inflation-adjusted "
                   "target. You can afford to lower this SIP a bit and redirect money towards "
                   "other goals. " + tail;
    }
}

std::string explain_plan(const Goal& goal,
                         RiskProfile risk,
                         std::optional<double> monthly_income) {
    if (!goal.results) {
        return "";
    }
    return explain_plan(normalize(goal.input), *goal.results, risk, monthly_income);
}

} // namespace sipcalc
