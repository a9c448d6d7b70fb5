#include "health.hpp"
#include <cmath>

namespace sipcalc {

HealthTier classify_coverage(double coverage, double effective_target) {
    if (!(effective_target > 0.0) || std::isnan(coverage)) {
        return HealthTier::Undefined;
    }
    if (coverage < WEAK_COVERAGE) return HealthTier::VeryWeak;
    if (coverage < NEEDS_WORK_COVERAGE) return HealthTier::NeedsWork;
    if (coverage < FULL_COVERAGE) return HealthTier::AlmostThere;
    if (coverage < OVERACHIEVER_COVERAGE) return HealthTier::OnTrack;
    return HealthTier::Overachiever;
}

HealthScore make_health_score(HealthTier tier) {
    HealthScore score;
    score.tier = tier;
    switch (tier) {
        case HealthTier::VeryWeak:
            score.emoji = "\U0001F631";
            score.label = "Very weak - huge shortfall";
            break;
        case HealthTier::NeedsWork:
            score.emoji = "\U0001F62C";
            score.label = "Needs work - underfunded";
            break;
        case HealthTier::AlmostThere:
            score.emoji = "\U0001F642";
            score.label = "Almost there - close to target";
            break;
        case HealthTier::OnTrack:
            score.emoji = "\U0001F60E";
            score.label = "On track - goal covered";
            break;
        case HealthTier::Overachiever:
            score.emoji = "\U0001F410";
            score.label = "Overachiever - well above target";
            break;
        case HealthTier::Undefined:
        default:
            score.emoji = "\U0001F937";
            score.label = "Set a goal first";
            break;
    }
    return score;
}

HealthScore score_health(double coverage, double effective_target) {
    return make_health_score(classify_coverage(coverage, effective_target));
}

std::string health_tier_to_string(HealthTier tier) {
    switch (tier) {
        case HealthTier::VeryWeak: return "very_weak";
        case HealthTier::NeedsWork: return "needs_work";
        case HealthTier::AlmostThere: return "almost_there";
        case HealthTier::OnTrack: return "on_track";
        case HealthTier::Overachiever: return "overachiever";
        case HealthTier::Undefined:
        default: return "undefined";
    }
}

} // namespace sipcalc
