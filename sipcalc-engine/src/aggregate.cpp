#include "aggregate.hpp"
#include "format.hpp"
#include "input_normalizer.hpp"
#include <algorithm>
#include <numeric>

namespace sipcalc {

// ============================================================================
// AggregateSummary Implementation
// ============================================================================

AggregateSummary::AggregateSummary()
    : total_current_contribution(0.0),
      total_required_contribution(0.0),
      coverage{0.0, 0},
      badge(PortfolioBadge::GettingStarted),
      conflict{ConflictLevel::NeedIncome, 0.0, ""} {}

namespace {

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

} // anonymous namespace

// ============================================================================
// Totals
// ============================================================================

double total_current_contribution(const Portfolio& portfolio) {
    double total = 0.0;
    for (const auto& goal : portfolio.goals()) {
        total += parse_number(goal.input.monthly_contribution);
    }
    return total;
}

double total_required_contribution(const Portfolio& portfolio) {
    double total = 0.0;
    for (const auto& goal : portfolio.goals()) {
        if (goal.results) {
            total += std::max(0.0, goal.results->required_contribution);
        }
    }
    return total;
}

CoverageStats average_coverage(const Portfolio& portfolio) {
    std::vector<double> coverages;
    coverages.reserve(portfolio.size());
    for (const auto& goal : portfolio.goals()) {
        if (goal.results && goal.results->coverage > 0.0) {
            coverages.push_back(goal.results->coverage);
        }
    }
    return CoverageStats{calculate_mean(coverages), coverages.size()};
}

// ============================================================================
// Badge
// ============================================================================

PortfolioBadge classify_badge(const CoverageStats& stats) {
    if (stats.count == 0 || stats.average <= 0.0) {
        return PortfolioBadge::GettingStarted;
    }
    if (stats.average >= 1.2) return PortfolioBadge::Overprepared;
    if (stats.average >= 1.0) return PortfolioBadge::OnTrack;
    if (stats.average >= 0.7) return PortfolioBadge::AlmostThere;
    return PortfolioBadge::HighRiskOfShortfall;
}

std::string badge_label(PortfolioBadge badge) {
    switch (badge) {
        case PortfolioBadge::HighRiskOfShortfall: return "High risk of shortfall \U0001F525";
        case PortfolioBadge::AlmostThere: return "Almost there \U0001F642";
        case PortfolioBadge::OnTrack: return "On track ✅";
        case PortfolioBadge::Overprepared: return "Overprepared \U0001F410";
        case PortfolioBadge::GettingStarted:
        default: return "Getting started \U0001F423";
    }
}

std::string badge_to_string(PortfolioBadge badge) {
    switch (badge) {
        case PortfolioBadge::HighRiskOfShortfall: return "high_risk_of_shortfall";
        case PortfolioBadge::AlmostThere: return "almost_there";
        case PortfolioBadge::OnTrack: return "on_track";
        case PortfolioBadge::Overprepared: return "overprepared";
        case PortfolioBadge::GettingStarted:
        default: return "getting_started";
    }
}

// ============================================================================
// Income conflict
// ============================================================================

ConflictAssessment assess_conflict(double total_required, double monthly_income) {
    if (monthly_income <= 0.0) {
        return ConflictAssessment{ConflictLevel::NeedIncome, 0.0,
            "Add your monthly income to see if your total SIPs make any sense."};
    }
    if (total_required <= 0.0) {
        return ConflictAssessment{ConflictLevel::CalculateFirst, 0.0,
            "Calculate your goals to see if your plan clashes with your income."};
    }

    const double percent = total_required / monthly_income * 100.0;
    const std::string pct = format_decimal(percent, 1);

    if (percent > 60.0) {
        return ConflictAssessment{ConflictLevel::Extreme, percent,
            "You'd need about " + pct + "% of your income in SIPs. "
            "Mathematically possible, practically extreme. "
            "Either reduce some goals or extend timelines."};
    }
    if (percent > 40.0) {
        return ConflictAssessment{ConflictLevel::Ambitious, percent,
            "Total required SIP is about " + pct + "% of your income. "
            "Ambitious but feasible if you stay disciplined."};
    }
    if (percent > 20.0) {
        return ConflictAssessment{ConflictLevel::Healthy, percent,
            "Total required SIP is about " + pct + "% of your income. "
            "That's a healthy range for long-term goals."};
    }
    return ConflictAssessment{ConflictLevel::Conservative, percent,
        "Total required SIP is only " + pct + "% of your income. "
        "Either your goals are tiny or you're playing it very safe."};
}

std::string conflict_level_to_string(ConflictLevel level) {
    switch (level) {
        case ConflictLevel::CalculateFirst: return "calculate_first";
        case ConflictLevel::Extreme: return "extreme";
        case ConflictLevel::Ambitious: return "ambitious";
        case ConflictLevel::Healthy: return "healthy";
        case ConflictLevel::Conservative: return "conservative";
        case ConflictLevel::NeedIncome:
        default: return "need_income";
    }
}

// ============================================================================
// Priority-weighted allocation
// ============================================================================

std::optional<std::vector<AllocationSuggestion>> recommend_allocation(
    const Portfolio& portfolio, double monthly_income)
{
    if (monthly_income <= 0.0 || portfolio.empty()) {
        return std::nullopt;
    }

    const double spendable = monthly_income * ALLOCATION_INCOME_SHARE;

    std::vector<int> priorities;
    priorities.reserve(portfolio.size());
    int total_priority = 0;
    for (const auto& goal : portfolio.goals()) {
        int priority = normalize_priority(goal.input.priority);
        priorities.push_back(priority);
        total_priority += priority;
    }

    std::vector<AllocationSuggestion> suggestions;
    suggestions.reserve(portfolio.size());
    for (size_t i = 0; i < portfolio.size(); ++i) {
        const Goal& goal = portfolio.get(i);
        double share = static_cast<double>(priorities[i]) / total_priority * spendable;
        suggestions.push_back(AllocationSuggestion{
            goal.id, goal.display_name(), priorities[i], round_currency(share)});
    }
    return suggestions;
}

// ============================================================================
// Summary
// ============================================================================

AggregateSummary build_summary(const Portfolio& portfolio) {
    const double income = parse_number(portfolio.monthly_income());

    AggregateSummary summary;
    summary.total_current_contribution = total_current_contribution(portfolio);
    summary.total_required_contribution = total_required_contribution(portfolio);
    summary.coverage = average_coverage(portfolio);
    summary.badge = classify_badge(summary.coverage);
    summary.conflict = assess_conflict(summary.total_required_contribution, income);
    summary.allocation = recommend_allocation(portfolio, income);
    return summary;
}

} // namespace sipcalc
