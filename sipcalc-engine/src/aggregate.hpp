#ifndef SIPCALC_AGGREGATE_HPP
#define SIPCALC_AGGREGATE_HPP

#include "goal.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sipcalc {

// Share of income that the allocation suggestion may spend
constexpr double ALLOCATION_INCOME_SHARE = 0.4;

enum class PortfolioBadge : uint8_t {
    GettingStarted = 0,         // no goal with positive coverage yet
    HighRiskOfShortfall = 1,    // (0, 0.7)
    AlmostThere = 2,            // [0.7, 1.0)
    OnTrack = 3,                // [1.0, 1.2)
    Overprepared = 4            // >= 1.2
};

enum class ConflictLevel : uint8_t {
    NeedIncome = 0,         // income not set
    CalculateFirst = 1,     // no required contribution computed yet
    Extreme = 2,            // > 60% of income
    Ambitious = 3,          // (40, 60]
    Healthy = 4,            // (20, 40]
    Conservative = 5        // <= 20
};

struct CoverageStats {
    double average;     // mean coverage of the qualifying goals, 0 when none
    size_t count;       // goals with Results and coverage > 0
};

struct ConflictAssessment {
    ConflictLevel level;
    double required_percent;    // total required / income * 100, 0 when not evaluated
    std::string message;
};

struct AllocationSuggestion {
    uint64_t goal_id;
    std::string name;
    int priority;
    double suggested_contribution;  // whole currency units
};

// Everything the dashboard shows about a portfolio as a whole
struct AggregateSummary {
    double total_current_contribution;
    double total_required_contribution;
    CoverageStats coverage;
    PortfolioBadge badge;
    ConflictAssessment conflict;
    std::optional<std::vector<AllocationSuggestion>> allocation;

    AggregateSummary();
};

// Sum of normalized monthly contributions, computed or not
double total_current_contribution(const Portfolio& portfolio);

// Sum of max(0, required contribution) over goals with Results
double total_required_contribution(const Portfolio& portfolio);

// Mean coverage over goals with Results and coverage > 0
CoverageStats average_coverage(const Portfolio& portfolio);

PortfolioBadge classify_badge(const CoverageStats& stats);
std::string badge_label(PortfolioBadge badge);
std::string badge_to_string(PortfolioBadge badge);

// Compare the total required contribution with the monthly income
ConflictAssessment assess_conflict(double total_required, double monthly_income);
std::string conflict_level_to_string(ConflictLevel level);

// Split ALLOCATION_INCOME_SHARE of the income across goals by priority.
// Absent when income <= 0 or the portfolio is empty.
std::optional<std::vector<AllocationSuggestion>> recommend_allocation(
    const Portfolio& portfolio, double monthly_income);

// Aggregate view over the portfolio, reading the income from the portfolio.
// Read-only with respect to every goal.
AggregateSummary build_summary(const Portfolio& portfolio);

} // namespace sipcalc

#endif // SIPCALC_AGGREGATE_HPP
