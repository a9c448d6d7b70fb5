#ifndef SIPCALC_GOAL_HPP
#define SIPCALC_GOAL_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace sipcalc {

enum class RiskProfile : uint8_t {
    Conservative = 0,
    Moderate = 1,
    Aggressive = 2
};

std::string risk_profile_to_string(RiskProfile risk);

// Unknown names map to Moderate
RiskProfile risk_profile_from_string(const std::string& name);

// Default expected annual return (percent) for a risk profile: 8 / 12 / 16
double default_return(RiskProfile risk);

std::string risk_description(RiskProfile risk);

// Raw goal fields as supplied by a form, CSV file or stored state.
// Numeric fields stay free-form text until normalized.
struct GoalInput {
    std::string name;
    std::string category;
    std::string target_amount;
    std::string years;
    std::string current_savings;
    std::string monthly_contribution;
    std::string annual_return;          // percent
    std::string inflation_rate;         // percent
    std::string contribution_streak;    // months, display only
    std::string priority;               // 1-5

    bool operator==(const GoalInput& other) const;
};

// GoalInput after numeric coercion
struct NormalizedGoal {
    double target_amount = 0.0;
    double years = 0.0;
    double current_savings = 0.0;
    double monthly_contribution = 0.0;
    double annual_return = 0.0;
    double inflation_rate = 0.0;
    int priority = 1;
    int contribution_streak = 0;
};

enum class HealthTier : uint8_t {
    Undefined = 0,      // no positive target or no numeric coverage
    VeryWeak = 1,
    NeedsWork = 2,
    AlmostThere = 3,
    OnTrack = 4,
    Overachiever = 5
};

struct HealthScore {
    HealthTier tier = HealthTier::Undefined;
    std::string emoji;
    std::string label;

    bool operator==(const HealthScore& other) const;
};

// Sampled point on the growth trajectory (display only)
struct ProjectionPoint {
    int month;              // 1-based
    std::string label;      // e.g. "2.5y"
    double value;           // cumulative value at the end of the month

    bool operator==(const ProjectionPoint& other) const;
};

// Computed state of a goal. Replaced wholesale on every recomputation.
struct Results {
    double fv_lump = 0.0;
    double fv_sip = 0.0;
    double fv_total = 0.0;
    double gap = 0.0;                       // fv_total - effective_target
    double required_contribution = 0.0;     // monthly, never negative
    std::vector<ProjectionPoint> projection;
    HealthScore health;
    double coverage = 0.0;                  // fv_total / effective_target
    double effective_target = 0.0;          // inflation-adjusted target
    int months = 1;
    double monthly_rate = 0.0;

    bool operator==(const Results& other) const;
};

struct Goal {
    uint64_t id = 0;
    GoalInput input;
    std::optional<Results> results;    // absent until computed

    bool operator==(const Goal& other) const;

    // Goal name, or "Goal {id}" when the name is blank
    std::string display_name() const;
};

class Portfolio {
public:
    Portfolio();

    void add(const Goal& goal);
    void add(Goal&& goal);

    const Goal& get(size_t index) const;
    const Goal* find(uint64_t id) const;
    Goal* find(uint64_t id);

    size_t size() const;
    bool empty() const;

    // max existing id + 1, or 1 for an empty portfolio
    uint64_t next_goal_id() const;

    const std::vector<Goal>& goals() const { return goals_; }
    std::vector<Goal>& goals() { return goals_; }

    RiskProfile risk_profile() const { return risk_profile_; }
    void set_risk_profile(RiskProfile risk) { risk_profile_ = risk; }

    const std::string& monthly_income() const { return monthly_income_; }
    void set_monthly_income(const std::string& income) { monthly_income_ = income; }

    // Load goals from CSV with header:
    // id,name,category,target_amount,years,current_savings,monthly_contribution,
    // annual_return,inflation_rate,priority[,contribution_streak]
    // A blank or non-numeric id is replaced by the next free id.
    static Portfolio load_from_csv(const std::string& filepath);
    static Portfolio load_from_csv(std::istream& is);

    bool operator==(const Portfolio& other) const;

private:
    std::vector<Goal> goals_;
    RiskProfile risk_profile_;
    std::string monthly_income_;
};

} // namespace sipcalc

#endif // SIPCALC_GOAL_HPP
