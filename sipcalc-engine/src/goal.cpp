#include "goal.hpp"
#include "input_normalizer.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace sipcalc {

// ============================================================================
// RiskProfile helpers
// ============================================================================

std::string risk_profile_to_string(RiskProfile risk) {
    switch (risk) {
        case RiskProfile::Conservative: return "conservative";
        case RiskProfile::Aggressive: return "aggressive";
        case RiskProfile::Moderate:
        default: return "moderate";
    }
}

RiskProfile risk_profile_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "conservative" || lower == "1") {
        return RiskProfile::Conservative;
    }
    if (lower == "aggressive" || lower == "3") {
        return RiskProfile::Aggressive;
    }
    return RiskProfile::Moderate;
}

double default_return(RiskProfile risk) {
    switch (risk) {
        case RiskProfile::Conservative: return 8.0;
        case RiskProfile::Aggressive: return 16.0;
        case RiskProfile::Moderate:
        default: return 12.0;
    }
}

std::string risk_description(RiskProfile risk) {
    switch (risk) {
        case RiskProfile::Conservative:
            return "Conservative - lower risk, lower expected return.";
        case RiskProfile::Aggressive:
            return "Aggressive - higher risk, higher expected return.";
        case RiskProfile::Moderate:
        default:
            return "Moderate - balanced risk and return.";
    }
}

// ============================================================================
// Value types
// ============================================================================

bool GoalInput::operator==(const GoalInput& other) const {
    return name == other.name &&
           category == other.category &&
           target_amount == other.target_amount &&
           years == other.years &&
           current_savings == other.current_savings &&
           monthly_contribution == other.monthly_contribution &&
           annual_return == other.annual_return &&
           inflation_rate == other.inflation_rate &&
           contribution_streak == other.contribution_streak &&
           priority == other.priority;
}

bool HealthScore::operator==(const HealthScore& other) const {
    return tier == other.tier && emoji == other.emoji && label == other.label;
}

bool ProjectionPoint::operator==(const ProjectionPoint& other) const {
    return month == other.month && label == other.label && value == other.value;
}

bool Results::operator==(const Results& other) const {
    return fv_lump == other.fv_lump &&
           fv_sip == other.fv_sip &&
           fv_total == other.fv_total &&
           gap == other.gap &&
           required_contribution == other.required_contribution &&
           projection == other.projection &&
           health == other.health &&
           coverage == other.coverage &&
           effective_target == other.effective_target &&
           months == other.months &&
           monthly_rate == other.monthly_rate;
}

bool Goal::operator==(const Goal& other) const {
    return id == other.id && input == other.input && results == other.results;
}

std::string Goal::display_name() const {
    if (input.name.empty()) {
        return "Goal " + std::to_string(id);
    }
    return input.name;
}

// ============================================================================
// Portfolio
// ============================================================================

Portfolio::Portfolio() : risk_profile_(RiskProfile::Moderate) {}

void Portfolio::add(const Goal& goal) {
    goals_.push_back(goal);
}

void Portfolio::add(Goal&& goal) {
    goals_.push_back(std::move(goal));
}

const Goal& Portfolio::get(size_t index) const {
    if (index >= goals_.size()) {
        throw std::out_of_range("Goal index out of range");
    }
    return goals_[index];
}

const Goal* Portfolio::find(uint64_t id) const {
    for (const auto& goal : goals_) {
        if (goal.id == id) {
            return &goal;
        }
    }
    return nullptr;
}

Goal* Portfolio::find(uint64_t id) {
    for (auto& goal : goals_) {
        if (goal.id == id) {
            return &goal;
        }
    }
    return nullptr;
}

size_t Portfolio::size() const {
    return goals_.size();
}

bool Portfolio::empty() const {
    return goals_.empty();
}

uint64_t Portfolio::next_goal_id() const {
    uint64_t max_id = 0;
    for (const auto& goal : goals_) {
        max_id = std::max(max_id, goal.id);
    }
    return max_id + 1;
}

bool Portfolio::operator==(const Portfolio& other) const {
    return goals_ == other.goals_ &&
           risk_profile_ == other.risk_profile_ &&
           monthly_income_ == other.monthly_income_;
}

namespace {

// Ids above 2^53 do not survive a JSON round trip as exact integers
constexpr double MAX_GOAL_ID = 9007199254740992.0;

// Positive integral id from a CSV cell, or 0 when the cell holds none
uint64_t parse_goal_id(const std::string& text) {
    double value = parse_number(text);
    if (!(value >= 1.0 && value < MAX_GOAL_ID) || value != std::floor(value)) {
        return 0;
    }
    return static_cast<uint64_t>(value);
}

} // anonymous namespace

Portfolio Portfolio::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

Portfolio Portfolio::load_from_csv(std::istream& is) {
    Portfolio portfolio;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return portfolio;
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.size() < 10) {
            continue;
        }

        Goal goal;
        uint64_t id = parse_goal_id(row[0]);
        goal.id = (id == 0 || portfolio.find(id) != nullptr) ? portfolio.next_goal_id() : id;

        goal.input.name = row[1];
        goal.input.category = row[2];
        goal.input.target_amount = row[3];
        goal.input.years = row[4];
        goal.input.current_savings = row[5];
        goal.input.monthly_contribution = row[6];
        goal.input.annual_return = row[7];
        goal.input.inflation_rate = row[8];
        goal.input.priority = row[9];
        goal.input.contribution_streak = row.size() > 10 ? row[10] : "0";

        portfolio.add(std::move(goal));
    }

    return portfolio;
}

} // namespace sipcalc
