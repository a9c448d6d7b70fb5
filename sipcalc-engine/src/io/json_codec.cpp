#include "json_codec.hpp"
#include "../health.hpp"
#include "../planner.hpp"

using json = nlohmann::json;

namespace sipcalc {
namespace io {

namespace {

// Text of a field that may be stored as a string, a number or null
std::string read_text(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return "";
    }
    const json& value = j[key];
    return value.is_string() ? value.get<std::string>() : value.dump();
}

// Non-finite doubles are written as null, so a null number is not an error
bool read_number(const json& j, const char* key, double& out) {
    if (!j.contains(key) || !j[key].is_number()) {
        return false;
    }
    out = j[key].get<double>();
    return true;
}

} // anonymous namespace

json goal_input_to_json(const GoalInput& input) {
    return json{
        {"goalName", input.name},
        {"goalType", input.category},
        {"targetAmount", input.target_amount},
        {"years", input.years},
        {"currentSavings", input.current_savings},
        {"monthlyContribution", input.monthly_contribution},
        {"annualReturn", input.annual_return},
        {"inflationRate", input.inflation_rate},
        {"monthsInvested", input.contribution_streak},
        {"priority", input.priority}
    };
}

json results_to_json(const Results& results) {
    json projection = json::array();
    for (const auto& point : results.projection) {
        projection.push_back(json{
            {"month", point.month},
            {"yearLabel", point.label},
            {"value", point.value}
        });
    }

    return json{
        {"fvLump", results.fv_lump},
        {"fvSip", results.fv_sip},
        {"fvTotal", results.fv_total},
        {"gap", results.gap},
        {"monthlyRequired", results.required_contribution},
        {"projection", projection},
        {"healthTier", health_tier_to_string(results.health.tier)},
        {"healthEmoji", results.health.emoji},
        {"healthLabel", results.health.label},
        {"coverage", results.coverage},
        {"effectiveTarget", results.effective_target},
        {"months", results.months},
        {"monthlyRate", results.monthly_rate}
    };
}

json goal_to_json(const Goal& goal) {
    return json{
        {"id", goal.id},
        {"inputs", goal_input_to_json(goal.input)},
        {"results", goal.results ? results_to_json(*goal.results) : json(nullptr)}
    };
}

json portfolio_to_json(const Portfolio& portfolio) {
    json goals = json::array();
    for (const auto& goal : portfolio.goals()) {
        goals.push_back(goal_to_json(goal));
    }
    return json{
        {"goals", goals},
        {"riskProfile", risk_profile_to_string(portfolio.risk_profile())},
        {"monthlyIncome", portfolio.monthly_income()}
    };
}

GoalInput goal_input_from_json(const json& j) {
    GoalInput input;
    input.name = read_text(j, "goalName");
    input.category = read_text(j, "goalType");
    input.target_amount = read_text(j, "targetAmount");
    input.years = read_text(j, "years");
    input.current_savings = read_text(j, "currentSavings");
    input.monthly_contribution = read_text(j, "monthlyContribution");
    input.annual_return = read_text(j, "annualReturn");
    input.inflation_rate = read_text(j, "inflationRate");
    input.contribution_streak = read_text(j, "monthsInvested");
    input.priority = read_text(j, "priority");
    return input;
}

std::optional<Results> results_from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    Results results;
    if (!read_number(j, "fvLump", results.fv_lump) ||
        !read_number(j, "fvSip", results.fv_sip) ||
        !read_number(j, "fvTotal", results.fv_total) ||
        !read_number(j, "gap", results.gap) ||
        !read_number(j, "coverage", results.coverage) ||
        !read_number(j, "effectiveTarget", results.effective_target)) {
        return std::nullopt;
    }

    results.required_contribution = 0.0;
    if (j.contains("monthlyRequired") &&
        !read_number(j, "monthlyRequired", results.required_contribution)) {
        return std::nullopt;
    }
    if (results.required_contribution < 0.0) {
        results.required_contribution = 0.0;
    }

    results.months = j.value("months", 1);
    results.monthly_rate = 0.0;
    if (j.contains("monthlyRate") && !read_number(j, "monthlyRate", results.monthly_rate)) {
        return std::nullopt;
    }

    if (j.contains("projection")) {
        const json& points = j.at("projection");
        if (!points.is_array()) {
            return std::nullopt;
        }
        for (const auto& point : points) {
            ProjectionPoint entry{};
            if (!point.is_object() || !read_number(point, "value", entry.value)) {
                return std::nullopt;
            }
            entry.month = point.at("month").get<int>();
            entry.label = point.at("yearLabel").get<std::string>();
            results.projection.push_back(std::move(entry));
        }
    }

    // The tier is a pure function of the stored numbers
    results.health = score_health(results.coverage, results.effective_target);
    return results;
}

std::optional<Portfolio> portfolio_from_json_string(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return std::nullopt;
        }

        Portfolio portfolio = default_portfolio();

        if (j.contains("goals") && j["goals"].is_array() && !j["goals"].empty()) {
            Portfolio loaded;
            for (const auto& goal_json : j["goals"]) {
                if (!goal_json.is_object() || !goal_json.contains("inputs") ||
                    !goal_json["inputs"].is_object()) {
                    return std::nullopt;
                }

                Goal goal;
                goal.input = goal_input_from_json(goal_json.at("inputs"));

                uint64_t id = 0;
                if (goal_json.contains("id") && goal_json["id"].is_number_unsigned()) {
                    id = goal_json["id"].get<uint64_t>();
                }
                goal.id = (id == 0 || loaded.find(id) != nullptr) ? loaded.next_goal_id() : id;

                // Results with unreadable numbers are dropped; the goal recomputes
                if (goal_json.contains("results") && !goal_json["results"].is_null()) {
                    goal.results = results_from_json(goal_json["results"]);
                }
                loaded.add(std::move(goal));
            }
            loaded.set_risk_profile(portfolio.risk_profile());
            portfolio = std::move(loaded);
        }

        if (j.contains("riskProfile") && j["riskProfile"].is_string()) {
            portfolio.set_risk_profile(risk_profile_from_string(j["riskProfile"].get<std::string>()));
        }

        if (j.contains("monthlyIncome")) {
            portfolio.set_monthly_income(read_text(j, "monthlyIncome"));
        }

        return portfolio;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string portfolio_to_json_string(const Portfolio& portfolio) {
    return portfolio_to_json(portfolio).dump(2);
}

} // namespace io
} // namespace sipcalc
