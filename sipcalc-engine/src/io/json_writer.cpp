#include "json_writer.hpp"
#include "json_codec.hpp"
#include "../aggregate.hpp"
#include "../explanation.hpp"
#include "../input_normalizer.hpp"
#include <fstream>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;

namespace sipcalc {
namespace io {

namespace {

json summary_to_json(const AggregateSummary& summary) {
    json allocation = nullptr;
    if (summary.allocation) {
        allocation = json::array();
        for (const auto& s : *summary.allocation) {
            allocation.push_back(json{
                {"goal_id", s.goal_id},
                {"name", s.name},
                {"priority", s.priority},
                {"suggested_contribution", s.suggested_contribution}
            });
        }
    }

    return json{
        {"total_current_contribution", summary.total_current_contribution},
        {"total_required_contribution", summary.total_required_contribution},
        {"average_coverage", summary.coverage.average},
        {"covered_goals", summary.coverage.count},
        {"badge", {
            {"code", badge_to_string(summary.badge)},
            {"label", badge_label(summary.badge)}
        }},
        {"income_conflict", {
            {"level", conflict_level_to_string(summary.conflict.level)},
            {"required_percent", summary.conflict.required_percent},
            {"message", summary.conflict.message}
        }},
        {"allocation", allocation}
    };
}

} // anonymous namespace

json build_report_json(const Portfolio& portfolio, const ScenarioAdjustments& adjustments) {
    const double income_value = parse_number(portfolio.monthly_income());
    std::optional<double> income;
    if (income_value > 0.0) {
        income = income_value;
    }

    json goals = json::array();
    for (const auto& goal : portfolio.goals()) {
        json entry = goal_to_json(goal);
        entry["name"] = goal.display_name();

        if (goal.results) {
            ScenarioSet scenarios = run_scenarios(goal, adjustments);
            entry["scenarios"] = json{
                {"extended_horizon", results_to_json(scenarios.extended_horizon)},
                {"increased_contribution", results_to_json(scenarios.increased_contribution)},
                {"reduced_target", results_to_json(scenarios.reduced_target)}
            };
            entry["explanation"] = explain_plan(goal, portfolio.risk_profile(), income);
        } else {
            entry["scenarios"] = nullptr;
            entry["explanation"] = nullptr;
        }
        goals.push_back(entry);
    }

    return json{
        {"risk_profile", risk_profile_to_string(portfolio.risk_profile())},
        {"monthly_income", portfolio.monthly_income()},
        {"goals", goals},
        {"summary", summary_to_json(build_summary(portfolio))}
    };
}

void write_report_json(std::ostream& os, const Portfolio& portfolio,
                       const ScenarioAdjustments& adjustments, bool pretty_print) {
    json report = build_report_json(portfolio, adjustments);
    os << report.dump(pretty_print ? 2 : -1) << "\n";
}

void write_report_json(const std::string& filepath, const Portfolio& portfolio,
                       const ScenarioAdjustments& adjustments, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_report_json(file, portfolio, adjustments, pretty_print);
}

} // namespace io
} // namespace sipcalc
