#include "export.hpp"
#include "../format.hpp"
#include "../input_normalizer.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace sipcalc {
namespace io {

namespace {

std::string whole_or_empty(double value) {
    if (value == 0.0) {
        return "";
    }
    return format_decimal(round_currency(value), 0);
}

std::string or_default(const std::string& value, const std::string& fallback) {
    return value.empty() ? fallback : value;
}

} // anonymous namespace

// ============================================================================
// Dashboard rows
// ============================================================================

std::vector<std::string> ExportRow::cells() const {
    return {
        std::to_string(goal_id),
        name,
        category,
        priority,
        base_target,
        inflation_rate,
        effective_target,
        years,
        current_savings,
        monthly_contribution,
        annual_return,
        projected_total,
        coverage_percent,
        health_label
    };
}

const std::vector<std::string>& export_headers() {
    static const std::vector<std::string> headers = {
        "Goal ID",
        "Goal Name",
        "Goal Type",
        "Priority",
        "Base Target",
        "Inflation Rate",
        "Inflation Adjusted Target",
        "Years",
        "Current Savings",
        "Monthly SIP",
        "Expected Return",
        "Projected Total",
        "Coverage %",
        "Health Label"
    };
    return headers;
}

std::vector<ExportRow> build_export_rows(const Portfolio& portfolio) {
    std::vector<ExportRow> rows;
    rows.reserve(portfolio.size());

    for (const auto& goal : portfolio.goals()) {
        const GoalInput& in = goal.input;

        ExportRow row;
        row.goal_id = goal.id;
        row.name = in.name;
        row.category = in.category;
        row.priority = in.priority;
        row.base_target = whole_or_empty(parse_number(in.target_amount));
        row.inflation_rate = in.inflation_rate;
        row.years = in.years;
        row.current_savings = in.current_savings;
        row.monthly_contribution = in.monthly_contribution;
        row.annual_return = in.annual_return;

        if (goal.results) {
            const Results& r = *goal.results;
            row.effective_target = whole_or_empty(r.effective_target);
            row.projected_total = format_decimal(round_currency(r.fv_total), 0);
            row.coverage_percent = format_decimal(r.coverage * 100.0, 1);
            row.health_label = r.health.label;
        }

        rows.push_back(std::move(row));
    }

    return rows;
}

// ============================================================================
// CSV output
// ============================================================================

std::string quote_csv_cell(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

size_t write_goals_csv(std::ostream& os, const Portfolio& portfolio) {
    const auto& headers = export_headers();
    for (size_t i = 0; i < headers.size(); ++i) {
        if (i > 0) os << ",";
        os << headers[i];
    }

    auto rows = build_export_rows(portfolio);
    for (const auto& row : rows) {
        os << "\n";
        auto cells = row.cells();
        for (size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) os << ",";
            os << quote_csv_cell(cells[i]);
        }
    }
    os << "\n";

    return rows.size();
}

size_t write_goals_csv(const std::string& filepath, const Portfolio& portfolio) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return write_goals_csv(file, portfolio);
}

// ============================================================================
// Advisory summary
// ============================================================================

std::string advisory_summary(const Goal& goal, RiskProfile risk) {
    const GoalInput& in = goal.input;
    const std::optional<Results>& r = goal.results;

    std::vector<std::string> lines;
    lines.push_back("Goal: " + or_default(in.name, "Unnamed goal"));
    lines.push_back("Type: " + or_default(in.category, "Not specified"));
    lines.push_back("Time horizon: " + or_default(in.years, "-") + " years");

    if (!in.target_amount.empty()) {
        lines.push_back("Base target today: " + format_inr(parse_number(in.target_amount)));
    }
    if (r) {
        lines.push_back("Inflation-adjusted target at " + or_default(in.inflation_rate, "0") +
                        "%: " + format_inr(r->effective_target));
    }
    if (!in.current_savings.empty()) {
        lines.push_back("Current savings: " + format_inr(parse_number(in.current_savings)));
    }
    if (!in.monthly_contribution.empty()) {
        lines.push_back("Current monthly SIP: " + format_inr(parse_number(in.monthly_contribution)));
    }
    if (r) {
        lines.push_back("Projected total at " + or_default(in.annual_return, "0") +
                        "%: " + format_inr(r->fv_total));
        lines.push_back("Coverage vs inflation-adjusted target: " +
                        format_decimal(r->coverage * 100.0, 1) + "%");
        lines.push_back("Required monthly SIP to fully fund: " +
                        format_inr(std::max(0.0, r->required_contribution)));
    }
    lines.push_back("Risk profile: " + risk_profile_to_string(risk));

    std::string summary;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) summary += "\n";
        summary += lines[i];
    }
    return summary;
}

} // namespace io
} // namespace sipcalc
