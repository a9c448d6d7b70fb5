#include <catch2/catch_test_macros.hpp>
#include "io/export.hpp"
#include "io/parquet_writer.hpp"
#include "planner.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace sipcalc;
using namespace sipcalc::io;

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream is(text);
    std::string line;
    while (std::getline(is, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

// ============================================================================
// Dashboard rows
// ============================================================================

TEST_CASE("export rows for a computed goal", "[export]") {
    Portfolio p = compute_all(default_portfolio());
    auto rows = build_export_rows(p);

    REQUIRE(rows.size() == 1);
    const ExportRow& row = rows[0];
    REQUIRE(row.goal_id == 1);
    REQUIRE(row.name == "Master's abroad fund");
    REQUIRE(row.category == "Education");
    REQUIRE(row.priority == "3");
    REQUIRE(row.base_target == "1500000");
    REQUIRE(row.inflation_rate == "5");
    REQUIRE(row.effective_target == "1914422");
    REQUIRE(row.years == "5");
    REQUIRE(row.current_savings == "50000");
    REQUIRE(row.monthly_contribution == "10000");
    REQUIRE(row.annual_return == "12");
    REQUIRE(row.projected_total == "907532");
    REQUIRE(row.coverage_percent == "47.4");
    REQUIRE(row.health_label == "Very weak - huge shortfall");
    REQUIRE(row.cells().size() == export_headers().size());
}

TEST_CASE("export rows leave computed cells empty before computation", "[export]") {
    Portfolio p = default_portfolio();
    GoalInput input = p.get(0).input;
    input.target_amount = "abc";
    p = update_goal_input(p, 1, input);

    ExportRow row = build_export_rows(p)[0];
    REQUIRE(row.base_target.empty());
    REQUIRE(row.effective_target.empty());
    REQUIRE(row.projected_total.empty());
    REQUIRE(row.coverage_percent.empty());
    REQUIRE(row.health_label.empty());
    REQUIRE(row.years == "5");
}

// ============================================================================
// CSV
// ============================================================================

TEST_CASE("quote_csv_cell doubles embedded quotes", "[export][csv]") {
    REQUIRE(quote_csv_cell("plain") == "\"plain\"");
    REQUIRE(quote_csv_cell("") == "\"\"");
    REQUIRE(quote_csv_cell("Say \"hi\", then go") == "\"Say \"\"hi\"\", then go\"");
}

TEST_CASE("goals CSV has a header line and one quoted line per goal", "[export][csv]") {
    Portfolio p = compute_all(add_goal(default_portfolio()));
    std::ostringstream os;
    size_t written = write_goals_csv(os, p);

    REQUIRE(written == 2);
    auto lines = split_lines(os.str());
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0] ==
            "Goal ID,Goal Name,Goal Type,Priority,Base Target,Inflation Rate,"
            "Inflation Adjusted Target,Years,Current Savings,Monthly SIP,Expected Return,"
            "Projected Total,Coverage %,Health Label");
    REQUIRE(lines[1].rfind("\"1\",\"Master's abroad fund\",\"Education\",\"3\",\"1500000\"", 0) == 0);
    REQUIRE(lines[2].rfind("\"2\",\"New goal 2\"", 0) == 0);
}

TEST_CASE("goals CSV to an unwritable path throws", "[export][csv][error]") {
    REQUIRE_THROWS_AS(write_goals_csv("/nonexistent/dir/goals.csv", default_portfolio()),
                      std::runtime_error);
}

TEST_CASE("goals CSV file is written", "[export][csv]") {
    auto path = std::filesystem::temp_directory_path() / DEFAULT_CSV_EXPORT;
    REQUIRE(write_goals_csv(path.string(), compute_all(default_portfolio())) == 1);

    std::ifstream in(path);
    std::string header;
    REQUIRE(static_cast<bool>(std::getline(in, header)));
    REQUIRE(header.rfind("Goal ID,", 0) == 0);
    std::filesystem::remove(path);
}

// ============================================================================
// Parquet
// ============================================================================

#ifndef HAVE_ARROW
TEST_CASE("Parquet export without Arrow throws", "[export][parquet]") {
    REQUIRE_THROWS_AS(ParquetWriter::write_goals(default_portfolio(), "/tmp/goals.parquet"),
                      std::runtime_error);
}
#else
TEST_CASE("Parquet export writes one row per goal", "[export][parquet]") {
    auto path = std::filesystem::temp_directory_path() / "sipcalc_goals.parquet";
    Portfolio p = compute_goal(add_goal(default_portfolio()), 1);
    REQUIRE(ParquetWriter::write_goals(p, path.string()) == 2);
    REQUIRE(std::filesystem::exists(path));
    std::filesystem::remove(path);
}
#endif

// ============================================================================
// Advisory summary
// ============================================================================

TEST_CASE("advisory summary of a computed goal", "[export][summary]") {
    Goal goal = compute_all(default_portfolio()).get(0);
    std::string summary = advisory_summary(goal, RiskProfile::Moderate);

    REQUIRE(summary ==
            "Goal: Master's abroad fund\n"
            "Type: Education\n"
            "Time horizon: 5 years\n"
            "Base target today: ₹15,00,000\n"
            "Inflation-adjusted target at 5%: ₹19,14,422\n"
            "Current savings: ₹50,000\n"
            "Current monthly SIP: ₹10,000\n"
            "Projected total at 12%: ₹9,07,532\n"
            "Coverage vs inflation-adjusted target: 47.4%\n"
            "Required monthly SIP to fully fund: ₹22,329\n"
            "Risk profile: moderate");
}

TEST_CASE("advisory summary omits blank and uncomputed lines", "[export][summary][edge]") {
    Goal goal;
    goal.id = 1;
    std::string summary = advisory_summary(goal, RiskProfile::Aggressive);

    REQUIRE(summary ==
            "Goal: Unnamed goal\n"
            "Type: Not specified\n"
            "Time horizon: - years\n"
            "Risk profile: aggressive");
}
