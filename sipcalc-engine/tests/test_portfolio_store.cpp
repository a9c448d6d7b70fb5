#include <catch2/catch_test_macros.hpp>
#include "io/portfolio_store.hpp"
#include "io/json_codec.hpp"
#include "planner.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace sipcalc;
using namespace sipcalc::io;

namespace fs = std::filesystem;

namespace {

Portfolio make_computed_portfolio() {
    Portfolio p = add_goal(default_portfolio());
    p = set_monthly_income(p, "80000");
    p = apply_risk_profile(p, 2, RiskProfile::Aggressive);
    return compute_goal(p, 1);
}

fs::path fresh_directory(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    return dir;
}

} // anonymous namespace

// ============================================================================
// Codec
// ============================================================================

TEST_CASE("stored record keeps goals, risk profile and income", "[store][json]") {
    Portfolio p = make_computed_portfolio();
    auto restored = portfolio_from_json_string(portfolio_to_json_string(p));

    REQUIRE(restored.has_value());
    REQUIRE(*restored == p);
    REQUIRE(restored->get(0).results.has_value());
    REQUIRE_FALSE(restored->get(1).results.has_value());
}

TEST_CASE("stored record uses the planner field names", "[store][json]") {
    nlohmann::json j = portfolio_to_json(default_portfolio());

    REQUIRE(j["riskProfile"].get<std::string>() == "moderate");
    REQUIRE(j["monthlyIncome"].get<std::string>().empty());
    REQUIRE(j["goals"].size() == 1);
    REQUIRE(j["goals"][0]["id"].get<uint64_t>() == 1);
    REQUIRE(j["goals"][0]["inputs"]["goalName"].get<std::string>() == "Master's abroad fund");
    REQUIRE(j["goals"][0]["inputs"]["targetAmount"].get<std::string>() == "1500000");
    REQUIRE(j["goals"][0]["results"].is_null());
}

TEST_CASE("numeric fields may be stored as numbers", "[store][json]") {
    auto p = portfolio_from_json_string(R"({
        "goals": [ { "id": 3, "inputs": { "goalName": "Car", "targetAmount": 800000,
                     "years": 2.5, "annualReturn": 9 }, "results": null } ],
        "riskProfile": "conservative",
        "monthlyIncome": 65000
    })");

    REQUIRE(p.has_value());
    REQUIRE(p->size() == 1);
    REQUIRE(p->get(0).id == 3);
    REQUIRE(p->get(0).input.target_amount == "800000");
    REQUIRE(p->get(0).input.years == "2.5");
    REQUIRE(p->get(0).input.annual_return == "9");
    REQUIRE(p->get(0).input.current_savings.empty());
    REQUIRE(p->risk_profile() == RiskProfile::Conservative);
    REQUIRE(p->monthly_income() == "65000");
}

TEST_CASE("missing fields keep the default portfolio values", "[store][json]") {
    auto p = portfolio_from_json_string(R"({ "monthlyIncome": "50000" })");

    REQUIRE(p.has_value());
    REQUIRE(p->size() == 1);
    REQUIRE(p->get(0).input == default_goal_input());
    REQUIRE(p->monthly_income() == "50000");

    auto empty_goals = portfolio_from_json_string(R"({ "goals": [] })");
    REQUIRE(empty_goals.has_value());
    REQUIRE(*empty_goals == default_portfolio());
}

TEST_CASE("malformed records are rejected", "[store][json][error]") {
    REQUIRE_FALSE(portfolio_from_json_string("").has_value());
    REQUIRE_FALSE(portfolio_from_json_string("{not json").has_value());
    REQUIRE_FALSE(portfolio_from_json_string("[1, 2, 3]").has_value());
    REQUIRE_FALSE(portfolio_from_json_string(R"({ "goals": [ 5 ] })").has_value());
    REQUIRE_FALSE(portfolio_from_json_string(R"({ "goals": [ { "id": 1 } ] })").has_value());
}

TEST_CASE("unreadable stored results are dropped for that goal only", "[store][json][edge]") {
    auto p = portfolio_from_json_string(R"({
        "goals": [ { "id": 1, "inputs": { "goalName": "A" }, "results": { "fvLump": "x" } },
                   { "id": 2, "inputs": { "goalName": "B" }, "results": 7 } ],
        "monthlyIncome": "50000"
    })");

    REQUIRE(p.has_value());
    REQUIRE(p->size() == 2);
    REQUIRE(p->get(0).input.name == "A");
    REQUIRE_FALSE(p->get(0).results.has_value());
    REQUIRE(p->get(1).input.name == "B");
    REQUIRE_FALSE(p->get(1).results.has_value());
    REQUIRE(p->monthly_income() == "50000");
}

TEST_CASE("goals with non-finite results survive a save and load", "[store][json][edge]") {
    Portfolio p = add_goal(default_portfolio());
    GoalInput runaway = p.get(1).input;
    runaway.annual_return = "1e9";
    p = update_goal_input(p, 2, runaway);
    p = compute_all(p);

    REQUIRE(p.get(1).results.has_value());
    REQUIRE(std::isinf(p.get(1).results->fv_total));

    MemoryPortfolioStore store;
    store.save(p);
    Portfolio restored = load_or_default(store);

    REQUIRE(restored.size() == 2);
    REQUIRE(restored.get(0).id == 1);
    REQUIRE(restored.get(0).results.has_value());
    REQUIRE(*restored.get(0).results == *p.get(0).results);
    REQUIRE(restored.get(1).id == 2);
    REQUIRE(restored.get(1).input == runaway);
    REQUIRE_FALSE(restored.get(1).results.has_value());
}

TEST_CASE("duplicate stored ids are reassigned", "[store][json]") {
    auto p = portfolio_from_json_string(R"({
        "goals": [ { "id": 2, "inputs": { "goalName": "A" } },
                   { "id": 2, "inputs": { "goalName": "B" } },
                   { "inputs": { "goalName": "C" } } ]
    })");

    REQUIRE(p.has_value());
    REQUIRE(p->get(0).id == 2);
    REQUIRE(p->get(1).id == 3);
    REQUIRE(p->get(2).id == 4);
}

// ============================================================================
// Stores
// ============================================================================

TEST_CASE("memory store round trip", "[store]") {
    MemoryPortfolioStore store;
    REQUIRE_FALSE(store.load().has_value());

    Portfolio p = make_computed_portfolio();
    store.save(p);

    REQUIRE(store.raw().has_value());
    REQUIRE(store.load() == p);
}

TEST_CASE("load_or_default falls back on missing state", "[store][fallback]") {
    MemoryPortfolioStore store;
    REQUIRE(load_or_default(store) == default_portfolio());
}

TEST_CASE("load_or_default falls back on corrupt state", "[store][fallback]") {
    MemoryPortfolioStore store;
    store.set_raw("{\"goals\": [ oops");
    REQUIRE(load_or_default(store) == default_portfolio());
}

TEST_CASE("load_or_default returns stored state", "[store]") {
    MemoryPortfolioStore store;
    Portfolio p = make_computed_portfolio();
    store.save(p);
    REQUIRE(load_or_default(store) == p);
}

TEST_CASE("file store writes goal-planner-v1.json", "[store][file]") {
    fs::path dir = fresh_directory("sipcalc_test_file_store");
    FilePortfolioStore store(dir.string());

    REQUIRE(store.path() == (dir / "goal-planner-v1.json").string());
    REQUIRE_FALSE(store.load().has_value());

    Portfolio p = make_computed_portfolio();
    store.save(p);
    REQUIRE(fs::exists(dir / "goal-planner-v1.json"));

    FilePortfolioStore reopened(dir.string());
    REQUIRE(reopened.load() == p);

    fs::remove_all(dir);
}

TEST_CASE("file store with a corrupt file falls back to the default", "[store][file][fallback]") {
    fs::path dir = fresh_directory("sipcalc_test_corrupt_store");
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "goal-planner-v1.json");
        out << "definitely not json";
    }

    FilePortfolioStore store(dir.string());
    REQUIRE_FALSE(store.load().has_value());
    REQUIRE(load_or_default(store) == default_portfolio());

    fs::remove_all(dir);
}
