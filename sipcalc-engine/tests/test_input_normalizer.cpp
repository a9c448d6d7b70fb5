#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "input_normalizer.hpp"
#include "planner.hpp"

using namespace sipcalc;
using Catch::Approx;

// ============================================================================
// parse_number
// ============================================================================

TEST_CASE("parse_number reads plain numbers", "[normalizer]") {
    REQUIRE(parse_number("1500000") == 1500000.0);
    REQUIRE(parse_number("12.5") == Approx(12.5));
    REQUIRE(parse_number("-300") == -300.0);
    REQUIRE(parse_number("1e3") == 1000.0);
}

TEST_CASE("parse_number ignores surrounding whitespace", "[normalizer]") {
    REQUIRE(parse_number("  42 ") == 42.0);
    REQUIRE(parse_number("\t7\n") == 7.0);
}

TEST_CASE("parse_number maps malformed text to zero", "[normalizer][edge]") {
    REQUIRE(parse_number("") == 0.0);
    REQUIRE(parse_number("   ") == 0.0);
    REQUIRE(parse_number("abc") == 0.0);
    REQUIRE(parse_number("12abc") == 0.0);
    REQUIRE(parse_number("1,50,000") == 0.0);
    REQUIRE(parse_number("inf") == 0.0);
    REQUIRE(parse_number("nan") == 0.0);
    REQUIRE(parse_number("1e999") == 0.0);
}

// ============================================================================
// normalize_priority
// ============================================================================

TEST_CASE("normalize_priority clamps into 1..5", "[normalizer]") {
    REQUIRE(normalize_priority("3") == 3);
    REQUIRE(normalize_priority("0") == 1);
    REQUIRE(normalize_priority("-4") == 1);
    REQUIRE(normalize_priority("9") == 5);
    REQUIRE(normalize_priority("") == 1);
    REQUIRE(normalize_priority("high") == 1);
}

TEST_CASE("normalize_priority rounds fractional values", "[normalizer]") {
    REQUIRE(normalize_priority("2.4") == 2);
    REQUIRE(normalize_priority("2.6") == 3);
    REQUIRE(normalize_priority("4.9") == 5);
}

// ============================================================================
// normalize
// ============================================================================

TEST_CASE("normalize converts the default goal", "[normalizer]") {
    NormalizedGoal g = normalize(default_goal_input());
    REQUIRE(g.target_amount == 1500000.0);
    REQUIRE(g.years == 5.0);
    REQUIRE(g.current_savings == 50000.0);
    REQUIRE(g.monthly_contribution == 10000.0);
    REQUIRE(g.annual_return == 12.0);
    REQUIRE(g.inflation_rate == 5.0);
    REQUIRE(g.priority == 3);
    REQUIRE(g.contribution_streak == 0);
}

TEST_CASE("normalize is total over blank input", "[normalizer][edge]") {
    GoalInput blank;
    NormalizedGoal g = normalize(blank);
    REQUIRE(g.target_amount == 0.0);
    REQUIRE(g.years == 0.0);
    REQUIRE(g.current_savings == 0.0);
    REQUIRE(g.monthly_contribution == 0.0);
    REQUIRE(g.annual_return == 0.0);
    REQUIRE(g.inflation_rate == 0.0);
    REQUIRE(g.priority == 1);
    REQUIRE(g.contribution_streak == 0);
}

TEST_CASE("normalize keeps the contribution streak as whole months", "[normalizer]") {
    GoalInput input = default_goal_input();
    input.contribution_streak = "17.6";
    REQUIRE(normalize(input).contribution_streak == 18);

    input.contribution_streak = "-3";
    REQUIRE(normalize(input).contribution_streak == 0);
}
