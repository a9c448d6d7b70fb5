#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "projection.hpp"
#include "planner.hpp"
#include <cmath>

using namespace sipcalc;
using Catch::Approx;
using Catch::Matchers::WithinRel;

namespace {

NormalizedGoal make_goal(double target, double years, double savings,
                         double contribution, double annual_return, double inflation) {
    NormalizedGoal g;
    g.target_amount = target;
    g.years = years;
    g.current_savings = savings;
    g.monthly_contribution = contribution;
    g.annual_return = annual_return;
    g.inflation_rate = inflation;
    g.priority = 3;
    return g;
}

} // anonymous namespace

// ============================================================================
// Building blocks
// ============================================================================

TEST_CASE("inflation_factor compounds annually", "[projection]") {
    REQUIRE(inflation_factor(5.0, 5.0) == Approx(1.2762815625));
    REQUIRE(inflation_factor(0.0, 5.0) == 1.0);
    REQUIRE(inflation_factor(5.0, 0.0) == 1.0);
    REQUIRE(inflation_factor(5.0, -3.0) == 1.0);
    REQUIRE(inflation_factor(-2.0, 5.0) == 1.0);
}

TEST_CASE("projection_months rounds and never drops below one", "[projection]") {
    REQUIRE(projection_months(5.0) == 60);
    REQUIRE(projection_months(2.5) == 30);
    REQUIRE(projection_months(0.04) == 1);
    REQUIRE(projection_months(0.0) == 1);
    REQUIRE(projection_months(-3.0) == 1);
    REQUIRE(projection_months(1.0 / 24.0) == 1);
}

TEST_CASE("projection_months caps very long horizons", "[projection][edge]") {
    REQUIRE(projection_months(5000.0) == MAX_PROJECTION_MONTHS);
    REQUIRE(projection_months(1e300) == MAX_PROJECTION_MONTHS);
}

TEST_CASE("monthly_rate divides the annual percentage", "[projection]") {
    REQUIRE(monthly_rate(12.0) == Approx(0.01));
    REQUIRE(monthly_rate(0.0) == 0.0);
}

TEST_CASE("future value helpers take the linear branch at zero rate", "[projection]") {
    REQUIRE(future_value_lump(10000.0, 12, 0.0) == 10000.0);
    REQUIRE(future_value_sip(1000.0, 12, 0.0) == 12000.0);
}

TEST_CASE("future_value_sip is an ordinary annuity", "[projection]") {
    REQUIRE(future_value_sip(1000.0, 1, 0.01) == Approx(1000.0));
    REQUIRE(future_value_sip(1000.0, 2, 0.01) == Approx(2010.0));
}

TEST_CASE("month_label rounds half-up to one decimal", "[projection]") {
    REQUIRE(month_label(1) == "0.1y");
    REQUIRE(month_label(3) == "0.3y");
    REQUIRE(month_label(6) == "0.5y");
    REQUIRE(month_label(12) == "1.0y");
    REQUIRE(month_label(60) == "5.0y");
    REQUIRE(month_label(27) == "2.3y");
}

// ============================================================================
// Trajectory sampling
// ============================================================================

TEST_CASE("sample_trajectory keeps month 1, every sixth month and the last month", "[projection]") {
    auto points = sample_trajectory(0.0, 1000.0, 14, 0.0);
    REQUIRE(points.size() == 4);
    REQUIRE(points[0].month == 1);
    REQUIRE(points[1].month == 6);
    REQUIRE(points[2].month == 12);
    REQUIRE(points[3].month == 14);
    REQUIRE(points[3].value == 14000.0);
    REQUIRE(points[3].label == "1.2y");
}

TEST_CASE("sample_trajectory does not duplicate a final sampled month", "[projection]") {
    auto points = sample_trajectory(0.0, 1000.0, 12, 0.0);
    REQUIRE(points.size() == 3);
    REQUIRE(points.back().month == 12);
}

TEST_CASE("sample_trajectory with a single month", "[projection][edge]") {
    auto points = sample_trajectory(500.0, 100.0, 1, 0.01);
    REQUIRE(points.size() == 1);
    REQUIRE(points[0].month == 1);
    REQUIRE(points[0].value == Approx(605.0));
}

TEST_CASE("trajectory final value matches the closed form", "[projection]") {
    Results r = project_goal(make_goal(1500000, 5, 50000, 10000, 12, 5));
    REQUIRE(r.projection.back().month == r.months);
    REQUIRE_THAT(r.projection.back().value, WithinRel(r.fv_total, 1e-9));
}

// ============================================================================
// project_goal scenarios
// ============================================================================

TEST_CASE("project_goal on the default education goal", "[projection][scenario]") {
    Results r = project_goal(default_goal_input());

    REQUIRE(r.months == 60);
    REQUIRE(r.monthly_rate == Approx(0.01));
    REQUIRE(r.effective_target == Approx(1914422.34).margin(1.0));
    REQUIRE(r.fv_lump == Approx(90834.83).margin(1.0));
    REQUIRE(r.fv_sip == Approx(816696.70).margin(1.0));
    REQUIRE(r.fv_total == Approx(907531.53).margin(1.0));
    REQUIRE(r.coverage == Approx(0.474).margin(0.001));
    REQUIRE(r.gap == Approx(-1006890.81).margin(5.0));
    REQUIRE(r.required_contribution == Approx(22328.82).margin(1.0));
    REQUIRE(r.health.tier == HealthTier::VeryWeak);
    REQUIRE(r.projection.size() == 11);
}

TEST_CASE("project_goal with zero return is linear", "[projection][scenario]") {
    Results r = project_goal(make_goal(100000, 1, 10000, 1000, 0, 0));

    REQUIRE(r.months == 12);
    REQUIRE(r.fv_lump == 10000.0);
    REQUIRE(r.fv_sip == 12000.0);
    REQUIRE(r.fv_total == 22000.0);
    REQUIRE(r.effective_target == 100000.0);
    REQUIRE(r.required_contribution == Approx(90000.0 / 12.0));
    REQUIRE(r.health.tier == HealthTier::VeryWeak);
}

TEST_CASE("project_goal on an already funded goal", "[projection][scenario]") {
    Results r = project_goal(make_goal(100000, 3, 200000, 0, 10, 0));

    REQUIRE(r.fv_lump > r.effective_target);
    REQUIRE(r.required_contribution == 0.0);
    REQUIRE(r.gap > 0.0);
    REQUIRE(r.health.tier == HealthTier::Overachiever);
}

TEST_CASE("project_goal without a target is undefined", "[projection][edge]") {
    Results r = project_goal(make_goal(0, 5, 1000, 100, 12, 5));

    REQUIRE(r.effective_target == 0.0);
    REQUIRE(r.coverage == 0.0);
    REQUIRE(r.required_contribution == 0.0);
    REQUIRE(r.health.tier == HealthTier::Undefined);
    REQUIRE(r.fv_total > 0.0);
}

TEST_CASE("project_goal treats a non-positive horizon as one month", "[projection][edge]") {
    Results r = project_goal(make_goal(1000, 0, 0, 100, 12, 5));

    REQUIRE(r.months == 1);
    REQUIRE(r.effective_target == 1000.0);
    REQUIRE(r.fv_sip == Approx(100.0));
    REQUIRE(r.projection.size() == 1);
}

TEST_CASE("project_goal accepts negative returns", "[projection][edge]") {
    Results r = project_goal(make_goal(100000, 2, 10000, 1000, -6, 0));

    REQUIRE(r.monthly_rate == Approx(-0.005));
    REQUIRE(r.fv_lump < 10000.0);
    REQUIRE(r.fv_sip < 24000.0);
    REQUIRE(std::isfinite(r.required_contribution));
    REQUIRE(r.required_contribution >= 0.0);
}

TEST_CASE("project_goal is deterministic", "[projection]") {
    GoalInput input = default_goal_input();
    REQUIRE(project_goal(input) == project_goal(input));
}

TEST_CASE("project_goal on text input normalizes first", "[projection]") {
    GoalInput input = default_goal_input();
    input.annual_return = "twelve";
    Results r = project_goal(input);

    REQUIRE(r.monthly_rate == 0.0);
    REQUIRE(r.fv_lump == 50000.0);
    REQUIRE(r.fv_sip == 600000.0);
}

TEST_CASE("more contribution never lowers the total", "[projection]") {
    Results base = project_goal(make_goal(1000000, 10, 0, 5000, 10, 6));
    Results more = project_goal(make_goal(1000000, 10, 0, 6000, 10, 6));
    REQUIRE(more.fv_total > base.fv_total);
    REQUIRE(more.required_contribution == Approx(base.required_contribution));
}

TEST_CASE("coverage never falls as contribution or savings rise", "[projection][property]") {
    const double returns[] = {0.0, 8.0, 12.0};
    for (double annual_return : returns) {
        double previous = -1.0;
        for (double contribution = 0.0; contribution <= 40000.0; contribution += 2500.0) {
            Results r = project_goal(make_goal(1500000, 5, 50000, contribution, annual_return, 5));
            REQUIRE(r.coverage >= previous);
            previous = r.coverage;
        }

        previous = -1.0;
        for (double savings = 0.0; savings <= 2000000.0; savings += 125000.0) {
            Results r = project_goal(make_goal(1500000, 5, savings, 10000, annual_return, 5));
            REQUIRE(r.coverage >= previous);
            previous = r.coverage;
        }
    }
}
