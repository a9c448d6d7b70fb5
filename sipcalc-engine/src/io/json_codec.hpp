#ifndef SIPCALC_IO_JSON_CODEC_HPP
#define SIPCALC_IO_JSON_CODEC_HPP

#include "../goal.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sipcalc {
namespace io {

// Stored record layout (key "goal-planner-v1"):
// {
//   "goals": [ { "id": 1, "inputs": { "goalName": ..., ... }, "results": null | {...} } ],
//   "riskProfile": "moderate",
//   "monthlyIncome": "80000"
// }

nlohmann::json goal_input_to_json(const GoalInput& input);
nlohmann::json results_to_json(const Results& results);
nlohmann::json goal_to_json(const Goal& goal);
nlohmann::json portfolio_to_json(const Portfolio& portfolio);

// Numeric input fields may be stored as strings or numbers; missing fields
// read as blank.
GoalInput goal_input_from_json(const nlohmann::json& j);

// Returns nullopt when a numeric field is missing or not a number (non-finite
// values are written as null). Throws nlohmann::json::exception when a
// trajectory point has no month or label. The health score is re-derived from
// coverage.
std::optional<Results> results_from_json(const nlohmann::json& j);

// Rebuild a portfolio from a stored record.
// Fields missing from the record keep the default portfolio's values, and an
// empty goal list keeps the default goal. Returns nullopt when the text is not
// valid JSON or the record is structurally invalid.
std::optional<Portfolio> portfolio_from_json_string(const std::string& text);

std::string portfolio_to_json_string(const Portfolio& portfolio);

} // namespace io
} // namespace sipcalc

#endif // SIPCALC_IO_JSON_CODEC_HPP
