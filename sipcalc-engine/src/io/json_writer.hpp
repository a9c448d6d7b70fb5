#ifndef SIPCALC_IO_JSON_WRITER_HPP
#define SIPCALC_IO_JSON_WRITER_HPP

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "../goal.hpp"
#include "../scenario.hpp"

namespace sipcalc {
namespace io {

// Planner report: every goal with its inputs, Results, what-if scenarios and
// explanation, followed by the portfolio summary. Goals that have not been
// computed carry null results and no scenarios.
nlohmann::json build_report_json(const Portfolio& portfolio,
                                  const ScenarioAdjustments& adjustments = ScenarioAdjustments());

// Write the planner report to a stream
void write_report_json(std::ostream& os, const Portfolio& portfolio,
                       const ScenarioAdjustments& adjustments = ScenarioAdjustments(),
                       bool pretty_print = true);

// Write the planner report to a file
void write_report_json(const std::string& filepath, const Portfolio& portfolio,
                       const ScenarioAdjustments& adjustments = ScenarioAdjustments(),
                       bool pretty_print = true);

} // namespace io
} // namespace sipcalc

#endif // SIPCALC_IO_JSON_WRITER_HPP
