#ifndef SIPCALC_IO_EXPORT_HPP
#define SIPCALC_IO_EXPORT_HPP

#include "../goal.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace sipcalc {
namespace io {

constexpr const char* DEFAULT_CSV_EXPORT = "goals-dashboard.csv";

// One dashboard row per goal. Cells are already rendered; a cell whose
// underlying value is zero, blank or not yet computed is empty.
struct ExportRow {
    uint64_t goal_id;
    std::string name;
    std::string category;
    std::string priority;
    std::string base_target;            // rounded normalized target
    std::string inflation_rate;
    std::string effective_target;       // rounded, from Results
    std::string years;
    std::string current_savings;
    std::string monthly_contribution;
    std::string annual_return;
    std::string projected_total;        // rounded, from Results
    std::string coverage_percent;       // one decimal, from Results
    std::string health_label;

    std::vector<std::string> cells() const;
};

const std::vector<std::string>& export_headers();

std::vector<ExportRow> build_export_rows(const Portfolio& portfolio);

// CSV with a plain header line followed by one fully quoted line per goal.
// Returns the number of goal rows written.
size_t write_goals_csv(std::ostream& os, const Portfolio& portfolio);

// Throws std::runtime_error if the file cannot be opened
size_t write_goals_csv(const std::string& filepath, const Portfolio& portfolio);

// Quote a cell, doubling embedded quotes
std::string quote_csv_cell(const std::string& value);

// Multi-line plain-text summary of one goal for sharing with an advisor.
// Lines whose value is blank, or that need Results the goal does not have,
// are left out.
std::string advisory_summary(const Goal& goal, RiskProfile risk);

} // namespace io
} // namespace sipcalc

#endif // SIPCALC_IO_EXPORT_HPP
