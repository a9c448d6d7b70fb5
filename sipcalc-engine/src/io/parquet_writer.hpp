#ifndef SIPCALC_PARQUET_WRITER_HPP
#define SIPCALC_PARQUET_WRITER_HPP

#include "../goal.hpp"
#include <string>

namespace sipcalc {

class ParquetWriter {
public:
    /**
     * Write the goals dashboard to a Parquet file.
     *
     * Output schema:
     *   - goal_id: uint64
     *   - goal_name: utf8
     *   - goal_type: utf8
     *   - priority: int32 (normalized 1-5)
     *   - base_target: float64
     *   - inflation_rate: float64
     *   - effective_target: float64 (null when not computed)
     *   - years: float64
     *   - current_savings: float64
     *   - monthly_contribution: float64
     *   - annual_return: float64
     *   - projected_total: float64 (null when not computed)
     *   - coverage: float64 (null when not computed)
     *   - health_label: utf8 (null when not computed)
     *
     * @param portfolio Goals to write, one row each
     * @param filepath Path to output Parquet file
     * @return Number of rows written
     * @throws std::runtime_error if the file cannot be written or Arrow is unavailable
     */
    static size_t write_goals(const Portfolio& portfolio, const std::string& filepath);
};

} // namespace sipcalc

#endif // SIPCALC_PARQUET_WRITER_HPP
