#ifndef SIPCALC_CONFIG_HPP
#define SIPCALC_CONFIG_HPP

#include "logger.hpp"
#include "scenario.hpp"
#include <stdexcept>
#include <string>

namespace sipcalc {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Planner settings read from a JSON file
 *
 * Example:
 *   @code
 *   {
 *     "state_dir": "${HOME}/.sipcalc",
 *     "logging": { "level": "DEBUG", "json": false, "file": "sipcalc.log" },
 *     "scenarios": { "extra_years": 2, "extra_contribution": 2000, "target_reduction": 200000 },
 *     "export": { "csv": "goals-dashboard.csv", "parquet": "goals.parquet" }
 *   }
 *   @endcode
 */
struct PlannerConfig {
    std::string state_dir;              ///< Directory holding the stored portfolio
    LoggerConfig logging;               ///< Logger settings
    ScenarioAdjustments scenarios;      ///< What-if perturbation sizes
    std::string export_csv_path;        ///< CSV export destination (empty = no export)
    std::string export_parquet_path;    ///< Parquet export destination (empty = no export)

    PlannerConfig();
};

/**
 * @brief Parses a planner configuration from a JSON string
 *
 * Missing keys keep their defaults.
 *
 * @throws ConfigParseError if JSON is invalid or a value is out of range
 */
PlannerConfig parse_planner_config_from_string(const std::string& json_string);

/**
 * @brief Parses a planner configuration from a JSON file
 *
 * Relative paths are resolved against the config file's directory.
 *
 * @throws ConfigParseError if the file cannot be read or is invalid
 */
PlannerConfig parse_planner_config_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of the config file
 *
 * Absolute and empty paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace sipcalc

#endif // SIPCALC_CONFIG_HPP
