#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace sipcalc {

PlannerConfig::PlannerConfig() : state_dir(".") {}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated reference, leave the rest untouched
                break;
            }
            pos++; // Skip '}'
        }

        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }

    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

namespace {

double read_non_negative(const json& section, const char* key, double fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    double value = section[key].get<double>();
    if (value < 0.0) {
        throw ConfigParseError(std::string("scenarios.") + key + " must be non-negative");
    }
    return value;
}

} // anonymous namespace

PlannerConfig parse_planner_config_from_string(const std::string& json_string) {
    PlannerConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Config root must be a JSON object");
        }

        if (j.contains("state_dir")) {
            config.state_dir = expand_environment_variables(j["state_dir"].get<std::string>());
        }

        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            if (logging.contains("level")) {
                config.logging.min_level = string_to_level(logging["level"].get<std::string>());
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file")) {
                config.logging.enable_file = true;
                config.logging.log_file_path =
                    expand_environment_variables(logging["file"].get<std::string>());
            }
        }

        if (j.contains("scenarios")) {
            const auto& scenarios = j["scenarios"];
            config.scenarios.extra_years =
                read_non_negative(scenarios, "extra_years", config.scenarios.extra_years);
            config.scenarios.extra_contribution =
                read_non_negative(scenarios, "extra_contribution", config.scenarios.extra_contribution);
            config.scenarios.target_reduction =
                read_non_negative(scenarios, "target_reduction", config.scenarios.target_reduction);
        }

        if (j.contains("export")) {
            const auto& exp = j["export"];
            if (exp.contains("csv")) {
                config.export_csv_path = expand_environment_variables(exp["csv"].get<std::string>());
            }
            if (exp.contains("parquet")) {
                config.export_parquet_path =
                    expand_environment_variables(exp["parquet"].get<std::string>());
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

PlannerConfig parse_planner_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    PlannerConfig config = parse_planner_config_from_string(buffer.str());

    config.state_dir = resolve_relative_path(config.state_dir, file_path);
    config.export_csv_path = resolve_relative_path(config.export_csv_path, file_path);
    config.export_parquet_path = resolve_relative_path(config.export_parquet_path, file_path);
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace sipcalc
