#include <iostream>
#include <fstream>
#include <string>
#include <cstdint>
#include <cstdlib>
#include "goal.hpp"
#include "planner.hpp"
#include "aggregate.hpp"
#include "config.hpp"
#include "format.hpp"
#include "logger.hpp"
#include "io/export.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/portfolio_store.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    std::string state_dir;
    std::string goals_path;
    std::string income;
    std::string risk;
    std::string output_path;
    std::string export_csv_path;
    std::string export_parquet_path;
    std::string log_level;
    uint64_t goal_id = 0;           // 0 = first goal
    uint64_t remove_goal_id = 0;
    bool has_income = false;
    bool add_goal = false;
    bool summary = false;
    bool no_save = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "SIPCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "State options:\n";
    std::cerr << "  --config <path>             JSON configuration file\n";
    std::cerr << "  --state-dir <dir>           Directory of the stored portfolio (default: .)\n";
    std::cerr << "  --goals <path>              Import goals from a CSV file\n";
    std::cerr << "  --no-save                   Do not write the portfolio back to the state directory\n\n";
    std::cerr << "Planning options:\n";
    std::cerr << "  --add-goal                  Append a new goal with default inputs\n";
    std::cerr << "  --remove-goal <id>          Remove a goal (the last goal is always kept)\n";
    std::cerr << "  --goal <id>                 Active goal for --risk and --summary (default: first goal)\n";
    std::cerr << "  --risk <profile>            conservative, moderate or aggressive; also sets the\n";
    std::cerr << "                              active goal's expected return to 8, 12 or 16%\n";
    std::cerr << "  --income <amount>           Monthly income used for conflict and allocation checks\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON report file (default: stdout)\n";
    std::cerr << "  --summary                   Print the advisory summary of the active goal instead\n";
    std::cerr << "                              of the JSON report\n";
    std::cerr << "  --export-csv <path>         Write the goals dashboard as CSV\n";
    std::cerr << "  --export-parquet <path>     Write the goals dashboard as Parquet\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Plan the stored goals with an income check:\n";
    std::cerr << "     " << program_name << " --state-dir ~/.sipcalc --income 80000 \\\n";
    std::cerr << "         --output report.json\n\n";
    std::cerr << "  2. Import goals and export the dashboard:\n";
    std::cerr << "     " << program_name << " --goals data/goals.csv --risk aggressive \\\n";
    std::cerr << "         --export-csv goals-dashboard.csv --no-save\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_id(const std::string& text, uint64_t& id) {
    try {
        size_t consumed = 0;
        unsigned long long value = std::stoull(text, &consumed);
        if (consumed != text.size() || value == 0) {
            return false;
        }
        id = static_cast<uint64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--state-dir" && i + 1 < argc) {
            args.state_dir = argv[++i];
        } else if (arg == "--goals" && i + 1 < argc) {
            args.goals_path = argv[++i];
        } else if (arg == "--no-save") {
            args.no_save = true;
        } else if (arg == "--add-goal") {
            args.add_goal = true;
        } else if (arg == "--remove-goal" && i + 1 < argc) {
            if (!parse_id(argv[++i], args.remove_goal_id)) {
                std::cerr << "Error: Invalid goal id: " << argv[i] << "\n\n";
                return false;
            }
        } else if (arg == "--goal" && i + 1 < argc) {
            if (!parse_id(argv[++i], args.goal_id)) {
                std::cerr << "Error: Invalid goal id: " << argv[i] << "\n\n";
                return false;
            }
        } else if (arg == "--risk" && i + 1 < argc) {
            args.risk = argv[++i];
        } else if (arg == "--income" && i + 1 < argc) {
            args.income = argv[++i];
            args.has_income = true;
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--summary") {
            args.summary = true;
        } else if (arg == "--export-csv" && i + 1 < argc) {
            args.export_csv_path = argv[++i];
        } else if (arg == "--export-parquet" && i + 1 < argc) {
            args.export_parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (!args.goals_path.empty() && !file_exists(args.goals_path)) {
        std::cerr << "Error: Goals file not found: " << args.goals_path << "\n";
        valid = false;
    }

    if (!args.risk.empty() &&
        args.risk != "conservative" && args.risk != "moderate" && args.risk != "aggressive") {
        std::cerr << "Error: --risk must be conservative, moderate or aggressive\n";
        valid = false;
    }

    if (!args.log_level.empty() &&
        args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

// Imported goals replace the stored ones; risk profile and income carry over
sipcalc::Portfolio import_goals(const std::string& path, const sipcalc::Portfolio& current) {
    sipcalc::Portfolio imported = sipcalc::Portfolio::load_from_csv(path);
    if (imported.empty()) {
        throw std::runtime_error("No goals found in " + path);
    }
    imported.set_risk_profile(current.risk_profile());
    imported.set_monthly_income(current.monthly_income());
    return imported;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    sipcalc::Logger& logger = sipcalc::Logger::get_instance();
    sipcalc::LogContext ctx("cli", "startup");

    try {
        sipcalc::PlannerConfig config;
        if (!args.config_path.empty()) {
            config = sipcalc::parse_planner_config_from_file(args.config_path);
        }

        // Command line overrides the config file
        if (!args.state_dir.empty()) config.state_dir = args.state_dir;
        if (!args.export_csv_path.empty()) config.export_csv_path = args.export_csv_path;
        if (!args.export_parquet_path.empty()) config.export_parquet_path = args.export_parquet_path;
        if (!args.log_level.empty()) config.logging.min_level = sipcalc::string_to_level(args.log_level);

        logger.configure(config.logging);

        // Load stored state
        sipcalc::io::FilePortfolioStore store(config.state_dir);
        sipcalc::Portfolio portfolio = sipcalc::io::load_or_default(store);

        if (!args.goals_path.empty()) {
            portfolio = import_goals(args.goals_path, portfolio);
            logger.log_portfolio_loaded(sipcalc::LogContext("cli", "import"),
                                        args.goals_path, portfolio.size());
        }

        // Apply edits
        if (args.add_goal) {
            portfolio = sipcalc::add_goal(portfolio);
        }
        if (args.remove_goal_id != 0) {
            portfolio = sipcalc::remove_goal(portfolio, args.remove_goal_id);
        }
        if (args.has_income) {
            portfolio = sipcalc::set_monthly_income(portfolio, args.income);
        }

        uint64_t active_id = args.goal_id != 0 ? args.goal_id : portfolio.get(0).id;
        if (portfolio.find(active_id) == nullptr) {
            throw std::runtime_error("Unknown goal id: " + std::to_string(active_id));
        }

        if (!args.risk.empty()) {
            portfolio = sipcalc::apply_risk_profile(
                portfolio, active_id, sipcalc::risk_profile_from_string(args.risk));
        }

        // Compute every goal
        portfolio = sipcalc::compute_all(portfolio);
        sipcalc::LogContext compute_ctx("planner", "compute");
        for (const auto& goal : portfolio.goals()) {
            logger.log_goal_computed(compute_ctx, goal);
        }

        sipcalc::AggregateSummary summary = sipcalc::build_summary(portfolio);
        std::cerr << "\nPortfolio:\n";
        std::cerr << "  Goals:             " << portfolio.size() << "\n";
        std::cerr << "  Risk profile:      " << sipcalc::risk_profile_to_string(portfolio.risk_profile()) << "\n";
        std::cerr << "  Monthly SIPs:      " << sipcalc::format_inr(summary.total_current_contribution) << "\n";
        std::cerr << "  Required SIPs:     " << sipcalc::format_inr(summary.total_required_contribution) << "\n";
        std::cerr << "  Average coverage:  " << sipcalc::format_decimal(summary.coverage.average * 100.0, 1) << "%\n";
        std::cerr << "  Status:            " << sipcalc::badge_label(summary.badge) << "\n";
        std::cerr << "  Income check:      " << summary.conflict.message << "\n";

        // Write report
        sipcalc::LogContext export_ctx("export", "export");
        if (args.summary) {
            std::cout << sipcalc::io::advisory_summary(*portfolio.find(active_id),
                                                       portfolio.risk_profile()) << "\n";
        } else if (args.output_path.empty()) {
            sipcalc::io::write_report_json(std::cout, portfolio, config.scenarios);
        } else {
            sipcalc::io::write_report_json(args.output_path, portfolio, config.scenarios);
            logger.log_export_written(export_ctx, "json", args.output_path, portfolio.size());
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        if (!config.export_csv_path.empty()) {
            size_t rows = sipcalc::io::write_goals_csv(config.export_csv_path, portfolio);
            logger.log_export_written(export_ctx, "csv", config.export_csv_path, rows);
        }

        if (!config.export_parquet_path.empty()) {
            size_t rows = sipcalc::ParquetWriter::write_goals(portfolio, config.export_parquet_path);
            logger.log_export_written(export_ctx, "parquet", config.export_parquet_path, rows);
        }

        if (!args.no_save) {
            store.save(portfolio);
            logger.log_info(sipcalc::LogContext("store", "save"), "Portfolio saved to " + store.path());
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
