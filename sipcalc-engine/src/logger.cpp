/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "format.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace sipcalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;

    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_portfolio_loaded(
    const LogContext& ctx,
    const std::string& source,
    size_t goal_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "portfolio_loaded";
    fields["component"] = ctx.component;
    fields["phase"] = ctx.phase;
    fields["source"] = source;
    fields["goal_count"] = std::to_string(goal_count);

    log(LogLevel::INFO, "Portfolio loaded", fields);
}

void Logger::log_state_fallback(
    const LogContext& ctx,
    const std::string& reason
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "state_fallback";
    fields["component"] = ctx.component;
    fields["phase"] = ctx.phase;
    fields["reason"] = reason;

    log(LogLevel::WARN, "Stored state unusable, using default portfolio", fields);
}

void Logger::log_goal_computed(
    const LogContext& ctx,
    const Goal& goal
) {
    if (!goal.results) {
        return;
    }
    const Results& r = *goal.results;

    std::map<std::string, std::string> fields;
    fields["event"] = "goal_computed";
    fields["component"] = ctx.component;
    fields["phase"] = ctx.phase;
    fields["goal_id"] = std::to_string(goal.id);
    fields["goal_name"] = goal.display_name();
    fields["months"] = std::to_string(r.months);
    fields["effective_target"] = format_decimal(r.effective_target, 2);
    fields["fv_total"] = format_decimal(r.fv_total, 2);
    fields["coverage"] = format_decimal(r.coverage, 4);
    fields["required_contribution"] = format_decimal(r.required_contribution, 2);
    fields["health"] = r.health.label;

    log(LogLevel::INFO, "Goal computed", fields);

    if (config_.min_level == LogLevel::DEBUG) {
        std::map<std::string, std::string> detail;
        detail["event"] = "goal_detail";
        detail["goal_id"] = std::to_string(goal.id);
        detail["fv_lump"] = format_decimal(r.fv_lump, 2);
        detail["fv_sip"] = format_decimal(r.fv_sip, 2);
        detail["gap"] = format_decimal(r.gap, 2);
        detail["monthly_rate"] = format_decimal(r.monthly_rate, 6);
        detail["projection_points"] = std::to_string(r.projection.size());
        log(LogLevel::DEBUG, "Goal detail", detail);
    }
}

void Logger::log_export_written(
    const LogContext& ctx,
    const std::string& format,
    const std::string& path,
    size_t rows
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "export_written";
    fields["component"] = ctx.component;
    fields["phase"] = ctx.phase;
    fields["format"] = format;
    fields["path"] = path;
    fields["rows"] = std::to_string(rows);

    log(LogLevel::INFO, "Export written", fields);
}

void Logger::log_info(
    const LogContext& ctx,
    const std::string& message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "info";
    fields["component"] = ctx.component;
    fields["phase"] = ctx.phase;

    log(LogLevel::INFO, message, fields);
}

void Logger::log_warning(
    const LogContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["component"] = ctx.component;
    fields["phase"] = ctx.phase;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(
    const LogContext& ctx,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["component"] = ctx.component;
    fields["phase"] = ctx.phase;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Planner error", fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace sipcalc
