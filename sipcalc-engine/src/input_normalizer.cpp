#include "input_normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace sipcalc {

double parse_number(const std::string& text) {
    auto start = std::find_if_not(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    if (start >= end) {
        return 0.0;
    }

    const std::string trimmed(start, end);
    const char* begin = trimmed.c_str();
    char* parsed_end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &parsed_end);

    if (parsed_end == begin || *parsed_end != '\0') {
        return 0.0;
    }
    if (errno == ERANGE || !std::isfinite(value)) {
        return 0.0;
    }
    return value;
}

int normalize_priority(const std::string& text) {
    double value = std::round(parse_number(text));
    value = std::max(static_cast<double>(MIN_PRIORITY),
                     std::min(static_cast<double>(MAX_PRIORITY), value));
    return static_cast<int>(value);
}

NormalizedGoal normalize(const GoalInput& input) {
    NormalizedGoal goal;
    goal.target_amount = parse_number(input.target_amount);
    goal.years = parse_number(input.years);
    goal.current_savings = parse_number(input.current_savings);
    goal.monthly_contribution = parse_number(input.monthly_contribution);
    goal.annual_return = parse_number(input.annual_return);
    goal.inflation_rate = parse_number(input.inflation_rate);
    goal.priority = normalize_priority(input.priority);

    double streak = std::round(parse_number(input.contribution_streak));
    goal.contribution_streak = streak > 0.0 && streak < 1e9 ? static_cast<int>(streak) : 0;
    return goal;
}

} // namespace sipcalc
