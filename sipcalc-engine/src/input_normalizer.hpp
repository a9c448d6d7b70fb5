#ifndef SIPCALC_INPUT_NORMALIZER_HPP
#define SIPCALC_INPUT_NORMALIZER_HPP

#include "goal.hpp"
#include <string>

namespace sipcalc {

constexpr int MIN_PRIORITY = 1;
constexpr int MAX_PRIORITY = 5;

// Parse free-form text as a number.
// Surrounding whitespace is ignored. Empty text, text with trailing garbage
// and non-finite values (inf, nan) all resolve to 0. Never throws.
double parse_number(const std::string& text);

// Parse a priority and clamp it into [MIN_PRIORITY, MAX_PRIORITY].
// Fractional values round to the nearest integer.
int normalize_priority(const std::string& text);

// Coerce every numeric field of a goal. Total: every input maps to a value.
NormalizedGoal normalize(const GoalInput& input);

} // namespace sipcalc

#endif // SIPCALC_INPUT_NORMALIZER_HPP
