#ifndef SIPCALC_FORMAT_HPP
#define SIPCALC_FORMAT_HPP

#include <string>

namespace sipcalc {

// Fixed-point rendering with `places` decimals, ties rounded away from zero
// (2.25 -> "2.3", 0.25 -> "0.3").
std::string format_decimal(double value, int places);

// Rupee amount rounded to whole units with Indian digit grouping:
// 1914423.4 -> "₹19,14,423", -1500 -> "₹-1,500"
std::string format_inr(double value);

// Round half away from zero to a whole number
double round_currency(double value);

} // namespace sipcalc

#endif // SIPCALC_FORMAT_HPP
