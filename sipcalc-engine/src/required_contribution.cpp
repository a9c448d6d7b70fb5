#include "required_contribution.hpp"
#include <algorithm>
#include <cmath>

namespace sipcalc {

double solve_required_contribution(double effective_target,
                                   double fv_lump,
                                   int months,
                                   double monthly_rate) {
    const double needed = effective_target - fv_lump;
    if (needed <= 0.0) {
        return 0.0;
    }

    const int n = std::max(1, months);
    if (monthly_rate == 0.0) {
        return needed / n;
    }

    const double denom = std::pow(1.0 + monthly_rate, n) - 1.0;
    if (denom == 0.0) {
        return needed / n;
    }
    return std::max(0.0, needed * monthly_rate / denom);
}

} // namespace sipcalc
