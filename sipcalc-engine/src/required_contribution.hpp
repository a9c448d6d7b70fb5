#ifndef SIPCALC_REQUIRED_CONTRIBUTION_HPP
#define SIPCALC_REQUIRED_CONTRIBUTION_HPP

namespace sipcalc {

// Monthly contribution that closes the gap between the lump-sum future value
// and the effective target over `months` at monthly rate `monthly_rate`.
//
//   needed = effective_target - fv_lump
//   needed <= 0       -> 0 (the lump sum alone funds the goal)
//   monthly_rate == 0 -> needed / months
//   otherwise         -> needed * rm / ((1 + rm)^months - 1)
//
// The result is never negative.
double solve_required_contribution(double effective_target,
                                   double fv_lump,
                                   int months,
                                   double monthly_rate);

} // namespace sipcalc

#endif // SIPCALC_REQUIRED_CONTRIBUTION_HPP
