// Bracketed root finding (Boost.Math TOMS 748)
#pragma once

#include <cstdint>
#include <limits>
#include <utility>

#include <boost/math/tools/roots.hpp>

namespace stablesim {

// Root finder wrapper: requires a sign change between lo and hi.
// Solves in R (double or long double) to within a few bits of its precision.
template <typename R, typename F>
inline bool toms748_root(
    F&& f,
    R lo, R hi,
    R Flo, R Fhi,
    R& out_root,
    unsigned max_iters = 100
) {
    if (!(hi > lo) || !(Flo * Fhi < R(0))) return false;
    auto tol = boost::math::tools::eps_tolerance<R>(std::numeric_limits<R>::digits - 3);
    boost::uintmax_t it = max_iters;
    auto r = boost::math::tools::toms748_solve(std::forward<F>(f), lo, hi, Flo, Fhi, tol, it);
    out_root = (r.first + r.second) / R(2);
    return true;
}

} // namespace stablesim
