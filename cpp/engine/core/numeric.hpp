#pragma once
/*
===============================================================================
Core: Numeric Guards
File: numeric.hpp
===============================================================================
Small helpers shared by the balances, the recycle error measure and the
samplers. None of them produce NaN or Inf unless asked to via a fallback.
*/

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

namespace procsim {

inline bool is_finite(double x) noexcept {
    return std::isfinite(x) != 0;
}

template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
    static_assert(std::is_arithmetic<T>::value, "clamp needs an arithmetic type");
    return v < lo ? lo : (hi < v ? hi : v);
}

// num / den, or `fallback` for a zero or non-finite operand or quotient.
inline double safe_div(double num, double den, double fallback = 0.0) noexcept {
    if (!is_finite(num) || !is_finite(den) || den == 0.0) return fallback;
    const double q = num / den;
    return is_finite(q) ? q : fallback;
}

inline double safe_sqrt(double x, double fallback = 0.0) noexcept {
    return (is_finite(x) && x >= 0.0) ? std::sqrt(x) : fallback;
}

// |b - a| relative to the larger magnitude. Differences at or below
// `abs_floor` count as zero change; non-finite inputs give Inf.
inline double relative_change(double a, double b, double abs_floor) noexcept {
    const double d = std::fabs(b - a);
    if (d <= abs_floor) return 0.0;
    return safe_div(d, std::max(std::fabs(a), std::fabs(b)), std::numeric_limits<double>::infinity());
}

} // namespace procsim
