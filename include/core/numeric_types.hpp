// Core numeric type traits for templated code
// Supports the floating types the simulator is built for (double/long double)
#pragma once

#include <algorithm>
#include <cmath>

namespace stablesim {

// NumTraits: type-specific comparison tolerance.
// Primary template (fallback for unspecialized types)
template <typename T>
struct NumTraits {
    static constexpr T tolerance() { return T(1e-9); }
};

template <>
struct NumTraits<double> {
    static constexpr double tolerance() { return 1e-9; }
};

template <>
struct NumTraits<long double> {
    static constexpr long double tolerance() { return 1e-12L; }
};

// Relative closeness using the type's tolerance
template <typename T>
inline bool approx_equal(T a, T b, T rel = NumTraits<T>::tolerance()) {
    const T scale = std::max<T>(T(1), std::max(std::abs(a), std::abs(b)));
    return std::abs(a - b) <= rel * scale;
}

} // namespace stablesim
