// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cmath>
#include <concepts>
#include <limits>

namespace tubeq::core {

// Truncating double -> integer conversion for numbers read from extractor
// output. NaN maps to 0, out-of-range values saturate at the type's bounds.
template<std::integral T>
[[nodiscard]] T saturate_cast(double value) noexcept {
    if (std::isnan(value)) return T{0};
    constexpr auto lo = std::numeric_limits<T>::lowest();
    constexpr auto hi = std::numeric_limits<T>::max();
    if (value <= static_cast<double>(lo)) return lo;
    if (value >= static_cast<double>(hi)) return hi;
    return static_cast<T>(value);
}

} // namespace tubeq::core
