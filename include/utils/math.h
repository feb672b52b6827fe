// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef UTILS_MATH_H
#define UTILS_MATH_H

#include <cmath>
#include <numbers>

namespace switchtower
{

/*!
 * \brief Check whether a value rounds to zero at the given number of decimal places.
 *
 * \param value The value to check.
 * \param decimals The number of decimal places to round to.
 * \return True if the value would be written as zero with that precision.
 */
[[nodiscard]] inline bool is_float_zero(const double value, const int decimals)
{
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) == 0.0;
}

[[nodiscard]] constexpr double deg_to_rad(const double degrees)
{
    return degrees * std::numbers::pi / 180.0;
}

[[nodiscard]] constexpr double rad_to_deg(const double radians)
{
    return radians * 180.0 / std::numbers::pi;
}

} // namespace switchtower
#endif // UTILS_MATH_H
