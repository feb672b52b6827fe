// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "gcode/Moves.h"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "Extruder.h"
#include "utils/math.h"

namespace switchtower::gcode
{

std::string headMove(const double x, const double y, const double speed)
{
    return fmt::format("G1 X{:.3f} Y{:.3f} F{:.1f}", x, y, speed);
}

std::string directionMove(
    const double direction,
    const double length,
    const double speed,
    const Extruder* extruder,
    const std::optional<double> feed_rate,
    const bool last_line)
{
    const double angle = deg_to_rad(direction);
    const double dx = length * std::cos(angle);
    const double dy = length * std::sin(angle);

    std::string command = "G1";
    if (! is_float_zero(dx, 3))
    {
        command += fmt::format(" X{:.3f}", dx);
    }
    if (! is_float_zero(dy, 3))
    {
        command += fmt::format(" Y{:.3f}", dy);
    }
    if (extruder != nullptr)
    {
        double extruded_length = std::abs(length);
        if (last_line)
        {
            extruded_length = std::max(0.0, extruded_length - extruder->coasting);
        }
        const double e = extruded_length * feed_rate.value_or(extruder->getFeedRate());
        command += fmt::format(" E{:.4f}", e);
    }
    command += fmt::format(" F{:.1f}", speed);
    return command;
}

double pathLength(const Point2D& from, const Point2D& to)
{
    return std::hypot(to.first - from.first, to.second - from.second);
}

} // namespace switchtower::gcode
