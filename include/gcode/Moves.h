// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef GCODE_MOVES_H
#define GCODE_MOVES_H

#include <optional>
#include <string>
#include <utility>

namespace switchtower
{
class Extruder;
}

namespace switchtower::gcode
{

using Point2D = std::pair<double, double>;

/*!
 * \brief Absolute travel move of the print head.
 *
 * \param x Target X coordinate in mm.
 * \param y Target Y coordinate in mm.
 * \param speed Feed rate in mm/min.
 * \return The command text, e.g. "G1 X10.000 Y20.000 F9000.0"
 */
[[nodiscard]] std::string headMove(const double x, const double y, const double speed);

/*!
 * \brief Relative move of \p length mm along \p direction.
 *
 * Expects the machine to be in relative positioning mode (G91). An axis whose displacement rounds
 * to zero is left out of the command.
 *
 * \param direction Direction in degrees, see gcode::Direction.
 * \param length Length of the move in mm. A negative length moves the opposite way.
 * \param speed Feed rate in mm/min.
 * \param extruder When given, the move extrudes with this extruder. Otherwise it is a travel move.
 * \param feed_rate Filament length per mm of travel. Defaults to the extruder's nominal feed rate.
 * \param last_line Whether this is the closing segment of a path. The extruder's coasting distance
 * is then left unextruded at the end of the segment.
 * \return The command text.
 */
[[nodiscard]] std::string directionMove(
    const double direction,
    const double length,
    const double speed,
    const Extruder* extruder = nullptr,
    const std::optional<double> feed_rate = std::nullopt,
    const bool last_line = false);

/*!
 * \brief Euclidean length of the segment from \p from to \p to.
 */
[[nodiscard]] double pathLength(const Point2D& from, const Point2D& to);

} // namespace switchtower::gcode

#endif // GCODE_MOVES_H
