// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef GCODE_DIRECTION_H
#define GCODE_DIRECTION_H

namespace switchtower::gcode
{

/*
 * Compass directions in degrees, counter-clockwise from the positive X axis.
 *
 * Any angle is a valid direction, so arithmetic such as "direction + 180" reverses a move.
 */
namespace Direction
{
constexpr double E = 0.0;
constexpr double NE = 45.0;
constexpr double N = 90.0;
constexpr double NW = 135.0;
constexpr double W = 180.0;
constexpr double SW = 225.0;
constexpr double S = 270.0;
constexpr double SE = 315.0;
} // namespace Direction

} // namespace switchtower::gcode

#endif // GCODE_DIRECTION_H
