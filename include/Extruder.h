// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef EXTRUDER_H
#define EXTRUDER_H

#include <cstddef>

#include "gcode/CommandLine.h"

namespace switchtower
{

class Settings;

/*!
 * Material and retraction properties of one extruder train, as far as the switch tower needs them.
 *
 * All lengths are filament or travel lengths in mm, all speeds are feed rates in mm/min.
 */
class Extruder
{
public:
    size_t tool{ 0 }; //!< Tool index, used in the T command when switching to this extruder.
    double retract{ 0.0 }; //!< Retraction length.
    double retract_speed{ 0.0 }; //!< Retraction and prime speed.
    double z_hop{ 0.0 }; //!< Lift during travel moves, zero when disabled.
    double wipe{ 0.0 }; //!< Length of the wipe move after a retraction, zero when disabled.
    double coasting{ 0.0 }; //!< Travel length left unextruded at the end of a closed path.

    Extruder() = default;

    /*!
     * \param nominal_feed_rate Filament length extruded per mm of travel for a regular line.
     */
    Extruder(
        const size_t tool_,
        const double retract_,
        const double retract_speed_,
        const double z_hop_,
        const double wipe_,
        const double nominal_feed_rate,
        const double coasting_ = 0.0);

    /*!
     * \brief Create an extruder from its settings.
     *
     * The nominal feed rate follows from the line cross section and the filament diameter:
     * line_width * layer_height / (pi * (diameter / 2)^2) * flow.
     */
    static Extruder fromSettings(const Settings& settings);

    /*!
     * \brief Filament length per mm of travel, scaled by \p multiplier.
     */
    [[nodiscard]] double getFeedRate(const double multiplier = 1.0) const;

    /*!
     * \brief Unretract the filament, adjusted by \p change mm.
     */
    [[nodiscard]] gcode::CommandLine getPrimeGcode(const double change = 0.0) const;

    [[nodiscard]] gcode::CommandLine getRetractGcode() const;

private:
    double feed_rate_{ 0.0 };
};

} // namespace switchtower

#endif // EXTRUDER_H
