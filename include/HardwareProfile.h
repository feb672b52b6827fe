// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef HARDWARE_PROFILE_H
#define HARDWARE_PROFILE_H

#include <array>
#include <vector>

#include "gcode/CommandLine.h"
#include "settings/EnumSettings.h"

namespace switchtower
{

/*!
 * Tuned purge and prime parameters of one hardware configuration.
 *
 * The values are physically tuned for the hot end and filament path. They are reproduced exactly
 * in the generated g-code and must not be rounded or approximated.
 */
struct HardwareTemplate
{
    struct Line
    {
        const char* command;
        const char* comment;
    };

    double height_delta; //!< Added to the base tower height.
    int purge_line_delta; //!< Added to the number of post-switch purge lines.

    /*!
     * Y shifts between the oscillating pre-switch purge trails, indexed by the purge flip-flop
     * (0 = flop, 1 = flip). One trail is printed before each shift.
     */
    std::array<std::vector<double>, 2> y_shifts;

    std::vector<Line> drip_lines; //!< Lines between the purge trails and the cooling period.
    int cooling_delay_ms; //!< Dwell to let the filament tip solidify before the long retract.
    std::vector<Line> long_retract_lines; //!< Lines after the cooling period, pulling the filament out.

    std::vector<Line> prime_feed_lines; //!< Feed of the new filament right after the tool change.
    double prime_trail_ratio; //!< Filament length per mm of the prime trail.
    double prime_trail_offset; //!< Added to the tower width to get the prime trail length.
    int prime_trail_speed;
    int prepurge_sign; //!< 1 when priming towards positive X, -1 towards negative X.
};

/*!
 * The expanded purge and prime tables for one tower.
 */
struct HardwareProfile
{
    /*!
     * Lines printed before the tool change, indexed by the purge flip-flop (0 = flop, 1 = flip).
     */
    std::array<std::vector<gcode::CommandLine>, 2> pre_switch_lines;

    /*!
     * Lines printed right after the tool change to prime the new filament.
     */
    std::vector<gcode::CommandLine> post_switch_lines;

    int prepurge_sign{ 1 };
};

/*!
 * \brief Get the tuned parameters of a hardware configuration.
 * \throws exceptions::HardwareConfigException If \p config has no known parameters.
 */
[[nodiscard]] const HardwareTemplate& getHardwareTemplate(const HardwareConfig config);

/*!
 * \brief Expand the hardware parameters for a tower of the given width.
 * \throws exceptions::HardwareConfigException If \p config has no known parameters.
 */
[[nodiscard]] HardwareProfile buildHardwareProfile(const HardwareConfig config, const double width);

} // namespace switchtower

#endif // HARDWARE_PROFILE_H
