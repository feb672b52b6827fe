// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef SWITCH_TOWER_H
#define SWITCH_TOWER_H

#include <memory>
#include <optional>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>
#ifdef BUILD_TESTS
#include <gtest/gtest_prod.h> //To allow tests to use private members.
#endif

#include "HardwareProfile.h"
#include "gcode/CommandExporter.h"
#include "gcode/CommandLine.h"
#include "settings/EnumSettings.h"

namespace switchtower
{

class Extruder;
class Layer;
class Settings;

/*!
 * Base dimensions of the purge zone, in mm. The walls and the raft are sized around it.
 */
struct TowerSize
{
    double width{ 50.0 };
    double height{ 14.0 }; //!< Must be an even whole number.
};

/*!
 * Sacrificial tower printed whenever the active filament changes during a multi-material print.
 *
 * The tower is built in three kinds of blocks:
 * - A raft, once per print, before anything else is printed on the tower.
 * - A switch block on every layer where the filament changes. The old filament is purged and
 *   pulled out, the tool is changed and the new filament is primed and purged until it runs clean.
 * - An infill block on the layers in between, so the tower keeps growing with the print.
 *
 * Successive switch blocks and successive infill blocks alternate between two orientations (the
 * flip-flops), so that consecutive layers interlock.
 *
 * The generators must be called in ascending layer order by a single owner. Each of them writes its
 * lines to the given exporter in the order in which the print head has to execute them.
 */
class SwitchTower
{
#ifdef BUILD_TESTS
    friend class SwitchTowerTest;
    FRIEND_TEST(SwitchTowerTest, InfillFlipOrientation);
#endif
public:
    /*!
     * \param start_pos_x X coordinate of the front left corner of the purge zone.
     * \param start_pos_y Y coordinate of the front left corner of the purge zone.
     * \param hw_config The hot end hardware, which selects the purge and prime sequences.
     * \param logger Where to send diagnostic messages.
     * \param size Base dimensions of the purge zone.
     * \throws exceptions::GeometryException If the height is not an even whole number, or the
     * tower would be too low to hold any purge line.
     */
    SwitchTower(
        const double start_pos_x,
        const double start_pos_y,
        const HardwareConfig hw_config,
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger(),
        const TowerSize size = TowerSize{});

    SwitchTower(const SwitchTower&) = delete;
    SwitchTower& operator=(const SwitchTower&) = delete;
    SwitchTower(SwitchTower&&) noexcept = default;
    SwitchTower& operator=(SwitchTower&&) noexcept = default;

    /*!
     * \brief Create a tower from the "switch_tower_*" settings.
     */
    static SwitchTower fromSettings(const Settings& settings, std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /*!
     * \brief Print speeds (mm/min) of the post-switch purge lines, one per line pair.
     *
     * \param min_speed Speed for the lines that are printed slowly. Currently none are.
     */
    [[nodiscard]] std::vector<double> generatePurgeSpeeds(const double min_speed) const;

    /*!
     * \brief Print speeds (mm/min) of the zig-zag infill passes.
     *
     * Four passes ramp down linearly from the default speed towards \p min_speed, followed by two
     * passes at \p min_speed.
     */
    [[nodiscard]] std::vector<double> generateInfillSpeeds(const double min_speed) const;

    /*!
     * \brief Print the raft the tower stands on. Call once, before any switch or infill block.
     *
     * Afterwards the tower top is at 0.2 mm, whatever it was before.
     *
     * \param[out] output Where to write the lines.
     * \param extruder The extruder that prints the raft.
     * \param retract Whether to retract after the raft.
     * \param xy_speed Travel speed (mm/min).
     * \param z_speed Z axis speed (mm/min).
     */
    void generateRaft(gcode::CommandExporter& output, const Extruder& extruder, const bool retract, const double xy_speed, const double z_speed);

    /*!
     * \brief Print a switch block: purge the old filament, change the tool and prime the new one.
     *
     * Emits exactly one tool change. Raises the tower top by the layer height and inverts the purge
     * flip-flop.
     *
     * \param[out] output Where to write the lines.
     * \param layer The layer on which the switch happens.
     * \param e_pos Current logical position of the old extruder.
     * \param old_e The extruder that was printing.
     * \param new_e The extruder to switch to.
     * \param z_hop The z-hop the print head currently has above the layer.
     * \param z_speed Z axis speed (mm/min).
     * \param xy_speed Travel speed (mm/min).
     */
    void generateSwitch(
        gcode::CommandExporter& output,
        const Layer& layer,
        const double e_pos,
        const Extruder& old_e,
        const Extruder& new_e,
        const double z_hop,
        const double z_speed,
        const double xy_speed);

    /*!
     * \brief Print an infill block: grow the tower by one layer without changing the filament.
     *
     * Raises the tower top by the layer height and inverts the infill flip-flop.
     *
     * \param[out] output Where to write the lines.
     * \param layer The current layer.
     * \param e_pos Current logical position of the extruder.
     * \param extruder The active extruder.
     * \param z_hop The z-hop the print head currently has above the layer.
     * \param z_speed Z axis speed (mm/min).
     * \param xy_speed Travel speed (mm/min).
     */
    void generateInfill(
        gcode::CommandExporter& output,
        const Layer& layer,
        const double e_pos,
        const Extruder& extruder,
        const double z_hop,
        const double z_speed,
        const double xy_speed);

    [[nodiscard]] HardwareConfig hardwareConfig() const noexcept
    {
        return hw_config_;
    }

    [[nodiscard]] double width() const noexcept
    {
        return width_;
    }

    [[nodiscard]] double height() const noexcept
    {
        return height_;
    }

    [[nodiscard]] double wallWidth() const noexcept
    {
        return wall_width_;
    }

    [[nodiscard]] double wallHeight() const noexcept
    {
        return wall_height_;
    }

    [[nodiscard]] double raftWidth() const noexcept
    {
        return raft_width_;
    }

    [[nodiscard]] double raftHeight() const noexcept
    {
        return raft_height_;
    }

    [[nodiscard]] double purgeLineLength() const noexcept
    {
        return purge_line_length_;
    }

    [[nodiscard]] int purgeLines() const noexcept
    {
        return purge_lines_;
    }

    [[nodiscard]] int prepurgeSign() const noexcept
    {
        return profile_.prepurge_sign;
    }

    [[nodiscard]] double lastTowerZ() const noexcept
    {
        return last_tower_z_;
    }

    [[nodiscard]] bool flipflopPurge() const noexcept
    {
        return flipflop_purge_;
    }

    [[nodiscard]] bool flipflopInfill() const noexcept
    {
        return flipflop_infill_;
    }

    [[nodiscard]] const std::vector<gcode::CommandLine>& preSwitchLines(const bool flipflop) const noexcept
    {
        return profile_.pre_switch_lines[flipflop ? 1 : 0];
    }

    [[nodiscard]] const std::vector<gcode::CommandLine>& postSwitchLines() const noexcept
    {
        return profile_.post_switch_lines;
    }

private:
    std::shared_ptr<spdlog::logger> log_;
    HardwareConfig hw_config_;

    double width_;
    double height_;
    double wall_width_;
    double wall_height_;
    double raft_width_;
    double raft_height_;

    double start_pos_x_;
    double start_pos_y_;
    double raft_pos_x_;
    double raft_pos_y_;

    double purge_line_length_;
    int purge_lines_; //!< Number of post-switch purge line pairs.

    HardwareProfile profile_;

    double last_tower_z_{ 0.0 }; //!< Top of the tower as printed so far.
    bool flipflop_purge_{ false };
    bool flipflop_infill_{ false };

    /*!
     * \brief Retraction needed before travelling to the tower.
     *
     * The retraction is the configured length corrected by the current extruder position. Nothing is
     * needed when that is zero at 3 decimals. The retraction never exceeds the configured length.
     *
     * \param e_pos Current logical extruder position.
     * \param extruder The extruder to retract.
     */
    [[nodiscard]] std::optional<gcode::CommandLine> getRetraction(const double e_pos, const Extruder& extruder) const;

    /*!
     * \brief Lift above the tower top, unless the head is already at that height.
     *
     * \param layer The current layer.
     * \param z_hop The z-hop the print head currently has above the layer.
     * \param z_speed Z axis speed (mm/min).
     * \param extruder The extruder whose z-hop setting applies.
     */
    [[nodiscard]] std::optional<gcode::CommandLine> getZHop(const Layer& layer, const double z_hop, const double z_speed, const Extruder& extruder) const;

    /*!
     * \brief Absolute travel to the corner where the wall starts for the given orientation.
     */
    [[nodiscard]] gcode::CommandLine getWallPosition(const bool flipflop, const double xy_speed) const;

    /*!
     * \brief Closed rectangular wall around the purge zone, in relative coordinates.
     *
     * The flip orientation runs east, north, west, south and the flop orientation east, south, west,
     * north. The last side is 0.3 mm short and closes the path.
     */
    void writeWall(gcode::CommandExporter& output, const bool flipflop, const Extruder& extruder, const double wall_speed, const double feed_rate) const;
};

} // namespace switchtower

#endif // SWITCH_TOWER_H
