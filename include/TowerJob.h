// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef TOWER_JOB_H
#define TOWER_JOB_H

#include <cstddef>
#include <memory>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include "Extruder.h"
#include "SwitchTower.h"
#include "settings/Settings.h"

namespace switchtower
{

namespace gcode
{
class CommandExporter;
}

/*!
 * Drives a switch tower through a whole print: the raft first, then one tower block per layer.
 *
 * The active extruder changes every "switch_every" layers, cycling through all extruders. A layer on
 * which the extruder changes gets a switch block, every other layer gets an infill block.
 */
class TowerJob
{
public:
    /*!
     * \param settings The global settings, for the tower and the layers.
     * \param extruder_settings One settings container per extruder, normally with \p settings as parent.
     * \throws exceptions::SettingException If fewer than two extruders are given.
     */
    TowerJob(const Settings& settings, const std::vector<Settings>& extruder_settings, std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /*!
     * \brief Write the tower g-code for \p layer_count layers.
     * \return The number of tool changes in the written g-code.
     */
    size_t run(gcode::CommandExporter& output, const size_t layer_count);

    [[nodiscard]] const SwitchTower& tower() const noexcept
    {
        return tower_;
    }

private:
    std::shared_ptr<spdlog::logger> log_;
    SwitchTower tower_;
    std::vector<Extruder> extruders_;
    Settings settings_; //!< Copy of the global settings, each layer reads its rates from it.

    double layer_height_;
    double z_speed_;
    double travel_speed_;
    size_t switch_every_;
};

} // namespace switchtower

#endif // TOWER_JOB_H
