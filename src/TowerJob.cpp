// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "TowerJob.h"

#include <string>
#include <utility>

#include <fmt/format.h>

#include "Layer.h"
#include "gcode/CommandExporter.h"
#include "utils/exception.h"

namespace switchtower
{

namespace
{

constexpr double raft_z = 0.2;

std::vector<Extruder> makeExtruders(const std::vector<Settings>& extruder_settings)
{
    if (extruder_settings.size() < 2)
    {
        spdlog::error("A switch tower needs at least two extruders, got {}", extruder_settings.size());
        throw exceptions::SettingException("machine_extruder_count", std::to_string(extruder_settings.size()));
    }
    std::vector<Extruder> extruders;
    extruders.reserve(extruder_settings.size());
    for (const Settings& settings : extruder_settings)
    {
        extruders.push_back(Extruder::fromSettings(settings));
    }
    return extruders;
}

} // namespace

TowerJob::TowerJob(const Settings& settings, const std::vector<Settings>& extruder_settings, std::shared_ptr<spdlog::logger> logger)
    : log_(logger)
    , tower_(SwitchTower::fromSettings(settings, logger))
    , extruders_(makeExtruders(extruder_settings))
    , settings_(settings)
    , layer_height_(settings.get<double>("layer_height"))
    , z_speed_(settings.get<double>("z_speed"))
    , travel_speed_(settings.get<double>("travel_speed"))
    , switch_every_(settings.get<size_t>("switch_every", 2))
{
    if (switch_every_ == 0)
    {
        throw exceptions::SettingException("switch_every", "0");
    }
}

size_t TowerJob::run(gcode::CommandExporter& output, const size_t layer_count)
{
    size_t active = 0;
    size_t tool_changes = 0;

    output.write(gcode::CommandLine::marker("LAYER:0"));
    tower_.generateRaft(output, extruders_[active], true, travel_speed_, z_speed_);

    for (size_t layer_nr = 1; layer_nr <= layer_count; layer_nr++)
    {
        output.write(gcode::CommandLine::marker(fmt::format("LAYER:{}", layer_nr)));

        const Extruder& current = extruders_[active];
        const Layer layer = Layer::fromSettings(settings_, raft_z + static_cast<double>(layer_nr) * layer_height_, current.getFeedRate());
        const size_t wanted = (layer_nr / switch_every_) % extruders_.size();

        // The extruder position is reset to zero at the end of every tower block.
        constexpr double e_pos = 0.0;
        constexpr double z_hop = 0.0;
        if (wanted != active)
        {
            tower_.generateSwitch(output, layer, e_pos, current, extruders_[wanted], z_hop, z_speed_, travel_speed_);
            active = wanted;
            tool_changes++;
        }
        else
        {
            tower_.generateInfill(output, layer, e_pos, current, z_hop, z_speed_, travel_speed_);
        }
    }

    log_->info("Switch tower: {} layers, {} tool changes, top at {:.3f}", layer_count, tool_changes, tower_.lastTowerZ());
    return tool_changes;
}

} // namespace switchtower
