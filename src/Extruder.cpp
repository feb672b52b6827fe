// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "Extruder.h"

#include <numbers>

#include <fmt/format.h>

#include "settings/Settings.h"

namespace switchtower
{

Extruder::Extruder(
    const size_t tool_,
    const double retract_,
    const double retract_speed_,
    const double z_hop_,
    const double wipe_,
    const double nominal_feed_rate,
    const double coasting_)
    : tool(tool_)
    , retract(retract_)
    , retract_speed(retract_speed_)
    , z_hop(z_hop_)
    , wipe(wipe_)
    , coasting(coasting_)
    , feed_rate_(nominal_feed_rate)
{
}

Extruder Extruder::fromSettings(const Settings& settings)
{
    const double line_width = settings.get<double>("line_width", 0.4);
    const double layer_height = settings.get<double>("layer_height", 0.2);
    const double diameter = settings.get<double>("material_diameter", 1.75);
    const double flow = settings.get<double>("material_flow", 1.0);
    const double filament_area = std::numbers::pi * (diameter / 2.0) * (diameter / 2.0);

    return Extruder(
        settings.get<size_t>("extruder_nr"),
        settings.get<double>("retraction_amount"),
        settings.get<double>("retraction_speed"),
        settings.get<double>("retraction_hop", 0.0),
        settings.get<double>("wipe_distance", 0.0),
        line_width * layer_height / filament_area * flow,
        settings.get<double>("coasting_distance", 0.0));
}

double Extruder::getFeedRate(const double multiplier) const
{
    return feed_rate_ * multiplier;
}

gcode::CommandLine Extruder::getPrimeGcode(const double change) const
{
    return { fmt::format("G1 E{:.4f} F{:.1f}", retract + change, retract_speed), " prime" };
}

gcode::CommandLine Extruder::getRetractGcode() const
{
    return { fmt::format("G1 E{:.4f} F{:.1f}", -retract, retract_speed), " retract" };
}

} // namespace switchtower
