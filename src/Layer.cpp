// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "Layer.h"

#include "settings/Settings.h"

namespace switchtower
{

Layer::Layer(const double height_, const double z_, const double outer_perimeter_speed, const double outer_perimeter_feed_rate)
    : height(height_)
    , z(z_)
    , outer_perimeter_speed_(outer_perimeter_speed)
    , outer_perimeter_feed_rate_(outer_perimeter_feed_rate)
{
}

Layer Layer::fromSettings(const Settings& settings, const double z, const double default_feed_rate)
{
    return Layer(
        settings.get<double>("layer_height"),
        z,
        settings.get<double>("outer_wall_speed"),
        settings.get<double>("outer_wall_feed_rate", default_feed_rate));
}

} // namespace switchtower
