// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef LAYER_H
#define LAYER_H

#include <utility>

namespace switchtower
{

class Settings;

/*!
 * View on the layer that is currently being post-processed.
 */
class Layer
{
public:
    double height{ 0.0 }; //!< Layer thickness in mm.
    double z{ 0.0 }; //!< Print height of this layer in mm.

    Layer() = default;

    Layer(const double height_, const double z_, const double outer_perimeter_speed, const double outer_perimeter_feed_rate);

    /*!
     * \brief Create a layer at height \p z, taking its thickness and wall rates from \p settings.
     *
     * \p default_feed_rate is used when the settings have no "outer_wall_feed_rate".
     */
    static Layer fromSettings(const Settings& settings, const double z, const double default_feed_rate);

    /*!
     * \brief Speed (mm/min) and feed rate (filament mm per mm) of the slowest outer perimeter on this layer.
     */
    [[nodiscard]] std::pair<double, double> getOuterPerimeterRates() const
    {
        return { outer_perimeter_speed_, outer_perimeter_feed_rate_ };
    }

private:
    double outer_perimeter_speed_{ 0.0 };
    double outer_perimeter_feed_rate_{ 0.0 };
};

} // namespace switchtower

#endif // LAYER_H
