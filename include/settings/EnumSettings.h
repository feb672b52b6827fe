// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef ENUMSETTINGS_H
#define ENUMSETTINGS_H

#include <string_view>

namespace switchtower
{

/*!
 * The hot end / filament path hardware the tower is printed with. It decides which purge and prime
 * sequences are used around a tool change.
 */
enum class HardwareConfig
{
    /*!
     * PTFE-lined hot end.
     */
    PTFE,

    /*!
     * E3D v6 hot end. Primes towards negative X and needs one extra purge line.
     */
    E3DV6,

    /*!
     * All-metal PEEK hot end.
     */
    PEEK,
};

/*!
 * \brief The name under which the hardware configuration is known to the machine settings.
 */
[[nodiscard]] std::string_view toString(const HardwareConfig config);

/*!
 * \brief Parse a hardware configuration name, such as "PEEK-PRO-12".
 * \throws exceptions::HardwareConfigException If the name is not a known configuration.
 */
[[nodiscard]] HardwareConfig hardwareConfigFromString(std::string_view name);

} // namespace switchtower

#endif // ENUMSETTINGS_H
