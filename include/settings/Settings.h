// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_SETTINGS_H
#define SETTINGS_SETTINGS_H

#include <cstddef>
#include <string>
#include <unordered_map>

namespace switchtower
{

/*!
 * \brief Container for a set of settings.
 *
 * You can ask this container for the value of a certain setting that should be
 * used in the context where this settings container is located.
 *
 * Values are stored in serialised form as strings and converted when they are
 * retrieved with get().
 */
class Settings
{
public:
    Settings() = default;

    /*!
     * \brief Adds a new setting, or replaces the value of an existing one.
     * \param key The name by which the setting is identified.
     * \param value The value of the setting in serialised form.
     */
    void add(const std::string& key, const std::string& value);

    /*!
     * \brief Get the value of a setting.
     *
     *  1. If this container contains a value for the setting, it uses that
     *     value directly.
     *  2. Otherwise it asks its parent settings container for the setting value.
     *  3. If a setting is not known at all, a SettingException is thrown.
     * \param key The key of the setting to get.
     * \return The setting's value, cast to the desired type.
     */
    template<typename A>
    A get(const std::string& key) const;

    /*!
     * \brief Get the value of a setting, or \p fallback if neither this container nor its parents have it.
     */
    template<typename A>
    A get(const std::string& key, const A& fallback) const
    {
        return hasInherited(key) ? get<A>(key) : fallback;
    }

    /*!
     * \brief Indicate whether this settings instance has an entry for the
     * specified setting, without looking at the parent.
     */
    [[nodiscard]] bool has(const std::string& key) const;

    /*!
     * \brief Indicate whether this container or any of its parents has the setting.
     */
    [[nodiscard]] bool hasInherited(const std::string& key) const;

    /*!
     * Change the parent settings object.
     *
     * If this set of settings has no value for a setting, the parent is asked.
     */
    void setParent(const Settings* new_parent);

    /*!
     * \brief Get a string containing all settings in this container, as "-s key=value" pairs.
     */
    [[nodiscard]] std::string getAllSettingsString() const;

private:
    const Settings* parent_{ nullptr };

    std::unordered_map<std::string, std::string> settings_;
};

enum class HardwareConfig;

template<>
std::string Settings::get<std::string>(const std::string& key) const;
template<>
double Settings::get<double>(const std::string& key) const;
template<>
size_t Settings::get<size_t>(const std::string& key) const;
template<>
int Settings::get<int>(const std::string& key) const;
template<>
bool Settings::get<bool>(const std::string& key) const;
template<>
HardwareConfig Settings::get<HardwareConfig>(const std::string& key) const;

} // namespace switchtower

#endif // SETTINGS_SETTINGS_H
