// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "settings/Settings.h"

#include <cstdlib>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "settings/EnumSettings.h"
#include "utils/exception.h"

namespace switchtower
{

void Settings::add(const std::string& key, const std::string& value)
{
    settings_.insert_or_assign(key, value);
}

template<>
std::string Settings::get<std::string>(const std::string& key) const
{
    if (const auto it = settings_.find(key); it != settings_.end())
    {
        return it->second;
    }

    if (parent_)
    {
        return parent_->get<std::string>(key);
    }

    spdlog::error("Trying to retrieve setting with no value given: {}", key);
    throw exceptions::SettingException(key);
}

template<>
double Settings::get<double>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    char* end = nullptr;
    const double result = std::strtod(value.c_str(), &end);
    if (value.empty() || end != value.c_str() + value.size())
    {
        spdlog::error("Setting {} is not a number: {}", key, value);
        throw exceptions::SettingException(key, value);
    }
    return result;
}

template<>
size_t Settings::get<size_t>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    if (value.empty() || value.front() == '-')
    {
        spdlog::error("Setting {} is not a positive integer: {}", key, value);
        throw exceptions::SettingException(key, value);
    }
    size_t parsed = 0;
    size_t result = 0;
    try
    {
        result = std::stoul(value, &parsed);
    }
    catch (const std::logic_error&)
    {
        parsed = 0; // Not a number, or out of range.
    }
    if (parsed != value.size())
    {
        spdlog::error("Setting {} is not a positive integer: {}", key, value);
        throw exceptions::SettingException(key, value);
    }
    return result;
}

template<>
int Settings::get<int>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    size_t parsed = 0;
    int result = 0;
    try
    {
        result = std::stoi(value, &parsed);
    }
    catch (const std::logic_error&)
    {
        parsed = 0; // Not a number, or out of range.
    }
    if (value.empty() || parsed != value.size())
    {
        spdlog::error("Setting {} is not an integer: {}", key, value);
        throw exceptions::SettingException(key, value);
    }
    return result;
}

template<>
bool Settings::get<bool>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    if (value == "on" || value == "yes" || value == "true" || value == "True")
    {
        return true;
    }
    if (value == "off" || value == "no" || value == "false" || value == "False")
    {
        return false;
    }
    return get<int>(key) != 0;
}

template<>
HardwareConfig Settings::get<HardwareConfig>(const std::string& key) const
{
    return hardwareConfigFromString(get<std::string>(key));
}

bool Settings::has(const std::string& key) const
{
    return settings_.contains(key);
}

bool Settings::hasInherited(const std::string& key) const
{
    return has(key) || (parent_ != nullptr && parent_->hasInherited(key));
}

void Settings::setParent(const Settings* new_parent)
{
    parent_ = new_parent;
}

std::string Settings::getAllSettingsString() const
{
    // Sorted, so that the output is stable.
    const std::map<std::string, std::string> sorted(settings_.begin(), settings_.end());
    std::stringstream sstream;
    for (const auto& [key, value] : sorted)
    {
        sstream << " -s " << key << "=\"" << value << "\"";
    }
    return sstream.str();
}

} // namespace switchtower
