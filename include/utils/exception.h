// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef UTILS_EXCEPTION_H
#define UTILS_EXCEPTION_H

#include <exception>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace switchtower::exceptions
{

class SettingException : public std::exception
{
    std::string msg_;

public:
    explicit SettingException(std::string_view key) noexcept
        : msg_(fmt::format("Trying to retrieve setting with no value given: {}", key)){};

    SettingException(std::string_view key, std::string_view value) noexcept
        : msg_(fmt::format("Setting '{}' has an invalid value: '{}'", key, value)){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class HardwareConfigException : public std::exception
{
    std::string msg_;

public:
    explicit HardwareConfigException(std::string_view name) noexcept
        : msg_(fmt::format("Unknown hardware configuration '{}'", name)){};

    explicit HardwareConfigException(const int raw_value) noexcept
        : msg_(fmt::format("Hardware configuration {} has no purge profile", raw_value)){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class GeometryException : public std::exception
{
    std::string msg_;

public:
    explicit GeometryException(std::string_view reason) noexcept
        : msg_(fmt::format("Invalid switch tower geometry: {}", reason)){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

} // namespace switchtower::exceptions

#endif // UTILS_EXCEPTION_H
