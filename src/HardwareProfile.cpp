// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "HardwareProfile.h"

#include <array>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "utils/exception.h"

namespace switchtower
{

namespace
{

// Filament fed per mm of pre-switch purge trail.
constexpr double prepurge_feed_ratio = 4.5 / 50.0;

const HardwareTemplate ptfe_template{
    .height_delta = 0.0,
    .purge_line_delta = 0,
    .y_shifts = { std::vector<double>{ 1.4, 0.6, 1.4, 0.6 }, std::vector<double>{ 0.6, 1.4, 0.6, 1.4 } },
    .drip_lines = { { "G1 E-20 F3000", " rapid retract" } },
    .cooling_delay_ms = 2500,
    .long_retract_lines = { { "G1 E-140 F3000", " 50mm/s long retract" } },
    .prime_feed_lines = { { "G1 E100 F3000", " 50mm/s feed" }, { "G1 E54 F1500", " 25mm/s feed" } },
    .prime_trail_ratio = 5.0 / 50.0,
    .prime_trail_offset = 0.0,
    .prime_trail_speed = 900,
    .prepurge_sign = 1,
};

const HardwareTemplate e3dv6_template{
    .height_delta = 2.0,
    .purge_line_delta = -1,
    .y_shifts = { std::vector<double>{ 1.4, 0.6, 1.4, 0.6, 1.4 }, std::vector<double>{ 0.8, 1.4, 0.6, 1.4, 1.0 } },
    .drip_lines = { { "G1 E-20 F3000", " rapid retract" } },
    .cooling_delay_ms = 2500,
    .long_retract_lines = { { "G1 E-140 F3000", " 50mm/s long retract" } },
    .prime_feed_lines = { { "G1 E100 F3000", " 50mm/s feed" }, { "G1 E54 F1500", " 25mm/s feed" } },
    .prime_trail_ratio = 5.0 / 50.0,
    .prime_trail_offset = 0.0,
    .prime_trail_speed = 900,
    .prepurge_sign = -1,
};

const HardwareTemplate peek_template{
    .height_delta = 0.0,
    .purge_line_delta = 0,
    .y_shifts = { std::vector<double>{ 1.4, 0.6, 1.4, 0.6 }, std::vector<double>{ 0.6, 1.4, 0.6, 1.4 } },
    .drip_lines = { { "G1 X10.000 E-20.0000 F1500", " drip trail" }, { "G1 E-15 F1500", " 25mm/s reshaping" } },
    .cooling_delay_ms = 2000,
    .long_retract_lines = { { "G1 E-95 F1500", " 25mm/s long retract" } },
    .prime_feed_lines = { { "G1 E125 F1500", " 25mm/s feed" } },
    .prime_trail_ratio = 1.6 / 40.0,
    .prime_trail_offset = -10.0,
    .prime_trail_speed = 1500,
    .prepurge_sign = 1,
};

void appendLines(std::vector<gcode::CommandLine>& target, const std::vector<HardwareTemplate::Line>& lines)
{
    for (const HardwareTemplate::Line& line : lines)
    {
        target.emplace_back(line.command, line.comment);
    }
}

std::vector<gcode::CommandLine> buildPreSwitchLines(const HardwareTemplate& hw, const std::vector<double>& y_shifts, const double width)
{
    const double feed_length = width * prepurge_feed_ratio;

    std::vector<gcode::CommandLine> lines;
    double trail_sign = 1.0;
    for (const double y_shift : y_shifts)
    {
        lines.emplace_back(fmt::format("G1 X{:.3f} E{:.4f} F6000", trail_sign * width, feed_length), " purge trail");
        lines.emplace_back(fmt::format("G1 Y{:g} F3000", y_shift), " Y shift");
        trail_sign = -trail_sign;
    }

    appendLines(lines, hw.drip_lines);
    lines.emplace_back(fmt::format("G4 P{}", hw.cooling_delay_ms), fmt::format(" {:g}s cooling period", hw.cooling_delay_ms / 1000.0));
    appendLines(lines, hw.long_retract_lines);
    return lines;
}

} // namespace

const HardwareTemplate& getHardwareTemplate(const HardwareConfig config)
{
    switch (config)
    {
    case HardwareConfig::PTFE:
        return ptfe_template;
    case HardwareConfig::E3DV6:
        return e3dv6_template;
    case HardwareConfig::PEEK:
        return peek_template;
    }
    spdlog::error("No purge profile for hardware configuration {}", static_cast<int>(config));
    throw exceptions::HardwareConfigException(static_cast<int>(config));
}

HardwareProfile buildHardwareProfile(const HardwareConfig config, const double width)
{
    const HardwareTemplate& hw = getHardwareTemplate(config);

    HardwareProfile profile;
    profile.pre_switch_lines[0] = buildPreSwitchLines(hw, hw.y_shifts[0], width);
    profile.pre_switch_lines[1] = buildPreSwitchLines(hw, hw.y_shifts[1], width);

    appendLines(profile.post_switch_lines, hw.prime_feed_lines);
    const double prime_trail_length = width * hw.prime_trail_ratio;
    profile.post_switch_lines.emplace_back(
        fmt::format("G1 X{:.3f} E{:.4f} F{}", hw.prepurge_sign * (width + hw.prime_trail_offset), prime_trail_length, hw.prime_trail_speed),
        " prime trail");
    profile.prepurge_sign = hw.prepurge_sign;
    return profile;
}

std::string_view toString(const HardwareConfig config)
{
    switch (config)
    {
    case HardwareConfig::PTFE:
        return "PTFE-PRO-12";
    case HardwareConfig::E3DV6:
        return "PTFE-EV6";
    case HardwareConfig::PEEK:
        return "PEEK-PRO-12";
    }
    return "unknown";
}

HardwareConfig hardwareConfigFromString(std::string_view name)
{
    constexpr std::array<HardwareConfig, 3> configs{ HardwareConfig::PTFE, HardwareConfig::E3DV6, HardwareConfig::PEEK };
    for (const HardwareConfig config : configs)
    {
        if (toString(config) == name)
        {
            return config;
        }
    }
    spdlog::error("Unknown hardware configuration: {}", name);
    throw exceptions::HardwareConfigException(name);
}

} // namespace switchtower
