// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "SwitchTower.h"

#include <cmath>
#include <utility>

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/concat.hpp>
#include <range/v3/view/iota.hpp>
#include <range/v3/view/repeat_n.hpp>
#include <range/v3/view/reverse.hpp>
#include <range/v3/view/transform.hpp>

#include "Extruder.h"
#include "Layer.h"
#include "gcode/Direction.h"
#include "gcode/Moves.h"
#include "settings/Settings.h"
#include "utils/exception.h"
#include "utils/math.h"

namespace switchtower
{

using gcode::CommandLine;
namespace Direction = gcode::Direction;

namespace
{

constexpr double raft_z = 0.2; //!< Height of the raft, and of the tower top after the raft.
constexpr double default_speed = 2400; //!< Default speed (mm/min) of the purge lines and the infill.
constexpr double y_shift_speed = 3000;
constexpr double switch_wipe_speed = 3000;
constexpr double infill_wipe_speed = 2000;
constexpr double raft_wall_speed = 2000;
constexpr double raft_fill_speed = 1000;
constexpr double raft_feed_multiplier = 1.3;
constexpr double purge_feed_multiplier = 1.2;
constexpr size_t infill_ramp_passes = 4;

} // namespace

SwitchTower::SwitchTower(
    const double start_pos_x,
    const double start_pos_y,
    const HardwareConfig hw_config,
    std::shared_ptr<spdlog::logger> logger,
    const TowerSize size)
    : log_(std::move(logger))
    , hw_config_(hw_config)
    , width_(size.width)
    , height_(size.height)
    , start_pos_x_(start_pos_x)
    , start_pos_y_(start_pos_y)
{
    if (width_ <= 0.0)
    {
        throw exceptions::GeometryException(fmt::format("width must be positive, got {}", width_));
    }
    if (height_ <= 0.0 || std::fmod(height_, 2.0) != 0.0)
    {
        throw exceptions::GeometryException(fmt::format("height must be a positive even number, got {}", height_));
    }

    const HardwareTemplate& hw = getHardwareTemplate(hw_config_);
    height_ += hw.height_delta;

    wall_width_ = width_ + 2.4;
    wall_height_ = height_ + 1;
    raft_width_ = width_ + 4;
    raft_height_ = height_ + 2;
    raft_pos_x_ = start_pos_x_ - 2;
    raft_pos_y_ = start_pos_y_ - 1.2;

    purge_line_length_ = width_ + 0.6;
    purge_lines_ = static_cast<int>(std::abs(height_ / 2)) - 1 + hw.purge_line_delta;
    if (purge_lines_ < 0)
    {
        throw exceptions::GeometryException(fmt::format("height {} leaves no room for purge lines on {}", height_, toString(hw_config_)));
    }

    profile_ = buildHardwareProfile(hw_config_, width_);
    log_->debug("Switch tower for {} at ({}, {}): {} purge lines of {} mm", toString(hw_config_), start_pos_x_, start_pos_y_, purge_lines_, purge_line_length_);
}

SwitchTower SwitchTower::fromSettings(const Settings& settings, std::shared_ptr<spdlog::logger> logger)
{
    const TowerSize size{ .width = settings.get<double>("switch_tower_width", 50.0), .height = settings.get<double>("switch_tower_height", 14.0) };
    return SwitchTower(
        settings.get<double>("switch_tower_position_x"),
        settings.get<double>("switch_tower_position_y"),
        settings.get<HardwareConfig>("switch_tower_hardware"),
        std::move(logger),
        size);
}

std::vector<double> SwitchTower::generatePurgeSpeeds(const double min_speed) const
{
    // Number of purge lines at the end that are printed at min_speed.
    constexpr int min_speed_lines = 0;

    return ranges::views::iota(0, purge_lines_)
         | ranges::views::transform(
               [min_speed](const int line_nr)
               {
                   return line_nr >= min_speed_lines ? default_speed : min_speed;
               })
         | ranges::views::reverse | ranges::to<std::vector<double>>();
}

std::vector<double> SwitchTower::generateInfillSpeeds(const double min_speed) const
{
    const double step = (default_speed - min_speed) / static_cast<double>(infill_ramp_passes);
    auto ramp = ranges::views::iota(size_t{ 0 }, infill_ramp_passes)
              | ranges::views::transform(
                    [step](const size_t pass)
                    {
                        return default_speed - static_cast<double>(pass) * step;
                    });
    return ranges::views::concat(ramp, ranges::views::repeat_n(min_speed, 2)) | ranges::to<std::vector<double>>();
}

std::optional<CommandLine> SwitchTower::getRetraction(const double e_pos, const Extruder& extruder) const
{
    double retraction = extruder.retract + e_pos;
    log_->debug("Retraction to add: {}. E position: {}", retraction, e_pos);
    if (is_float_zero(retraction, 3))
    {
        return std::nullopt;
    }
    if (retraction > extruder.retract)
    {
        retraction = extruder.retract;
    }
    return CommandLine{ fmt::format("G1 E{:.4f} F{:.1f}", -retraction, extruder.retract_speed), " tower retract" };
}

std::optional<CommandLine> SwitchTower::getZHop(const Layer& layer, const double z_hop, const double z_speed, const Extruder& extruder) const
{
    if (extruder.z_hop == 0.0)
    {
        return std::nullopt;
    }
    const double new_z_hop = last_tower_z_ + extruder.z_hop;
    if (new_z_hop == layer.z + z_hop)
    {
        return std::nullopt;
    }
    return CommandLine{ fmt::format("G1 Z{:.3f} F{:.1f}", new_z_hop, z_speed), " z-hop" };
}

CommandLine SwitchTower::getWallPosition(const bool flipflop, const double xy_speed) const
{
    const double x = start_pos_x_ - 1.2;
    double y = start_pos_y_ - 0.5;
    if (! flipflop)
    {
        y += wall_height_;
    }
    return { gcode::headMove(x, y, xy_speed), " move to purge zone" };
}

void SwitchTower::writeWall(gcode::CommandExporter& output, const bool flipflop, const Extruder& extruder, const double wall_speed, const double feed_rate) const
{
    const double last_y = wall_height_ - 0.3;
    const double side_direction = flipflop ? Direction::N : Direction::S;
    const double closing_direction = flipflop ? Direction::S : Direction::N;

    output.write(gcode::directionMove(Direction::E, wall_width_, wall_speed, &extruder, feed_rate), " wall");
    output.write(gcode::directionMove(side_direction, wall_height_, wall_speed, &extruder, feed_rate), " wall");
    output.write(gcode::directionMove(Direction::W, wall_width_, wall_speed, &extruder, feed_rate), " wall");
    output.write(gcode::directionMove(closing_direction, last_y, wall_speed, &extruder, feed_rate, true), " wall");
}

void SwitchTower::generateRaft(gcode::CommandExporter& output, const Extruder& extruder, const bool retract, const double xy_speed, const double z_speed)
{
    output.write(CommandLine::marker(" TOWER RAFT START"));
    if (extruder.z_hop != 0.0)
    {
        output.write(fmt::format("G1 Z{:.3f} F{:.1f}", raft_z + extruder.z_hop, z_speed), " z-hop");
    }
    output.write(gcode::headMove(raft_pos_x_ - 0.4, raft_pos_y_ - 0.4, xy_speed), " move to raft zone");
    output.write(fmt::format("G1 Z{:g} F{}", raft_z, static_cast<int>(z_speed)), " move z close");
    output.write("G91", " relative positioning");

    // Three nested perimeters, spiralling inwards.
    double width = raft_width_ + 0.8;
    double height = raft_height_ + 0.8;
    output.write(gcode::directionMove(Direction::E, width, raft_wall_speed, &extruder), " raft wall");
    output.write(gcode::directionMove(Direction::N, height, raft_wall_speed, &extruder), " raft wall");
    output.write(gcode::directionMove(Direction::W, width, raft_wall_speed, &extruder), " raft wall");
    width -= 0.4;
    height -= 0.4;
    output.write(gcode::directionMove(Direction::S, height, raft_wall_speed, &extruder), " raft wall");
    output.write(gcode::directionMove(Direction::E, width, raft_wall_speed, &extruder), " raft wall");
    height -= 0.4;
    output.write(gcode::directionMove(Direction::N, height, raft_wall_speed, &extruder), " raft wall");
    width -= 0.4;
    height -= 0.4;
    output.write(gcode::directionMove(Direction::W, width, raft_wall_speed, &extruder), " raft wall");
    output.write(gcode::directionMove(Direction::S, height, raft_wall_speed, &extruder), " raft wall");

    output.write(CommandLine{ gcode::directionMove(Direction::SE, 0.6, xy_speed), std::nullopt });

    const double feed_rate = extruder.getFeedRate(raft_feed_multiplier);
    const int fill_passes = static_cast<int>(raft_width_ / 2);
    for (int pass = 0; pass < fill_passes; pass++)
    {
        output.write(gcode::directionMove(Direction::N, raft_height_, raft_fill_speed, &extruder, feed_rate), " raft1");
        output.write(gcode::directionMove(Direction::E, 1, raft_fill_speed), " raft2");
        output.write(gcode::directionMove(Direction::S, raft_height_, raft_fill_speed, &extruder, feed_rate), " raft3");
        output.write(gcode::directionMove(Direction::E, 1, raft_fill_speed), " raft4");
    }

    if (retract)
    {
        output.write(extruder.getRetractGcode());
    }
    output.write("G90", " absolute positioning");
    output.write(CommandLine::marker(" TOWER RAFT END"));
    last_tower_z_ = raft_z;
}

void SwitchTower::generateSwitch(
    gcode::CommandExporter& output,
    const Layer& layer,
    const double e_pos,
    const Extruder& old_e,
    const Extruder& new_e,
    const double z_hop,
    const double z_speed,
    const double xy_speed)
{
    log_->debug("Adding purge tower");
    output.write(CommandLine::marker(" TOWER START"));

    const auto [min_speed, feed_rate] = layer.getOuterPerimeterRates();

    output.write(getRetraction(e_pos, old_e));
    output.write(getZHop(layer, z_hop, z_speed, old_e));

    last_tower_z_ += layer.height;
    if (flipflop_purge_)
    {
        output.write(gcode::headMove(start_pos_x_ - 0.6, start_pos_y_ + 0.2, xy_speed), " move to purge zone");
    }
    else
    {
        output.write(gcode::headMove(start_pos_x_ + 0.6, start_pos_y_, xy_speed), " move to purge zone");
    }
    output.write(fmt::format("G1 Z{:.3f} F{:.1f}", last_tower_z_, z_speed), " move z close");
    output.write("G91", " relative positioning");
    output.write(old_e.getPrimeGcode(-0.1));

    for (const CommandLine& line : preSwitchLines(flipflop_purge_))
    {
        output.write(line);
    }

    output.write(fmt::format("T{}", new_e.tool), " change tool");

    for (const CommandLine& line : postSwitchLines())
    {
        output.write(line);
    }

    // Post-switch purge, back and forth over the purge zone, in the direction the prime trail left off.
    const double purge_feed_rate = new_e.getFeedRate(purge_feed_multiplier);
    const double purge_length = purge_line_length_ * profile_.prepurge_sign;
    const double dir_1 = profile_.prepurge_sign == 1 ? Direction::W : Direction::E;
    const double dir_2 = profile_.prepurge_sign == 1 ? Direction::E : Direction::W;
    const double first_shift = flipflop_purge_ ? 0.6 : 0.9;
    const double second_shift = flipflop_purge_ ? 0.9 : 0.6;

    for (const double speed : generatePurgeSpeeds(min_speed))
    {
        output.write(gcode::directionMove(Direction::N, first_shift, y_shift_speed), " Y shift");
        output.write(gcode::directionMove(dir_1, purge_length, speed, &new_e, purge_feed_rate), " purge trail");
        output.write(gcode::directionMove(Direction::N, second_shift, y_shift_speed), " Y shift");
        output.write(gcode::directionMove(dir_2, purge_length, speed, &new_e, purge_feed_rate), " purge trail");
    }

    output.write(gcode::directionMove(Direction::N, first_shift, y_shift_speed), " Y shift");
    output.write(gcode::directionMove(dir_1, purge_length, default_speed, &new_e, feed_rate), " purge trail");
    double direction = dir_1;

    if (hw_config_ == HardwareConfig::E3DV6)
    {
        // The E3D v6 melt zone holds more material, purge one more line.
        output.write(gcode::directionMove(Direction::N, second_shift, y_shift_speed), " Y shift");
        output.write(gcode::directionMove(dir_2, purge_length, min_speed, &new_e, feed_rate), " purge trail");
        direction = dir_2;
    }

    output.write("G90", " absolute positioning");
    output.write(getWallPosition(false, xy_speed));
    output.write("G91", " relative positioning");

    writeWall(output, false, new_e, min_speed, feed_rate);

    output.write(new_e.getRetractGcode());
    if (new_e.wipe != 0.0)
    {
        output.write(gcode::directionMove(direction + 180, new_e.wipe, switch_wipe_speed), " wipe");
    }

    output.write("G90", " absolute positioning");
    output.write("G92 E0", " reset extruder position");
    output.write(getZHop(layer, z_hop, z_speed, old_e));
    output.write(CommandLine::marker(" TOWER END"));

    flipflop_purge_ = ! flipflop_purge_;
}

void SwitchTower::generateInfill(
    gcode::CommandExporter& output,
    const Layer& layer,
    const double e_pos,
    const Extruder& extruder,
    const double z_hop,
    const double z_speed,
    const double xy_speed)
{
    log_->debug("Adding purge tower infill");
    output.write(CommandLine::marker(" TOWER INFILL START"));

    const auto [min_speed, feed_rate] = layer.getOuterPerimeterRates();

    output.write(getRetraction(e_pos, extruder));
    output.write(getZHop(layer, z_hop, z_speed, extruder));
    last_tower_z_ += layer.height;

    output.write(getWallPosition(flipflop_infill_, xy_speed));
    output.write(fmt::format("G1 Z{:.3f} F{:.1f}", last_tower_z_, z_speed), " move z close");
    output.write("G91", " relative positioning");
    output.write(extruder.getPrimeGcode());

    // Zig-zag between the long walls, six diagonals across the wall width.
    const double infill_x = wall_width_ / 6;
    const double infill_y = wall_height_ - 0.3;
    const double infill_angle = rad_to_deg(std::atan(infill_y / infill_x));
    const double infill_path_length = gcode::pathLength({ 0.0, 0.0 }, { infill_x, infill_y });

    writeWall(output, flipflop_infill_, extruder, default_speed, feed_rate);

    bool flip = flipflop_infill_;
    double direction = infill_angle;
    const std::vector<double> speeds = generateInfillSpeeds(min_speed);
    for (size_t pass = 0; pass < speeds.size(); pass++)
    {
        direction = flip ? infill_angle : 360 - infill_angle;
        const bool last_line = pass + 1 == speeds.size();
        output.write(gcode::directionMove(direction, infill_path_length, speeds[pass], &extruder, feed_rate, last_line), " infill");
        flip = ! flip;
    }

    output.write(extruder.getRetractGcode());
    if (extruder.wipe != 0.0)
    {
        output.write(gcode::directionMove(direction + 180, extruder.wipe, infill_wipe_speed), " wipe");
    }

    output.write("G90", " absolute positioning");
    output.write(getZHop(layer, z_hop, z_speed, extruder));
    output.write("G92 E0", " reset extruder position");
    output.write(CommandLine::marker(" TOWER INFILL END"));

    flipflop_infill_ = ! flipflop_infill_;
}

} // namespace switchtower
