// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "Application.h"

#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/dup_filter_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "SwitchTower.h"
#include "TowerJob.h"
#include "gcode/CommandExporter.h"

namespace switchtower
{

Application::Application()
{
    auto dup_sink = std::make_shared<spdlog::sinks::dup_filter_sink_mt>(std::chrono::seconds{ 10 });
    auto base_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    dup_sink->add_sink(base_sink);

    spdlog::default_logger()->sinks()
        = std::vector<std::shared_ptr<spdlog::sinks::sink>>{ dup_sink }; // replace default_logger sinks with the duplicating filtering sink to avoid spamming

    if (auto spdlog_val = spdlog::details::os::getenv("SWITCHTOWER_LOG_LEVEL"); ! spdlog_val.empty())
    {
        spdlog::cfg::helpers::load_levels(spdlog_val);
    }

    loadDefaults();
}

Application& Application::getInstance()
{
    static Application instance; // Constructs using the default constructor.
    return instance;
}

void Application::printCall() const
{
    spdlog::error("Command called: {}", fmt::join(argv_, argv_ + argc_, " "));
}

void Application::printHelp() const
{
    fmt::print("\n");
    fmt::print("usage:\n");
    fmt::print("SwitchTower help\n");
    fmt::print("\tShow this help message\n");
    fmt::print("\n");
    fmt::print("SwitchTower speeds [-s <settingkey>=<value>]\n");
    fmt::print("\tPrint the post-switch purge speeds of the configured tower.\n");
    fmt::print("\n");
    fmt::print("SwitchTower tower [-v] [-s <settingkey>=<value>] [-e<extruder_nr>] [-l <layers>] [-o <output.gcode>]\n");
    fmt::print("  -v\n\tIncrease the verbose level (show log messages).\n");
    fmt::print("  -s <setting>=<value>\n\tSet a setting to a value for the last supplied extruder train, or the general settings.\n");
    fmt::print("  -e<extruder_nr>\n\tSwitch setting focus to the extruder train with the given number.\n");
    fmt::print("  -l <layers>\n\tNumber of layers to build the tower for, after the raft.\n");
    fmt::print("  -o <output_file>\n\tSpecify a file to which to write the generated gcode.\n");
    fmt::print("\n");
    fmt::print("Hardware configurations (switch_tower_hardware): PTFE-PRO-12, PTFE-EV6, PEEK-PRO-12\n");
    fmt::print("\n");
}

void Application::loadDefaults()
{
    settings_.add("switch_tower_hardware", "PTFE-PRO-12");
    settings_.add("switch_tower_position_x", "100");
    settings_.add("switch_tower_position_y", "100");
    settings_.add("switch_tower_width", "50");
    settings_.add("switch_tower_height", "14");
    settings_.add("switch_every", "2");
    settings_.add("layer_height", "0.2");
    settings_.add("outer_wall_speed", "1200");
    settings_.add("z_speed", "600");
    settings_.add("travel_speed", "9000");
    settings_.add("line_width", "0.4");
    settings_.add("material_diameter", "1.75");
    settings_.add("material_flow", "1.0");
    settings_.add("retraction_amount", "2.0");
    settings_.add("retraction_speed", "2100");
    settings_.add("retraction_hop", "0.0");
    settings_.add("wipe_distance", "0.0");
    settings_.add("coasting_distance", "0.0");

    getExtruderSettings(1);
}

Settings& Application::getExtruderSettings(const size_t extruder_nr)
{
    // Reserve up front, the extruder settings are handed out by reference while parsing.
    extruder_settings_.reserve(16);
    while (extruder_settings_.size() <= extruder_nr)
    {
        Settings& extruder = extruder_settings_.emplace_back();
        extruder.setParent(&settings_);
        extruder.add("extruder_nr", std::to_string(extruder_settings_.size() - 1));
    }
    return extruder_settings_[extruder_nr];
}

bool Application::parseArguments(const std::vector<std::string>& arguments)
{
    Settings* last_settings = &settings_;

    for (size_t argument_index = 0; argument_index < arguments.size(); argument_index++)
    {
        const std::string& argument = arguments[argument_index];
        if (argument.size() < 2 || argument[0] != '-')
        {
            spdlog::error("Unknown argument: {}", argument);
            return false;
        }

        switch (argument[1])
        {
        case 'v':
            spdlog::set_level(spdlog::level::debug);
            break;
        case 'e':
        {
            size_t extruder_nr = 0;
            try
            {
                extruder_nr = std::stoul(argument.substr(2));
            }
            catch (const std::logic_error&)
            {
                spdlog::error("Invalid extruder number: {}", argument);
                return false;
            }
            if (extruder_nr >= 16)
            {
                spdlog::error("Extruder number {} is out of range", extruder_nr);
                return false;
            }
            last_settings = &getExtruderSettings(extruder_nr);
            break;
        }
        case 's':
        {
            argument_index++;
            if (argument_index >= arguments.size())
            {
                spdlog::error("Missing setting with -s argument.");
                return false;
            }
            const std::string& key_value = arguments[argument_index];
            const size_t value_position = key_value.find('=');
            if (value_position == std::string::npos)
            {
                spdlog::error("Missing value in setting argument: -s {}", key_value);
                return false;
            }
            last_settings->add(key_value.substr(0, value_position), key_value.substr(value_position + 1));
            break;
        }
        case 'l':
        {
            argument_index++;
            if (argument_index >= arguments.size())
            {
                spdlog::error("Missing layer count with -l argument.");
                return false;
            }
            try
            {
                layer_count_ = std::stoul(arguments[argument_index]);
            }
            catch (const std::logic_error&)
            {
                spdlog::error("Invalid layer count: {}", arguments[argument_index]);
                return false;
            }
            break;
        }
        case 'o':
            argument_index++;
            if (argument_index >= arguments.size())
            {
                spdlog::error("Missing output file with -o argument.");
                return false;
            }
            output_file_ = arguments[argument_index];
            break;
        default:
            spdlog::error("Unknown option: {}", argument);
            return false;
        }
    }
    return true;
}

int Application::printSpeeds()
{
    const SwitchTower tower = SwitchTower::fromSettings(settings_);
    const std::vector<double> speeds = tower.generatePurgeSpeeds(settings_.get<double>("outer_wall_speed"));
    fmt::print("[{}]\n", fmt::join(speeds, ", "));
    return 0;
}

int Application::writeTower()
{
    spdlog::debug("Settings:{}", settings_.getAllSettingsString());
    TowerJob job(settings_, extruder_settings_);

    std::ofstream file;
    if (! output_file_.empty())
    {
        file.open(output_file_);
        if (! file.is_open())
        {
            spdlog::error("Couldn't open output file: {}", output_file_);
            return 1;
        }
    }
    gcode::StreamExporter exporter(output_file_.empty() ? std::cout : file);
    const size_t tool_changes = job.run(exporter, layer_count_);
    spdlog::info("Wrote {} lines with {} tool changes", exporter.linesWritten(), tool_changes);
    return 0;
}

int Application::run(const size_t argc, char** argv)
{
    argc_ = argc;
    argv_ = argv;

    if (argc < 2)
    {
        printHelp();
        return 1;
    }

    const std::string command = argv[1];
    const std::vector<std::string> arguments(argv + 2, argv + argc);

    if (command == "help")
    {
        printHelp();
        return 0;
    }
    if (command != "speeds" && command != "tower")
    {
        spdlog::error("Unknown command: {}", command);
        printCall();
        printHelp();
        return 1;
    }
    if (! parseArguments(arguments))
    {
        printCall();
        printHelp();
        return 1;
    }

    try
    {
        return command == "speeds" ? printSpeeds() : writeTower();
    }
    catch (const std::exception& e)
    {
        spdlog::error("{}", e.what());
        return 1;
    }
}

} // namespace switchtower
