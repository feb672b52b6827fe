// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "TowerJob.h"

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "gcode/CommandExporter.h"
#include "settings/Settings.h"
#include "utils/exception.h"

// NOLINTBEGIN(*-magic-numbers)
namespace switchtower
{

using gcode::CommandLine;

/*
 * Fixture with the settings of a two-extruder machine.
 */
class TowerJobTest : public testing::Test
{
public:
    Settings settings;
    std::vector<Settings> extruder_settings;
    gcode::CommandBuffer output;

    void SetUp() override
    {
        settings.add("switch_tower_hardware", "PTFE-PRO-12");
        settings.add("switch_tower_position_x", "100");
        settings.add("switch_tower_position_y", "100");
        settings.add("layer_height", "0.2");
        settings.add("outer_wall_speed", "1200");
        settings.add("z_speed", "600");
        settings.add("travel_speed", "9000");
        settings.add("retraction_amount", "2");
        settings.add("retraction_speed", "2100");

        addExtruders(2);
    }

    void addExtruders(const size_t count)
    {
        extruder_settings.clear();
        for (size_t extruder_nr = 0; extruder_nr < count; extruder_nr++)
        {
            Settings& extruder = extruder_settings.emplace_back();
            extruder.add("extruder_nr", std::to_string(extruder_nr));
            extruder.setParent(&settings);
        }
    }

    std::vector<std::string> toolChanges() const
    {
        std::vector<std::string> result;
        for (const CommandLine& line : output.lines())
        {
            if (line.command && line.command->starts_with('T'))
            {
                result.push_back(*line.command);
            }
        }
        return result;
    }

    size_t countMarker(const std::string& comment) const
    {
        return std::count(output.lines().begin(), output.lines().end(), CommandLine::marker(comment));
    }
};

TEST_F(TowerJobTest, SwitchEveryTwoLayers)
{
    TowerJob job(settings, extruder_settings);
    const size_t tool_changes = job.run(output, 4);

    EXPECT_EQ(size_t(2), tool_changes);
    EXPECT_EQ((std::vector<std::string>{ "T1", "T0" }), toolChanges());
    EXPECT_EQ(size_t(1), countMarker(" TOWER RAFT START"));
    EXPECT_EQ(size_t(2), countMarker(" TOWER START"));
    EXPECT_EQ(size_t(2), countMarker(" TOWER INFILL START"));
    EXPECT_NEAR(1.0, job.tower().lastTowerZ(), 1e-9);
}

TEST_F(TowerJobTest, LayerMarkers)
{
    TowerJob job(settings, extruder_settings);
    job.run(output, 3);

    ASSERT_FALSE(output.empty());
    EXPECT_EQ(CommandLine::marker("LAYER:0"), output.lines().front());
    for (const std::string layer : { "LAYER:0", "LAYER:1", "LAYER:2", "LAYER:3" })
    {
        EXPECT_EQ(size_t(1), countMarker(layer)) << layer;
    }
    EXPECT_EQ(size_t(0), countMarker("LAYER:4"));
}

TEST_F(TowerJobTest, SwitchEveryLayer)
{
    settings.add("switch_every", "1");
    TowerJob job(settings, extruder_settings);

    EXPECT_EQ(size_t(3), job.run(output, 3));
    EXPECT_EQ((std::vector<std::string>{ "T1", "T0", "T1" }), toolChanges());
    EXPECT_EQ(size_t(0), countMarker(" TOWER INFILL START"));
}

TEST_F(TowerJobTest, CyclesThroughAllExtruders)
{
    addExtruders(3);
    settings.add("switch_every", "1");
    TowerJob job(settings, extruder_settings);

    EXPECT_EQ(size_t(4), job.run(output, 4));
    EXPECT_EQ((std::vector<std::string>{ "T1", "T2", "T0", "T1" }), toolChanges());
}

TEST_F(TowerJobTest, OnlyRaft)
{
    TowerJob job(settings, extruder_settings);

    EXPECT_EQ(size_t(0), job.run(output, 0));
    EXPECT_EQ(CommandLine::marker(" TOWER RAFT END"), output.lines().back());
    EXPECT_DOUBLE_EQ(0.2, job.tower().lastTowerZ());
}

TEST_F(TowerJobTest, OuterWallFeedRate)
{
    settings.add("outer_wall_feed_rate", "0.05");
    TowerJob job(settings, extruder_settings);
    job.run(output, 2);

    // Layer 1 is infill, its wall runs at the default speed. Layer 2 switches, its wall runs at the outer wall speed.
    const CommandLine infill_wall{ "G1 X52.400 E2.6200 F2400.0", " wall" };
    const CommandLine switch_wall{ "G1 X52.400 E2.6200 F1200.0", " wall" };
    EXPECT_EQ(1, std::count(output.lines().begin(), output.lines().end(), infill_wall));
    EXPECT_EQ(1, std::count(output.lines().begin(), output.lines().end(), switch_wall));
}

TEST_F(TowerJobTest, OuterWallFeedRateDefaultsToExtruder)
{
    TowerJob job(settings, extruder_settings);
    job.run(output, 1);

    // 52.4 mm of 0.4 mm line at 0.2 mm layer height, from 1.75 mm filament.
    const CommandLine infill_wall{ "G1 X52.400 E1.7428 F2400.0", " wall" };
    EXPECT_EQ(1, std::count(output.lines().begin(), output.lines().end(), infill_wall));
}

TEST_F(TowerJobTest, NeedsTwoExtruders)
{
    addExtruders(1);
    EXPECT_THROW(TowerJob(settings, extruder_settings), exceptions::SettingException);
}

TEST_F(TowerJobTest, SwitchEveryZeroThrows)
{
    settings.add("switch_every", "0");
    EXPECT_THROW(TowerJob(settings, extruder_settings), exceptions::SettingException);
}

TEST_F(TowerJobTest, UnknownHardwareThrows)
{
    settings.add("switch_tower_hardware", "PTFE-PRO-13");
    EXPECT_THROW(TowerJob(settings, extruder_settings), exceptions::HardwareConfigException);
}

TEST_F(TowerJobTest, OddHeightThrows)
{
    settings.add("switch_tower_height", "15");
    EXPECT_THROW(TowerJob(settings, extruder_settings), exceptions::GeometryException);
}

} // namespace switchtower
// NOLINTEND(*-magic-numbers)
