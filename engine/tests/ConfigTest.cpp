#include "Config.hpp"
#include "EngineConfig.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace Plume;

TEST(ConfigTest, EmptyFluidSectionGivesDefaults)
{
    Config::getInstance().loadFromString("fluid: {}\n");

    const FluidConfig& fluid = Config::getInstance().getFluidConfig();
    const FluidConfig defaults;
    EXPECT_EQ(fluid.simResolution, defaults.simResolution);
    EXPECT_EQ(fluid.dyeResolution, defaults.dyeResolution);
    EXPECT_EQ(fluid.pressureIterations, defaults.pressureIterations);
    EXPECT_FLOAT_EQ(fluid.splatForce, defaults.splatForce);
    EXPECT_TRUE(fluid.shading);
    EXPECT_TRUE(fluid.transparent);

    EXPECT_EQ(Config::getInstance().getWindowConfig().width, WindowConfig{}.width);
}

TEST(ConfigTest, OverridesAreApplied)
{
    Config::getInstance().loadFromString("window:\n"
                                         "  width: 640\n"
                                         "  visible: false\n"
                                         "fluid:\n"
                                         "  sim_resolution: 64\n"
                                         "  shading: false\n"
                                         "  splat_force: 3000.5\n"
                                         "  pressure_iterations: 40\n");

    const Config& config = Config::getInstance();
    EXPECT_EQ(config.getWindowConfig().width, 640);
    EXPECT_FALSE(config.getWindowConfig().visible);
    EXPECT_EQ(config.getFluidConfig().simResolution, 64);
    EXPECT_FALSE(config.getFluidConfig().shading);
    EXPECT_FLOAT_EQ(config.getFluidConfig().splatForce, 3000.5f);
    EXPECT_EQ(config.getFluidConfig().pressureIterations, 40);
}

TEST(ConfigTest, MissingFluidSectionKeepsPreviousValues)
{
    Config::getInstance().loadFromString("fluid:\n  curl: 7.0\n");

    EXPECT_THROW(Config::getInstance().loadFromString("window:\n  width: 320\n"),
                 std::runtime_error);

    EXPECT_FLOAT_EQ(Config::getInstance().getFluidConfig().curl, 7.0f);
    EXPECT_NE(Config::getInstance().getWindowConfig().width, 320);
}

TEST(ConfigTest, InvalidValuesAreRejected)
{
    EXPECT_THROW(Config::getInstance().loadFromString("fluid:\n  pressure_iterations: 0\n"),
                 std::runtime_error);
    EXPECT_THROW(Config::getInstance().loadFromString("fluid:\n  splat_radius: -1.0\n"),
                 std::runtime_error);
    EXPECT_THROW(Config::getInstance().loadFromString("fluid:\n  sim_resolution: abc\n"),
                 std::runtime_error);
    EXPECT_THROW(Config::getInstance().loadFromString("window:\n  height: 0\nfluid: {}\n"),
                 std::runtime_error);
}

TEST(ConfigTest, ValidateFluidConfig)
{
    EXPECT_NO_THROW(validateFluidConfig(FluidConfig{}));

    FluidConfig config;
    config.dyeResolution = 0;
    EXPECT_THROW(validateFluidConfig(config), std::runtime_error);

    config = FluidConfig{};
    config.densityDissipation = -0.5f;
    EXPECT_THROW(validateFluidConfig(config), std::runtime_error);
}

TEST(ConfigTest, ShippedConfigFileLoads)
{
    ASSERT_NO_THROW(Config::getInstance().loadFromYaml(Paths::getConfigFile().string()));

    const FluidConfig& fluid = Config::getInstance().getFluidConfig();
    EXPECT_EQ(fluid.simResolution, 128);
    EXPECT_EQ(fluid.dyeResolution, 1440);
    EXPECT_FLOAT_EQ(fluid.densityDissipation, 3.5f);
}

TEST(ConfigTest, MissingFileThrows)
{
    EXPECT_THROW(Config::getInstance().loadFromYaml("/nonexistent/plume.yaml"),
                 std::runtime_error);
}
