#include "Config.hpp"
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace
{

template <typename T> void readOptional(const YAML::Node& section, const char* key, T& target)
{
    if (section[key])
    {
        target = section[key].as<T>();
    }
}

Plume::WindowConfig parseWindowSection(const YAML::Node& window)
{
    Plume::WindowConfig config;
    readOptional(window, "width", config.width);
    readOptional(window, "height", config.height);
    readOptional(window, "title", config.title);
    readOptional(window, "vsync", config.vsync);
    readOptional(window, "visible", config.visible);
    readOptional(window, "transparent", config.transparent);

    if (config.width <= 0 || config.height <= 0)
    {
        throw std::runtime_error("Window size must be positive");
    }
    return config;
}

Plume::FluidConfig parseFluidSection(const YAML::Node& fluid)
{
    Plume::FluidConfig config;
    readOptional(fluid, "sim_resolution", config.simResolution);
    readOptional(fluid, "dye_resolution", config.dyeResolution);
    readOptional(fluid, "density_dissipation", config.densityDissipation);
    readOptional(fluid, "velocity_dissipation", config.velocityDissipation);
    readOptional(fluid, "pressure", config.pressure);
    readOptional(fluid, "pressure_iterations", config.pressureIterations);
    readOptional(fluid, "curl", config.curl);
    readOptional(fluid, "splat_radius", config.splatRadius);
    readOptional(fluid, "splat_force", config.splatForce);
    readOptional(fluid, "shading", config.shading);
    readOptional(fluid, "color_update_speed", config.colorUpdateSpeed);
    readOptional(fluid, "transparent", config.transparent);

    Plume::validateFluidConfig(config);
    return config;
}

// Leaves the outputs untouched when any section is invalid
void loadRoot(const YAML::Node& config, Plume::WindowConfig& windowOut,
              Plume::FluidConfig& fluidOut)
{
    Plume::WindowConfig windowConfig;
    Plume::FluidConfig fluidConfig;

    if (config["window"])
    {
        windowConfig = parseWindowSection(config["window"]);
    }

    if (config["fluid"])
    {
        fluidConfig = parseFluidSection(config["fluid"]);
    }
    else
    {
        throw std::runtime_error("Missing 'fluid' section in config file");
    }

    windowOut = windowConfig;
    fluidOut = fluidConfig;
}

}

namespace Plume
{

void validateFluidConfig(const FluidConfig& config)
{
    if (config.simResolution <= 0)
    {
        throw std::runtime_error("sim_resolution must be positive");
    }
    if (config.dyeResolution <= 0)
    {
        throw std::runtime_error("dye_resolution must be positive");
    }
    if (config.pressureIterations <= 0)
    {
        throw std::runtime_error("pressure_iterations must be positive");
    }
    if (config.densityDissipation < 0.0f || config.velocityDissipation < 0.0f)
    {
        throw std::runtime_error("dissipation rates must not be negative");
    }
    if (config.pressure < 0.0f)
    {
        throw std::runtime_error("pressure must not be negative");
    }
    if (config.splatRadius <= 0.0f)
    {
        throw std::runtime_error("splat_radius must be positive");
    }
    if (config.colorUpdateSpeed < 0.0f)
    {
        throw std::runtime_error("color_update_speed must not be negative");
    }
}

Config& Config::getInstance()
{
    static Config instance;
    return instance;
}

void Config::loadFromYaml(const std::string& path)
{
    try
    {
        loadRoot(YAML::LoadFile(path), m_windowConfig, m_fluidConfig);
    }
    catch (const YAML::Exception& e)
    {
        throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
    }
    catch (const std::exception& e)
    {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }
}

void Config::loadFromString(const std::string& yaml)
{
    try
    {
        loadRoot(YAML::Load(yaml), m_windowConfig, m_fluidConfig);
    }
    catch (const YAML::Exception& e)
    {
        throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
    }
    catch (const std::exception& e)
    {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }
}

}
