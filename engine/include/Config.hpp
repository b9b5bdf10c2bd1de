#pragma once

#include <string>

namespace Plume
{

struct WindowConfig
{
    int width{1280};
    int height{720};
    std::string title{"Plume"};
    bool vsync{true};
    bool visible{true};
    bool transparent{false};
};

// Tunables of one fluid session. Immutable once handed to start().
struct FluidConfig
{
    int simResolution{128};
    int dyeResolution{1440};
    float densityDissipation{3.5f};
    float velocityDissipation{2.0f};
    float pressure{0.1f};
    int pressureIterations{20};
    float curl{3.0f};
    float splatRadius{0.2f};
    float splatForce{6000.0f};
    bool shading{true};
    float colorUpdateSpeed{10.0f};
    bool transparent{true};
};

// Throws std::runtime_error naming the first offending option.
void validateFluidConfig(const FluidConfig& config);

// Host-level settings for the demo executable. The fluid core never reads this.
class Config
{
public:
    static Config& getInstance();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) = delete;
    Config& operator=(Config&&) = delete;

    void loadFromYaml(const std::string& path);
    void loadFromString(const std::string& yaml);

    const WindowConfig& getWindowConfig() const
    {
        return m_windowConfig;
    }
    const FluidConfig& getFluidConfig() const
    {
        return m_fluidConfig;
    }

private:
    Config() = default;
    ~Config() = default;

    WindowConfig m_windowConfig;
    FluidConfig m_fluidConfig;
};

}
