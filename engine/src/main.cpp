#include "Config.hpp"
#include "Engine.hpp"
#include "EngineConfig.hpp"
#include "FluidCursor.hpp"
#include <cstdlib>
#include <iostream>

int main()
{
    try
    {
        Plume::Config::getInstance().loadFromYaml(Plume::Paths::getConfigFile().string());
        std::cout << "Configuration loaded successfully." << std::endl;

        const auto& config = Plume::Config::getInstance();

        Plume::Engine engine(config.getWindowConfig());
        engine.initialize();

        Plume::StopFunction stop = Plume::start(engine, config.getFluidConfig());
        engine.run();
        stop();

        engine.shutdown();

        return EXIT_SUCCESS;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
