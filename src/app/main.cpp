#include <cstdlib>
#include <filesystem>
#include <string>
#include <topclock/app.hpp>
#include <topclock/config/config.hpp>
#include <topclock/config/paths.hpp>
#include <topclock/core/log.hpp>
#include <utility>

namespace fs = std::filesystem;

int main(int argc, char* argv[])
{
    topclock::log::init();

    try
    {
        LOG_INFO("Starting topclock");

        std::string config_path = topclock::paths::settings_path(argc, argv);
        topclock::Config config;

        if (!config_path.empty() && fs::exists(config_path))
        {
            LOG_INFO("Loading config from: {}", config_path);
            auto loaded = topclock::load_config(config_path);
            if (loaded)
            {
                config = *loaded;
            }
            else
            {
                LOG_WARN("Failed to load config, using defaults");
                config = topclock::default_config();
            }
        }
        else
        {
            LOG_INFO("No config file found, using defaults");
            config = topclock::default_config();
        }

        fs::path geometry_file = topclock::paths::geometry_path(config);
        topclock::ClockApp app(std::move(config), geometry_file);
        app.run();
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        topclock::log::shutdown();
        return 1;
    }

    LOG_INFO("topclock exiting");
    topclock::log::shutdown();
    return 0;
}
