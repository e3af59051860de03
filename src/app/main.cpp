#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <winplace/config/config.hpp>
#include <winplace/core/log.hpp>
#include <winplace/core/window_rules.hpp>
#include <winplace/daemon.hpp>

namespace fs = std::filesystem;

std::string get_config_path(int argc, char* argv[])
{
    // Command line argument takes priority
    if (argc > 1)
    {
        return argv[1];
    }

    // Try XDG_CONFIG_HOME
    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        return std::string(xdg) + "/winplace/config.toml";
    }

    // Fall back to ~/.config
    if (char const* home = std::getenv("HOME"))
    {
        return std::string(home) + "/.config/winplace/config.toml";
    }

    return "";
}

int main(int argc, char* argv[])
{
    winplace::log::init();

    try
    {
        LOG_INFO("Starting winplace");

        std::string config_path = get_config_path(argc, argv);
        winplace::Config config;

        if (!config_path.empty() && fs::exists(config_path))
        {
            auto loaded = winplace::load_config(config_path);
            if (!loaded)
            {
                LOG_CRITICAL("Configuration in {} is invalid, not starting", config_path);
                winplace::log::shutdown();
                return 1;
            }
            config = std::move(*loaded);
        }
        else
        {
            LOG_WARN("No config file at '{}', running without rules", config_path);
            config = winplace::default_config();
        }

        winplace::log::set_level(config.global.log_level);

        auto rules = std::make_shared<winplace::RuleSet const>(
            winplace::RuleSet::compile(config.ignores, config.rules)
        );

        winplace::Daemon placer(config, std::move(rules), config_path);
        placer.run();
    }
    catch (winplace::ConfigError const& e)
    {
        LOG_CRITICAL("Invalid rule: {}", e.what());
        winplace::log::shutdown();
        return 1;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        winplace::log::shutdown();
        return 1;
    }

    LOG_INFO("winplace exiting");
    winplace::log::shutdown();
    return 0;
}
