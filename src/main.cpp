#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "multibar/common/config.hpp"
#include "multibar/common/constants.hpp"
#include "multibar/common/logger.hpp"
#include "multibar/common/paths.hpp"
#include "cli/main_command.hpp"
#include "cli/config_command.hpp"
#include "cli/demo_command.hpp"
#include "cli/pipe_command.hpp"

namespace {

// Bars share stderr with console logging, so file logging is used whenever
// a log file is configured or requested.
void initialize_logging(const multibar::common::GlobalConfig& global, bool log_to_file) {
    std::string log_file = global.log_file;
    if (log_file.empty() && log_to_file) {
        log_file = multibar::common::PathManager::instance().getLogDir() + "/multibar.log";
    }

    auto mode = log_file.empty()
        ? multibar::common::LogMode::CONSOLE_ONLY
        : multibar::common::LogMode::FILE_ONLY;

    multibar::common::Logger::instance().initialize(mode, log_file, global.log_level, global.logging);
}

}

int main(int argc, char** argv) {
    try {
        CLI::App app{"Concurrent terminal progress bars", multibar::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", multibar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        bool log_to_file = false;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_flag("--log-to-file", log_to_file, "Write logs to the state directory instead of stderr");

        auto config_cmd = std::make_unique<multibar::cli::ConfigCommand>();
        auto demo_cmd = std::make_unique<multibar::cli::DemoCommand>();
        auto pipe_cmd = std::make_unique<multibar::cli::PipeCommand>();

        config_cmd->setup(app.add_subcommand("config", "Manage configuration"));
        demo_cmd->setup(app.add_subcommand("demo", "Show concurrent bars in action"));
        pipe_cmd->setup(app.add_subcommand("pipe", "Count lines passing from stdin to stdout"));

        CLI11_PARSE(app, argc, argv);

        auto& config = multibar::common::Config::instance();
        if (!config.load(config_file)) {
            std::cerr << "Warning: failed to load configuration, using defaults\n";
        }

        initialize_logging(config.global(), log_to_file);
        multibar::common::Logger::instance().debug("[Main] Started | version={} | config={}",
                                                   multibar::constants::version::VERSION,
                                                   config.getConfigPath());

        int result = 0;
        if (config_cmd->wasCalled()) {
            result = config_cmd->execute();
        } else if (demo_cmd->wasCalled()) {
            result = demo_cmd->execute();
        } else if (pipe_cmd->wasCalled()) {
            result = pipe_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        multibar::common::Logger::instance().shutdown();
        return result;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
