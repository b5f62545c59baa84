#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "nestbar/common/config.hpp"
#include "nestbar/common/constants.hpp"
#include "nestbar/common/logger.hpp"
#include "cli/config_command.hpp"
#include "cli/run_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"Nested terminal progress indicators", "nestbar-demo"};
        app.set_version_flag("--version,-v", nestbar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_path;
        std::string log_file;
        app.add_option("-c,--config", config_path, "Configuration file path");
        app.add_option("--log-file", log_file, "Write logs to this file instead of stderr");

        auto run_cmd = std::make_unique<nestbar::cli::RunCommand>();
        auto config_cmd = std::make_unique<nestbar::cli::ConfigCommand>();

        run_cmd->setup(app.add_subcommand("run", "Draw nested progress indicators"));
        config_cmd->setup(app.add_subcommand("config", "Inspect configuration"));

        CLI11_PARSE(app, argc, argv);

        auto& config = nestbar::common::Config::instance();
        if (!config.load(config_path)) {
            std::cerr << "Warning: failed to load configuration, using defaults\n";
        }

        const auto& global = config.global();
        std::string effective_log_file = log_file.empty() ? global.log_file : log_file;

        if (!effective_log_file.empty()) {
            nestbar::common::Logger::instance().initialize(
                nestbar::common::LogMode::FILE_ONLY,
                effective_log_file,
                global.log_level,
                global.logging
            );
        } else {
            nestbar::common::Logger::instance().initialize(
                nestbar::common::LogMode::CONSOLE_ONLY,
                "",
                global.log_level,
                global.logging
            );
        }

        int exit_code = 0;
        if (run_cmd->wasCalled()) {
            exit_code = run_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            exit_code = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        nestbar::common::Logger::instance().shutdown();
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
