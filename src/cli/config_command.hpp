#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace nestbar {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();

    void setup(CLI::App* subcommand);
    int execute();

private:
    CLI::App* show_cmd_ = nullptr;

    CLI::App* validate_cmd_ = nullptr;
    std::string validate_path_;

    int executeShow();
    int executeValidate();
};

}}
