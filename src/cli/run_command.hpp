#pragma once

#include "main_command.hpp"
#include "nestbar/common/types.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <cstddef>

namespace nestbar {
namespace cli {

// Nested loops over nrange() so every display feature can be watched live.
class RunCommand : public MainCommand {
public:
    RunCommand();

    void setup(CLI::App* subcommand);
    bool validateArguments() const override;
    int execute();

private:
    size_t outer_ = 3;
    size_t inner_ = 50;
    int delay_ms_ = 20;
    std::string desc_ = "outer";
    std::string color_;
    std::string bg_;
    bool rainbow_ = false;
    int ncols_ = 0;
    bool no_leave_ = false;
    size_t fail_at_ = 0;

    CLI::Option* ncols_opt_ = nullptr;
    CLI::Option* fail_at_opt_ = nullptr;

    common::Options buildOptions(const std::string& desc) const;
};

}}
