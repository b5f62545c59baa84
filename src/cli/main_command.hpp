#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace nestbar {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual bool validateArguments() const;
    bool wasCalled() const { return was_called_; }

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;
};

}}
