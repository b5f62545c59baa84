#include "run_command.hpp"
#include "nestbar/common/config.hpp"
#include "nestbar/common/error_codes.hpp"
#include "nestbar/common/logger.hpp"
#include "nestbar/progress/progress_range.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace nestbar {
namespace cli {

namespace {

class SimulatedFailure : public std::runtime_error {
public:
    explicit SimulatedFailure(size_t step)
        : std::runtime_error("Simulated failure at step " + std::to_string(step)) {}
};

}

RunCommand::RunCommand() = default;

void RunCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("--outer", outer_, "Outer loop length")->capture_default_str();
    subcommand->add_option("--inner", inner_, "Inner loop length")->capture_default_str();
    subcommand->add_option("--delay-ms", delay_ms_, "Sleep per inner step")->capture_default_str();
    subcommand->add_option("--desc", desc_, "Outer description")->capture_default_str();
    subcommand->add_option("--color", color_, "Text color");
    subcommand->add_option("--bg", bg_, "Background color");
    subcommand->add_flag("--rainbow", rainbow_, "Cycle text colors on every render");
    ncols_opt_ = subcommand->add_option("--ncols", ncols_, "Line width (default: terminal)");
    subcommand->add_flag("--no-leave", no_leave_, "Erase the outer line when done");
    fail_at_opt_ = subcommand->add_option("--fail-at", fail_at_,
        "Throw from the loop body at this inner step (counted across all outer passes)");

    subcommand->callback([this]() { was_called_ = true; });
}

bool RunCommand::validateArguments() const {
    if (delay_ms_ < 0) {
        std::cerr << "Error: --delay-ms must be >= 0\n";
        return false;
    }
    return true;
}

common::Options RunCommand::buildOptions(const std::string& desc) const {
    common::Options options = common::Config::instance().displayDefaults();
    options.desc = desc;

    if (!color_.empty()) options.text_color = color_;
    if (!bg_.empty()) options.bg_color = bg_;
    if (rainbow_) options.rainbow = true;
    if (ncols_opt_->count() > 0) options.ncols = ncols_;
    if (no_leave_) options.leave = false;

    return options;
}

int RunCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }

    auto& logger = common::Logger::instance();
    logger.info("[Demo] Run started | outer={} | inner={} | delay_ms={}", outer_, inner_, delay_ms_);

    size_t step = 0;

    try {
        for (size_t i : progress::nrange(outer_, buildOptions(desc_))) {
            for (size_t j : progress::nrange(inner_, buildOptions("inner " + std::to_string(i)))) {
                (void)j;
                if (fail_at_opt_->count() > 0 && step == fail_at_) {
                    throw SimulatedFailure(step);
                }
                ++step;
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
            }
        }
    } catch (const common::InvalidConfig& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const SimulatedFailure& e) {
        logger.warn("[Demo] Run aborted | step={}", step);
        std::cerr << e.what() << std::endl;
        return 1;
    }

    logger.info("[Demo] Run finished | steps={}", step);
    return 0;
}

}}
