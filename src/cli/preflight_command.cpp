#include "preflight_command.hpp"
#include "gateway_setup/ui/console_prompter.hpp"
#include <iostream>

namespace gateway_setup {
namespace cli {

PreflightCommand::PreflightCommand(const ui::TerminalCapabilities& terminal)
    : MainCommand(terminal), was_called_(false) {}

void PreflightCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    subcommand->callback([this]() { was_called_ = true; });
}

bool PreflightCommand::wasCalled() const {
    return was_called_;
}

int PreflightCommand::execute() {
    // Runs without a TTY too; only the recommended-failure confirmation
    // needs input and EOF declines it.
    ui::ConsolePrompter prompter(std::cin, std::cout, terminal_.colors);
    return runPreflight(prompter);
}

}}
