#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace gateway_setup {
namespace cli {

class PreflightCommand : public MainCommand {
public:
    explicit PreflightCommand(const ui::TerminalCapabilities& terminal);

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
};

}}
