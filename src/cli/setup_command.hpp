#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace gateway_setup {
namespace cli {

// Full flow: preflight, metadata wizard, wallet walkthrough.
class SetupCommand : public MainCommand {
public:
    explicit SetupCommand(const ui::TerminalCapabilities& terminal);

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    bool skip_preflight_ = false;
    std::string metadata_out_;
};

}}
