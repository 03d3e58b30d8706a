#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace gateway_setup {
namespace cli {

class WalletCommand : public MainCommand {
public:
    explicit WalletCommand(const ui::TerminalCapabilities& terminal);

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    std::string network_ = "testnet";
};

}}
