#include "wallet_command.hpp"
#include "gateway_setup/ui/console_prompter.hpp"
#include <iostream>

namespace gateway_setup {
namespace cli {

WalletCommand::WalletCommand(const ui::TerminalCapabilities& terminal)
    : MainCommand(terminal), was_called_(false) {}

void WalletCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("-n,--network", network_, "Target network")
              ->check(CLI::IsMember({"mainnet", "testnet"}))
              ->capture_default_str();

    subcommand->callback([this]() { was_called_ = true; });
}

bool WalletCommand::wasCalled() const {
    return was_called_;
}

int WalletCommand::execute() {
    if (!ensureInteractive()) {
        return 1;
    }

    ui::ConsolePrompter prompter(std::cin, std::cout, terminal_.colors);
    return runWallet(prompter, metadata::parseNetwork(network_));
}

}}
