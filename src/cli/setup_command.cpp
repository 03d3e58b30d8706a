#include "setup_command.hpp"
#include "gateway_setup/common/logger.hpp"
#include "gateway_setup/ui/console_prompter.hpp"
#include <iostream>

namespace gateway_setup {
namespace cli {

SetupCommand::SetupCommand(const ui::TerminalCapabilities& terminal)
    : MainCommand(terminal), was_called_(false) {}

void SetupCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_flag("--skip-preflight", skip_preflight_,
                        "Skip the Git/Docker/pocketd checks");
    subcommand->add_option("--metadata-out", metadata_out_,
                          "Also write the confirmed metadata as JSON to PATH");

    subcommand->callback([this]() { was_called_ = true; });
}

bool SetupCommand::wasCalled() const {
    return was_called_;
}

int SetupCommand::execute() {
    if (!ensureInteractive()) {
        return 1;
    }

    ui::ConsolePrompter prompter(std::cin, std::cout, terminal_.colors);
    common::Logger::instance().info("[Setup] Started | skip_preflight={}", skip_preflight_);

    if (!skip_preflight_) {
        int rc = runPreflight(prompter);
        if (rc != 0) {
            return rc;
        }
    }

    auto meta = runMetadata(prompter);
    if (!meta) {
        return 1;
    }

    if (!metadata_out_.empty() && !exportMetadata(prompter, *meta, metadata_out_)) {
        return 1;
    }

    return runWallet(prompter, meta->network);
}

}}
