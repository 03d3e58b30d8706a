#include "metadata_command.hpp"
#include "gateway_setup/ui/console_prompter.hpp"
#include <iostream>

namespace gateway_setup {
namespace cli {

MetadataCommand::MetadataCommand(const ui::TerminalCapabilities& terminal)
    : MainCommand(terminal), was_called_(false) {}

void MetadataCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("-o,--output", output_path_,
                          "Write the confirmed metadata to PATH instead of stdout");

    subcommand->callback([this]() { was_called_ = true; });
}

bool MetadataCommand::wasCalled() const {
    return was_called_;
}

int MetadataCommand::execute() {
    if (!ensureInteractive()) {
        return 1;
    }

    ui::ConsolePrompter prompter(std::cin, std::cout, terminal_.colors);
    auto meta = runMetadata(prompter);
    if (!meta) {
        return 1;
    }

    if (output_path_.empty()) {
        std::cout << metadata::toJson(*meta).dump(2) << std::endl;
        return 0;
    }

    return exportMetadata(prompter, *meta, output_path_) ? 0 : 1;
}

}}
