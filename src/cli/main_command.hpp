#pragma once

#include "gateway_setup/metadata/project_metadata.hpp"
#include "gateway_setup/ui/prompter.hpp"
#include "gateway_setup/ui/terminal.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace gateway_setup {
namespace cli {

class MainCommand {
public:
    explicit MainCommand(const ui::TerminalCapabilities& terminal);
    virtual ~MainCommand();

    static void printWelcome(bool colors);

protected:
    CLI::App* subcommand_ = nullptr;
    const ui::TerminalCapabilities& terminal_;

    // Prints the welcome text and the interactive-terminal notice when
    // stdin/stdout are not a TTY.
    bool ensureInteractive() const;

    int runPreflight(ui::Prompter& prompter) const;
    std::optional<metadata::ProjectMetadata> runMetadata(ui::Prompter& prompter) const;
    bool exportMetadata(ui::Prompter& prompter, const metadata::ProjectMetadata& meta,
                        const std::string& path) const;
    int runWallet(ui::Prompter& prompter, metadata::Network network) const;
};

}}
