#include "main_command.hpp"
#include "gateway_setup/common/clipboard.hpp"
#include "gateway_setup/common/config.hpp"
#include "gateway_setup/common/constants.hpp"
#include "gateway_setup/common/error_codes.hpp"
#include "gateway_setup/common/logger.hpp"
#include "gateway_setup/common/secure_file.hpp"
#include "gateway_setup/metadata/wizard.hpp"
#include "gateway_setup/preflight/checker.hpp"
#include "gateway_setup/wallet/wallet_setup.hpp"
#include <cstdlib>
#include <iostream>

namespace gateway_setup {
namespace cli {

MainCommand::MainCommand(const ui::TerminalCapabilities& terminal) : terminal_(terminal) {}
MainCommand::~MainCommand() = default;

void MainCommand::printWelcome(bool colors) {
    ui::Style style(colors);
    std::cout << style.cyan(style.bold(std::string("🛠️  Welcome to the ") +
                                       constants::system::APPLICATION_NAME + " (Shannon Protocol)"))
              << "\n\n";
    std::cout << "This CLI will guide you through creating your Gateway and Application wallets,\n"
              << "staking them, and deploying both the PATH backend and the Portal frontend.\n\n";
}

bool MainCommand::ensureInteractive() const {
    if (terminal_.interactive) {
        return true;
    }

    printWelcome(false);
    auto code = common::SetupErrorCode::TERMINAL_NOT_INTERACTIVE;
    std::cerr << common::SetupErrorCodeHelper::getMessage(code) << "\n";
    common::Logger::instance().warn("[CLI] Not interactive | code={}", common::SetupErrorCodeHelper::toString(code));
    return false;
}

int MainCommand::runPreflight(ui::Prompter& prompter) const {
    const auto& config = common::Config::instance().global();
    preflight::PreflightChecker checker(preflight::defaultTools(config.preflight));

    auto failure = checker.run(prompter);
    if (failure) {
        common::Logger::instance().warn("[CLI] Preflight stopped | code={}",
                                        common::SetupErrorCodeHelper::toString(*failure));
        return common::exitCodeFor(*failure);
    }
    return 0;
}

std::optional<metadata::ProjectMetadata> MainCommand::runMetadata(ui::Prompter& prompter) const {
    return metadata::collectConfiguration(prompter);
}

bool MainCommand::exportMetadata(ui::Prompter& prompter, const metadata::ProjectMetadata& meta,
                                 const std::string& path) const {
    auto result = common::writeSecureJson(path, metadata::toJson(meta));
    if (!result.success) {
        auto code = result.error.value_or(common::SetupErrorCode::EXPORT_WRITE_FAILED);
        prompter.error(std::string(common::SetupErrorCodeHelper::getMessage(code)) + ": " + result.detail);
        return false;
    }
    prompter.info("Metadata written to " + result.path);
    return true;
}

int MainCommand::runWallet(ui::Prompter& prompter, metadata::Network network) const {
    const auto& config = common::Config::instance().global();
    common::SystemClipboard clipboard;
    const char* shell = std::getenv("SHELL");

    wallet::WalletSetup setup(prompter, clipboard, config.wallet, ui::Style(terminal_.colors),
                              shell ? shell : "");
    auto result = setup.run(network);
    if (!result) {
        auto code = setup.lastError().value_or(common::SetupErrorCode::WALLET_CANCELLED);
        return common::exitCodeFor(code);
    }
    return 0;
}

}}
