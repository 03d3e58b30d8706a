#include <CLI/CLI.hpp>
#include <csignal>
#include <iostream>
#include <memory>

#include "gateway_setup/common/config.hpp"
#include "gateway_setup/common/constants.hpp"
#include "gateway_setup/common/error_codes.hpp"
#include "gateway_setup/common/logger.hpp"
#include "gateway_setup/ui/terminal.hpp"
#include "cli/main_command.hpp"
#include "cli/setup_command.hpp"
#include "cli/preflight_command.hpp"
#include "cli/metadata_command.hpp"
#include "cli/wallet_command.hpp"

namespace common = gateway_setup::common;
namespace cli = gateway_setup::cli;

void initialize_logging(bool verbose) {
    const auto& global = common::Config::instance().global();

    if (verbose) {
        common::Logger::instance().initialize(
            common::LogMode::CONSOLE_ONLY,
            "",
            common::LogLevel::DEBUG,
            global.logging
        );
    } else {
        common::Logger::instance().initialize(
            common::LogMode::FILE_ONLY,
            global.log_file,
            global.log_level,
            global.logging
        );
    }
}

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);

    try {
        CLI::App app{gateway_setup::constants::system::APPLICATION_NAME,
                     gateway_setup::constants::system::BINARY_NAME};
        app.set_version_flag("--version,-v", gateway_setup::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_path;
        bool verbose = false;
        bool no_color = false;
        app.add_option("--config", config_path, "Configuration file path");
        app.add_flag("--verbose", verbose, "Log debug output to the console");
        app.add_flag("--no-color", no_color, "Disable colored output");

        gateway_setup::ui::TerminalCapabilities terminal;

        auto setup_cmd = std::make_unique<cli::SetupCommand>(terminal);
        auto preflight_cmd = std::make_unique<cli::PreflightCommand>(terminal);
        auto metadata_cmd = std::make_unique<cli::MetadataCommand>(terminal);
        auto wallet_cmd = std::make_unique<cli::WalletCommand>(terminal);

        setup_cmd->setup(app.add_subcommand("run", "Run the full setup (default)"));
        preflight_cmd->setup(app.add_subcommand("preflight", "Check required tools"));
        metadata_cmd->setup(app.add_subcommand("metadata", "Collect project metadata"));
        wallet_cmd->setup(app.add_subcommand("wallet", "Create, fund and stake wallets"));

        CLI11_PARSE(app, argc, argv);

        terminal = gateway_setup::ui::TerminalCapabilities::detect(!no_color);

        auto& config = common::Config::instance();
        bool config_ok = config.load(config_path);

        initialize_logging(verbose);
        common::Logger::instance().info("[CLI] Starting | version={} | config={}",
                                        gateway_setup::constants::version::CLI_VERSION,
                                        config.getConfigPath());

        if (!config_ok) {
            auto code = common::SetupErrorCode::CONFIG_PARSE_FAILED;
            common::ErrorContext ctx{"CLI", {{"path", config.getConfigPath()}}};
            common::Logger::instance().warn("{}", common::formatError(code, ctx));
            gateway_setup::ui::Style style(terminal.colors);
            std::cerr << style.yellow(std::string("Warning: ") + common::SetupErrorCodeHelper::getMessage(code) +
                                      " (" + config.getConfigPath() + ")") << "\n";
        }

        int rc;
        if (preflight_cmd->wasCalled()) {
            rc = preflight_cmd->execute();
        } else if (metadata_cmd->wasCalled()) {
            rc = metadata_cmd->execute();
        } else if (wallet_cmd->wasCalled()) {
            rc = wallet_cmd->execute();
        } else {
            rc = setup_cmd->execute();
        }

        common::Logger::instance().info("[CLI] Finished | exit_code={}", rc);
        if (rc != 0 && !common::Logger::instance().activeLogFile().empty()) {
            std::cerr << "Details were logged to " << common::Logger::instance().activeLogFile() << "\n";
        }
        common::Logger::instance().shutdown();
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "\033[31mUnexpected error: " << e.what() << "\033[0m" << std::endl;
        common::Logger::instance().error("[CLI] Unexpected error | error={}", e.what());
        return 1;
    }
}
