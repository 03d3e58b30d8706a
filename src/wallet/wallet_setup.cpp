#include "gateway_setup/wallet/wallet_setup.hpp"
#include "gateway_setup/common/constants.hpp"
#include "gateway_setup/common/logger.hpp"
#include "gateway_setup/common/secure_file.hpp"
#include "gateway_setup/common/string_utils.hpp"
#include <unistd.h>
#include <climits>
#include <regex>

namespace gateway_setup {
namespace wallet {

namespace {

constexpr const char* SNIPPET_HEREDOC = "heredoc";
constexpr const char* SNIPPET_PRINTF = "printf";

std::vector<std::string> txFlags(metadata::Network network, const common::WalletConfig& config) {
    return {
        std::string("--network=") + networkFlag(network),
        "--gas=auto",
        "--gas-prices=" + config.gas_prices,
        "--gas-adjustment=" + config.gas_adjustment,
        "--yes"
    };
}

std::string lines(const std::vector<std::string>& parts) {
    return common::join(parts, "\n");
}

}

bool looksLikeFishShell(const std::string& shell) {
    return common::toLower(shell).find("fish") != std::string::npos;
}

std::string formatMultiline(const std::vector<std::string>& command_lines) {
    static const std::regex trailing_space(R"(\s+$)");
    std::vector<std::string> stripped;
    for (const auto& line : command_lines) {
        stripped.push_back(std::regex_replace(line, trailing_space, ""));
    }
    return common::join(stripped, " \\\n");
}

const char* networkFlag(metadata::Network network) {
    return network == metadata::Network::TESTNET ? constants::wallet::TESTNET_NETWORK_FLAG
                                                 : constants::wallet::MAINNET_NETWORK_FLAG;
}

ConfigFileSnippets buildConfigFileSnippets(SnippetKind kind, const common::WalletConfig& config) {
    const std::string gw_file = constants::wallet::GATEWAY_STAKE_CONFIG_FILE;
    const std::string app_file = constants::wallet::APPLICATION_STAKE_CONFIG_FILE;

    ConfigFileSnippets snippets;
    if (kind == SnippetKind::PRINTF) {
        snippets.gateway = "printf 'stake_amount: " + config.gateway_stake + "\\n' > " + gw_file;
        snippets.application = "printf 'stake_amount: " + config.application_stake +
                               "\\nservice_ids:\\n  - \"" + config.service_id + "\"\\n' > " + app_file;
        return snippets;
    }

    snippets.gateway = "cat <<EOF > " + gw_file + "\n"
                       "stake_amount: " + config.gateway_stake + "\n"
                       "EOF";
    snippets.application = "cat <<EOF > " + app_file + "\n"
                           "stake_amount: " + config.application_stake + "\n"
                           "service_ids:\n"
                           "  - \"" + config.service_id + "\"\n"
                           "EOF";
    return snippets;
}

std::string buildBalanceCommand(const std::string& address, metadata::Network network) {
    return "pocketd query bank balances " + address + " --network=" + networkFlag(network);
}

std::string buildStakeGatewayCommand(const std::string& gateway_address, metadata::Network network,
                                     const common::WalletConfig& config) {
    std::vector<std::string> parts = {
        "pocketd tx gateway stake-gateway",
        std::string("--config=") + constants::wallet::GATEWAY_STAKE_CONFIG_FILE,
        "--from=" + gateway_address
    };
    auto flags = txFlags(network, config);
    parts.insert(parts.end(), flags.begin(), flags.end());
    return formatMultiline(parts);
}

std::string buildStakeApplicationCommand(const std::string& application_address, metadata::Network network,
                                         const common::WalletConfig& config) {
    std::vector<std::string> parts = {
        "pocketd tx application stake-application",
        std::string("--config=") + constants::wallet::APPLICATION_STAKE_CONFIG_FILE,
        "--from=" + application_address
    };
    auto flags = txFlags(network, config);
    parts.insert(parts.end(), flags.begin(), flags.end());
    return formatMultiline(parts);
}

std::string buildDelegateCommand(const std::string& gateway_address, const std::string& application_address,
                                 metadata::Network network, const common::WalletConfig& config) {
    std::vector<std::string> parts = {
        "pocketd tx application delegate-to-gateway " + gateway_address,
        "--from=" + application_address
    };
    auto flags = txFlags(network, config);
    parts.insert(parts.end(), flags.begin(), flags.end());
    return formatMultiline(parts);
}

nlohmann::json buildExportPayload(const WalletSetupResult& result, const std::string& faucet_url,
                                  const std::string& created_at_iso, const std::string& hostname) {
    nlohmann::json payload;
    payload["network"] = metadata::toString(result.network);
    payload["gateway"] = {{"name", result.gateway.name}, {"address", result.gateway.address}};
    payload["application"] = {{"name", result.application.name}, {"address", result.application.address}};
    payload["funded"] = result.funded;
    payload["fundedAtIso"] = result.funded_at_iso;
    if (result.network == metadata::Network::TESTNET) {
        payload["faucetUrl"] = faucet_url;
    }
    payload["createdAtIso"] = created_at_iso;
    payload["hostname"] = hostname;
    return payload;
}

std::string localHostname() {
    char buffer[HOST_NAME_MAX + 1] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "unknown";
    }
    return buffer;
}

WalletSetup::WalletSetup(ui::Prompter& prompter, common::Clipboard& clipboard,
                         common::WalletConfig config, ui::Style style, std::string shell,
                         metadata::Clock clock)
    : prompter_(prompter), clipboard_(clipboard), config_(std::move(config)),
      style_(style), shell_(std::move(shell)), clock_(std::move(clock)) {}

std::optional<std::string> WalletSetup::askText(
    const ui::TextPrompt& prompt,
    const std::function<metadata::FieldCheck(const std::string&)>& validate) {
    while (true) {
        auto raw = prompter_.text(prompt);
        if (!raw) {
            return std::nullopt;
        }
        auto check = validate(*raw);
        if (check.is_valid) {
            return check.normalized;
        }
        prompter_.error(check.error);
    }
}

void WalletSetup::offerCopy(const std::string& question, bool initial_value, const std::string& text,
                            const std::string& copied_message) {
    auto wanted = prompter_.confirm(question, initial_value);
    if (!wanted || !*wanted) {
        return;
    }

    if (clipboard_.copy(text)) {
        prompter_.note(copied_message, "Copied");
    } else {
        common::Logger::instance().debug("[Wallet] Clipboard unavailable");
        prompter_.note("Copy manually:\n" + text, "Copy manually");
    }
}

bool WalletSetup::confirmOrStop(const std::string& question, const std::string& stop_message) {
    auto answer = prompter_.confirm(question, true);
    if (!answer || !*answer) {
        stop(stop_message);
        return false;
    }
    return true;
}

std::optional<WalletSetupResult> WalletSetup::stop(const std::string& message) {
    last_error_ = common::SetupErrorCode::WALLET_CANCELLED;
    common::Logger::instance().info("[Wallet] Stopped | reason={}", message);
    prompter_.cancel(message);
    return std::nullopt;
}

std::optional<WalletSetupResult> WalletSetup::run(metadata::Network network) {
    last_error_.reset();
    const std::string cancelled = common::SetupErrorCodeHelper::getMessage(common::SetupErrorCode::WALLET_CANCELLED);
    const bool testnet = network == metadata::Network::TESTNET;

    prompter_.intro(style_.cyan("Wallet Setup · Create Gateway & Application wallets"));
    prompter_.note("Using previously selected network: " + style_.bold(metadata::toString(network)) +
                   "\n(You can change this by re-running the metadata step.)", "Network");

    // Gateway wallet
    prompter_.step(lines({
        "🔑 Let's create your Gateway wallet.",
        "",
        "Run this in another terminal:",
        style_.magenta("pocketd keys add gateway"),
        "",
        "You will paste the resulting address below (looks like pokt1...):"
    }));

    ui::TextPrompt gw_name_prompt;
    gw_name_prompt.message = "Gateway account name (for your reference only):";
    gw_name_prompt.initial_value = constants::wallet::DEFAULT_GATEWAY_ACCOUNT;
    auto gateway_name = askText(gw_name_prompt, [](const std::string& raw) {
        return metadata::FieldValidator::validateAccountName(raw, constants::wallet::DEFAULT_GATEWAY_ACCOUNT);
    });
    if (!gateway_name) return stop(cancelled);

    ui::TextPrompt gw_addr_prompt;
    gw_addr_prompt.message = "Gateway address (pokt1…):";
    gw_addr_prompt.placeholder = "pokt1abc…";
    auto gateway_address = askText(gw_addr_prompt, [](const std::string& raw) {
        return metadata::FieldValidator::validateAddress(raw);
    });
    if (!gateway_address) return stop(cancelled);

    // Application wallet
    prompter_.step(lines({
        "🔑 Now create your Application wallet.",
        "",
        "Run:",
        style_.magenta("pocketd keys add application"),
        "",
        "You will paste the resulting address below:"
    }));

    ui::TextPrompt app_name_prompt;
    app_name_prompt.message = "Application account name:";
    app_name_prompt.initial_value = constants::wallet::DEFAULT_APPLICATION_ACCOUNT;
    auto application_name = askText(app_name_prompt, [](const std::string& raw) {
        return metadata::FieldValidator::validateAccountName(raw, constants::wallet::DEFAULT_APPLICATION_ACCOUNT);
    });
    if (!application_name) return stop(cancelled);

    ui::TextPrompt app_addr_prompt;
    app_addr_prompt.message = "Application address (pokt1…):";
    app_addr_prompt.placeholder = "pokt1def…";
    const std::string gw_address = *gateway_address;
    auto application_address = askText(app_addr_prompt, [&gw_address](const std::string& raw) {
        return metadata::FieldValidator::validateAddress(raw, gw_address);
    });
    if (!application_address) return stop(cancelled);

    common::Logger::instance().info("[Wallet] Addresses captured | gateway={} | application={}",
                                    *gateway_address, *application_address);

    const std::string addresses = "Gateway (" + *gateway_name + "): " + *gateway_address +
                                  "\nApplication (" + *application_name + "): " + *application_address;
    offerCopy("Copy both addresses to clipboard for safekeeping?", false, addresses,
              "Addresses copied to clipboard.");

    // Funding
    if (testnet) {
        prompter_.step(lines({
            "🚰 Fund your testnet accounts via the faucet before staking.",
            "",
            style_.bold("Faucet:"),
            config_.faucet_url,
            "",
            style_.bold("Addresses to fund:"),
            "• Gateway:     " + *gateway_address,
            "• Application: " + *application_address,
            "",
            style_.dim("Tip: request enough to cover staking amounts and transaction fees.")
        }));
        if (!confirmOrStop("Have you funded BOTH addresses via the faucet?",
                           "Please fund your testnet accounts, then re-run this step.")) {
            return std::nullopt;
        }
    } else {
        prompter_.step(lines({
            "💰 Mainnet requires real POKT.",
            "",
            "Make sure BOTH accounts are funded with sufficient POKT to cover your planned",
            "stake amounts plus transaction fees before proceeding.",
            "",
            style_.bold("Addresses:"),
            "• Gateway:     " + *gateway_address,
            "• Application: " + *application_address
        }));
        if (!confirmOrStop("Are BOTH mainnet addresses funded with sufficient POKT?",
                           "Please fund your mainnet accounts, then re-run this step.")) {
            return std::nullopt;
        }
    }
    const std::string funded_at = metadata::formatIsoTimestamp(clock_());

    // Balance check
    const std::string balance_gw = buildBalanceCommand(*gateway_address, network);
    const std::string balance_app = buildBalanceCommand(*application_address, network);
    prompter_.step(lines({
        "🧮 Verify funding by querying on-chain balances for both wallets.",
        "",
        style_.bold("Run these in another terminal:"),
        style_.magenta(balance_gw),
        style_.magenta(balance_app),
        "",
        style_.dim("Proceed once both balances show a non-zero amount.")
    }));
    offerCopy("Copy both balance commands to clipboard?", false, balance_gw + "\n" + balance_app,
              "Balance commands copied to clipboard.");
    if (!confirmOrStop("Did BOTH balances show > 0?",
                       "Fund the accounts until both balances are > 0, then re-run this step.")) {
        return std::nullopt;
    }

    // Staking config files
    const bool fish = looksLikeFishShell(shell_);
    ui::SelectPrompt snippet_prompt;
    snippet_prompt.message = fish ? "Detected fish shell. Use fish-safe commands to create config files?"
                                  : "Choose how to create the staking config files:";
    snippet_prompt.options = {
        {SNIPPET_HEREDOC, "Heredoc (bash/zsh/sh)"},
        {SNIPPET_PRINTF, "printf (compatible with fish/bash/zsh/sh)"}
    };
    snippet_prompt.initial_value = fish ? SNIPPET_PRINTF : SNIPPET_HEREDOC;

    auto snippet_choice = prompter_.select(snippet_prompt);
    if (!snippet_choice) return stop(cancelled);

    SnippetKind kind = *snippet_choice == SNIPPET_PRINTF ? SnippetKind::PRINTF : SnippetKind::HEREDOC;
    auto snippets = buildConfigFileSnippets(kind, config_);

    prompter_.step(lines({
        "🛠 Create the Gateway staking config file:",
        "",
        style_.magenta(snippets.gateway),
        "",
        "Then create the Application staking config file:",
        "",
        style_.magenta(snippets.application),
        "",
        style_.dim(std::string("These write ") + constants::wallet::GATEWAY_STAKE_CONFIG_FILE +
                   " and " + constants::wallet::APPLICATION_STAKE_CONFIG_FILE + ".")
    }));
    offerCopy("Copy BOTH config-file commands to clipboard?", true,
              snippets.gateway + "\n\n" + snippets.application, "Config-file commands copied to clipboard.");
    if (!confirmOrStop("Did you create BOTH config files in /tmp?",
                       "Create the config files first, then re-run this step.")) {
        return std::nullopt;
    }

    // Staking
    const std::string stake_gw = buildStakeGatewayCommand(*gateway_address, network, config_);
    prompter_.step(lines({"💸 Stake the Gateway first:", "", style_.magenta(stake_gw)}));
    offerCopy("Copy Gateway staking command to clipboard?", true, stake_gw, "Gateway staking command copied.");
    if (!confirmOrStop("Did the Gateway stake transaction succeed?",
                       "Complete the Gateway staking, then re-run this step.")) {
        return std::nullopt;
    }

    const std::string stake_app = buildStakeApplicationCommand(*application_address, network, config_);
    prompter_.step(lines({"Now stake the Application:", "", style_.magenta(stake_app)}));
    offerCopy("Copy Application staking command to clipboard?", true, stake_app,
              "Application staking command copied.");
    if (!confirmOrStop("Did the Application stake transaction succeed?",
                       "Complete the Application staking, then re-run this step.")) {
        return std::nullopt;
    }

    // Delegation
    const std::string delegate = buildDelegateCommand(*gateway_address, *application_address, network, config_);
    prompter_.step(lines({"🔗 Delegate the Application to your Gateway:", "", style_.magenta(delegate)}));
    offerCopy("Copy delegation command to clipboard?", true, delegate, "Delegation command copied.");
    if (!confirmOrStop("Did the delegation transaction succeed?",
                       "Complete delegation, then re-run this step.")) {
        return std::nullopt;
    }

    WalletSetupResult result;
    result.network = network;
    result.gateway = {*gateway_name, *gateway_address};
    result.application = {*application_name, *application_address};
    result.export_path = config_.export_path;
    result.funded = true;
    result.funded_at_iso = funded_at;

    prompter_.info("Exporting to " + result.export_path + " (secure temp)...");
    auto payload = buildExportPayload(result, config_.faucet_url,
                                      metadata::formatIsoTimestamp(clock_()), localHostname());
    auto exported = common::writeSecureJson(result.export_path, payload);
    if (!exported.success) {
        last_error_ = exported.error.value_or(common::SetupErrorCode::EXPORT_WRITE_FAILED);
        prompter_.error(std::string(common::SetupErrorCodeHelper::getMessage(*last_error_)) + ": " + exported.detail);
        return std::nullopt;
    }

    prompter_.note(lines({
        style_.bold("Path: ") + exported.path,
        "",
        "This file contains ONLY addresses and labels (no private keys).",
        "Ensure the export directory is in your .gitignore. Permissions are restricted to the current user."
    }), "Export to " + result.export_path);

    common::Logger::instance().info("[Wallet] Setup complete | network={} | export={}",
                                    metadata::toString(network), exported.path);
    prompter_.outro(style_.green("Wallet setup complete."));
    return result;
}

}}
