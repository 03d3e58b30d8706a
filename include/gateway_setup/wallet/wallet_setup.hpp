#pragma once

#include "gateway_setup/common/clipboard.hpp"
#include "gateway_setup/common/config.hpp"
#include "gateway_setup/common/error_codes.hpp"
#include "gateway_setup/metadata/project_metadata.hpp"
#include "gateway_setup/metadata/validator.hpp"
#include "gateway_setup/metadata/wizard.hpp"
#include "gateway_setup/ui/prompter.hpp"
#include "gateway_setup/ui/terminal.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gateway_setup {
namespace wallet {

struct WalletAccount {
    std::string name;
    std::string address;
};

struct WalletSetupResult {
    metadata::Network network = metadata::Network::TESTNET;
    WalletAccount gateway;
    WalletAccount application;
    std::string export_path;
    bool funded = false;
    std::string funded_at_iso;
};

enum class SnippetKind {
    HEREDOC,
    PRINTF
};

struct ConfigFileSnippets {
    std::string gateway;
    std::string application;
};

bool looksLikeFishShell(const std::string& shell);

// Joins command lines with " \" + newline after stripping trailing whitespace.
std::string formatMultiline(const std::vector<std::string>& lines);

const char* networkFlag(metadata::Network network);

ConfigFileSnippets buildConfigFileSnippets(SnippetKind kind, const common::WalletConfig& config);
std::string buildBalanceCommand(const std::string& address, metadata::Network network);
std::string buildStakeGatewayCommand(const std::string& gateway_address, metadata::Network network,
                                     const common::WalletConfig& config);
std::string buildStakeApplicationCommand(const std::string& application_address, metadata::Network network,
                                         const common::WalletConfig& config);
std::string buildDelegateCommand(const std::string& gateway_address, const std::string& application_address,
                                 metadata::Network network, const common::WalletConfig& config);

// Addresses and labels only. faucetUrl is present for testnet exports.
nlohmann::json buildExportPayload(const WalletSetupResult& result, const std::string& faucet_url,
                                  const std::string& created_at_iso, const std::string& hostname);

std::string localHostname();

class WalletSetup {
public:
    WalletSetup(ui::Prompter& prompter, common::Clipboard& clipboard,
                common::WalletConfig config, ui::Style style, std::string shell,
                metadata::Clock clock = metadata::systemClock());

    // Walks the operator through wallet creation, funding, staking and
    // delegation, then exports keys.json. Returns std::nullopt when the
    // operator cancels, declines a confirmation, or the export fails.
    std::optional<WalletSetupResult> run(metadata::Network network);

    std::optional<common::SetupErrorCode> lastError() const { return last_error_; }

private:
    ui::Prompter& prompter_;
    common::Clipboard& clipboard_;
    common::WalletConfig config_;
    ui::Style style_;
    std::string shell_;
    metadata::Clock clock_;
    std::optional<common::SetupErrorCode> last_error_;

    std::optional<std::string> askText(const ui::TextPrompt& prompt,
                                       const std::function<metadata::FieldCheck(const std::string&)>& validate);
    void offerCopy(const std::string& question, bool initial_value, const std::string& text,
                   const std::string& copied_message);
    bool confirmOrStop(const std::string& question, const std::string& stop_message);
    std::optional<WalletSetupResult> stop(const std::string& message);
};

}}
