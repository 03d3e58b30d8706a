#pragma once

#include <string>
#include <cstddef>

namespace gateway_setup {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "0.3.0";

    inline std::string getFullVersion() {
        return std::string("Pocket Gateway Setup v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "Pocket Gateway Installer";
    constexpr const char* BINARY_NAME = "gateway-setup";
    constexpr const char* LOGGER_NAME = "gateway-setup";
    constexpr const char* CONFIG_ENV = "GATEWAY_SETUP_CONFIG";
}

namespace metadata {
    constexpr size_t MAX_PROJECT_NAME_LENGTH = 64;
    constexpr const char* PROJECT_NAME_PLACEHOLDER = "my-pokt-gateway";
    constexpr const char* DOMAIN_PLACEHOLDER = "api.example.com (or leave blank)";
}

namespace wallet {
    constexpr const char* DEFAULT_GATEWAY_ACCOUNT = "my-gateway";
    constexpr const char* DEFAULT_APPLICATION_ACCOUNT = "my-app";
    constexpr const char* DEFAULT_EXPORT_PATH = ".tmp/keys.json";
    constexpr const char* DEFAULT_FAUCET_URL = "https://faucet.beta.testnet.pokt.network/";
    constexpr const char* DEFAULT_GATEWAY_STAKE = "5000000000upokt";
    constexpr const char* DEFAULT_APPLICATION_STAKE = "1000000000upokt";
    constexpr const char* DEFAULT_SERVICE_ID = "anvil";
    constexpr const char* DEFAULT_GAS_PRICES = "10upokt";
    constexpr const char* DEFAULT_GAS_ADJUSTMENT = "1.5";
    constexpr const char* GATEWAY_STAKE_CONFIG_FILE = "/tmp/stake_gateway_config.yaml";
    constexpr const char* APPLICATION_STAKE_CONFIG_FILE = "/tmp/stake_app_config.yaml";
    constexpr const char* TESTNET_NETWORK_FLAG = "beta";
    constexpr const char* MAINNET_NETWORK_FLAG = "main";
}

namespace config_defaults {
    constexpr size_t LOG_ROTATION_SIZE_MB = 5;
    constexpr size_t LOG_MAX_FILES = 3;
}

}
}
