#include "gateway_setup/common/config.hpp"
#include "gateway_setup/common/constants.hpp"
#include "gateway_setup/common/paths.hpp"
#include "gateway_setup/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <unistd.h>

namespace gateway_setup {
namespace common {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

LogLevel parseLogLevel(const std::string& level, LogLevel fallback) {
    if (level == "DEBUG" || level == "debug") return LogLevel::DEBUG;
    if (level == "INFO" || level == "info") return LogLevel::INFO;
    if (level == "WARN" || level == "warn") return LogLevel::WARN;
    if (level == "ERROR" || level == "error") return LogLevel::ERROR;
    return fallback;
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants;

    GlobalConfig config;

    config.log_level = LogLevel::INFO;
    config.log_file = PathManager::instance().getLogDir() + "/gateway-setup.log";

    config.logging.rotation_size_mb = config_defaults::LOG_ROTATION_SIZE_MB;
    config.logging.max_files = config_defaults::LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.preflight.git_min_version = "";
    config.preflight.docker_min_version = "";
    config.preflight.pocketd_min_version = "";

    config.wallet.export_path = wallet::DEFAULT_EXPORT_PATH;
    config.wallet.faucet_url = wallet::DEFAULT_FAUCET_URL;
    config.wallet.gateway_stake = wallet::DEFAULT_GATEWAY_STAKE;
    config.wallet.application_stake = wallet::DEFAULT_APPLICATION_STAKE;
    config.wallet.service_id = wallet::DEFAULT_SERVICE_ID;
    config.wallet.gas_prices = wallet::DEFAULT_GAS_PRICES;
    config.wallet.gas_adjustment = wallet::DEFAULT_GAS_ADJUSTMENT;

    return config;
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    loaded_from_file_ = false;

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            current_config_path_ = PathManager::instance().getConfigFile();
            Logger::instance().debug("[Config] No config file, using defaults");
            return true;
        }
        effective_config_file = *best;
    }

    current_config_path_ = effective_config_file;

    if (!std::filesystem::exists(effective_config_file)) {
        Logger::instance().warn("[Config] Not found | path={}", effective_config_file);
        return false;
    }

    loaded_from_file_ = tryLoadTomlFile(effective_config_file);
    return loaded_from_file_;
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] Not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            auto global_section = data.at("global");

            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                global_.log_level = parseLogLevel(
                    toml::find<std::string>(global_section, "log_level"), global_.log_level);
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                global_.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
        }

        if (data.contains("preflight")) {
            auto preflight_section = data.at("preflight");

            if (preflight_section.contains("git_min_version")) {
                global_.preflight.git_min_version = toml::find<std::string>(preflight_section, "git_min_version");
            }
            if (preflight_section.contains("docker_min_version")) {
                global_.preflight.docker_min_version = toml::find<std::string>(preflight_section, "docker_min_version");
            }
            if (preflight_section.contains("pocketd_min_version")) {
                global_.preflight.pocketd_min_version = toml::find<std::string>(preflight_section, "pocketd_min_version");
            }
        }

        if (data.contains("wallet")) {
            auto wallet_section = data.at("wallet");

            if (wallet_section.contains("export_path")) {
                global_.wallet.export_path = toml::find<std::string>(wallet_section, "export_path");
            }
            if (wallet_section.contains("faucet_url")) {
                global_.wallet.faucet_url = toml::find<std::string>(wallet_section, "faucet_url");
            }
            if (wallet_section.contains("gateway_stake_upokt")) {
                global_.wallet.gateway_stake =
                    std::to_string(toml::find<int64_t>(wallet_section, "gateway_stake_upokt")) + "upokt";
            }
            if (wallet_section.contains("app_stake_upokt")) {
                global_.wallet.application_stake =
                    std::to_string(toml::find<int64_t>(wallet_section, "app_stake_upokt")) + "upokt";
            }
            if (wallet_section.contains("service_id")) {
                global_.wallet.service_id = toml::find<std::string>(wallet_section, "service_id");
            }
            if (wallet_section.contains("gas_prices")) {
                global_.wallet.gas_prices = toml::find<std::string>(wallet_section, "gas_prices");
            }
            if (wallet_section.contains("gas_adjustment")) {
                global_.wallet.gas_adjustment = toml::find<std::string>(wallet_section, "gas_adjustment");
            }
        }

        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        global_ = createDefaultConfig();
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

}}
