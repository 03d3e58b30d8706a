#pragma once

#include <string>
#include <optional>
#include <cstddef>

namespace gateway_setup {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct PreflightConfig {
    std::string git_min_version;
    std::string docker_min_version;
    std::string pocketd_min_version;
};

struct WalletConfig {
    std::string export_path;
    std::string faucet_url;
    std::string gateway_stake;
    std::string application_stake;
    std::string service_id;
    std::string gas_prices;
    std::string gas_adjustment;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    LoggingConfig logging;
    PreflightConfig preflight;
    WalletConfig wallet;
};

class Config {
public:
    static Config& instance();
    static GlobalConfig createDefaultConfig();

    bool load(const std::string& config_file = "");

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    std::optional<std::string> findBestConfig() const;
    std::string getConfigPath() const { return current_config_path_; }
    bool loadedFromFile() const { return loaded_from_file_; }

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    bool loaded_from_file_ = false;

    bool tryLoadTomlFile(const std::string& path);
};

LogLevel parseLogLevel(const std::string& level, LogLevel fallback);

}}
