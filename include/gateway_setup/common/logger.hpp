#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace gateway_setup {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

// Process-wide logger. Calls made before initialize() are dropped, so the
// library code can log unconditionally (tests never initialize it).
class Logger {
public:
    static Logger& instance();

    void initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config);
    void setLevel(LogLevel level);
    void flush();
    void shutdown();

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        if (logger_) logger_->error(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        if (logger_) logger_->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        if (logger_) logger_->info(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        if (logger_) logger_->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }

    bool isInitialized() const { return logger_ != nullptr; }

    // Path of the file sink actually opened; empty when logging to stderr.
    const std::string& activeLogFile() const { return active_log_file_; }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;
    std::string active_log_file_;
    LogFormat format_ = LogFormat::TEXT;

    spdlog::sink_ptr openFileSink(const std::string& log_file, const LoggingConfig& logging_config);
};

spdlog::level::level_enum toSpdlogLevel(LogLevel level);

// "gateway-setup.log" becomes "gateway-setup.json.log" for JSON output.
std::string logFileForFormat(const std::string& base_path, LogFormat format);

}}
