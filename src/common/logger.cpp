#include "gateway_setup/common/logger.hpp"
#include "gateway_setup/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>

namespace gateway_setup {
namespace common {

namespace {

constexpr const char* TEXT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr const char* JSON_PATTERN = R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})";

}

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::info;
}

std::string logFileForFormat(const std::string& base_path, LogFormat format) {
    if (format != LogFormat::JSON) {
        return base_path;
    }

    std::filesystem::path p(base_path);
    std::filesystem::path renamed = p.stem();
    renamed += ".json";
    renamed += p.extension();
    return (p.parent_path() / renamed).string();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

spdlog::sink_ptr Logger::openFileSink(const std::string& log_file, const LoggingConfig& logging_config) {
    if (log_file.empty()) {
        return nullptr;
    }

    std::string path = logFileForFormat(log_file, logging_config.format);
    std::filesystem::path dir = std::filesystem::path(path).parent_path();

    std::error_code ec;
    if (!dir.empty() && !std::filesystem::exists(dir, ec) && !std::filesystem::create_directories(dir, ec)) {
        std::cerr << "[Logger] Cannot create log directory " << dir << ": " << ec.message() << std::endl;
        return nullptr;
    }

    try {
        size_t max_size = logging_config.rotation_size_mb * 1024 * 1024;
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, max_size, logging_config.max_files);
        active_log_file_ = path;
        return sink;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Cannot open log file " << path << ": " << ex.what() << std::endl;
        return nullptr;
    }
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (logger_) {
        logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        return;
    }

    active_log_file_.clear();
    format_ = LogFormat::TEXT;

    spdlog::sink_ptr sink;
    if (mode == LogMode::FILE_ONLY) {
        sink = openFileSink(log_file, logging_config);
        if (sink) {
            format_ = logging_config.format;
        }
    }

    // Console mode, or the file could not be opened.
    if (!sink) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }

    auto spdlog_level = toSpdlogLevel(level);
    sink->set_level(spdlog_level);

    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sink);
    logger_->set_pattern(format_ == LogFormat::JSON ? JSON_PATTERN : TEXT_PATTERN);
    logger_->set_level(spdlog_level);
    logger_->flush_on(spdlog::level::warn);

    spdlog::register_logger(logger_);
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }
    logger_->flush();
    spdlog::drop(constants::system::LOGGER_NAME);
    logger_.reset();
    active_log_file_.clear();
}

}}
