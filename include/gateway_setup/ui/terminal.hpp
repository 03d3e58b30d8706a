#pragma once

#include <string>

namespace gateway_setup {
namespace ui {

struct TerminalCapabilities {
    bool interactive = false;
    bool colors = false;

    static TerminalCapabilities detect(bool allow_colors = true);
};

namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";
}

class Style {
public:
    explicit Style(bool enabled) : enabled_(enabled) {}

    std::string bold(const std::string& text) const { return wrap(color::BOLD, text); }
    std::string dim(const std::string& text) const { return wrap(color::DIM, text); }
    std::string red(const std::string& text) const { return wrap(color::RED, text); }
    std::string green(const std::string& text) const { return wrap(color::GREEN, text); }
    std::string yellow(const std::string& text) const { return wrap(color::YELLOW, text); }
    std::string magenta(const std::string& text) const { return wrap(color::MAGENTA, text); }
    std::string cyan(const std::string& text) const { return wrap(color::CYAN, text); }

    bool enabled() const { return enabled_; }

private:
    bool enabled_;

    std::string wrap(const char* code, const std::string& text) const {
        if (!enabled_) return text;
        return std::string(code) + text + color::RESET;
    }
};

}}
