#pragma once

#include <map>
#include <string>
#include <unordered_map>

namespace gateway_setup {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

// Structured key/value detail attached to a logged failure.
struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
};

template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>& getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        static ErrorInfo<EnumType> fallback{code, "UNKNOWN", "Unknown error"};
        return fallback;
    }

    static const char* toString(EnumType code) {
        return getInfo(code).code_str;
    }

    static const char* getMessage(EnumType code) {
        return getInfo(code).default_message;
    }

protected:
    // Specialized once per error enum, next to the enum.
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    for (const auto& [key, value] : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    }
    return result;
}

// "[Component] CODE | key=value | ..." for log lines.
template<typename EnumType>
std::string formatError(EnumType code, const ErrorContext& ctx) {
    std::string result = "[" + ctx.component + "] " + ErrorRegistry<EnumType>::toString(code);
    std::string details = formatContext(ctx);
    if (!details.empty()) {
        result += " | " + details;
    }
    return result;
}

}}
