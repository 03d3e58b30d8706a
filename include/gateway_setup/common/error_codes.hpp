#pragma once

#include "error_framework.hpp"
#include <unordered_map>

namespace gateway_setup {
namespace common {

enum class SetupErrorCode {
    PREFLIGHT_REQUIRED_TOOL_MISSING = 100,
    PREFLIGHT_DECLINED = 101,

    METADATA_CANCELLED = 200,

    WALLET_CANCELLED = 300,

    EXPORT_DIRECTORY_FAILED = 400,
    EXPORT_WRITE_FAILED = 401,

    CONFIG_PARSE_FAILED = 500,
    TERMINAL_NOT_INTERACTIVE = 501
};

using SetupErrorCodeHelper = ErrorRegistry<SetupErrorCode>;

template<>
inline const std::unordered_map<SetupErrorCode, ErrorInfo<SetupErrorCode>>&
ErrorRegistry<SetupErrorCode>::getInfoMap() {
    static const std::unordered_map<SetupErrorCode, ErrorInfo<SetupErrorCode>> map = {
        {SetupErrorCode::PREFLIGHT_REQUIRED_TOOL_MISSING, {
            SetupErrorCode::PREFLIGHT_REQUIRED_TOOL_MISSING,
            "PREFLIGHT_REQUIRED_TOOL_MISSING",
            "Please resolve the above and re-run the installer."
        }},
        {SetupErrorCode::PREFLIGHT_DECLINED, {
            SetupErrorCode::PREFLIGHT_DECLINED,
            "PREFLIGHT_DECLINED",
            "Aborted."
        }},
        {SetupErrorCode::METADATA_CANCELLED, {
            SetupErrorCode::METADATA_CANCELLED,
            "METADATA_CANCELLED",
            "Setup cancelled."
        }},
        {SetupErrorCode::WALLET_CANCELLED, {
            SetupErrorCode::WALLET_CANCELLED,
            "WALLET_CANCELLED",
            "Wallet setup cancelled."
        }},
        {SetupErrorCode::EXPORT_DIRECTORY_FAILED, {
            SetupErrorCode::EXPORT_DIRECTORY_FAILED,
            "EXPORT_DIRECTORY_FAILED",
            "Could not create the export directory"
        }},
        {SetupErrorCode::EXPORT_WRITE_FAILED, {
            SetupErrorCode::EXPORT_WRITE_FAILED,
            "EXPORT_WRITE_FAILED",
            "Could not write the export file"
        }},
        {SetupErrorCode::CONFIG_PARSE_FAILED, {
            SetupErrorCode::CONFIG_PARSE_FAILED,
            "CONFIG_PARSE_FAILED",
            "Configuration file could not be parsed, using defaults"
        }},
        {SetupErrorCode::TERMINAL_NOT_INTERACTIVE, {
            SetupErrorCode::TERMINAL_NOT_INTERACTIVE,
            "TERMINAL_NOT_INTERACTIVE",
            "An interactive terminal is required. Re-run in a terminal session."
        }}
    };
    return map;
}

inline int exitCodeFor(SetupErrorCode code) {
    switch (code) {
        case SetupErrorCode::PREFLIGHT_REQUIRED_TOOL_MISSING:
            return 2;
        default:
            return 1;
    }
}

}}
