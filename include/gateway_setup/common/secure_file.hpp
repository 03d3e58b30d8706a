#pragma once

#include "error_codes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace gateway_setup {
namespace common {

struct ExportResult {
    bool success = false;
    std::string path;
    std::optional<SetupErrorCode> error;
    std::string detail;
};

// Writes pretty-printed JSON to path (resolved against the working
// directory). The parent directory is restricted to 0700 and the file to
// 0600; content goes to "<path>.tmp" first and is renamed into place.
ExportResult writeSecureJson(const std::string& path, const nlohmann::json& data);

}}
