#pragma once

#include "project_metadata.hpp"
#include <string>
#include <vector>

namespace gateway_setup {
namespace metadata {

struct FieldCheck {
    bool is_valid = true;
    std::string normalized;
    std::string error;

    static FieldCheck accept(const std::string& normalized) { return {true, normalized, ""}; }
    static FieldCheck reject(const std::string& error) { return {false, "", error}; }
};

class FieldValidator {
public:
    static FieldCheck validateProjectName(const std::string& raw);

    // Empty normalized value means the domain was cleared.
    static FieldCheck validateDomain(const std::string& raw);
    static std::string normalizeDomain(const std::string& raw);
    static bool domainLooksValid(const std::string& domain);

    static FieldCheck validateAccountName(const std::string& raw, const std::string& example);
    static FieldCheck validateAddress(const std::string& raw, const std::string& must_differ_from = "");
    static bool isPoktAddress(const std::string& raw);
};

// If a local-only deployment still carries same-host hosting, moves hosting
// to the external platform. Idempotent.
ProjectMetadata normalizeFrontendHosting(ProjectMetadata meta);

std::vector<FrontendHosting> hostingOptionsFor(DeploymentType type);
FrontendHosting defaultHostingFor(DeploymentType type);

}}
