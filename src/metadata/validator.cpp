#include "gateway_setup/metadata/validator.hpp"
#include "gateway_setup/common/constants.hpp"
#include "gateway_setup/common/string_utils.hpp"
#include <regex>

namespace gateway_setup {
namespace metadata {

FieldCheck FieldValidator::validateProjectName(const std::string& raw) {
    std::string name = common::trim(raw);
    if (name.empty()) {
        return FieldCheck::reject("Please enter a project name.");
    }
    if (common::utf8Length(raw) > constants::metadata::MAX_PROJECT_NAME_LENGTH) {
        return FieldCheck::reject("Keep it under 64 characters.");
    }
    return FieldCheck::accept(name);
}

std::string FieldValidator::normalizeDomain(const std::string& raw) {
    std::string domain = common::toLower(common::trim(raw));

    if (domain.rfind("https://", 0) == 0) {
        domain.erase(0, 8);
    } else if (domain.rfind("http://", 0) == 0) {
        domain.erase(0, 7);
    }

    while (!domain.empty() && domain.back() == '/') {
        domain.pop_back();
    }

    return domain;
}

bool FieldValidator::domainLooksValid(const std::string& domain) {
    static const std::regex fqdn_pattern(
        R"(^([a-z0-9][a-z0-9-]{0,62}\.)+[a-z]{2,}$)", std::regex::icase);
    static const std::regex localhost_pattern(
        R"(^localhost(:[0-9]{1,5})?$)", std::regex::icase);

    return std::regex_match(domain, fqdn_pattern) || std::regex_match(domain, localhost_pattern);
}

FieldCheck FieldValidator::validateDomain(const std::string& raw) {
    std::string domain = normalizeDomain(raw);
    if (domain.empty()) {
        return FieldCheck::accept("");
    }
    if (!domainLooksValid(domain)) {
        return FieldCheck::reject("Please enter a valid domain (e.g., api.example.com) or leave blank.");
    }
    return FieldCheck::accept(domain);
}

FieldCheck FieldValidator::validateAccountName(const std::string& raw, const std::string& example) {
    std::string name = common::trim(raw);
    if (name.empty()) {
        return FieldCheck::reject("Please enter an account name (e.g., " + example + ")");
    }
    return FieldCheck::accept(name);
}

bool FieldValidator::isPoktAddress(const std::string& raw) {
    static const std::regex address_pattern(R"(^pokt1[0-9a-z]{20,90}$)");
    return std::regex_match(common::trim(raw), address_pattern);
}

FieldCheck FieldValidator::validateAddress(const std::string& raw, const std::string& must_differ_from) {
    std::string address = common::trim(raw);
    if (address.empty()) {
        return FieldCheck::reject("Please paste the address from pocketd.");
    }
    if (!isPoktAddress(address)) {
        return FieldCheck::reject("That doesn't look like a valid pokt1… address.");
    }
    if (!must_differ_from.empty() && address == common::trim(must_differ_from)) {
        return FieldCheck::reject("Application and Gateway addresses must be different.");
    }
    return FieldCheck::accept(address);
}

ProjectMetadata normalizeFrontendHosting(ProjectMetadata meta) {
    if (meta.deployment_type == DeploymentType::LOCAL_ONLY &&
        meta.frontend_hosting == FrontendHosting::SAME_HOST) {
        meta.frontend_hosting = FrontendHosting::EXTERNAL_PLATFORM;
    }
    return meta;
}

std::vector<FrontendHosting> hostingOptionsFor(DeploymentType type) {
    if (type == DeploymentType::LOCAL_ONLY) {
        return {FrontendHosting::EXTERNAL_PLATFORM, FrontendHosting::SKIP};
    }
    return {FrontendHosting::SAME_HOST, FrontendHosting::EXTERNAL_PLATFORM, FrontendHosting::SKIP};
}

FrontendHosting defaultHostingFor(DeploymentType type) {
    return type == DeploymentType::LOCAL_ONLY ? FrontendHosting::EXTERNAL_PLATFORM
                                              : FrontendHosting::SAME_HOST;
}

}}
