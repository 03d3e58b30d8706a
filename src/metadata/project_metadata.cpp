#include "gateway_setup/metadata/project_metadata.hpp"
#include "gateway_setup/common/string_utils.hpp"
#include <sstream>
#include <stdexcept>

namespace gateway_setup {
namespace metadata {

bool ProjectMetadata::operator==(const ProjectMetadata& other) const {
    return project_name == other.project_name &&
           network == other.network &&
           deployment_type == other.deployment_type &&
           frontend_hosting == other.frontend_hosting &&
           domain == other.domain &&
           integrations == other.integrations &&
           created_at_iso == other.created_at_iso;
}

const char* toString(Network network) {
    switch (network) {
        case Network::MAINNET: return "mainnet";
        case Network::TESTNET: return "testnet";
    }
    return "testnet";
}

const char* toString(DeploymentType type) {
    switch (type) {
        case DeploymentType::HOSTED: return "hosted";
        case DeploymentType::LOCAL_ONLY: return "local-only";
    }
    return "hosted";
}

const char* toString(FrontendHosting hosting) {
    switch (hosting) {
        case FrontendHosting::SAME_HOST: return "same-host";
        case FrontendHosting::EXTERNAL_PLATFORM: return "external-platform";
        case FrontendHosting::SKIP: return "skip";
    }
    return "skip";
}

const char* toString(Integration integration) {
    switch (integration) {
        case Integration::STRIPE: return "stripe";
        case Integration::AUTH: return "auth";
    }
    return "stripe";
}

Network parseNetwork(const std::string& value) {
    if (value == "mainnet") return Network::MAINNET;
    if (value == "testnet") return Network::TESTNET;
    throw std::invalid_argument("Unknown network: " + value);
}

DeploymentType parseDeploymentType(const std::string& value) {
    if (value == "hosted") return DeploymentType::HOSTED;
    if (value == "local-only") return DeploymentType::LOCAL_ONLY;
    throw std::invalid_argument("Unknown deployment type: " + value);
}

FrontendHosting parseFrontendHosting(const std::string& value) {
    if (value == "same-host") return FrontendHosting::SAME_HOST;
    if (value == "external-platform") return FrontendHosting::EXTERNAL_PLATFORM;
    if (value == "skip") return FrontendHosting::SKIP;
    throw std::invalid_argument("Unknown frontend hosting: " + value);
}

Integration parseIntegration(const std::string& value) {
    if (value == "stripe") return Integration::STRIPE;
    if (value == "auth") return Integration::AUTH;
    throw std::invalid_argument("Unknown integration: " + value);
}

std::string deploymentLabel(DeploymentType type) {
    return type == DeploymentType::HOSTED ? "Hosted VPS (DigitalOcean)" : "Local only (dev/test)";
}

std::string hostingLabel(FrontendHosting hosting) {
    switch (hosting) {
        case FrontendHosting::SAME_HOST: return "Deploy to same VPS";
        case FrontendHosting::EXTERNAL_PLATFORM: return "Deploy separately to Vercel";
        case FrontendHosting::SKIP: return "Skip for now";
    }
    return "Skip for now";
}

std::string integrationLabel(Integration integration) {
    return integration == Integration::STRIPE ? "Stripe billing" : "Auth modules";
}

std::vector<std::string> integrationNames(const std::set<Integration>& integrations) {
    std::vector<std::string> names;
    for (auto integration : integrations) {
        names.push_back(toString(integration));
    }
    return names;
}

std::string formatSummary(const ProjectMetadata& meta) {
    std::ostringstream oss;
    oss << "Project name:        " << meta.project_name << "\n";
    oss << "Network:             " << toString(meta.network) << "\n";
    oss << "Deployment type:     "
        << (meta.deployment_type == DeploymentType::HOSTED ? "Hosted VPS" : "Local only") << "\n";

    oss << "Frontend hosting:    ";
    switch (meta.frontend_hosting) {
        case FrontendHosting::SAME_HOST: oss << "Same VPS"; break;
        case FrontendHosting::EXTERNAL_PLATFORM: oss << "Vercel"; break;
        case FrontendHosting::SKIP: oss << "Skip"; break;
    }
    oss << "\n";

    oss << "Domain:              " << (meta.domain ? *meta.domain : "—") << "\n";

    auto names = integrationNames(meta.integrations);
    oss << "Integrations:        " << (names.empty() ? "—" : common::join(names, ", "));
    return oss.str();
}

nlohmann::json toJson(const ProjectMetadata& meta) {
    nlohmann::json json;
    json["projectName"] = meta.project_name;
    json["network"] = toString(meta.network);
    json["deploymentType"] = toString(meta.deployment_type);
    json["frontendHosting"] = toString(meta.frontend_hosting);

    if (meta.domain) {
        json["domain"] = *meta.domain;
    } else {
        json["domain"] = nullptr;
    }

    json["integrations"] = integrationNames(meta.integrations);
    json["createdAtIso"] = meta.created_at_iso;
    return json;
}

ProjectMetadata fromJson(const nlohmann::json& json) {
    ProjectMetadata meta;
    meta.project_name = json.at("projectName").get<std::string>();
    meta.network = parseNetwork(json.at("network").get<std::string>());
    meta.deployment_type = parseDeploymentType(json.at("deploymentType").get<std::string>());
    meta.frontend_hosting = parseFrontendHosting(json.at("frontendHosting").get<std::string>());

    if (json.contains("domain") && !json["domain"].is_null()) {
        meta.domain = json["domain"].get<std::string>();
    }

    if (json.contains("integrations")) {
        for (const auto& item : json["integrations"]) {
            meta.integrations.insert(parseIntegration(item.get<std::string>()));
        }
    }

    meta.created_at_iso = json.value("createdAtIso", std::string());
    return meta;
}

}}
