#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace gateway_setup {
namespace metadata {

enum class Network {
    MAINNET,
    TESTNET
};

enum class DeploymentType {
    HOSTED,
    LOCAL_ONLY
};

enum class FrontendHosting {
    SAME_HOST,
    EXTERNAL_PLATFORM,
    SKIP
};

enum class Integration {
    STRIPE,
    AUTH
};

struct ProjectMetadata {
    std::string project_name;
    Network network = Network::TESTNET;
    DeploymentType deployment_type = DeploymentType::HOSTED;
    FrontendHosting frontend_hosting = FrontendHosting::SAME_HOST;
    std::optional<std::string> domain;
    std::set<Integration> integrations;
    std::string created_at_iso;

    bool operator==(const ProjectMetadata& other) const;
    bool operator!=(const ProjectMetadata& other) const { return !(*this == other); }
};

const char* toString(Network network);
const char* toString(DeploymentType type);
const char* toString(FrontendHosting hosting);
const char* toString(Integration integration);

// Parsers accept the wire names above and throw std::invalid_argument otherwise.
Network parseNetwork(const std::string& value);
DeploymentType parseDeploymentType(const std::string& value);
FrontendHosting parseFrontendHosting(const std::string& value);
Integration parseIntegration(const std::string& value);

std::string deploymentLabel(DeploymentType type);
std::string hostingLabel(FrontendHosting hosting);
std::string integrationLabel(Integration integration);

std::vector<std::string> integrationNames(const std::set<Integration>& integrations);

std::string formatSummary(const ProjectMetadata& meta);

nlohmann::json toJson(const ProjectMetadata& meta);
ProjectMetadata fromJson(const nlohmann::json& json);

}}
