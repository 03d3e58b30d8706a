#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "gateway_setup/metadata/project_metadata.hpp"

using namespace gateway_setup::metadata;

namespace {

ProjectMetadata sample() {
    ProjectMetadata meta;
    meta.project_name = "edge-gw";
    meta.network = Network::MAINNET;
    meta.deployment_type = DeploymentType::LOCAL_ONLY;
    meta.frontend_hosting = FrontendHosting::EXTERNAL_PLATFORM;
    meta.domain = "api.example.com";
    meta.integrations = {Integration::AUTH, Integration::STRIPE};
    meta.created_at_iso = "2025-01-02T03:04:05.678Z";
    return meta;
}

}

TEST(ProjectMetadataJson, UsesWireNames) {
    auto json = toJson(sample());
    EXPECT_EQ(json["projectName"], "edge-gw");
    EXPECT_EQ(json["network"], "mainnet");
    EXPECT_EQ(json["deploymentType"], "local-only");
    EXPECT_EQ(json["frontendHosting"], "external-platform");
    EXPECT_EQ(json["domain"], "api.example.com");
    EXPECT_EQ(json["integrations"], nlohmann::json::array({"stripe", "auth"}));
    EXPECT_EQ(json["createdAtIso"], "2025-01-02T03:04:05.678Z");
}

TEST(ProjectMetadataJson, AbsentDomainIsNull) {
    auto meta = sample();
    meta.domain.reset();
    auto json = toJson(meta);
    EXPECT_TRUE(json["domain"].is_null());
    EXPECT_EQ(fromJson(json), meta);
}

TEST(ProjectMetadataJson, RejectsUnknownEnumValues) {
    auto json = toJson(sample());
    json["frontendHosting"] = "netlify";
    EXPECT_THROW(fromJson(json), std::invalid_argument);
}

TEST(ProjectMetadataSummary, RendersDashForEmptyValues) {
    ProjectMetadata meta;
    meta.project_name = "demo";
    auto summary = formatSummary(meta);

    EXPECT_NE(summary.find("Project name:        demo"), std::string::npos);
    EXPECT_NE(summary.find("Network:             testnet"), std::string::npos);
    EXPECT_NE(summary.find("Deployment type:     Hosted VPS"), std::string::npos);
    EXPECT_NE(summary.find("Frontend hosting:    Same VPS"), std::string::npos);
    EXPECT_NE(summary.find("Domain:              —"), std::string::npos);
    EXPECT_NE(summary.find("Integrations:        —"), std::string::npos);
}

TEST(ProjectMetadataSummary, ListsIntegrations) {
    auto summary = formatSummary(sample());
    EXPECT_NE(summary.find("Frontend hosting:    Vercel"), std::string::npos);
    EXPECT_NE(summary.find("Domain:              api.example.com"), std::string::npos);
    EXPECT_NE(summary.find("Integrations:        stripe, auth"), std::string::npos);
}
