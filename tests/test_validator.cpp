#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gateway_setup/metadata/validator.hpp"

using gateway_setup::metadata::DeploymentType;
using gateway_setup::metadata::FieldValidator;
using gateway_setup::metadata::FrontendHosting;
using gateway_setup::metadata::ProjectMetadata;
using gateway_setup::metadata::normalizeFrontendHosting;

TEST(ProjectNameValidation, TrimsSurroundingWhitespace) {
    auto check = FieldValidator::validateProjectName("  my-gateway  ");
    ASSERT_TRUE(check.is_valid);
    EXPECT_EQ(check.normalized, "my-gateway");
}

TEST(ProjectNameValidation, RejectsBlank) {
    EXPECT_FALSE(FieldValidator::validateProjectName("").is_valid);
    auto check = FieldValidator::validateProjectName("   \t ");
    EXPECT_FALSE(check.is_valid);
    EXPECT_EQ(check.error, "Please enter a project name.");
}

TEST(ProjectNameValidation, LengthBoundary) {
    EXPECT_TRUE(FieldValidator::validateProjectName(std::string(64, 'a')).is_valid);

    auto check = FieldValidator::validateProjectName(std::string(65, 'a'));
    EXPECT_FALSE(check.is_valid);
    EXPECT_EQ(check.error, "Keep it under 64 characters.");
}

TEST(ProjectNameValidation, CountsCodePointsNotBytes) {
    std::string name;
    for (int i = 0; i < 64; ++i) {
        name += "\xC3\xA9";  // é
    }
    EXPECT_TRUE(FieldValidator::validateProjectName(name).is_valid);
    EXPECT_FALSE(FieldValidator::validateProjectName(name + "x").is_valid);
}

TEST(ProjectNameValidation, AcceptedNamesStayWithinBounds) {
    const std::vector<std::string> names = {"a", " b ", "gateway one", std::string(64, 'z')};
    for (const auto& raw : names) {
        auto check = FieldValidator::validateProjectName(raw);
        ASSERT_TRUE(check.is_valid) << raw;
        EXPECT_GE(check.normalized.size(), 1u);
        EXPECT_LE(check.normalized.size(), 64u);
    }
}

TEST(DomainValidation, StripsSchemeCaseAndTrailingSlash) {
    auto check = FieldValidator::validateDomain("HTTPS://API.Example.com/");
    ASSERT_TRUE(check.is_valid);
    EXPECT_EQ(check.normalized, "api.example.com");

    EXPECT_EQ(FieldValidator::validateDomain("http://gw.pokt.network//").normalized, "gw.pokt.network");
}

TEST(DomainValidation, BlankClearsDomain) {
    auto check = FieldValidator::validateDomain("   ");
    ASSERT_TRUE(check.is_valid);
    EXPECT_TRUE(check.normalized.empty());
}

TEST(DomainValidation, AcceptsLocalhostWithOptionalPort) {
    EXPECT_TRUE(FieldValidator::validateDomain("localhost").is_valid);
    EXPECT_TRUE(FieldValidator::validateDomain("LOCALHOST:3000").is_valid);
    EXPECT_TRUE(FieldValidator::validateDomain("localhost:8").is_valid);
    EXPECT_FALSE(FieldValidator::validateDomain("localhost:123456").is_valid);
    EXPECT_FALSE(FieldValidator::validateDomain("localhost:").is_valid);
}

TEST(DomainValidation, RejectsMalformedNames) {
    for (const char* raw : {"not a domain!", "example", "-bad.example.com", "api.example.c",
                            "api..example.com", "api.example.com:8080", "exa_mple.com"}) {
        auto check = FieldValidator::validateDomain(raw);
        EXPECT_FALSE(check.is_valid) << raw;
        EXPECT_EQ(check.error, "Please enter a valid domain (e.g., api.example.com) or leave blank.");
    }
}

TEST(DomainValidation, AcceptsMultiLabelNames) {
    EXPECT_TRUE(FieldValidator::validateDomain("a.b.c.example.io").is_valid);
    EXPECT_TRUE(FieldValidator::validateDomain("gw-01.example.com").is_valid);
    EXPECT_TRUE(FieldValidator::validateDomain(std::string(63, 'a') + ".com").is_valid);
    EXPECT_FALSE(FieldValidator::validateDomain(std::string(64, 'a') + ".com").is_valid);
}

TEST(AddressValidation, RequiresPoktPrefixAndShape) {
    const std::string valid = "pokt1" + std::string(38, 'q');
    EXPECT_TRUE(FieldValidator::isPoktAddress(valid));
    EXPECT_TRUE(FieldValidator::isPoktAddress("  " + valid + " "));
    EXPECT_FALSE(FieldValidator::isPoktAddress("pokt1short"));
    EXPECT_FALSE(FieldValidator::isPoktAddress("cosmos1" + std::string(38, 'q')));
    EXPECT_FALSE(FieldValidator::isPoktAddress("pokt1" + std::string(38, 'Q')));
}

TEST(AddressValidation, ReportsEachFailure) {
    const std::string gateway = "pokt1" + std::string(38, 'a');

    EXPECT_EQ(FieldValidator::validateAddress("").error, "Please paste the address from pocketd.");
    EXPECT_EQ(FieldValidator::validateAddress("pokt1x").error,
              "That doesn't look like a valid pokt1… address.");
    EXPECT_EQ(FieldValidator::validateAddress(" " + gateway, gateway).error,
              "Application and Gateway addresses must be different.");

    auto check = FieldValidator::validateAddress(" pokt1" + std::string(38, 'b') + " ", gateway);
    ASSERT_TRUE(check.is_valid);
    EXPECT_EQ(check.normalized, "pokt1" + std::string(38, 'b'));
}

TEST(AccountNameValidation, UsesExampleInMessage) {
    auto check = FieldValidator::validateAccountName("  ", "my-app");
    EXPECT_FALSE(check.is_valid);
    EXPECT_EQ(check.error, "Please enter an account name (e.g., my-app)");
    EXPECT_EQ(FieldValidator::validateAccountName(" ops ", "my-app").normalized, "ops");
}

TEST(HostingNormalizer, LocalOnlyNeverKeepsSameHost) {
    ProjectMetadata meta;
    meta.deployment_type = DeploymentType::LOCAL_ONLY;
    meta.frontend_hosting = FrontendHosting::SAME_HOST;

    auto normalized = normalizeFrontendHosting(meta);
    EXPECT_EQ(normalized.frontend_hosting, FrontendHosting::EXTERNAL_PLATFORM);
    EXPECT_EQ(normalized.deployment_type, DeploymentType::LOCAL_ONLY);
}

TEST(HostingNormalizer, LeavesOtherCombinationsAlone) {
    for (auto type : {DeploymentType::HOSTED, DeploymentType::LOCAL_ONLY}) {
        for (auto hosting : {FrontendHosting::SAME_HOST, FrontendHosting::EXTERNAL_PLATFORM,
                             FrontendHosting::SKIP}) {
            ProjectMetadata meta;
            meta.deployment_type = type;
            meta.frontend_hosting = hosting;
            auto once = normalizeFrontendHosting(meta);
            EXPECT_EQ(normalizeFrontendHosting(once), once);
            if (!(type == DeploymentType::LOCAL_ONLY && hosting == FrontendHosting::SAME_HOST)) {
                EXPECT_EQ(once, meta);
            }
        }
    }
}

TEST(HostingNormalizer, OptionsFollowDeploymentType) {
    using gateway_setup::metadata::defaultHostingFor;
    using gateway_setup::metadata::hostingOptionsFor;

    EXPECT_EQ(hostingOptionsFor(DeploymentType::HOSTED).size(), 3u);
    auto local = hostingOptionsFor(DeploymentType::LOCAL_ONLY);
    ASSERT_EQ(local.size(), 2u);
    EXPECT_EQ(local[0], FrontendHosting::EXTERNAL_PLATFORM);
    EXPECT_EQ(local[1], FrontendHosting::SKIP);

    EXPECT_EQ(defaultHostingFor(DeploymentType::HOSTED), FrontendHosting::SAME_HOST);
    EXPECT_EQ(defaultHostingFor(DeploymentType::LOCAL_ONLY), FrontendHosting::EXTERNAL_PLATFORM);
}
