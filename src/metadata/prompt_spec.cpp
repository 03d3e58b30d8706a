#include "gateway_setup/metadata/prompt_spec.hpp"
#include "gateway_setup/common/constants.hpp"
#include <algorithm>
#include <stdexcept>

namespace gateway_setup {
namespace metadata {

const std::vector<Field>& allFields() {
    static const std::vector<Field> fields = {
        Field::PROJECT_NAME,
        Field::NETWORK,
        Field::DEPLOYMENT_TYPE,
        Field::FRONTEND_HOSTING,
        Field::DOMAIN,
        Field::INTEGRATIONS
    };
    return fields;
}

const char* fieldName(Field field) {
    switch (field) {
        case Field::PROJECT_NAME: return "projectName";
        case Field::NETWORK: return "network";
        case Field::DEPLOYMENT_TYPE: return "deploymentType";
        case Field::FRONTEND_HOSTING: return "frontendHosting";
        case Field::DOMAIN: return "domain";
        case Field::INTEGRATIONS: return "integrations";
    }
    return "projectName";
}

std::string fieldLabel(Field field) {
    switch (field) {
        case Field::PROJECT_NAME: return "Project name";
        case Field::NETWORK: return "Network";
        case Field::DEPLOYMENT_TYPE: return "Deployment type";
        case Field::FRONTEND_HOSTING: return "Frontend hosting";
        case Field::DOMAIN: return "Domain";
        case Field::INTEGRATIONS: return "Integrations";
    }
    return "";
}

Field parseField(const std::string& name) {
    for (auto field : allFields()) {
        if (name == fieldName(field)) {
            return field;
        }
    }
    throw std::invalid_argument("Unknown field: " + name);
}

ProjectMetadata defaultMetadata() {
    ProjectMetadata meta;
    meta.network = Network::TESTNET;
    meta.deployment_type = DeploymentType::HOSTED;
    meta.frontend_hosting = defaultHostingFor(meta.deployment_type);
    return meta;
}

PromptSpec describe(Field field, const ProjectMetadata& seed) {
    PromptSpec spec;
    spec.field = field;

    switch (field) {
        case Field::PROJECT_NAME:
            spec.kind = PromptKind::TEXT;
            spec.text.message = "Project name";
            spec.text.placeholder = constants::metadata::PROJECT_NAME_PLACEHOLDER;
            spec.text.initial_value = seed.project_name;
            spec.validate = &FieldValidator::validateProjectName;
            break;

        case Field::NETWORK:
            spec.kind = PromptKind::SELECT;
            spec.select.message = "Network";
            for (auto network : {Network::MAINNET, Network::TESTNET}) {
                spec.select.options.push_back({toString(network), toString(network)});
            }
            spec.select.initial_value = toString(seed.network);
            break;

        case Field::DEPLOYMENT_TYPE:
            spec.kind = PromptKind::SELECT;
            spec.select.message = "Deployment type";
            for (auto type : {DeploymentType::HOSTED, DeploymentType::LOCAL_ONLY}) {
                spec.select.options.push_back({toString(type), deploymentLabel(type)});
            }
            spec.select.initial_value = toString(seed.deployment_type);
            break;

        case Field::FRONTEND_HOSTING: {
            spec.kind = PromptKind::SELECT;
            spec.select.message = "Frontend hosting";
            for (auto hosting : hostingOptionsFor(seed.deployment_type)) {
                spec.select.options.push_back({toString(hosting), hostingLabel(hosting)});
            }
            spec.select.initial_value = toString(normalizeFrontendHosting(seed).frontend_hosting);
            break;
        }

        case Field::DOMAIN:
            spec.kind = PromptKind::TEXT;
            spec.text.message = seed.domain ? "Domain name (optional, leave blank to clear)"
                                            : "Domain name (optional, for HTTPS setup)";
            spec.text.placeholder = constants::metadata::DOMAIN_PLACEHOLDER;
            spec.text.initial_value = seed.domain.value_or("");
            spec.text.blank_clears = true;
            spec.validate = &FieldValidator::validateDomain;
            break;

        case Field::INTEGRATIONS:
            spec.kind = PromptKind::MULTI_SELECT;
            spec.multi_select.message = "Optional integrations";
            for (auto integration : {Integration::STRIPE, Integration::AUTH}) {
                spec.multi_select.options.push_back({toString(integration), integrationLabel(integration)});
            }
            spec.multi_select.initial_values = integrationNames(seed.integrations);
            break;
    }

    return spec;
}

void applyAnswer(Field field, const FieldAnswer& answer, ProjectMetadata& target) {
    switch (field) {
        case Field::PROJECT_NAME:
            target.project_name = answer.value;
            break;
        case Field::NETWORK:
            target.network = parseNetwork(answer.value);
            break;
        case Field::DEPLOYMENT_TYPE:
            target.deployment_type = parseDeploymentType(answer.value);
            break;
        case Field::FRONTEND_HOSTING:
            target.frontend_hosting = parseFrontendHosting(answer.value);
            break;
        case Field::DOMAIN:
            if (answer.value.empty()) {
                target.domain.reset();
            } else {
                target.domain = answer.value;
            }
            break;
        case Field::INTEGRATIONS: {
            std::set<Integration> integrations;
            for (const auto& value : answer.values) {
                integrations.insert(parseIntegration(value));
            }
            target.integrations = integrations;
            break;
        }
    }
}

}}
