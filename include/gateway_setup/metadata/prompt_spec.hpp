#pragma once

#include "project_metadata.hpp"
#include "validator.hpp"
#include "gateway_setup/ui/prompter.hpp"
#include <functional>
#include <string>
#include <vector>

namespace gateway_setup {
namespace metadata {

enum class Field {
    PROJECT_NAME,
    NETWORK,
    DEPLOYMENT_TYPE,
    FRONTEND_HOSTING,
    DOMAIN,
    INTEGRATIONS
};

enum class PromptKind {
    TEXT,
    SELECT,
    MULTI_SELECT
};

struct PromptSpec {
    Field field;
    PromptKind kind;
    ui::TextPrompt text;
    ui::SelectPrompt select;
    ui::MultiSelectPrompt multi_select;
    std::function<FieldCheck(const std::string&)> validate;
};

struct FieldAnswer {
    std::string value;
    std::vector<std::string> values;
};

// Collection order of the initial pass.
const std::vector<Field>& allFields();

const char* fieldName(Field field);
std::string fieldLabel(Field field);
Field parseField(const std::string& name);

ProjectMetadata defaultMetadata();

// Builds the prompt for one field, seeded from the current (or default)
// values in seed. Shared by the initial pass and the edit pass.
PromptSpec describe(Field field, const ProjectMetadata& seed);

// Writes an already validated answer into target.
void applyAnswer(Field field, const FieldAnswer& answer, ProjectMetadata& target);

}}
