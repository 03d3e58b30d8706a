#pragma once

#include "project_metadata.hpp"
#include "prompt_spec.hpp"
#include "gateway_setup/ui/prompter.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace gateway_setup {
namespace metadata {

enum class ReviewOutcome {
    CONFIRM,
    START_OVER,
    CANCEL
};

using Clock = std::function<std::chrono::system_clock::time_point()>;

Clock systemClock();

// ISO-8601 UTC with millisecond precision, e.g. 2025-01-02T03:04:05.678Z.
std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp);

class MetadataWizard {
public:
    MetadataWizard(ui::Prompter& prompter, Clock clock = systemClock());

    // Collects, reviews and confirms project metadata. Returns std::nullopt
    // when the operator cancels at any point.
    std::optional<ProjectMetadata> run();

    std::optional<ProjectMetadata> collectAll();
    ReviewOutcome reviewLoop(ProjectMetadata& meta);

    // Prompts for a single field until a valid answer or cancellation.
    // target is only modified on a valid answer.
    bool promptField(Field field, ProjectMetadata& target);

private:
    ui::Prompter& prompter_;
    Clock clock_;

    std::optional<FieldAnswer> ask(const PromptSpec& spec);
    void editField(ProjectMetadata& meta);
};

std::optional<ProjectMetadata> collectConfiguration(ui::Prompter& prompter, Clock clock = systemClock());

}}
