#include "gateway_setup/metadata/wizard.hpp"
#include "gateway_setup/common/logger.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gateway_setup {
namespace metadata {

namespace {

constexpr const char* ACTION_CONFIRM = "confirm";
constexpr const char* ACTION_EDIT = "edit";
constexpr const char* ACTION_START_OVER = "start-over";
constexpr const char* ACTION_CANCEL = "cancel";

bool isListed(const std::vector<ui::SelectOption>& options, const std::string& value) {
    return std::any_of(options.begin(), options.end(),
                       [&value](const ui::SelectOption& option) { return option.value == value; });
}

}

Clock systemClock() {
    return []() { return std::chrono::system_clock::now(); };
}

std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();
    if (millis < 0) {
        seconds -= std::chrono::seconds(1);
        millis += 1000;
    }

    std::time_t time_t_val = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&time_t_val, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << millis << "Z";
    return oss.str();
}

MetadataWizard::MetadataWizard(ui::Prompter& prompter, Clock clock)
    : prompter_(prompter), clock_(std::move(clock)) {}

std::optional<FieldAnswer> MetadataWizard::ask(const PromptSpec& spec) {
    switch (spec.kind) {
        case PromptKind::TEXT:
            while (true) {
                auto raw = prompter_.text(spec.text);
                if (!raw) {
                    return std::nullopt;
                }
                FieldCheck check = spec.validate(*raw);
                if (check.is_valid) {
                    return FieldAnswer{check.normalized, {}};
                }
                common::Logger::instance().debug("[Metadata] Rejected | field={} | reason={}",
                                                 fieldName(spec.field), check.error);
                prompter_.error(check.error);
            }

        case PromptKind::SELECT:
            while (true) {
                auto value = prompter_.select(spec.select);
                if (!value) {
                    return std::nullopt;
                }
                if (isListed(spec.select.options, *value)) {
                    return FieldAnswer{*value, {}};
                }
                prompter_.error("Please pick one of the listed options.");
            }

        case PromptKind::MULTI_SELECT:
            while (true) {
                auto values = prompter_.multiSelect(spec.multi_select);
                if (!values) {
                    return std::nullopt;
                }
                bool all_listed = std::all_of(values->begin(), values->end(),
                    [&spec](const std::string& v) { return isListed(spec.multi_select.options, v); });
                if (all_listed) {
                    return FieldAnswer{"", *values};
                }
                prompter_.error("Please pick only the listed options.");
            }
    }
    return std::nullopt;
}

bool MetadataWizard::promptField(Field field, ProjectMetadata& target) {
    auto answer = ask(describe(field, target));
    if (!answer) {
        return false;
    }
    applyAnswer(field, *answer, target);
    return true;
}

std::optional<ProjectMetadata> MetadataWizard::collectAll() {
    ProjectMetadata draft = defaultMetadata();

    for (auto field : allFields()) {
        if (!promptField(field, draft)) {
            common::Logger::instance().info("[Metadata] Collection cancelled | field={}", fieldName(field));
            return std::nullopt;
        }
    }

    draft.created_at_iso = formatIsoTimestamp(clock_());
    return normalizeFrontendHosting(draft);
}

void MetadataWizard::editField(ProjectMetadata& meta) {
    ui::SelectPrompt pick;
    pick.message = "Pick a field to edit";
    for (auto field : allFields()) {
        pick.options.push_back({fieldName(field), fieldLabel(field)});
    }

    auto picked = prompter_.select(pick);
    if (!picked || !isListed(pick.options, *picked)) {
        return;
    }

    Field field = parseField(*picked);
    ProjectMetadata edited = meta;
    if (!promptField(field, edited)) {
        common::Logger::instance().debug("[Metadata] Edit cancelled | field={}", fieldName(field));
        return;
    }

    if (field == Field::DEPLOYMENT_TYPE || field == Field::FRONTEND_HOSTING) {
        edited = normalizeFrontendHosting(edited);
    }

    meta = edited;
    common::Logger::instance().debug("[Metadata] Field edited | field={}", fieldName(field));
}

ReviewOutcome MetadataWizard::reviewLoop(ProjectMetadata& meta) {
    ui::SelectPrompt actions;
    actions.message = "What would you like to do?";
    actions.options = {
        {ACTION_CONFIRM, "Confirm & continue"},
        {ACTION_EDIT, "Edit a field"},
        {ACTION_START_OVER, "Start over"},
        {ACTION_CANCEL, "Cancel setup"}
    };
    actions.initial_value = ACTION_CONFIRM;

    while (true) {
        prompter_.note(formatSummary(meta), "Review configuration");

        auto choice = prompter_.select(actions);
        if (!choice || *choice == ACTION_CANCEL) {
            return ReviewOutcome::CANCEL;
        }
        if (*choice == ACTION_CONFIRM) {
            return ReviewOutcome::CONFIRM;
        }
        if (*choice == ACTION_START_OVER) {
            return ReviewOutcome::START_OVER;
        }
        if (*choice == ACTION_EDIT) {
            editField(meta);
        }
    }
}

std::optional<ProjectMetadata> MetadataWizard::run() {
    prompter_.intro("Let's grab a few details for your gateway setup.");
    prompter_.note("Type the number of an option and press Enter. Press Ctrl+D to cancel.", "Controls");

    while (true) {
        auto meta = collectAll();
        if (!meta) {
            prompter_.cancel("Setup cancelled.");
            return std::nullopt;
        }

        switch (reviewLoop(*meta)) {
            case ReviewOutcome::CONFIRM:
                common::Logger::instance().info("[Metadata] Confirmed | project={} | network={}",
                                                meta->project_name, toString(meta->network));
                prompter_.outro("Configuration captured in memory.");
                return meta;
            case ReviewOutcome::CANCEL:
                common::Logger::instance().info("[Metadata] Cancelled at review");
                prompter_.cancel("Setup cancelled.");
                return std::nullopt;
            case ReviewOutcome::START_OVER:
                common::Logger::instance().info("[Metadata] Starting over");
                break;
        }
    }
}

std::optional<ProjectMetadata> collectConfiguration(ui::Prompter& prompter, Clock clock) {
    MetadataWizard wizard(prompter, std::move(clock));
    return wizard.run();
}

}}
