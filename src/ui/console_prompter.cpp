#include "gateway_setup/ui/console_prompter.hpp"
#include "gateway_setup/common/string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace gateway_setup {
namespace ui {

ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out, bool use_colors)
    : in_(in), out_(out), style_(use_colors) {}

void ConsolePrompter::intro(const std::string& title) {
    out_ << "\n" << style_.bold(title) << "\n\n";
}

void ConsolePrompter::outro(const std::string& message) {
    out_ << "\n" << message << "\n\n";
}

void ConsolePrompter::cancel(const std::string& message) {
    out_ << "\n" << style_.red(message) << "\n";
}

void ConsolePrompter::note(const std::string& body, const std::string& title) {
    out_ << "\n" << style_.bold(title) << "\n";
    out_ << std::string(title.size(), '-') << "\n";
    out_ << body << "\n";
}

void ConsolePrompter::step(const std::string& message) {
    out_ << "\n" << message << "\n";
}

void ConsolePrompter::info(const std::string& message) {
    out_ << style_.cyan(message) << "\n";
}

void ConsolePrompter::warn(const std::string& message) {
    out_ << style_.yellow(message) << "\n";
}

void ConsolePrompter::error(const std::string& message) {
    out_ << style_.red(message) << "\n";
}

std::optional<std::string> ConsolePrompter::readLine() {
    std::string input;
    if (!std::getline(in_, input)) {
        out_ << "\n";
        return std::nullopt;
    }
    return input;
}

std::optional<std::string> ConsolePrompter::text(const TextPrompt& prompt) {
    out_ << prompt.message;
    if (!prompt.initial_value.empty() && prompt.blank_clears) {
        out_ << " " << style_.dim("(current: " + prompt.initial_value + ")");
    } else if (!prompt.initial_value.empty()) {
        out_ << " [" << prompt.initial_value << "]";
    } else if (!prompt.placeholder.empty()) {
        out_ << " " << style_.dim("(" + prompt.placeholder + ")");
    }
    out_ << ": " << std::flush;

    auto input = readLine();
    if (!input) {
        return std::nullopt;
    }

    if (common::trim(*input).empty()) {
        return prompt.blank_clears ? std::string() : prompt.initial_value;
    }
    return input;
}

void ConsolePrompter::printOptions(const std::vector<SelectOption>& options,
                                   const std::vector<std::string>& marked) {
    for (size_t i = 0; i < options.size(); ++i) {
        bool is_marked = std::find(marked.begin(), marked.end(), options[i].value) != marked.end();
        out_ << "  " << (i + 1) << ") " << options[i].label;
        if (is_marked) {
            out_ << style_.dim(" *");
        }
        out_ << "\n";
    }
}

std::optional<size_t> ConsolePrompter::resolveOption(const std::vector<SelectOption>& options,
                                                     const std::string& token) const {
    std::string t = common::trim(token);
    if (t.empty()) {
        return std::nullopt;
    }

    if (std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c); }) && t.size() < 6) {
        size_t idx = static_cast<size_t>(std::stoul(t));
        if (idx >= 1 && idx <= options.size()) {
            return idx - 1;
        }
        return std::nullopt;
    }

    for (size_t i = 0; i < options.size(); ++i) {
        if (options[i].value == t) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ConsolePrompter::select(const SelectPrompt& prompt) {
    int default_idx = -1;
    for (size_t i = 0; i < prompt.options.size(); ++i) {
        if (prompt.options[i].value == prompt.initial_value) {
            default_idx = static_cast<int>(i);
        }
    }

    out_ << prompt.message << ":\n";
    printOptions(prompt.options, {prompt.initial_value});

    while (true) {
        out_ << "Choice";
        if (default_idx >= 0) {
            out_ << " [" << (default_idx + 1) << "]";
        }
        out_ << ": " << std::flush;

        auto input = readLine();
        if (!input) {
            return std::nullopt;
        }

        if (common::trim(*input).empty() && default_idx >= 0) {
            return prompt.options[default_idx].value;
        }

        auto idx = resolveOption(prompt.options, *input);
        if (idx) {
            return prompt.options[*idx].value;
        }

        error("Please pick one of the listed options.");
    }
}

std::optional<std::vector<std::string>> ConsolePrompter::multiSelect(const MultiSelectPrompt& prompt) {
    out_ << prompt.message << ":\n";
    printOptions(prompt.options, prompt.initial_values);
    out_ << style_.dim("Comma-separated numbers, 'none' to clear, Enter to keep current.") << "\n";

    while (true) {
        out_ << "Choices: " << std::flush;

        auto input = readLine();
        if (!input) {
            return std::nullopt;
        }

        std::string t = common::trim(*input);
        if (t.empty()) {
            return prompt.initial_values;
        }
        if (common::toLower(t) == "none") {
            return std::vector<std::string>{};
        }

        std::vector<std::string> chosen;
        bool all_valid = true;
        for (const auto& token : common::split(t, ',')) {
            auto idx = resolveOption(prompt.options, token);
            if (!idx) {
                all_valid = false;
                break;
            }
            const std::string& value = prompt.options[*idx].value;
            if (std::find(chosen.begin(), chosen.end(), value) == chosen.end()) {
                chosen.push_back(value);
            }
        }

        if (all_valid) {
            return chosen;
        }

        error("Unknown choice. Use the numbers shown above.");
    }
}

std::optional<bool> ConsolePrompter::confirm(const std::string& message, bool initial_value) {
    while (true) {
        out_ << message << (initial_value ? " [Y/n]: " : " [y/N]: ") << std::flush;

        auto input = readLine();
        if (!input) {
            return std::nullopt;
        }

        std::string t = common::toLower(common::trim(*input));
        if (t.empty()) return initial_value;
        if (t == "y" || t == "yes") return true;
        if (t == "n" || t == "no") return false;

        error("Please answer y or n.");
    }
}

}}
