#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gateway_setup {
namespace ui {

struct SelectOption {
    std::string value;
    std::string label;
};

struct TextPrompt {
    std::string message;
    std::string placeholder;
    std::string initial_value;
    // A blank answer normally keeps initial_value. Optional fields set this
    // so that a blank answer clears the value instead.
    bool blank_clears = false;
};

struct SelectPrompt {
    std::string message;
    std::vector<SelectOption> options;
    std::string initial_value;
};

struct MultiSelectPrompt {
    std::string message;
    std::vector<SelectOption> options;
    std::vector<std::string> initial_values;
};

// Every interactive read in the installer goes through a Prompter.
// A std::nullopt answer always means the operator cancelled the prompt.
class Prompter {
public:
    virtual ~Prompter() = default;

    virtual void intro(const std::string& title) = 0;
    virtual void outro(const std::string& message) = 0;
    virtual void cancel(const std::string& message) = 0;
    virtual void note(const std::string& body, const std::string& title) = 0;
    virtual void step(const std::string& message) = 0;
    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;

    virtual std::optional<std::string> text(const TextPrompt& prompt) = 0;
    virtual std::optional<std::string> select(const SelectPrompt& prompt) = 0;
    virtual std::optional<std::vector<std::string>> multiSelect(const MultiSelectPrompt& prompt) = 0;
    virtual std::optional<bool> confirm(const std::string& message, bool initial_value) = 0;
};

}}
