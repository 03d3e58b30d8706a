#pragma once

#include "prompter.hpp"
#include "terminal.hpp"
#include <istream>
#include <ostream>

namespace gateway_setup {
namespace ui {

// Line-oriented prompter over a pair of streams. End of input cancels the
// pending prompt.
class ConsolePrompter : public Prompter {
public:
    ConsolePrompter(std::istream& in, std::ostream& out, bool use_colors);

    void intro(const std::string& title) override;
    void outro(const std::string& message) override;
    void cancel(const std::string& message) override;
    void note(const std::string& body, const std::string& title) override;
    void step(const std::string& message) override;
    void info(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;

    std::optional<std::string> text(const TextPrompt& prompt) override;
    std::optional<std::string> select(const SelectPrompt& prompt) override;
    std::optional<std::vector<std::string>> multiSelect(const MultiSelectPrompt& prompt) override;
    std::optional<bool> confirm(const std::string& message, bool initial_value) override;

private:
    std::istream& in_;
    std::ostream& out_;
    Style style_;

    std::optional<std::string> readLine();
    void printOptions(const std::vector<SelectOption>& options,
                      const std::vector<std::string>& marked);
    std::optional<size_t> resolveOption(const std::vector<SelectOption>& options,
                                        const std::string& token) const;
};

}}
