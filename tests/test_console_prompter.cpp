#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "gateway_setup/ui/console_prompter.hpp"

using namespace gateway_setup::ui;

namespace {

SelectPrompt networkPrompt() {
    SelectPrompt prompt;
    prompt.message = "Network";
    prompt.options = {{"mainnet", "mainnet"}, {"testnet", "testnet"}};
    prompt.initial_value = "testnet";
    return prompt;
}

MultiSelectPrompt integrationsPrompt() {
    MultiSelectPrompt prompt;
    prompt.message = "Optional integrations";
    prompt.options = {{"stripe", "Stripe billing"}, {"auth", "Auth modules"}};
    prompt.initial_values = {"auth"};
    return prompt;
}

}

TEST(ConsolePrompterTest, TextBlankKeepsInitialValue) {
    std::istringstream in("\n   \n  spaced  \n");
    std::ostringstream out;
    ConsolePrompter prompter(in, out, false);

    TextPrompt prompt;
    prompt.message = "Account name";
    prompt.initial_value = "gateway";

    EXPECT_EQ(prompter.text(prompt), std::optional<std::string>("gateway"));
    EXPECT_EQ(prompter.text(prompt), std::optional<std::string>("gateway"));
    EXPECT_EQ(prompter.text(prompt), std::optional<std::string>("  spaced  "));
    EXPECT_FALSE(prompter.text(prompt).has_value());
    EXPECT_NE(out.str().find("Account name [gateway]: "), std::string::npos);
}

TEST(ConsolePrompterTest, TextBlankClearsOptionalValue) {
    std::istringstream in("\n  \t \nnew.example.com\n");
    std::ostringstream out;
    ConsolePrompter prompter(in, out, false);

    TextPrompt prompt;
    prompt.message = "Domain";
    prompt.initial_value = "api.example.com";
    prompt.blank_clears = true;

    EXPECT_EQ(prompter.text(prompt), std::optional<std::string>(""));
    EXPECT_EQ(prompter.text(prompt), std::optional<std::string>(""));
    EXPECT_EQ(prompter.text(prompt), std::optional<std::string>("new.example.com"));
    EXPECT_NE(out.str().find("Domain (current: api.example.com): "), std::string::npos);
}

TEST(ConsolePrompterTest, SelectByNumberValueOrDefault) {
    std::istringstream in("1\ntestnet\n\n7\nmainnet\n");
    std::ostringstream out;
    ConsolePrompter prompter(in, out, false);

    EXPECT_EQ(prompter.select(networkPrompt()), std::optional<std::string>("mainnet"));
    EXPECT_EQ(prompter.select(networkPrompt()), std::optional<std::string>("testnet"));
    EXPECT_EQ(prompter.select(networkPrompt()), std::optional<std::string>("testnet"));
    EXPECT_EQ(prompter.select(networkPrompt()), std::optional<std::string>("mainnet"));
    EXPECT_NE(out.str().find("Please pick one of the listed options."), std::string::npos);
}

TEST(ConsolePrompterTest, EndOfInputCancels) {
    std::istringstream in("");
    std::ostringstream out;
    ConsolePrompter prompter(in, out, false);

    EXPECT_FALSE(prompter.select(networkPrompt()).has_value());
    EXPECT_FALSE(prompter.multiSelect(integrationsPrompt()).has_value());
    EXPECT_FALSE(prompter.confirm("Continue?", true).has_value());
}

TEST(ConsolePrompterTest, MultiSelectParsesCommaList) {
    std::istringstream in("\n2, 1, 2\nnone\nstripe,9\n1\n");
    std::ostringstream out;
    ConsolePrompter prompter(in, out, false);

    EXPECT_EQ(prompter.multiSelect(integrationsPrompt()), (std::optional<std::vector<std::string>>({"auth"})));
    EXPECT_EQ(prompter.multiSelect(integrationsPrompt()),
              (std::optional<std::vector<std::string>>({"auth", "stripe"})));
    EXPECT_EQ(prompter.multiSelect(integrationsPrompt()), (std::optional<std::vector<std::string>>(
                                                               std::vector<std::string>{})));
    EXPECT_EQ(prompter.multiSelect(integrationsPrompt()),
              (std::optional<std::vector<std::string>>({"stripe"})));
}

TEST(ConsolePrompterTest, ConfirmAcceptsYesNoAndDefault) {
    std::istringstream in("\nYES\nn\nmaybe\ny\n");
    std::ostringstream out;
    ConsolePrompter prompter(in, out, false);

    EXPECT_EQ(prompter.confirm("Continue?", false), std::optional<bool>(false));
    EXPECT_EQ(prompter.confirm("Continue?", false), std::optional<bool>(true));
    EXPECT_EQ(prompter.confirm("Continue?", true), std::optional<bool>(false));
    EXPECT_EQ(prompter.confirm("Continue?", true), std::optional<bool>(true));
    EXPECT_NE(out.str().find("Please answer y or n."), std::string::npos);
}

TEST(ConsolePrompterTest, PlainOutputHasNoEscapeCodes) {
    std::istringstream in;
    std::ostringstream out;
    ConsolePrompter prompter(in, out, false);

    prompter.note("Project name: edge", "Review configuration");
    prompter.error("bad");
    EXPECT_EQ(out.str().find('\033'), std::string::npos);
    EXPECT_NE(out.str().find("Review configuration\n--------------------\nProject name: edge"), std::string::npos);
}
