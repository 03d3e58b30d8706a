#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gateway_setup/common/clipboard.hpp"
#include "gateway_setup/common/process.hpp"

using gateway_setup::common::runProcess;

TEST(ProcessTest, CapturesStdoutAndExitCode) {
    auto result = runProcess({"sh", "-c", "echo git version 2.46.2; exit 3"});
    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.output, "git version 2.46.2\n");
    EXPECT_FALSE(result.succeeded());
}

TEST(ProcessTest, DiscardsStderr) {
    auto result = runProcess({"sh", "-c", "echo noise >&2; echo ok"});
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "ok\n");
}

TEST(ProcessTest, FeedsStdin) {
    auto result = runProcess({"cat"}, "pokt1abc\n");
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "pokt1abc\n");
}

TEST(ProcessTest, MissingBinaryIsNotLaunched) {
    auto result = runProcess({"gateway-setup-no-such-tool-xyz", "--version"});
    EXPECT_FALSE(result.launched);
    EXPECT_FALSE(result.succeeded());
}

TEST(ProcessTest, EmptyCommandLine) {
    EXPECT_FALSE(runProcess({}).launched);
}

TEST(SystemClipboardTest, FallsThroughToWorkingHelper) {
    std::vector<std::vector<std::string>> helpers = {
        {"gateway-setup-no-such-clipboard"},
        {"sh", "-c", "cat > /dev/null"}
    };
    gateway_setup::common::SystemClipboard clipboard(helpers);
    EXPECT_TRUE(clipboard.copy("Gateway (my-gateway): pokt1abc"));
}

TEST(SystemClipboardTest, ReportsWhenNoHelperWorks) {
    std::vector<std::vector<std::string>> helpers = {{"gateway-setup-no-such-clipboard"}, {"false"}};
    gateway_setup::common::SystemClipboard clipboard(helpers);
    EXPECT_FALSE(clipboard.copy("text"));
}
