#pragma once

#include "gateway_setup/common/config.hpp"
#include "gateway_setup/common/error_codes.hpp"
#include "gateway_setup/common/process.hpp"
#include "gateway_setup/ui/prompter.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gateway_setup {
namespace preflight {

struct ToolDescriptor {
    std::string name;
    std::string command;
    std::vector<std::vector<std::string>> probe_args;
    bool required = true;
    std::string min_version;
    std::string hint;
    std::string help_url;
    // Extra command that must succeed after the version probe (e.g. daemon reachability).
    std::vector<std::string> readiness_args;
    std::string readiness_reason;
    std::string readiness_hint;
};

struct CheckResult {
    std::string name;
    bool ok = false;
    bool required = true;
    std::string version;
    std::string reason;
    std::string hint;
    std::string help_url;
};

using CommandRunner = std::function<common::ProcessResult(const std::vector<std::string>&)>;

std::optional<std::string> extractVersion(const std::string& output);
int compareVersions(const std::string& a, const std::string& b);

std::vector<ToolDescriptor> defaultTools(const common::PreflightConfig& config);

class PreflightChecker {
public:
    explicit PreflightChecker(std::vector<ToolDescriptor> tools);
    PreflightChecker(std::vector<ToolDescriptor> tools, CommandRunner runner);

    CheckResult check(const ToolDescriptor& tool) const;
    std::vector<CheckResult> checkAll() const;

    // Interactive pass: renders per-tool status and the failure summary.
    // Returns std::nullopt when setup may continue.
    std::optional<common::SetupErrorCode> run(ui::Prompter& prompter) const;

    const std::vector<ToolDescriptor>& tools() const { return tools_; }

private:
    std::vector<ToolDescriptor> tools_;
    CommandRunner runner_;

    std::optional<std::string> probeVersion(const ToolDescriptor& tool) const;
};

std::string formatFailureReport(const std::vector<CheckResult>& failures);

}}
