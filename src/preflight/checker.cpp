#include "gateway_setup/preflight/checker.hpp"
#include "gateway_setup/common/logger.hpp"
#include "gateway_setup/common/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace gateway_setup {
namespace preflight {

std::optional<std::string> extractVersion(const std::string& output) {
    std::string trimmed = common::trim(output);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    static const std::regex version_pattern(R"(\d+(?:\.\d+){0,3})");
    std::smatch match;
    if (std::regex_search(trimmed, match, version_pattern)) {
        return match.str(0);
    }
    return trimmed;
}

static int parseSegment(const std::string& segment) {
    if (segment.empty() || segment.size() > 9 ||
        !std::all_of(segment.begin(), segment.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return 0;
    }
    return std::stoi(segment);
}

int compareVersions(const std::string& a, const std::string& b) {
    auto pa = common::split(a, '.');
    auto pb = common::split(b, '.');

    for (size_t i = 0; i < std::max(pa.size(), pb.size()); ++i) {
        int x = i < pa.size() ? parseSegment(pa[i]) : 0;
        int y = i < pb.size() ? parseSegment(pb[i]) : 0;
        if (x > y) return 1;
        if (x < y) return -1;
    }
    return 0;
}

std::vector<ToolDescriptor> defaultTools(const common::PreflightConfig& config) {
    std::vector<ToolDescriptor> tools;

    ToolDescriptor git;
    git.name = "Git";
    git.command = "git";
    git.probe_args = {{"--version"}, {"-v"}, {"version"}};
    git.required = true;
    git.min_version = config.git_min_version;
    git.hint = "Install Git and re-run the installer in your terminal.";
    git.help_url = "https://git-scm.com/downloads";
    tools.push_back(git);

    ToolDescriptor docker;
    docker.name = "Docker";
    docker.command = "docker";
    docker.probe_args = {{"--version"}, {"-v"}, {"version"}};
    docker.required = false;
    docker.min_version = config.docker_min_version;
    docker.hint = "Install Docker Desktop (or dockerd/colima) and ensure it's running.";
    docker.help_url = "https://docs.docker.com/get-docker/";
    docker.readiness_args = {"docker", "info"};
    docker.readiness_reason = "Docker CLI found but the daemon isn't reachable";
    docker.readiness_hint = "Start Docker (Docker Desktop, dockerd, or colima) and ensure the daemon is running.";
    tools.push_back(docker);

    ToolDescriptor pocketd;
    pocketd.name = "pocketd";
    pocketd.command = "pocketd";
    pocketd.probe_args = {{"--version"}, {"version"}, {"-v"}};
    pocketd.required = true;
    pocketd.min_version = config.pocketd_min_version;
    pocketd.hint = "Install the Pocketd CLI, then re-run the installer in your terminal.";
    pocketd.help_url = "https://dev.poktroll.com/explore/account_management/pocketd_cli";
    tools.push_back(pocketd);

    return tools;
}

PreflightChecker::PreflightChecker(std::vector<ToolDescriptor> tools)
    : PreflightChecker(std::move(tools), [](const std::vector<std::string>& argv) {
          return common::runProcess(argv);
      }) {}

PreflightChecker::PreflightChecker(std::vector<ToolDescriptor> tools, CommandRunner runner)
    : tools_(std::move(tools)), runner_(std::move(runner)) {}

std::optional<std::string> PreflightChecker::probeVersion(const ToolDescriptor& tool) const {
    for (const auto& args : tool.probe_args) {
        std::vector<std::string> argv = {tool.command};
        argv.insert(argv.end(), args.begin(), args.end());

        auto result = runner_(argv);
        if (!result.succeeded()) {
            continue;
        }

        auto version = extractVersion(result.output);
        if (version) {
            return version;
        }
    }
    return std::nullopt;
}

CheckResult PreflightChecker::check(const ToolDescriptor& tool) const {
    CheckResult result;
    result.name = tool.name;
    result.required = tool.required;

    auto version = probeVersion(tool);
    if (!version) {
        result.ok = false;
        result.reason = tool.required ? "Not found in PATH" : "CLI not found";
        result.hint = tool.hint;
        result.help_url = tool.help_url;
        common::Logger::instance().warn("[Preflight] Missing | tool={}", tool.name);
        return result;
    }

    result.version = *version;

    if (!tool.min_version.empty() && compareVersions(*version, tool.min_version) < 0) {
        result.ok = false;
        result.reason = "Detected " + *version + ", requires >= " + tool.min_version;
        result.hint = tool.hint;
        result.help_url = tool.help_url;
        common::Logger::instance().warn("[Preflight] Outdated | tool={} | version={} | required={}",
                                        tool.name, *version, tool.min_version);
        return result;
    }

    if (!tool.readiness_args.empty() && !runner_(tool.readiness_args).succeeded()) {
        result.ok = false;
        result.reason = tool.readiness_reason;
        result.hint = tool.readiness_hint;
        result.help_url = tool.help_url;
        common::Logger::instance().warn("[Preflight] Not ready | tool={}", tool.name);
        return result;
    }

    result.ok = true;
    common::Logger::instance().info("[Preflight] Found | tool={} | version={}", tool.name, *version);
    return result;
}

std::vector<CheckResult> PreflightChecker::checkAll() const {
    std::vector<CheckResult> results;
    for (const auto& tool : tools_) {
        results.push_back(check(tool));
    }
    return results;
}

std::string formatFailureReport(const std::vector<CheckResult>& failures) {
    std::ostringstream oss;
    oss << "Some required tools are missing or not ready:\n";
    for (const auto& failure : failures) {
        oss << "\n• " << failure.name << ": " << failure.reason;
        if (!failure.required) {
            oss << " (recommended)";
        }
        oss << "\n";
        if (!failure.hint.empty()) {
            oss << "  - " << failure.hint << "\n";
        }
        if (!failure.help_url.empty()) {
            oss << "  - " << failure.help_url << "\n";
        }
    }
    return oss.str();
}

std::optional<common::SetupErrorCode> PreflightChecker::run(ui::Prompter& prompter) const {
    std::vector<std::string> names;
    for (const auto& tool : tools_) {
        names.push_back(tool.name);
    }
    prompter.note("We'll quickly verify your environment: " + common::join(names, ", ") + ".",
                  "Preflight checks");

    std::vector<CheckResult> failures;
    for (const auto& tool : tools_) {
        CheckResult result = check(tool);
        if (result.ok) {
            prompter.info(result.name + " ✓ (" + result.version + ")");
        } else {
            prompter.warn(result.name + " ✗");
            failures.push_back(result);
        }
    }

    if (failures.empty()) {
        prompter.info("All requirements satisfied. Onward!");
        return std::nullopt;
    }

    prompter.note(formatFailureReport(failures), "Preflight results");

    bool any_required = std::any_of(failures.begin(), failures.end(),
                                    [](const CheckResult& r) { return r.required; });
    if (any_required) {
        auto code = common::SetupErrorCode::PREFLIGHT_REQUIRED_TOOL_MISSING;
        prompter.cancel(common::SetupErrorCodeHelper::getMessage(code));
        return code;
    }

    auto proceed = prompter.confirm("Only recommended checks failed. Continue anyway?", false);
    if (!proceed || !*proceed) {
        auto code = common::SetupErrorCode::PREFLIGHT_DECLINED;
        prompter.cancel(common::SetupErrorCodeHelper::getMessage(code));
        return code;
    }

    return std::nullopt;
}

}}
