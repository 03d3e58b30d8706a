#pragma once

#include <string>
#include <vector>

namespace gateway_setup {
namespace common {

struct ProcessResult {
    bool launched = false;
    int exit_code = -1;
    std::string output;

    bool succeeded() const { return launched && exit_code == 0; }
};

// Runs argv[0] from PATH without a shell. stderr is discarded; stdout is
// captured when capture_output is set. stdin_data, when non-empty, is written
// to the child's stdin.
ProcessResult runProcess(const std::vector<std::string>& argv,
                         const std::string& stdin_data = "",
                         bool capture_output = true);

}}
