#include "gateway_setup/ui/terminal.hpp"
#include <cstdlib>
#include <unistd.h>

namespace gateway_setup {
namespace ui {

TerminalCapabilities TerminalCapabilities::detect(bool allow_colors) {
    TerminalCapabilities caps;
    caps.interactive = isatty(STDIN_FILENO) && isatty(STDOUT_FILENO);

    const char* no_color = std::getenv("NO_COLOR");
    const char* term = std::getenv("TERM");
    bool dumb = term && std::string(term) == "dumb";

    caps.colors = allow_colors && isatty(STDOUT_FILENO) && !no_color && !dumb;
    return caps;
}

}}
