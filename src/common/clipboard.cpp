#include "gateway_setup/common/clipboard.hpp"
#include "gateway_setup/common/logger.hpp"
#include "gateway_setup/common/process.hpp"

namespace gateway_setup {
namespace common {

SystemClipboard::SystemClipboard()
    : helpers_{
          {"wl-copy"},
          {"xclip", "-selection", "clipboard"},
          {"xsel", "--clipboard", "--input"},
          {"pbcopy"}
      } {}

SystemClipboard::SystemClipboard(std::vector<std::vector<std::string>> helpers)
    : helpers_(std::move(helpers)) {}

bool SystemClipboard::copy(const std::string& text) {
    for (const auto& helper : helpers_) {
        auto result = runProcess(helper, text, false);
        if (result.succeeded()) {
            Logger::instance().debug("[Clipboard] Copied | helper={} | bytes={}", helper.front(), text.size());
            return true;
        }
    }

    Logger::instance().info("[Clipboard] No usable clipboard helper");
    return false;
}

}}
