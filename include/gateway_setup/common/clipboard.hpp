#pragma once

#include <string>
#include <vector>

namespace gateway_setup {
namespace common {

class Clipboard {
public:
    virtual ~Clipboard() = default;
    virtual bool copy(const std::string& text) = 0;
};

// Pipes text into the first clipboard helper found on PATH
// (wl-copy, xclip, xsel, pbcopy).
class SystemClipboard : public Clipboard {
public:
    SystemClipboard();
    explicit SystemClipboard(std::vector<std::vector<std::string>> helpers);

    bool copy(const std::string& text) override;

private:
    std::vector<std::vector<std::string>> helpers_;
};

}}
