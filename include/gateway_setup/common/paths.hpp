#pragma once

#include <string>
#include <vector>

namespace gateway_setup {
namespace common {

class PathManager {
public:
    static PathManager& instance();

    std::string getConfigDir() const;
    std::string getLogDir() const;
    std::string getConfigFile() const;

    std::vector<std::string> getConfigSearchPaths() const;

private:
    PathManager() = default;

    std::string getXdgConfigHome() const;
    std::string getXdgStateHome() const;
};

}}
