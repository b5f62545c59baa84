#pragma once

#include <string>
#include <vector>

namespace nestbar {
namespace common {

class PathManager {
public:
    static PathManager& instance();

    std::string getConfigDir() const;
    std::string getConfigFile() const;

    // $NESTBAR_CONFIG first, then the XDG config file.
    std::vector<std::string> getConfigSearchPaths() const;

private:
    PathManager() = default;

    std::string getXdgConfigHome() const;
};

}}
