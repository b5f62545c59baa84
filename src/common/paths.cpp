#include "nestbar/common/paths.hpp"
#include "nestbar/common/constants.hpp"
#include <unistd.h>
#include <pwd.h>
#include <cstdlib>

namespace nestbar {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        if (*env) {
            paths.push_back(env);
        }
    }

    std::string config_file = getConfigFile();
    if (!config_file.empty()) {
        paths.push_back(config_file);
    }

    return paths;
}

std::string PathManager::getConfigDir() const {
    std::string base = getXdgConfigHome();
    if (base.empty()) {
        return "";
    }
    return base + "/" + constants::system::APPLICATION_NAME;
}

std::string PathManager::getConfigFile() const {
    std::string dir = getConfigDir();
    if (dir.empty()) {
        return "";
    }
    return dir + "/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getXdgConfigHome() const {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) return xdg;
    }

    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : nullptr;
    }

    if (!home) {
        return "";
    }
    return std::string(home) + "/.config";
}

}}
