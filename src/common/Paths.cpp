#include "stemsync/common/Paths.hpp"

#include <cstdlib>

namespace stemsync::common {

std::filesystem::path userConfigDir() {
#ifdef _WIN32
    if (const char* appData = std::getenv("APPDATA"); appData != nullptr && appData[0] != '\0') {
        return std::filesystem::path(appData) / "stemsync";
    }
    return {};
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "stemsync";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0') {
        return std::filesystem::path(home) / ".config" / "stemsync";
    }
    return {};
#endif
}

std::filesystem::path userPlayerConfigPath() {
    const auto dir = userConfigDir();
    if (dir.empty()) {
        return {};
    }
    return dir / "player.json";
}

}  // namespace stemsync::common
