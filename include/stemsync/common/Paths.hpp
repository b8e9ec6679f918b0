#pragma once

#include <filesystem>

namespace stemsync::common {

/// Returns the per-user config directory for stemsync.
/// On Linux: $XDG_CONFIG_HOME/stemsync/ or ~/.config/stemsync/.
/// On Windows: %APPDATA%\stemsync\.
/// Returns an empty path when no user config location is available.
std::filesystem::path userConfigDir();

/// Resolves the default player config file (player.json in userConfigDir()).
/// Returns an empty path when no user config location is available.
std::filesystem::path userPlayerConfigPath();

}  // namespace stemsync::common
