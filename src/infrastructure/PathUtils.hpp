// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace writher::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/Writher, created on demand. */
    static std::filesystem::path GetAppDataDir();
    /** @brief $XDG_CONFIG_HOME/Writher, created on demand. */
    static std::filesystem::path GetAppConfigDir();
    static std::filesystem::path GetModelsDir();

    static std::filesystem::path GetSettingsPath();
    static std::filesystem::path GetDatabasePath();
    static std::filesystem::path GetRecoveryFilePath();
};

} // namespace writher::infrastructure
