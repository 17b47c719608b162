#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace writher::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path EnsureDir(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[PathUtils] Cannot create " << dir << ": " << ec.message() << std::endl;
        }
    }
    return dir;
}

} // namespace

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppDataDir() {
    return EnsureDir(GetDataHome() / "Writher");
}

fs::path PathUtils::GetAppConfigDir() {
    return EnsureDir(GetConfigHome() / "Writher");
}

fs::path PathUtils::GetModelsDir() {
    return EnsureDir(GetAppDataDir() / "models");
}

fs::path PathUtils::GetSettingsPath() {
    return GetAppConfigDir() / "settings.json";
}

fs::path PathUtils::GetDatabasePath() {
    return GetAppDataDir() / "writher.db";
}

fs::path PathUtils::GetRecoveryFilePath() {
    return GetAppDataDir() / "recovery_notes.txt";
}

} // namespace writher::infrastructure
