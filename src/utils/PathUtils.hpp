#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace flux::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getHomePath() {
#ifdef _WIN32
        const char* home = std::getenv("USERPROFILE");
#else
        const char* home = std::getenv("HOME");
#endif
        return home ? fs::path(home) : fs::current_path();
    }

    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        return getHomePath() / "Library" / "Application Support";
#else
        const char* xdg = std::getenv("XDG_DATA_HOME");
        return xdg ? fs::path(xdg) : getHomePath() / ".local" / "share";
#endif
    }

    static fs::path getFluxPath() {
        return getAppDataPath() / "flux";
    }

    static fs::path getConfigPath() {
        return getFluxPath() / "config.json";
    }

    static fs::path getLogsPath() {
        return getFluxPath() / "logs";
    }

    static fs::path getDownloadsPath() {
        return getHomePath() / "Downloads";
    }
};

} // namespace flux::utils
