// Flux - File Utilities
// Best-effort file system operations

#pragma once

#include <filesystem>

namespace fs = std::filesystem;

namespace flux::utils {

/**
 * @brief File and directory utilities
 *
 * None of these throw; failures are reported through the return value.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool deleteFile(const fs::path& path);
    static bool replaceFile(const fs::path& source, const fs::path& destination);
};

} // namespace flux::utils
