/**
 * FileUtils.cpp
 *
 * Best-effort file system operations.
 */

#include "FileUtils.hpp"

namespace flux::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    if (path.empty()) return true;
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

bool FileUtils::replaceFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    if (fs::exists(destination, ec)) {
        fs::remove(destination, ec);
        if (ec) return false;
    }
    fs::rename(source, destination, ec);
    return !ec;
}

} // namespace flux::utils
