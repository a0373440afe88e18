/**
 * JsonUtils.cpp
 *
 * JSON file persistence helpers.
 */

#include "JsonUtils.hpp"

#include <fstream>

namespace flux::utils {

// -- Parsing --

std::optional<json> JsonUtils::parseFile(const std::filesystem::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) return std::nullopt;
        return json::parse(file);
    } catch (const json::exception&) { return std::nullopt; }
}

// -- Serialization --

bool JsonUtils::writeFile(const std::filesystem::path& path, const json& j, int indent) {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream file(path);
        if (!file.is_open()) return false;
        file << j.dump(indent);
        file.flush();
        return static_cast<bool>(file);
    } catch (const std::exception&) { return false; }
}

bool JsonUtils::writeFileAtomic(const std::filesystem::path& path, const json& j, int indent) {
    auto tmpPath = path;
    tmpPath += ".tmp";

    if (!writeFile(tmpPath, j, indent)) {
        std::error_code ec;
        std::filesystem::remove(tmpPath, ec);
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        return false;
    }
    return true;
}

// -- Safe accessors --

int64_t JsonUtils::getLong(const json& j, const std::string& key, int64_t defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_number_integer()) return j[key].get<int64_t>();
    return defaultValue;
}

} // namespace flux::utils
