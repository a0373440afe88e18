// Flux - JSON Utilities
// JSON file persistence helpers

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace flux::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 */
class JsonUtils {
public:
    // Parsing
    static std::optional<json> parseFile(const std::filesystem::path& path);

    // Serialization
    static bool writeFile(const std::filesystem::path& path, const json& j, int indent = 2);

    /**
     * Write to a sibling temporary file, then rename it over `path`.
     * Readers never observe a partially written document.
     */
    static bool writeFileAtomic(const std::filesystem::path& path, const json& j, int indent = -1);

    // Safe accessors
    static int64_t getLong(const json& j, const std::string& key, int64_t defaultValue = 0);
};

} // namespace flux::utils
