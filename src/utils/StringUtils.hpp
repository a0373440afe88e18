// Flux - String Utilities
// String helpers for header parsing and identifiers

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flux::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // UUID
    static std::string generateUUID();

    // Parsing
    static std::optional<uint64_t> parseUnsigned(const std::string& str);

    // Removes surrounding quotes and any path component from a header-supplied name
    static std::string sanitizeFileName(const std::string& name);
};

} // namespace flux::utils
