/**
 * StringUtils.cpp
 *
 * String manipulation utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <random>

namespace flux::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// -- UUID --

std::string StringUtils::generateUUID() {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<> dis(0, 15);
    static const char hex[] = "0123456789abcdef";

    std::string uuid(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        uuid[i] = hex[dis(gen)];
    }
    uuid[14] = '4'; // version 4
    uuid[19] = hex[(dis(gen) & 0x3) | 0x8]; // variant
    return uuid;
}

// -- Parsing --

std::optional<uint64_t> StringUtils::parseUnsigned(const std::string& str) {
    std::string digits = trim(str);
    if (digits.empty()) return std::nullopt;

    uint64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        auto digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

std::string StringUtils::sanitizeFileName(const std::string& name) {
    std::string result = trim(name);
    while (!result.empty() && (result.front() == '"' || result.front() == '\'')) result.erase(0, 1);
    while (!result.empty() && (result.back() == '"' || result.back() == '\'')) result.pop_back();

    auto slash = result.find_last_of("/\\");
    if (slash != std::string::npos) {
        result = result.substr(slash + 1);
    }
    if (result == "." || result == "..") {
        return "";
    }
    return result;
}

} // namespace flux::utils
