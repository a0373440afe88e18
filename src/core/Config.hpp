#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace flux::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Holds the tunables of the HTTP client, the decision engine and the
 * transfer engine. Library code reads it only through the option value
 * objects (ClientOptions, DecisionPolicy, EngineOptions), never directly.
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file, merged over the defaults
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config.merge_patch(json::parse(file));
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
            return false;
        } catch (const std::filesystem::filesystem_error&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            m_configPath = savePath;
            return true;

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Reset to the default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "1.0.0"},
            {"client", {
                {"timeoutSeconds", 30},
                {"probeTimeoutSeconds", 5},
                {"connectTimeoutSeconds", 10},
                {"maxRetries", 3},
                {"backoffBaseMillis", 1000},
                {"verifySsl", false},
                {"userAgent", "Flux/1.0.0"},
                {"maxPooledSessions", 32}
            }},
            {"decisions", {
                {"minSamples", 10},
                {"cooldownSeconds", 5.0},
                {"stableCv", 0.15},
                {"unstableCv", 0.30},
                {"highRttMs", 200.0},
                {"lowRttMs", 50.0},
                {"lowErrorRate", 0.05},
                {"highErrorRate", 0.10},
                {"minEfficiencyForScaleUp", 70.0},
                {"minChunkSize", 1024 * 1024},
                {"maxChunkSize", 16 * 1024 * 1024},
                {"minConnections", 1},
                {"maxConnections", 16}
            }},
            {"engine", {
                {"initialConnections", 8},
                {"fetchThreads", 32},
                {"outputDirectory", ""}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "client.maxRetries")
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path (e.g., "decisions.cooldownSeconds")
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            m_config[ptr] = value;
        } catch (const json::exception&) {
            // Invalid key path, nothing to set
        }
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * Convert dot notation to JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace flux::core
