/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables and explicit overrides.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace webid::common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value (explicit override, then environment, then default)
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparseable values log a warning and fall back to the default.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value (true/false, 1/0, yes/no, on/off)
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value (takes precedence over the environment)
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicit override
     */
    void unset(const std::string& key);

    /**
     * @brief Load known keys from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Get environment variable
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    // Logging
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";

    // Profile fetching
    static constexpr const char* FETCH_TIMEOUT = "WEBID_FETCH_TIMEOUT";
    static constexpr const char* CONNECT_TIMEOUT = "WEBID_CONNECT_TIMEOUT";
    static constexpr const char* MAX_REDIRECTS = "WEBID_MAX_REDIRECTS";
    static constexpr const char* MAX_PROFILE_BYTES = "WEBID_MAX_PROFILE_BYTES";
    static constexpr const char* USER_AGENT = "WEBID_USER_AGENT";
};

} // namespace webid::common
