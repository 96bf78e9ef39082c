#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Process-wide configuration backed by Poco's JSONConfiguration
 *
 * Values are read once per session by the components that need them;
 * the engine never writes settings back except when a default config
 * file is created on first run.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    /**
     * @brief Load a .json, .yaml or .yml file merged over the defaults
     * @return false if the file is missing or cannot be parsed
     */
    bool load(const std::string &path);
    bool save(const std::string &path) const;

    // Load the file, or write the defaults to it when it does not exist yet
    bool loadOrCreate(const std::string &path);

    nlohmann::json getAll() const;
    void update(const nlohmann::json &patch);

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;
    uint64_t getUInt64(const std::string &key, uint64_t def) const;
    std::vector<std::string> getStringList(const std::string &key) const;
    bool hasKey(const std::string &key) const;

    // Application getters
    std::string getLogLevel() const;
    std::string getLogFile() const;
    int getLogMaxSizeMB() const;
    int getLogMaxFiles() const;
    std::string getDestinationRoot() const;
    int getWatcherPollIntervalMs() const;

    // Category-specific enabled extensions, lowercase without the dot
    std::vector<std::string> getEnabledImageExtensions() const;
    std::vector<std::string> getEnabledVideoExtensions() const;
    std::vector<std::string> getEnabledRawExtensions() const;
    std::vector<std::string> getEnabledExtensionsForCategory(const std::string &category) const;

    nlohmann::json getNestedConfig(const std::string &prefix) const;

    bool validateConfig() const;

    // Drop every loaded value and restore the built-in defaults
    void resetToDefaults();

    static nlohmann::json defaultConfig();

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void loadJsonDocument(const nlohmann::json &document);
    static bool readYamlFile(const std::string &path, nlohmann::json &out);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
