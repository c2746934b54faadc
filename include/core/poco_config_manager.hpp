#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/dedup_config.hpp"

/**
 * @brief Configuration store for duplicate check runs
 *
 * Settings live in a Poco JSONConfiguration seeded with the DedupConfig
 * defaults. Files (JSON or YAML) are merged over the defaults.
 */
class PocoConfigManager
{
public:
    PocoConfigManager();

    /**
     * @brief Merge a configuration file over the defaults
     * @param path .json, .yaml or .yml file
     * @return false if the file is missing or cannot be parsed
     */
    bool load(const std::string &path);

    /**
     * @brief Write the current settings as JSON
     */
    bool save(const std::string &path) const;

    nlohmann::json getAll() const;

    /**
     * @brief Merge a JSON patch; nested objects become dotted keys
     */
    void update(const nlohmann::json &patch);

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    int64_t getInt64(const std::string &key, int64_t def) const;
    bool getBool(const std::string &key, bool def) const;

    /**
     * @brief Materialise the settings used by the pipeline
     * Values that fail validation keep their defaults.
     */
    DedupConfig getDedupConfig() const;

    /**
     * @brief Check value ranges, logging every problem found
     * @return List of problems, empty if the configuration is valid
     */
    std::vector<std::string> validateConfig() const;

    /**
     * @brief The default settings as a JSON tree
     */
    static nlohmann::json defaultConfig();

private:
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;

    void resetToDefaults();
    void applyPatch(const nlohmann::json &patch);
    nlohmann::json toJson() const;
};
