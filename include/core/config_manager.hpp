#pragma once

#include "core/playlist_types.hpp"
#include "core/ytdlp_client.hpp"
#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <yaml-cpp/yaml.h>

/**
 * @brief Layered application settings
 *
 * Starts from built-in defaults; a JSON or YAML file and then command-line overrides
 * are applied on top as patches. Keys use dotted paths ("audio.bitrate_kbps").
 */
class ConfigManager
{
public:
    ConfigManager();

    /**
     * @brief Merge a .json, .yaml or .yml file over the current values
     * @throws ConfigError if the file cannot be read or parsed
     */
    void loadFile(const std::filesystem::path &path);

    /**
     * @brief Write the current values as JSON
     * @throws ConfigError if the file cannot be written
     */
    void save(const std::filesystem::path &path) const;

    nlohmann::json getAll() const;

    /**
     * @brief Apply a nested patch; null values are ignored
     */
    void update(const nlohmann::json &patch);

    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;

    /**
     * @brief Check ranges and enumerations
     * @throws ConfigError naming the first invalid key
     */
    void validate() const;

    /**
     * @brief Validated per-run settings
     * @throws ConfigError if validation fails
     */
    RunConfig toRunConfig() const;

    YtDlpSettings toYtDlpSettings() const;

    std::string backend() const { return getString("source.backend", "ytdlp"); }
    std::string logLevel() const { return getString("log_level", "INFO"); }
    std::string logFile() const { return getString("log_file", ""); }

    static nlohmann::json defaults();

    /**
     * @brief Convert a YAML document to JSON, typing scalars as bool, integer, float or string
     */
    static nlohmann::json yamlToJson(const YAML::Node &node);

private:
    void applyLocked(const std::string &prefix, const nlohmann::json &node);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
