#include "core/config_manager.hpp"
#include "core/errors.hpp"
#include "core/media_source_factory.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    constexpr int kMinBitrate = 32;
    constexpr int kMaxBitrate = 320;
    constexpr int kMaxConcurrency = 64;
    constexpr int kMaxRetries = 10;

    std::string lowercase(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    bool isConcurrentMode(const std::string &mode)
    {
        return mode == "concurrent" || mode == "bounded";
    }
}

ConfigManager::ConfigManager()
{
    cfg_ = new JSONConfiguration();
    update(defaults());
}

nlohmann::json ConfigManager::defaults()
{
    return nlohmann::json{
        {"output_dir", "downloads"},
        {"log_level", "INFO"},
        {"log_file", ""},
        {"api_key", ""},
        {"write_info_json", false},
        {"audio", {{"bitrate_kbps", 320}}},
        {"source", {{"backend", "ytdlp"}, {"ytdlp_path", "yt-dlp"}, {"ffmpeg_path", "ffmpeg"}}},
        {"scheduling", {{"mode", "sequential"}, {"concurrency_limit", 3}, {"inter_item_delay_ms", 1000}}},
        {"network", {{"retries", 3}, {"fetch_timeout_seconds", 300}}},
        {"transcode", {{"timeout_seconds", 600}}}};
}

void ConfigManager::loadFile(const std::filesystem::path &path)
{
    const std::string extension = lowercase(path.extension().string());
    nlohmann::json patch;

    if (extension == ".yaml" || extension == ".yml")
    {
        try
        {
            patch = yamlToJson(YAML::LoadFile(path.string()));
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError("Cannot read " + path.string() + ": " + e.what());
        }
    }
    else
    {
        std::ifstream in(path);
        if (!in.good())
        {
            throw ConfigError("Cannot open config file " + path.string());
        }
        patch = nlohmann::json::parse(in, nullptr, false);
        if (patch.is_discarded())
        {
            throw ConfigError("Invalid JSON in " + path.string());
        }
    }

    if (!patch.is_object() && !patch.is_null())
    {
        throw ConfigError("Config file " + path.string() + " must contain a mapping at top level");
    }
    update(patch);
}

void ConfigManager::save(const std::filesystem::path &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
    {
        throw ConfigError("Cannot write config file " + path.string());
    }
    cfg_->save(out);
}

nlohmann::json ConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void ConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyLocked("", patch);
}

void ConfigManager::applyLocked(const std::string &prefix, const nlohmann::json &node)
{
    if (node.is_object())
    {
        for (auto it = node.begin(); it != node.end(); ++it)
        {
            std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
            applyLocked(key, it.value());
        }
    }
    else if (node.is_null() || prefix.empty())
    {
        return;
    }
    else if (node.is_boolean())
        cfg_->setBool(prefix, node.get<bool>());
    else if (node.is_number_integer())
        cfg_->setInt(prefix, node.get<int>());
    else if (node.is_number_float())
        cfg_->setDouble(prefix, node.get<double>());
    else if (node.is_string())
        cfg_->setString(prefix, node.get<std::string>());
    else
        cfg_->setString(prefix, node.dump());
}

std::string ConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int ConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        throw ConfigError("Setting " + key + " must be an integer");
    }
}

bool ConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        throw ConfigError("Setting " + key + " must be a boolean");
    }
}

void ConfigManager::validate() const
{
    if (getString("output_dir", "").empty())
    {
        throw ConfigError("output_dir must not be empty");
    }

    int bitrate = getInt("audio.bitrate_kbps", 320);
    if (bitrate < kMinBitrate || bitrate > kMaxBitrate)
    {
        throw ConfigError("audio.bitrate_kbps must be between " + std::to_string(kMinBitrate) + " and " +
                          std::to_string(kMaxBitrate) + ", got " + std::to_string(bitrate));
    }

    std::string mode = getString("scheduling.mode", "sequential");
    if (mode != "sequential" && !isConcurrentMode(mode))
    {
        throw ConfigError("scheduling.mode must be 'sequential' or 'concurrent', got '" + mode + "'");
    }

    int limit = getInt("scheduling.concurrency_limit", 3);
    if (limit < 1 || limit > kMaxConcurrency)
    {
        throw ConfigError("scheduling.concurrency_limit must be between 1 and " + std::to_string(kMaxConcurrency));
    }

    if (getInt("scheduling.inter_item_delay_ms", 1000) < 0)
    {
        throw ConfigError("scheduling.inter_item_delay_ms must not be negative");
    }

    if (!MediaSourceFactory::isKnownBackend(backend()))
    {
        throw ConfigError("source.backend must be 'ytdlp' or 'two_stage', got '" + backend() + "'");
    }

    const int retries = getInt("network.retries", 3);
    if (retries < 0 || retries > kMaxRetries)
    {
        throw ConfigError("network.retries must be between 0 and " + std::to_string(kMaxRetries) +
                          ", got " + std::to_string(retries));
    }
    if (getInt("network.fetch_timeout_seconds", 300) < 0 || getInt("transcode.timeout_seconds", 600) < 0)
    {
        throw ConfigError("Timeouts must not be negative");
    }

    if (!Logger::isValidLevel(logLevel()))
    {
        throw ConfigError("log_level must be one of TRACE, DEBUG, INFO, WARN, ERROR");
    }
}

RunConfig ConfigManager::toRunConfig() const
{
    validate();

    RunConfig config;
    config.output_dir = getString("output_dir", "downloads");
    config.bitrate_kbps = getInt("audio.bitrate_kbps", 320);
    config.scheduling = isConcurrentMode(getString("scheduling.mode", "sequential"))
                            ? SchedulingMode::BOUNDED_CONCURRENCY
                            : SchedulingMode::SEQUENTIAL;
    config.concurrency_limit = static_cast<std::size_t>(getInt("scheduling.concurrency_limit", 3));
    config.inter_item_delay = std::chrono::milliseconds(getInt("scheduling.inter_item_delay_ms", 1000));

    std::string api_key = getString("api_key", "");
    if (!api_key.empty())
    {
        config.api_key = api_key;
    }
    std::string title = getString("custom_title", "");
    if (!title.empty())
    {
        config.custom_title = title;
    }
    return config;
}

YtDlpSettings ConfigManager::toYtDlpSettings() const
{
    YtDlpSettings settings;
    settings.executable = getString("source.ytdlp_path", "yt-dlp");
    settings.ffmpeg_location = getString("source.ffmpeg_path", "ffmpeg");
    if (settings.ffmpeg_location == "ffmpeg")
    {
        // Plain name: leave discovery on PATH to yt-dlp
        settings.ffmpeg_location.clear();
    }
    settings.fetch_timeout = std::chrono::seconds(getInt("network.fetch_timeout_seconds", 300));
    settings.transcode_timeout = std::chrono::seconds(getInt("transcode.timeout_seconds", 600));
    settings.retries = getInt("network.retries", 3);
    settings.write_info_json = getBool("write_info_json", false);
    return settings;
}

nlohmann::json ConfigManager::yamlToJson(const YAML::Node &node)
{
    switch (node.Type())
    {
    case YAML::NodeType::Map:
    {
        nlohmann::json object = nlohmann::json::object();
        for (const auto &entry : node)
        {
            object[entry.first.as<std::string>()] = yamlToJson(entry.second);
        }
        return object;
    }
    case YAML::NodeType::Sequence:
    {
        nlohmann::json array = nlohmann::json::array();
        for (const auto &element : node)
        {
            array.push_back(yamlToJson(element));
        }
        return array;
    }
    case YAML::NodeType::Scalar:
    {
        // Quoted scalars stay strings ("320" in quotes is text)
        if (node.Tag() == "!")
        {
            return node.Scalar();
        }
        bool flag = false;
        if (YAML::convert<bool>::decode(node, flag))
        {
            return flag;
        }
        long long integer = 0;
        if (YAML::convert<long long>::decode(node, integer))
        {
            return integer;
        }
        double number = 0.0;
        if (YAML::convert<double>::decode(node, number))
        {
            return number;
        }
        return node.Scalar();
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        break;
    }
    return nullptr;
}
