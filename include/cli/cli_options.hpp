#pragma once

#include "core/playlist_types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Parsed command line
 *
 * Settings given on the command line are collected in `overrides`, a config patch
 * applied after the config file.
 */
struct CliOptions
{
    std::optional<std::string> url;
    std::optional<std::string> config_path;
    std::optional<std::string> report_path;
    nlohmann::json overrides = nlohmann::json::object();

    bool force_single = false;
    bool force_collection = false;
    bool check_only = false;
    bool assume_yes = false;
    bool show_help = false;

    /**
     * @brief Parse argv
     * @throws UsageError for unknown options, missing or malformed values
     */
    static CliOptions parse(int argc, const char *const argv[]);

    static CliOptions parse(const std::vector<std::string> &args);

    static std::string usage(const std::string &program);

    /**
     * @brief Reference for the URL, honoring --single/--collection
     */
    PlaylistRef playlistRef() const;
};
