#pragma once

#include "core/playlist_types.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief File helpers shared by the media sources and the item processor
 */
class FileUtils
{
public:
    /**
     * @brief Prefix of every temporary artifact written for one item
     *
     * Zero-padded sequence index plus id, so concurrent items in one directory never
     * share a name: ".tmp_007_dQw4w9WgXcQ".
     */
    static std::string tempStem(const ItemDescriptor &item);

    /**
     * @brief Create directory and parents if missing
     * @throws FilesystemError if the directory cannot be created
     */
    static void ensureDirectory(const fs::path &dir);

    /**
     * @brief Move a completed file onto its final name
     *
     * Uses rename; across file systems falls back to copy then remove.
     * An existing target is replaced.
     *
     * @throws FilesystemError on failure
     */
    static void moveIntoPlace(const fs::path &from, const fs::path &to);

    /**
     * @brief Remove a file, ignoring errors
     * @return true if something was removed
     */
    static bool removeQuietly(const fs::path &path);

    /**
     * @brief Remove every regular file in dir whose name starts with prefix
     * @return Number of files removed
     */
    static std::size_t removeByPrefix(const fs::path &dir, const std::string &prefix);

    /**
     * @brief First regular file in dir named prefix + "." + extension
     */
    static std::optional<fs::path> findByPrefix(const fs::path &dir, const std::string &prefix,
                                                const std::string &extension);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const fs::path &path);
};
