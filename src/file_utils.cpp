#include "core/file_utils.hpp"
#include "core/errors.hpp"
#include "core/filename_sanitizer.hpp"
#include <cerrno>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>

std::string FileUtils::tempStem(const ItemDescriptor &item)
{
    std::ostringstream stem;
    stem << ".tmp_" << std::setw(3) << std::setfill('0') << item.sequence_index << "_"
         << FilenameSanitizer::sanitize(item.id);
    return stem.str();
}

void FileUtils::ensureDirectory(const fs::path &dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        throw FilesystemError("Cannot create directory " + dir.string() + ": " + ec.message());
    }
    if (!isValidDirectory(dir))
    {
        throw FilesystemError("Not a directory: " + dir.string());
    }
}

void FileUtils::moveIntoPlace(const fs::path &from, const fs::path &to)
{
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec)
    {
        return;
    }

    if (ec.value() != EXDEV)
    {
        throw FilesystemError("Cannot move " + from.string() + " to " + to.string() + ": " + ec.message());
    }

    // Different file systems: copy next to the target first so the final step is still a rename
    fs::path staging = to;
    staging += ".part";
    fs::copy_file(from, staging, fs::copy_options::overwrite_existing, ec);
    if (!ec)
    {
        fs::rename(staging, to, ec);
    }
    if (ec)
    {
        removeQuietly(staging);
        throw FilesystemError("Cannot move " + from.string() + " to " + to.string() + ": " + ec.message());
    }
    removeQuietly(from);
}

bool FileUtils::removeQuietly(const fs::path &path)
{
    std::error_code ec;
    return fs::remove(path, ec);
}

std::size_t FileUtils::removeByPrefix(const fs::path &dir, const std::string &prefix)
{
    std::vector<fs::path> matches;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec))
    {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().filename().string().rfind(prefix, 0) == 0)
        {
            matches.push_back(it->path());
        }
    }

    std::size_t removed = 0;
    for (const auto &path : matches)
    {
        if (removeQuietly(path))
        {
            ++removed;
        }
    }
    return removed;
}

std::optional<fs::path> FileUtils::findByPrefix(const fs::path &dir, const std::string &prefix,
                                                const std::string &extension)
{
    fs::path candidate = dir / (prefix + "." + extension);
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec))
    {
        return candidate;
    }
    return std::nullopt;
}

bool FileUtils::isValidDirectory(const fs::path &path)
{
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_directory(path, ec);
}
