#include "core/http_media_fetcher.hpp"
#include "core/error_recovery.hpp"
#include "core/errors.hpp"
#include <Poco/Exception.h>
#include <Poco/URI.h>
#include <fstream>
#include <httplib.h>
#include <system_error>

HttpMediaFetcher::HttpMediaFetcher(Settings settings, const Logger &logger)
    : settings_(settings), logger_(logger)
{
}

std::uint64_t HttpMediaFetcher::download(const std::string &url,
                                         const std::map<std::string, std::string> &headers,
                                         const std::filesystem::path &target,
                                         const ProgressCallback &progress) const
{
    return ErrorRecovery::retryWithBackoff(logger_, settings_.max_attempts, "download " + target.filename().string(),
                                           [&]()
                                           { return downloadOnce(url, headers, target, progress); });
}

std::uint64_t HttpMediaFetcher::downloadOnce(const std::string &url,
                                             const std::map<std::string, std::string> &headers,
                                             const std::filesystem::path &target,
                                             const ProgressCallback &progress) const
{
    Poco::URI uri;
    try
    {
        uri = Poco::URI(url);
    }
    catch (const Poco::SyntaxException &e)
    {
        throw ItemFetchError("Malformed stream URL: " + e.displayText());
    }
    if (uri.getScheme() != "http" && uri.getScheme() != "https")
    {
        throw ItemFetchError("Unsupported stream scheme: " + uri.getScheme());
    }

    const std::string origin = uri.getScheme() + "://" + uri.getHost() + ":" + std::to_string(uri.getPort());
    httplib::Client client(origin);
    client.set_follow_location(true);
    client.set_connection_timeout(settings_.connect_timeout);
    client.set_read_timeout(settings_.read_timeout);

    httplib::Headers request_headers;
    for (const auto &[name, value] : headers)
    {
        request_headers.emplace(name, value);
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        throw FilesystemError("Cannot open " + target.string() + " for writing");
    }

    std::uint64_t written = 0;
    auto result = client.Get(
        uri.getPathAndQuery(), request_headers,
        [&](const char *data, size_t length)
        {
            out.write(data, static_cast<std::streamsize>(length));
            written += length;
            return out.good();
        },
        [&](uint64_t current, uint64_t total)
        {
            if (progress && total > 0)
            {
                progress(static_cast<double>(current) / static_cast<double>(total));
            }
            return true;
        });
    out.close();

    std::string failure;
    if (!result)
    {
        failure = "HTTP request failed: " + httplib::to_string(result.error());
    }
    else if (result->status != 200 && result->status != 206)
    {
        failure = "HTTP status " + std::to_string(result->status);
    }
    else if (!out)
    {
        failure = "Write error on " + target.string();
    }

    if (!failure.empty())
    {
        std::error_code ec;
        std::filesystem::remove(target, ec);
        throw ItemFetchError(failure);
    }

    logger_.debug("Downloaded " + std::to_string(written) + " bytes to " + target.string());
    return written;
}
