#pragma once

#include <cstddef>
#include <string>

/**
 * @brief Maps arbitrary titles to safe, length-bounded file names
 */
class FilenameSanitizer
{
public:
    static constexpr std::size_t kMaxLength = 200;
    // Leaves room for a sequence prefix and ".mp3.part" within NAME_MAX (255 bytes)
    static constexpr std::size_t kMaxBytes = 230;
    static constexpr const char *kEllipsis = "...";
    static constexpr const char *kPlaceholder = "_";

    /**
     * @brief Sanitize a title for use as a file name
     *
     * Characters illegal on common file systems become '_', whitespace runs collapse
     * to one space and are trimmed, and anything longer than kMaxLength code points or
     * kMaxBytes bytes is cut at a code point boundary and suffixed with kEllipsis.
     * Never returns an empty string.
     *
     * @param raw Title as reported by the media source (UTF-8)
     * @return Sanitized name without extension
     */
    static std::string sanitize(const std::string &raw);

    /**
     * @brief Number of UTF-8 code points in a string
     */
    static std::size_t codePointLength(const std::string &text);

    static bool isForbidden(char c);
};
