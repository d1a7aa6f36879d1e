#include "core/filename_sanitizer.hpp"

namespace
{
    bool isAsciiSpace(char c)
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
    }

    bool isContinuationByte(char c)
    {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }
}

bool FilenameSanitizer::isForbidden(char c)
{
    switch (c)
    {
    case '<':
    case '>':
    case ':':
    case '"':
    case '/':
    case '\\':
    case '|':
    case '?':
    case '*':
        return true;
    default:
        break;
    }

    const unsigned char uc = static_cast<unsigned char>(c);
    return (uc < 0x20 || uc == 0x7F) && !isAsciiSpace(c);
}

std::size_t FilenameSanitizer::codePointLength(const std::string &text)
{
    std::size_t count = 0;
    for (char c : text)
    {
        if (!isContinuationByte(c))
        {
            ++count;
        }
    }
    return count;
}

std::string FilenameSanitizer::sanitize(const std::string &raw)
{
    std::string collapsed;
    collapsed.reserve(raw.size());

    bool pending_space = false;
    for (char c : raw)
    {
        if (isAsciiSpace(c))
        {
            pending_space = !collapsed.empty();
            continue;
        }
        if (pending_space)
        {
            collapsed.push_back(' ');
            pending_space = false;
        }
        collapsed.push_back(isForbidden(c) ? '_' : c);
    }

    if (collapsed.empty())
    {
        return kPlaceholder;
    }

    // Keep whole code points while both the code point and the byte budget allow
    std::size_t seen = 0;
    std::size_t cut = 0;
    while (cut < collapsed.size())
    {
        std::size_t next = cut + 1;
        while (next < collapsed.size() && isContinuationByte(collapsed[next]))
        {
            ++next;
        }
        if (seen == kMaxLength || next > kMaxBytes)
        {
            break;
        }
        cut = next;
        ++seen;
    }

    if (cut == collapsed.size())
    {
        return collapsed;
    }
    return collapsed.substr(0, cut) + kEllipsis;
}
