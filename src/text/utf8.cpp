#include "text/utf8.h"

#include <cctype>

namespace memeseed::text
{
namespace
{
// Byte length of the sequence introduced by `c`, or 0 for a continuation/invalid lead byte.
static size_t SequenceLength(unsigned char c)
{
    if ((c & 0x80) == 0)
        return 1;
    if ((c & 0xE0) == 0xC0)
        return 2;
    if ((c & 0xF0) == 0xE0)
        return 3;
    if ((c & 0xF8) == 0xF0)
        return 4;
    return 0;
}
} // namespace

std::vector<char32_t> DecodeUtf8(std::string_view bytes)
{
    std::vector<char32_t> out;
    out.reserve(bytes.size());

    const unsigned char* data = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t len = bytes.size();
    size_t i = 0;
    while (i < len)
    {
        const unsigned char c = data[i];
        const size_t n = SequenceLength(c);
        if (n == 0)
        {
            ++i;
            continue;
        }
        if (i + n > len)
            break;

        char32_t cp = (n == 1) ? c : (char32_t)(c & (0x7F >> n));
        bool malformed = false;
        for (size_t j = 1; j < n; ++j)
        {
            const unsigned char cc = data[i + j];
            if ((cc & 0xC0) != 0x80)
            {
                malformed = true;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (malformed)
        {
            ++i;
            continue;
        }

        i += n;
        out.push_back(cp);
    }
    return out;
}

std::string Utf8Prefix(std::string_view bytes, std::size_t max_codepoints)
{
    size_t i = 0;
    size_t count = 0;
    while (i < bytes.size() && count < max_codepoints)
    {
        const size_t n = SequenceLength((unsigned char)bytes[i]);
        const size_t step = (n == 0 || i + n > bytes.size()) ? 1 : n;
        i += step;
        ++count;
    }
    return std::string(bytes.substr(0, i));
}

std::string ToUpperAscii(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
    {
        if ((unsigned char)c < 0x80)
            c = (char)std::toupper((unsigned char)c);
    }
    return out;
}

std::string TrimAscii(std::string_view s)
{
    size_t b = 0;
    while (b < s.size() && std::isspace((unsigned char)s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace((unsigned char)s[e - 1]))
        --e;
    return std::string(s.substr(b, e - b));
}
} // namespace memeseed::text
