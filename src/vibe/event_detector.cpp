#include "vibe/event_detector.h"

#include <cctype>
#include <vector>

namespace memeseed::vibe
{
namespace
{
struct EventRule
{
    const char* words[2];
    const char* tag;
};

static const EventRule kRules[] = {
    {{"touchdown", nullptr}, "TOUCHDOWN"},
    {{"fumble", nullptr}, "FUMBLE"},
    {{"interception", nullptr}, "INTERCEPTION"},
    {{"halftime", nullptr}, "HALFTIME"},
    {{"commercial", "ad"}, "COMMERCIAL"},
};

// Word = run of [A-Za-z0-9_], matching a regex \b boundary.
static bool IsWordChar(unsigned char c)
{
    return std::isalnum(c) || c == '_';
}

static std::vector<std::string> LowerWords(std::string_view text)
{
    std::vector<std::string> out;
    std::string cur;
    for (char ch : text)
    {
        const unsigned char c = (unsigned char)ch;
        if (IsWordChar(c))
        {
            cur.push_back((char)std::tolower(c));
        }
        else if (!cur.empty())
        {
            out.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!cur.empty())
        out.push_back(std::move(cur));
    return out;
}
} // namespace

std::optional<std::string> DetectEvent(std::string_view text)
{
    const std::vector<std::string> words = LowerWords(text);
    if (words.empty())
        return std::nullopt;

    for (const EventRule& rule : kRules)
    {
        for (const char* w : rule.words)
        {
            if (!w)
                continue;
            for (const auto& tok : words)
            {
                if (tok == w)
                    return std::string(rule.tag);
            }
        }
    }
    return std::nullopt;
}
} // namespace memeseed::vibe
