#include "vibe/focus_bias.h"

#include <cctype>
#include <unordered_set>

namespace memeseed::vibe
{
namespace
{
static std::string ToLowerAscii(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
        c = (char)std::tolower((unsigned char)c);
    return out;
}

static std::string TrimAscii(std::string_view s)
{
    size_t b = 0;
    while (b < s.size() && std::isspace((unsigned char)s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace((unsigned char)s[e - 1]))
        --e;
    return std::string(s.substr(b, e - b));
}

static std::string DedupeKey(std::string_view s)
{
    return ToLowerAscii(TrimAscii(s));
}
} // namespace

FocusAliasRegistry FocusAliasRegistry::Defaults()
{
    FocusAliasRegistry r;
    r.Register("Seattle Seahawks", "Seahawks");
    r.Register("New England Patriots", "Patriots");
    return r;
}

void FocusAliasRegistry::Register(std::string key, std::string alias)
{
    m_entries.push_back(Entry{ToLowerAscii(key), std::move(alias)});
}

std::string FocusAliasRegistry::AliasFor(std::string_view label) const
{
    const std::string lower = ToLowerAscii(label);
    for (const auto& e : m_entries)
    {
        if (!e.key_lower.empty() && lower.find(e.key_lower) != std::string::npos)
            return e.alias;
    }
    return {};
}

FocusTerm FocusAliasRegistry::Resolve(std::string_view label) const
{
    FocusTerm t;
    t.label = std::string(label);
    t.alias = AliasFor(label);
    return t;
}

const FocusPools& DefaultFocusPools()
{
    static const FocusPools pools = {
        {
            {"Bad Bunny"},
            {"Geno Smith", "DK Metcalf", "Tyler Lockett", "Kenneth Walker", "Devon Witherspoon"},
            {"Drake Maye", "Rhamondre Stevenson", "Christian Gonzalez", "Jabrill Peppers", "Kyle Dugger"},
        },
        {"Seattle Seahawks", "New England Patriots"},
    };
    return pools;
}

std::vector<std::string> PickFocusTerms(const FocusPools& pools, IRandomSource& rng)
{
    std::vector<std::string> drawn;
    for (const auto& pool : pools.pools)
    {
        if (pool.empty())
            continue;
        drawn.push_back(pool[rng.NextIndex(pool.size())]);
    }
    drawn.insert(drawn.end(), pools.anchors.begin(), pools.anchors.end());

    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (auto& t : drawn)
    {
        const std::string k = DedupeKey(t);
        if (k.empty() || !seen.insert(k).second)
            continue;
        out.push_back(std::move(t));
    }
    return out;
}

std::vector<std::string> BiasKeywords(const std::vector<std::string>& keywords,
                                      const std::vector<std::string>& focus_terms,
                                      std::size_t top_k,
                                      const FocusAliasRegistry& aliases)
{
    std::vector<std::string> merged;
    if (top_k == 0)
        return merged;

    std::vector<std::string> ordered;
    ordered.reserve(focus_terms.size() + keywords.size());
    for (const auto& t : focus_terms)
        ordered.push_back(aliases.Resolve(t).Display());
    ordered.insert(ordered.end(), keywords.begin(), keywords.end());

    std::unordered_set<std::string> seen;
    for (auto& k : ordered)
    {
        const std::string key = DedupeKey(k);
        if (key.empty() || !seen.insert(key).second)
            continue;
        merged.push_back(std::move(k));
        if (merged.size() >= top_k)
            break;
    }
    return merged;
}

bool MatchesFocus(const Post& post, const std::vector<std::string>& focus_terms)
{
    const std::string hay = ToLowerAscii(PostText(post));
    for (const auto& t : focus_terms)
    {
        const std::string needle = ToLowerAscii(t);
        if (!needle.empty() && hay.find(needle) != std::string::npos)
            return true;
    }
    return false;
}

std::vector<const Post*> FilterByFocus(const std::vector<const Post*>& candidates,
                                       const std::vector<std::string>& focus_terms)
{
    if (focus_terms.empty())
        return candidates;

    std::vector<const Post*> hits;
    for (const Post* p : candidates)
    {
        if (p && MatchesFocus(*p, focus_terms))
            hits.push_back(p);
    }
    return hits.empty() ? candidates : hits;
}
} // namespace memeseed::vibe
