#include "vibe/keyword_extractor.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace memeseed::vibe
{
namespace
{
static const std::unordered_set<std::string_view>& StopWords()
{
    static const std::unordered_set<std::string_view> words = {
        "the",   "a",      "an",     "and",    "or",     "but",    "to",   "of",   "in",    "on",
        "for",   "with",   "at",     "by",     "from",   "as",     "is",   "are",  "was",   "were",
        "be",    "been",   "being",  "it",     "its",    "this",   "that", "these", "those", "you",
        "your",  "we",     "our",    "they",   "their",  "i",      "me",   "my",   "rt",    "vs",
        "game",  "thread", "highlight", "report", "per", "new",    "today", "team", "teams", "season",
        "super", "bowl",   "nfl",    "http",   "https",  "www",    "com",  "amp",
    };
    return words;
}

struct TermCount
{
    std::string term;
    std::size_t count = 0;
};
} // namespace

std::vector<std::string> TokenizeKeywords(std::string_view text)
{
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&]() {
        if (cur.size() >= 3)
            out.push_back(cur);
        cur.clear();
    };

    for (char ch : text)
    {
        const unsigned char c = (unsigned char)ch;
        if (c < 0x80 && std::isalpha(c))
            cur.push_back((char)std::tolower(c));
        else
            flush();
    }
    flush();
    return out;
}

bool IsStopWord(std::string_view lower_token)
{
    return StopWords().count(lower_token) != 0;
}

std::vector<const Post*> AlignedPosts(const std::vector<Post>& posts,
                                      MoodState mood,
                                      const AlignmentThresholds& thresholds)
{
    std::vector<const Post*> out;
    out.reserve(posts.size());
    for (const auto& p : posts)
    {
        bool keep = true;
        if (mood == MoodState::Positive)
            keep = p.polarity >= thresholds.positive_at_least;
        else if (mood == MoodState::Negative)
            keep = p.polarity <= thresholds.negative_at_most;
        if (keep)
            out.push_back(&p);
    }

    if (out.empty())
    {
        for (const auto& p : posts)
            out.push_back(&p);
    }
    return out;
}

std::vector<std::string> ExtractKeywords(const std::vector<Post>& posts,
                                         MoodState mood,
                                         std::size_t top_k,
                                         const AlignmentThresholds& thresholds)
{
    if (top_k == 0 || posts.empty())
        return {};

    std::vector<TermCount> counts;
    std::unordered_map<std::string, std::size_t> index;

    for (const Post* p : AlignedPosts(posts, mood, thresholds))
    {
        for (auto& tok : TokenizeKeywords(PostText(*p)))
        {
            if (IsStopWord(tok))
                continue;
            auto it = index.find(tok);
            if (it == index.end())
            {
                index.emplace(tok, counts.size());
                counts.push_back(TermCount{std::move(tok), 1});
            }
            else
            {
                counts[it->second].count++;
            }
        }
    }

    // `counts` is already in first-seen order, so a stable sort on count alone keeps the tie-break.
    std::stable_sort(counts.begin(), counts.end(), [](const TermCount& a, const TermCount& b) {
        return a.count > b.count;
    });

    std::vector<std::string> out;
    out.reserve(std::min(top_k, counts.size()));
    for (const auto& tc : counts)
    {
        if (out.size() >= top_k)
            break;
        out.push_back(tc.term);
    }
    return out;
}
} // namespace memeseed::vibe
