#include "core/post.h"

namespace memeseed
{
std::string_view MoodStateName(MoodState mood)
{
    switch (mood)
    {
    case MoodState::Positive: return "POSITIVE";
    case MoodState::Negative: return "NEGATIVE";
    case MoodState::Neutral:  return "NEUTRAL";
    }
    return "NEUTRAL";
}

std::string_view MoodWord(MoodState mood)
{
    switch (mood)
    {
    case MoodState::Positive: return "HYPE";
    case MoodState::Negative: return "SALTY";
    case MoodState::Neutral:  return "NEUTRAL";
    }
    return "NEUTRAL";
}

std::string PostText(const Post& p)
{
    std::string out;
    out.reserve(p.title.size() + 1 + p.body.size());
    out += p.title;
    out.push_back('\n');
    out += p.body;
    return out;
}
} // namespace memeseed
