#pragma once

#include "core/post.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace memeseed::vibe
{
// Per-post polarity bounds used to pick the posts that "agree" with the batch mood.
// Inclusive, and deliberately independent of MoodThresholds.
struct AlignmentThresholds
{
    float positive_at_least = 0.10f;
    float negative_at_most = -0.10f;
};

constexpr std::size_t kDefaultTopK = 6;

// Lowercase runs of >= 3 ASCII letters, in order of appearance. Stop words are kept.
std::vector<std::string> TokenizeKeywords(std::string_view text);

// True for articles, pronouns and feed noise ("game", "nfl", "thread", "https", ...).
bool IsStopWord(std::string_view lower_token);

// Posts whose polarity agrees with `mood` (all posts for NEUTRAL), in input order.
// Falls back to the full batch when nothing agrees.
std::vector<const Post*> AlignedPosts(const std::vector<Post>& posts,
                                      MoodState mood,
                                      const AlignmentThresholds& thresholds = {});

// Frequency-ranked keywords from the title + body of the mood-aligned posts.
// Ties keep first-seen order. Deterministic for a given batch, mood and top_k.
std::vector<std::string> ExtractKeywords(const std::vector<Post>& posts,
                                         MoodState mood,
                                         std::size_t top_k = kDefaultTopK,
                                         const AlignmentThresholds& thresholds = {});
} // namespace memeseed::vibe
