#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace memeseed
{
// One short social post as consumed by the pipeline.
//
// `polarity` and `event` are filled in by vibe::ClassifyPosts(); before that they are 0 / empty.
// Posts are request-scoped: built by a PostSource, classified once, then only read.
struct Post
{
    std::string id;
    std::string title;
    std::string body;
    std::int64_t created_at = 0; // unix seconds (0 when unknown)
    std::vector<std::string> image_urls;

    float polarity = 0.0f; // [-1, 1]
    std::optional<std::string> event;
};

enum class MoodState : std::uint8_t
{
    Neutral = 0,
    Positive,
    Negative,
};

// "POSITIVE" / "NEGATIVE" / "NEUTRAL"
std::string_view MoodStateName(MoodState mood);

// Meme-facing mood word: "HYPE" / "SALTY" / "NEUTRAL".
std::string_view MoodWord(MoodState mood);

// Axis-aligned rectangle in canvas pixels, half-open: [x0, x1) x [y0, y1).
struct LayoutBox
{
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;

    int Width() const { return x1 - x0; }
    int Height() const { return y1 - y0; }
    bool Valid() const { return x1 > x0 && y1 > y0; }
};

// Full searchable text of a post (title + newline + body).
std::string PostText(const Post& p);
} // namespace memeseed
