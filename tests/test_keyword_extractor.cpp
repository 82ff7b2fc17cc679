#include "test.h"

#include "vibe/keyword_extractor.h"

using namespace memeseed;

namespace
{
Post MakePost(std::string title, std::string body, float polarity)
{
    Post p;
    p.title = std::move(title);
    p.body = std::move(body);
    p.polarity = polarity;
    return p;
}
} // namespace

TEST_CASE("TokenizeKeywords")
{
    const auto toks = vibe::TokenizeKeywords("Go HAWKS!! 12th-man, ok? touchdown");
    REQUIRE(toks.size() == 3);
    CHECK(toks[0] == "hawks");
    CHECK(toks[1] == "man");
    CHECK(toks[2] == "touchdown");

    CHECK(vibe::TokenizeKeywords("").empty());
    CHECK(vibe::TokenizeKeywords("a an ok 42").empty());
}

TEST_CASE("IsStopWord")
{
    CHECK(vibe::IsStopWord("the"));
    CHECK(vibe::IsStopWord("nfl"));
    CHECK(vibe::IsStopWord("https"));
    CHECK_FALSE(vibe::IsStopWord("seahawks"));
}

TEST_CASE("ExtractKeywords - ranked by frequency, ties in first-seen order")
{
    std::vector<Post> posts = {
        MakePost("Defense defense DEFENSE", "metcalf runs", 0.5f),
        MakePost("metcalf again", "what a catch", 0.6f),
        MakePost("refs", "refs refs refs refs", -0.8f),
    };

    const auto kw = vibe::ExtractKeywords(posts, MoodState::Positive, 4);
    REQUIRE(kw.size() == 4);
    CHECK(kw[0] == "defense");
    CHECK(kw[1] == "metcalf");
    CHECK(kw[2] == "runs");
    CHECK(kw[3] == "again");

    SUBCASE("deterministic")
    {
        for (int i = 0; i < 5; ++i)
            CHECK(vibe::ExtractKeywords(posts, MoodState::Positive, 4) == kw);
    }

    SUBCASE("negative mood aligns on the salty post")
    {
        const auto neg = vibe::ExtractKeywords(posts, MoodState::Negative, 2);
        REQUIRE_FALSE(neg.empty());
        CHECK(neg[0] == "refs");
        CHECK(neg.size() == 1);
    }

    SUBCASE("neutral uses every post")
    {
        const auto all = vibe::ExtractKeywords(posts, MoodState::Neutral, 1);
        REQUIRE(all.size() == 1);
        CHECK(all[0] == "refs");
    }
}

TEST_CASE("ExtractKeywords - empty aligned subset falls back to the whole batch")
{
    std::vector<Post> posts = {
        MakePost("kickoff chaos", "", 0.0f),
        MakePost("kickoff return", "", 0.05f),
    };

    const auto aligned = vibe::AlignedPosts(posts, MoodState::Positive);
    CHECK(aligned.size() == posts.size());

    const auto fallback = vibe::ExtractKeywords(posts, MoodState::Positive, 6);
    const auto full = vibe::ExtractKeywords(posts, MoodState::Neutral, 6);
    CHECK(fallback == full);
    REQUIRE_FALSE(full.empty());
    CHECK(full[0] == "kickoff");
}

TEST_CASE("ExtractKeywords - alignment thresholds are inclusive and configurable")
{
    std::vector<Post> posts = {
        MakePost("boundary", "", 0.10f),
        MakePost("below", "", 0.09f),
    };

    auto kw = vibe::ExtractKeywords(posts, MoodState::Positive, 6);
    REQUIRE(kw.size() == 1);
    CHECK(kw[0] == "boundary");

    vibe::AlignmentThresholds loose;
    loose.positive_at_least = 0.0f;
    kw = vibe::ExtractKeywords(posts, MoodState::Positive, 6, loose);
    CHECK(kw.size() == 2);
}

TEST_CASE("ExtractKeywords - degenerate input")
{
    CHECK(vibe::ExtractKeywords({}, MoodState::Neutral, 6).empty());

    std::vector<Post> posts = {MakePost("!!! ??? 123", "the and", 0.0f)};
    CHECK(vibe::ExtractKeywords(posts, MoodState::Neutral, 6).empty());
    CHECK(vibe::ExtractKeywords(posts, MoodState::Neutral, 0).empty());
}
