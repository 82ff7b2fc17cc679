#include "test.h"

#include "vibe/event_detector.h"
#include "vibe/keyword_extractor.h"
#include "vibe/vibe_classifier.h"

#include <cstdio>
#include <fstream>
#include <map>

using namespace memeseed;

namespace
{
// Scores by exact text lookup; unknown text is neutral.
class TableScorer final : public vibe::ISentimentScorer
{
public:
    std::map<std::string, float> scores;

    float Score(std::string_view text) const override
    {
        auto it = scores.find(std::string(text));
        return it == scores.end() ? 0.0f : it->second;
    }
};

Post MakePost(std::string title, std::string body = {})
{
    Post p;
    p.title = std::move(title);
    p.body = std::move(body);
    return p;
}
} // namespace

TEST_CASE("ClassifyMood - thresholds are exclusive")
{
    CHECK(vibe::ClassifyMood(0.2f) == MoodState::Neutral);
    CHECK(vibe::ClassifyMood(-0.2f) == MoodState::Neutral);
    CHECK(vibe::ClassifyMood(0.0f) == MoodState::Neutral);
    CHECK(vibe::ClassifyMood(0.2001f) == MoodState::Positive);
    CHECK(vibe::ClassifyMood(-0.2001f) == MoodState::Negative);
    CHECK(vibe::ClassifyMood(1.0f) == MoodState::Positive);
    CHECK(vibe::ClassifyMood(-1.0f) == MoodState::Negative);

    SUBCASE("custom thresholds")
    {
        vibe::MoodThresholds th;
        th.positive_above = 0.5f;
        th.negative_below = -0.5f;
        CHECK(vibe::ClassifyMood(0.4f, th) == MoodState::Neutral);
        CHECK(vibe::ClassifyMood(0.6f, th) == MoodState::Positive);
    }
}

TEST_CASE("MeanPolarity")
{
    CHECK(vibe::MeanPolarity({}) == doctest::Approx(0.0f));

    std::vector<Post> posts(2);
    posts[0].polarity = 0.5f;
    posts[1].polarity = -0.1f;
    CHECK(vibe::MeanPolarity(posts) == doctest::Approx(0.2f));
}

TEST_CASE("Four positive posts outvote one negative")
{
    TableScorer scorer;
    std::vector<Post> posts;
    const float pol[] = {0.3f, 0.4f, 0.5f, 0.6f, -0.5f};
    for (int i = 0; i < 5; ++i)
    {
        const std::string title = "post" + std::to_string(i) + (i < 4 ? " victory parade" : " refs robbed");
        posts.push_back(MakePost(title));
        scorer.scores[PostText(posts.back())] = pol[i];
    }

    vibe::ClassifyPosts(posts, scorer);
    const float mean = vibe::MeanPolarity(posts);
    CHECK(mean == doctest::Approx(0.26f));
    CHECK(vibe::ClassifyMood(mean) == MoodState::Positive);

    const auto aligned = vibe::AlignedPosts(posts, MoodState::Positive);
    REQUIRE(aligned.size() == 4);
    for (const Post* p : aligned)
        CHECK(p->polarity > 0.0f);

    const auto kw = vibe::ExtractKeywords(posts, MoodState::Positive);
    CHECK(std::find(kw.begin(), kw.end(), "victory") != kw.end());
    CHECK(std::find(kw.begin(), kw.end(), "robbed") == kw.end());
}

TEST_CASE("ClassifyPosts fills polarity and event")
{
    vibe::LexiconScorer scorer;
    std::vector<Post> posts = {MakePost("What a TOUCHDOWN", "incredible catch!"), MakePost("quiet night")};
    vibe::ClassifyPosts(posts, scorer);

    CHECK(posts[0].polarity > 0.0f);
    REQUIRE(posts[0].event.has_value());
    CHECK(*posts[0].event == "TOUCHDOWN");
    CHECK_FALSE(posts[1].event.has_value());
    CHECK(posts[1].polarity == doctest::Approx(0.0f));
}

TEST_CASE("LexiconScorer")
{
    vibe::LexiconScorer scorer;

    CHECK(scorer.Score("") == doctest::Approx(0.0f));
    CHECK(scorer.Score("the and of") == doctest::Approx(0.0f));
    CHECK(scorer.Score("This is great") > 0.3f);
    CHECK(scorer.Score("terrible awful refs") < -0.3f);

    SUBCASE("range")
    {
        const float s = scorer.Score("LOVE LOVE LOVE amazing awesome best win wow!!!!");
        CHECK(s <= 1.0f);
        CHECK(s > 0.9f);
    }

    SUBCASE("negation flips the sign")
    {
        CHECK(scorer.Score("good") > 0.0f);
        CHECK(scorer.Score("not good") < 0.0f);
        CHECK(scorer.Score("isn't good") < 0.0f);
    }

    SUBCASE("boosters and exclamations strengthen")
    {
        CHECK(scorer.Score("very good") > scorer.Score("good"));
        CHECK(scorer.Score("good!!") > scorer.Score("good"));
        CHECK(scorer.Score("barely good") < scorer.Score("good"));
    }

    SUBCASE("but shifts weight to the second clause")
    {
        CHECK(scorer.Score("the defense was bad but the win was great") > 0.0f);
        CHECK(scorer.Score("the offense was great but the loss was awful") < 0.0f);
    }

    SUBCASE("lexicon file extends the table")
    {
        const std::string path = "memeseed_test_lexicon.txt";
        {
            std::ofstream f(path);
            f << "skol\t2.5\t0.5\t[2, 3, 2]\n";
            f << "garbage line without tab\n";
        }
        CHECK(scorer.Score("skol") == doctest::Approx(0.0f));
        std::string err;
        REQUIRE(scorer.LoadLexiconFile(path, err));
        CHECK(scorer.Score("skol") > 0.3f);
        std::remove(path.c_str());
    }

    SUBCASE("missing lexicon file reports an error")
    {
        std::string err;
        CHECK_FALSE(scorer.LoadLexiconFile("does/not/exist.txt", err));
        CHECK_FALSE(err.empty());
    }
}

TEST_CASE("ClassifyTexts")
{
    vibe::LexiconScorer scorer;
    CHECK(vibe::ClassifyTexts({}, scorer) == MoodState::Neutral);
    CHECK(vibe::ClassifyTexts({"great win", "amazing game"}, scorer) == MoodState::Positive);
    CHECK(vibe::ClassifyTexts({"terrible loss", "awful refs"}, scorer) == MoodState::Negative);
}

TEST_CASE("DetectEvent")
{
    CHECK(vibe::DetectEvent("Touchdown Seahawks!") == std::optional<std::string>("TOUCHDOWN"));
    CHECK(vibe::DetectEvent("that FUMBLE though") == std::optional<std::string>("FUMBLE"));
    CHECK(vibe::DetectEvent("halftime show was wild") == std::optional<std::string>("HALFTIME"));
    CHECK(vibe::DetectEvent("best ad of the night") == std::optional<std::string>("COMMERCIAL"));

    SUBCASE("first rule wins")
    {
        CHECK(vibe::DetectEvent("interception then touchdown") == std::optional<std::string>("TOUCHDOWN"));
    }

    SUBCASE("whole words only")
    {
        CHECK_FALSE(vibe::DetectEvent("bad call").has_value());
        CHECK_FALSE(vibe::DetectEvent("touchdowns galore").has_value());
        CHECK_FALSE(vibe::DetectEvent("").has_value());
    }
}
