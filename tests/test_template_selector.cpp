#include "test.h"

#include "vibe/template_selector.h"

using namespace memeseed;

namespace
{
vibe::TemplateInputs HypeInputs()
{
    vibe::TemplateInputs in;
    in.mood = MoodState::Positive;
    in.keywords = {"metcalf", "defense", "touchdown", "extra"};
    in.event = "TOUCHDOWN";
    in.topic = "super bowl";
    in.business = "Harbor Tap";
    in.offer = "2-for-1 wings";
    return in;
}
} // namespace

TEST_CASE("SelectTemplate - pinned draw, no embellishments")
{
    test::ScriptedRandom rng({0.9, 0.9}, {0});
    const auto t = vibe::SelectTemplate(HypeInputs(), rng);

    CHECK(rng.index_calls == 1);
    CHECK(rng.unit_calls == 2);
    CHECK(t.headline == "LIVE REACTION CHECK");
    CHECK(t.subline == "HYPE: METCALF \xE2\x80\xA2 DEFENSE \xE2\x80\xA2 TOUCHDOWN");
}

TEST_CASE("SelectTemplate - embellishments")
{
    SUBCASE("offer tag")
    {
        test::ScriptedRandom rng({0.1, 0.9}, {0});
        const auto t = vibe::SelectTemplate(HypeInputs(), rng);
        CHECK(t.subline == "HYPE: METCALF \xE2\x80\xA2 DEFENSE \xE2\x80\xA2 TOUCHDOWN \xE2\x80\xA2 2-FOR-1 WINGS");
        CHECK(t.headline == "LIVE REACTION CHECK");
    }

    SUBCASE("business tag upper-cases the headline")
    {
        test::ScriptedRandom rng({0.9, 0.05}, {0});
        const auto t = vibe::SelectTemplate(HypeInputs(), rng);
        CHECK(t.headline == "LIVE REACTION CHECK @ HARBOR TAP");
    }

    SUBCASE("thresholds are strict")
    {
        test::ScriptedRandom rng({vibe::kOfferTagChance, vibe::kBusinessTagChance}, {0});
        const auto t = vibe::SelectTemplate(HypeInputs(), rng);
        CHECK(t.headline == "LIVE REACTION CHECK");
        CHECK(t.subline.find("WINGS") == std::string::npos);
    }
}

TEST_CASE("SelectTemplate - mood catalogs and event slot")
{
    CHECK(vibe::TemplatePoolSize(MoodState::Positive) == 9);
    CHECK(vibe::TemplatePoolSize(MoodState::Negative) == 9);
    CHECK(vibe::TemplatePoolSize(MoodState::Neutral) == 9);

    // Index 5 is the first mood-specific template.
    test::ScriptedRandom rng({0.9, 0.9}, {5});
    const auto t = vibe::SelectTemplate(HypeInputs(), rng);
    CHECK(t.headline == "WE ARE SO BACK");
    CHECK(t.subline == "TOUCHDOWN GOT ME LIKE METCALF");

    SUBCASE("missing event falls back to the topic")
    {
        auto in = HypeInputs();
        in.event.reset();
        test::ScriptedRandom r2({0.9, 0.9}, {5});
        CHECK(vibe::SelectTemplate(in, r2).subline == "SUPER BOWL GOT ME LIKE METCALF");
    }
}

TEST_CASE("SelectTemplate - keyword fallbacks")
{
    vibe::TemplateInputs in;
    in.mood = MoodState::Negative;
    in.topic = "  ";

    test::ScriptedRandom rng({0.9, 0.9}, {0});
    const auto t = vibe::SelectTemplate(in, rng);
    CHECK(t.subline == "SALTY: THE GAME \xE2\x80\xA2 VIBES \xE2\x80\xA2 CHAOS");
}

TEST_CASE("SelectTemplate - every pick is filled in")
{
    for (MoodState mood : {MoodState::Positive, MoodState::Negative, MoodState::Neutral})
    {
        auto in = HypeInputs();
        in.mood = mood;
        for (std::size_t i = 0; i < vibe::TemplatePoolSize(mood); ++i)
        {
            test::ScriptedRandom rng({0.9, 0.9}, {i});
            const auto t = vibe::SelectTemplate(in, rng);
            CHECK_FALSE(t.headline.empty());
            CHECK_FALSE(t.subline.empty());
            CHECK(t.headline.find('{') == std::string::npos);
            CHECK(t.subline.find('{') == std::string::npos);
        }
    }
}
