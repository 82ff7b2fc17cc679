#include "test.h"

#include "compose/meme_composer.h"
#include "io/image_loader.h"
#include "io/meme_metadata_json.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>

using namespace memeseed;

namespace
{
class TableScorer final : public vibe::ISentimentScorer
{
public:
    std::map<std::string, float> by_title;

    float Score(std::string_view text) const override
    {
        for (const auto& [title, score] : by_title)
            if (text.substr(0, title.size()) == title)
                return score;
        return 0.0f;
    }
};

Post MakePost(std::string title, std::string body, std::vector<std::string> urls = {})
{
    Post p;
    p.title = std::move(title);
    p.body = std::move(body);
    p.image_urls = std::move(urls);
    return p;
}

struct Harness
{
    TableScorer scorer;
    test::ScriptedRandom rng;
    test::MapImageFetcher fetcher;
    test::FixedFontProvider fonts;

    explicit Harness(test::ScriptedRandom r = {}) : rng(std::move(r)) {}

    compose::RenderedMeme Run(std::vector<Post> posts, const compose::StyleConfig& cfg, const std::atomic<bool>* cancel = nullptr)
    {
        compose::ComposeServices services{scorer, rng, fetcher, fonts};
        services.cancel = cancel;
        compose::RenderedMeme out;
        std::string err;
        REQUIRE(compose::Compose(std::move(posts), cfg, services, out, err));
        return out;
    }
};
} // namespace

TEST_CASE("Compose - grid with no images degrades to one placeholder tile")
{
    Harness h;
    compose::StyleConfig cfg;
    cfg.tiles = 4;

    const auto meme = h.Run({MakePost("Kickoff soon", "tailgate chili"), MakePost("Warmups", "tailgate weather")}, cfg);
    const auto& m = meme.metadata;

    CHECK(m.tiles_requested == 4);
    CHECK(m.tiles_used == 1);
    CHECK(m.images_requested == 0);
    CHECK(m.images_used == 0);
    CHECK(m.style == compose::MemeStyleKind::Grid);
    CHECK(meme.image.width == 1024);
    CHECK(meme.image.height == 1024);
    CHECK_FALSE(meme.png.empty());

    // The notice box is on the canvas.
    CHECK(meme.image.RgbAt(3, 205) == raster::Rgb8{0, 0, 0});
    // CTA band.
    CHECK(meme.image.RgbAt(2, 1020) == raster::Rgb8{255, 213, 79});

    REQUIRE_FALSE(m.keywords.empty());
    CHECK(m.keywords[0] == "tailgate");
    CHECK(m.headline.rfind("NEUTRAL \xE2\x80\xA2 TAILGATE", 0) == 0);
    CHECK(m.subline == "15% OFF \xE2\x80\x94 local pizza shop");
    CHECK(meme.caption.rfind("Mood: NEUTRAL. Keywords: tailgate", 0) == 0);
    const std::string tail = ". 15% OFF at local pizza shop tonight.";
    REQUIRE(meme.caption.size() > tail.size());
    CHECK(meme.caption.compare(meme.caption.size() - tail.size(), tail.size(), tail) == 0);
}

TEST_CASE("Compose - selected images that fail to load are reported, not fatal")
{
    Harness h;
    compose::StyleConfig cfg;
    cfg.tiles = 2;

    std::vector<Post> posts = {
        MakePost("first post", "", {"https://i.redd.it/missing1.jpg"}),
        MakePost("second post", "", {"https://i.redd.it/garbage.jpg"}),
    };
    h.fetcher.bytes["https://i.redd.it/garbage.jpg"] = {1, 2, 3, 4};

    const auto meme = h.Run(posts, cfg);
    const auto& m = meme.metadata;
    CHECK(m.images_requested == 2);
    CHECK(m.images_used == 0);
    CHECK(m.tiles_used == 1);
    CHECK(m.image_urls_used.size() == 2);
    CHECK(m.image_errors.size() == 2);
}

TEST_CASE("Compose - grid samples tiles from image posts")
{
    test::ScriptedRandom rng({}, {4, 0, 0, 0});
    Harness h(rng);
    compose::StyleConfig cfg;
    cfg.tiles = 4;
    cfg.width = 256;
    cfg.height = 256;

    std::vector<Post> posts;
    for (int i = 0; i < 6; ++i)
    {
        const std::string url = "https://i.redd.it/p" + std::to_string(i) + ".png";
        posts.push_back(MakePost("post number " + std::to_string(i), "", {url, url + "?second"}));
        h.fetcher.bytes[url] = test::SolidPng(8, 8, raster::Rgb8{0, 200, 0});
    }
    posts.push_back(MakePost("text only", "no pictures"));

    const auto meme = h.Run(posts, cfg);
    const auto& m = meme.metadata;
    REQUIRE(m.image_urls_used.size() == 4);
    // Sampling draws without replacement; the first draw picks index 4.
    CHECK(m.image_urls_used[0] == "https://i.redd.it/p4.png");
    for (const auto& u : m.image_urls_used)
        CHECK(u.find("?second") == std::string::npos);
    CHECK(m.images_used == 4);
    CHECK(m.tiles_used == 4);
}

TEST_CASE("Compose - four positive posts and one negative read as HYPE")
{
    Harness h;
    std::vector<Post> posts = {
        MakePost("p1 parade", "confetti"),
        MakePost("p2 parade", "confetti"),
        MakePost("p3 parade", "trophy"),
        MakePost("p4 parade", "trophy"),
        MakePost("n1 refs", "robbed robbed robbed"),
    };
    h.scorer.by_title = {{"p1", 0.3f}, {"p2", 0.4f}, {"p3", 0.5f}, {"p4", 0.6f}, {"n1", -0.5f}};

    const auto meme = h.Run(posts, compose::StyleConfig{});
    CHECK(meme.metadata.mood == MoodState::Positive);
    CHECK(meme.metadata.mean_polarity == doctest::Approx(0.26f));
    CHECK(meme.metadata.post_count == 5);
    REQUIRE_FALSE(meme.metadata.keywords.empty());
    CHECK(meme.metadata.keywords[0] == "parade");
    for (const auto& k : meme.metadata.keywords)
        CHECK(k != "robbed");
}

TEST_CASE("Compose - classic with two related images splits the canvas")
{
    // candidate 0, coin 0.1 (< 0.5: two images), sample [0, 1], then template 0 with no tags.
    test::ScriptedRandom rng({0.1, 0.9, 0.9}, {0, 0, 0, 0});
    Harness h(rng);
    h.fetcher.bytes["https://i.redd.it/a.png"] = test::SolidPng(16, 16, raster::Rgb8{255, 0, 0});
    h.fetcher.bytes["https://i.redd.it/b.png"] = test::SolidPng(16, 16, raster::Rgb8{0, 0, 255});

    compose::StyleConfig cfg;
    cfg.style = compose::MemeStyleKind::Classic;
    cfg.two_image_background = true;
    cfg.width = 400;
    cfg.height = 400;

    const auto meme = h.Run({MakePost("Two angles of the catch", "unreal", {"https://i.redd.it/a.png", "https://i.redd.it/b.png"})}, cfg);
    const auto& m = meme.metadata;

    CHECK(m.style == compose::MemeStyleKind::Classic);
    CHECK(m.images_requested == 2);
    CHECK(m.images_used == 2);
    CHECK(m.tiles_used == 1);
    REQUIRE(m.image_urls_used.size() == 2);
    CHECK(m.image_urls_used[0] == "https://i.redd.it/a.png");
    CHECK(m.image_urls_used[1] == "https://i.redd.it/b.png");

    const auto left = meme.image.RgbAt(2, 200);
    const auto right = meme.image.RgbAt(397, 200);
    CHECK(left.r > 150);
    CHECK(left.b == 0);
    CHECK(right.b > 150);
    CHECK(right.r == 0);

    CHECK(m.headline == "LIVE REACTION CHECK");
    CHECK(meme.caption == m.headline + " \xE2\x80\x94 " + m.subline + ". 15% OFF at local pizza shop.");

    SUBCASE("the PNG decodes to the canvas size")
    {
        raster::RgbaImage decoded;
        std::string err;
        REQUIRE(image_loader::DecodeImage(meme.png, decoded, err));
        CHECK(decoded.width == 400);
        CHECK(decoded.height == 400);
        CHECK(decoded.RgbAt(2, 200) == left);
    }
}

TEST_CASE("Compose - classic without the two-image option uses one photo")
{
    test::ScriptedRandom rng({}, {0, 1});
    Harness h(rng);
    h.fetcher.bytes["https://i.redd.it/b.png"] = test::SolidPng(16, 16, raster::Rgb8{0, 0, 255});

    compose::StyleConfig cfg;
    cfg.style = compose::MemeStyleKind::Classic;
    cfg.two_image_background = false;
    cfg.width = 300;
    cfg.height = 300;

    const auto meme = h.Run({MakePost("Two angles of the catch", "", {"https://i.redd.it/a.png", "https://i.redd.it/b.png"})}, cfg);
    REQUIRE(meme.metadata.image_urls_used.size() == 1);
    CHECK(meme.metadata.image_urls_used[0] == "https://i.redd.it/b.png");
    CHECK(meme.metadata.images_used == 1);
    CHECK(meme.image.RgbAt(2, 150).b > 150);
    CHECK(meme.image.RgbAt(297, 150).b > 150);
}

TEST_CASE("Compose - focus bias steers keywords and images")
{
    Harness h;
    compose::StyleConfig cfg;
    cfg.focus_bias = true;
    cfg.tiles = 1;
    cfg.width = 256;
    cfg.height = 256;

    std::vector<Post> posts = {
        MakePost("Random sideline shot", "", {"https://i.redd.it/other.png"}),
        MakePost("Bad Bunny halftime", "", {"https://i.redd.it/bunny.png"}),
    };
    h.fetcher.bytes["https://i.redd.it/bunny.png"] = test::SolidPng(4, 4, raster::Rgb8{200, 0, 200});

    const auto meme = h.Run(posts, cfg);
    const auto& m = meme.metadata;
    REQUIRE(m.focus_terms.size() == 5);
    CHECK(m.focus_terms[0] == "Bad Bunny");
    REQUIRE(m.keywords.size() >= 4);
    CHECK(m.keywords[0] == "Bad Bunny");
    CHECK(std::find(m.keywords.begin(), m.keywords.end(), "Seahawks") != m.keywords.end());
    REQUIRE(m.image_urls_used.size() == 1);
    CHECK(m.image_urls_used[0] == "https://i.redd.it/bunny.png");
}

TEST_CASE("Compose - cancellation falls back to placeholders")
{
    Harness h;
    compose::StyleConfig cfg;
    cfg.tiles = 1;
    h.fetcher.bytes["https://i.redd.it/a.png"] = test::SolidPng(4, 4, raster::Rgb8{255, 0, 0});

    std::atomic<bool> cancel{true};
    const auto meme = h.Run({MakePost("a post", "", {"https://i.redd.it/a.png"})}, cfg, &cancel);
    CHECK(meme.metadata.images_requested == 1);
    CHECK(meme.metadata.images_used == 0);
    CHECK(meme.metadata.tiles_used == 1);
    CHECK(meme.image.width == 1024);
}

TEST_CASE("Compose - empty batch still renders")
{
    Harness h;
    const auto meme = h.Run({}, compose::StyleConfig{});
    CHECK(meme.metadata.post_count == 0);
    CHECK(meme.metadata.mood == MoodState::Neutral);
    CHECK(meme.metadata.keywords.empty());
    CHECK_FALSE(meme.png.empty());

    SUBCASE("classic too")
    {
        compose::StyleConfig cfg;
        cfg.style = compose::MemeStyleKind::Classic;
        Harness h2;
        const auto classic = h2.Run({}, cfg);
        CHECK(classic.image.RgbAt(2, 500) == compose::kPlaceholderColor);
        CHECK_FALSE(classic.metadata.headline.empty());
    }
}

TEST_CASE("Compose - fonts without outlines are flagged")
{
    Harness h;
    test::FixedFontProvider flat(false);
    compose::ComposeServices services{h.scorer, h.rng, h.fetcher, flat};
    compose::RenderedMeme out;
    std::string err;
    REQUIRE(compose::Compose({MakePost("hello there", "")}, compose::StyleConfig{}, services, out, err));
    CHECK(out.metadata.stroke_fallback);
}

TEST_CASE("MemeMetadataToJson")
{
    compose::MemeMetadata m;
    m.mood = MoodState::Negative;
    m.keywords = {"refs", "flag"};
    m.style = compose::MemeStyleKind::Classic;
    m.tiles_requested = 4;
    m.tiles_used = 1;
    m.images_requested = 2;
    m.images_used = 1;
    m.image_urls_used = {"u1", "u2"};
    m.caption = "c";

    const auto j = io::MemeMetadataToJson(m);
    CHECK(j["mood"] == "SALTY");
    CHECK(j["moodState"] == "NEGATIVE");
    CHECK(j["style"] == "classic");
    CHECK(j["keywords"].size() == 2);
    CHECK(j["imagesUsed"] == 1);
    CHECK(j["imagesRequested"] == 2);
    CHECK(j["tilesRequested"] == 4);
    CHECK(j["tilesUsed"] == 1);
    CHECK(j["imageUrlsUsed"][1] == "u2");
    CHECK(j["strokeFallback"] == false);

    std::string text;
    std::string err;
    REQUIRE(io::MemeMetadataToJsonText(m, text, err));
    const auto round = nlohmann::json::parse(text);
    CHECK(round == j);
}

TEST_CASE("MemeMetadataToJsonText - invalid UTF-8 from the command line")
{
    compose::MemeMetadata m;
    m.caption = "15% OFF at Caf\xff Bar tonight.";
    m.subline = "15% OFF \xE2\x80\x94 Caf\xff Bar";

    std::string text;
    std::string err;
    REQUIRE(io::MemeMetadataToJsonText(m, text, err));
    CHECK(err.empty());

    const auto j = nlohmann::json::parse(text);
    CHECK(j["caption"] == "15% OFF at Caf\xEF\xBF\xBD Bar tonight.");
    CHECK(j["subline"] == "15% OFF \xE2\x80\x94 Caf\xEF\xBF\xBD Bar");
}

TEST_CASE("Compose - a business name with invalid UTF-8 still yields metadata")
{
    Harness h;
    compose::StyleConfig cfg;
    cfg.width = 256;
    cfg.height = 256;
    cfg.business = "Caf\xff";

    const auto meme = h.Run({MakePost("kickoff soon", "")}, cfg);
    std::string text;
    std::string err;
    REQUIRE(io::MemeMetadataToJsonText(meme.metadata, text, err));
    CHECK(nlohmann::json::parse(text)["caption"].get<std::string>().find("Caf\xEF\xBF\xBD") != std::string::npos);
}
