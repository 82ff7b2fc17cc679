#include "test.h"

#include "vibe/focus_bias.h"

using namespace memeseed;

namespace
{
Post MakePost(std::string title, std::string body = {})
{
    Post p;
    p.title = std::move(title);
    p.body = std::move(body);
    return p;
}
} // namespace

TEST_CASE("FocusAliasRegistry")
{
    const auto reg = vibe::FocusAliasRegistry::Defaults();
    CHECK(reg.AliasFor("Seattle Seahawks") == "Seahawks");
    CHECK(reg.AliasFor("new england patriots") == "Patriots");
    CHECK(reg.AliasFor("Bad Bunny").empty());

    const vibe::FocusTerm t = reg.Resolve("Bad Bunny");
    CHECK(t.Display() == "Bad Bunny");
    CHECK(reg.Resolve("Seattle Seahawks").Display() == "Seahawks");

    SUBCASE("first registration wins")
    {
        vibe::FocusAliasRegistry r;
        r.Register("Kansas City Chiefs", "Chiefs");
        r.Register("Kansas City", "KC");
        CHECK(r.AliasFor("Kansas City Chiefs") == "Chiefs");
    }
}

TEST_CASE("PickFocusTerms - one per pool, anchors appended, deduped")
{
    vibe::FocusPools pools;
    pools.pools = {{"Bad Bunny"}, {"Geno Smith", "DK Metcalf"}, {}, {"seattle seahawks"}};
    pools.anchors = {"Seattle Seahawks", "New England Patriots"};

    test::ScriptedRandom rng({}, {0, 1, 0});
    const auto terms = vibe::PickFocusTerms(pools, rng);

    CHECK(rng.index_calls == 3);
    REQUIRE(terms.size() == 4);
    CHECK(terms[0] == "Bad Bunny");
    CHECK(terms[1] == "DK Metcalf");
    CHECK(terms[2] == "seattle seahawks");
    CHECK(terms[3] == "New England Patriots");
}

TEST_CASE("PickFocusTerms - default pools")
{
    test::ScriptedRandom rng;
    const auto terms = vibe::PickFocusTerms(vibe::DefaultFocusPools(), rng);
    REQUIRE(terms.size() == 5);
    CHECK(terms[0] == "Bad Bunny");
    CHECK(terms[3] == "Seattle Seahawks");
    CHECK(terms[4] == "New England Patriots");
}

TEST_CASE("BiasKeywords")
{
    const std::vector<std::string> kw = {"touchdown", "seahawks", "refs", "halftime"};
    const std::vector<std::string> focus = {"Bad Bunny", "Seattle Seahawks"};

    const auto out = vibe::BiasKeywords(kw, focus, 4);
    REQUIRE(out.size() == 4);
    CHECK(out[0] == "Bad Bunny");
    CHECK(out[1] == "Seahawks");
    CHECK(out[2] == "touchdown");
    CHECK(out[3] == "refs");

    CHECK(vibe::BiasKeywords(kw, {}, 6) == kw);
    CHECK(vibe::BiasKeywords(kw, focus, 0).empty());
}

TEST_CASE("MatchesFocus and FilterByFocus")
{
    std::vector<Post> posts = {
        MakePost("Halftime show", "bad bunny was electric"),
        MakePost("Kickoff", "nothing to see"),
        MakePost("SEATTLE SEAHAWKS WIN"),
    };
    const std::vector<std::string> focus = {"Bad Bunny", "Seattle Seahawks"};

    CHECK(vibe::MatchesFocus(posts[0], focus));
    CHECK_FALSE(vibe::MatchesFocus(posts[1], focus));
    CHECK(vibe::MatchesFocus(posts[2], focus));

    const std::vector<const Post*> all = {&posts[0], &posts[1], &posts[2]};
    const auto hits = vibe::FilterByFocus(all, focus);
    REQUIRE(hits.size() == 2);
    CHECK(hits[0] == &posts[0]);
    CHECK(hits[1] == &posts[2]);

    SUBCASE("no hits keeps the candidates")
    {
        const auto kept = vibe::FilterByFocus(all, {"Taylor Swift"});
        CHECK(kept == all);
    }

    SUBCASE("short terms match inside longer words")
    {
        CHECK(vibe::MatchesFocus(posts[1], {"kick"}));
    }
}
