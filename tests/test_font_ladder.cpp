#include "test.h"

#include "text/font_ladder.h"

using namespace memeseed;

TEST_CASE("FontLadder - falls through to the built-in face")
{
    text::FontLadderOptions opts;
    opts.candidates = {"/nonexistent/memeseed/Impact.ttf"};
    opts.fontconfig_pattern = "";

    text::FontLadder ladder(opts);
    CHECK(ladder.Rung() == text::FontRung::Builtin);
    CHECK(ladder.FontPath().empty());
    REQUIRE_FALSE(ladder.Rejections().empty());
    CHECK(ladder.Rejections()[0] == "candidate: missing /nonexistent/memeseed/Impact.ttf");

    const text::IFontFace& face = ladder.FaceAt(40);
    CHECK(face.PixelSize() == 40);
    CHECK(face.MeasureWidth("HELLO") > 0);

    text::TextMask mask;
    CHECK_FALSE(face.RenderMask("HELLO", 3, mask));
    CHECK(face.RenderMask("HELLO", 0, mask));

    SUBCASE("faces are cached per size")
    {
        CHECK(&ladder.FaceAt(40) == &face);
        CHECK(&ladder.FaceAt(41) != &face);
    }

    SUBCASE("non-positive sizes are clamped")
    {
        CHECK(ladder.FaceAt(0).PixelSize() == 1);
    }
}

TEST_CASE("FontRungName")
{
    CHECK(text::FontRungName(text::FontRung::Candidate) == "candidate");
    CHECK(text::FontRungName(text::FontRung::Fontconfig) == "fontconfig");
    CHECK(text::FontRungName(text::FontRung::Builtin) == "builtin");
}
