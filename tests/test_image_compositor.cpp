#include "test.h"

#include "compose/image_compositor.h"
#include "compose/meme_style.h"

#include <utility>

using namespace memeseed;

TEST_CASE("GridTiles")
{
    CHECK(compose::NormalizeTiles(1) == 1);
    CHECK(compose::NormalizeTiles(2) == 2);
    CHECK(compose::NormalizeTiles(3) == 4);
    CHECK(compose::NormalizeTiles(0) == 4);

    const auto one = compose::GridTiles(1, 100, 80);
    REQUIRE(one.size() == 1);
    CHECK(one[0].Width() == 100);

    const auto two = compose::GridTiles(2, 101, 80);
    REQUIRE(two.size() == 2);
    CHECK(two[0].x1 == 50);
    CHECK(two[1].x0 == 50);
    CHECK(two[1].x1 == 101);

    const auto four = compose::GridTiles(4, 100, 80);
    REQUIRE(four.size() == 4);
    CHECK(four[3].x0 == 50);
    CHECK(four[3].y0 == 40);
    CHECK(four[3].y1 == 80);
}

TEST_CASE("ComposeGrid - zero images still shows a notice")
{
    test::FixedFontProvider fonts;
    raster::RgbaImage out;
    const auto tiles = compose::GridTiles(1, 1024, 1024);
    CHECK(compose::ComposeGrid({}, tiles, 1024, 1024, fonts, out));

    REQUIRE(out.width == 1024);
    REQUIRE(out.height == 1024);
    // Placeholder outside the notice, black notice box inside it.
    CHECK(out.RgbAt(3, 100) == compose::kPlaceholderColor);
    CHECK(out.RgbAt(3, 205) == raster::Rgb8{0, 0, 0});
    CHECK(out.RgbAt(3, 375) == raster::Rgb8{0, 0, 0});

    bool white = false;
    for (int x = 0; x < 1024 && !white; ++x)
        white = out.RgbAt(x, 240) == raster::Rgb8{255, 255, 255};
    CHECK(white);

    SUBCASE("font without outlines reports the fallback")
    {
        test::FixedFontProvider flat(false);
        raster::RgbaImage o2;
        CHECK_FALSE(compose::ComposeGrid({}, tiles, 1024, 1024, flat, o2));
        CHECK(o2.width == 1024);
    }
}

TEST_CASE("ComposeGrid - the notice scales with the canvas")
{
    for (const auto& dims : {std::pair{300, 300}, std::pair{512, 768}, std::pair{1600, 900}})
    {
        const int w = dims.first;
        const int h = dims.second;
        CAPTURE(w);
        CAPTURE(h);
        test::FixedFontProvider fonts;
        raster::RgbaImage out;
        compose::ComposeGrid({}, compose::GridTiles(1, w, h), w, h, fonts, out);
        REQUIRE(out.width == w);
        REQUIRE(out.height == h);

        const LayoutBox notice = compose::NoticeBox(w, h);
        const LayoutBox hint = compose::NoticeHintBox(w, h);
        REQUIRE(notice.Valid());
        REQUIRE(hint.Valid());
        CHECK(notice.y1 <= hint.y0);
        // Same fractional position as (0, 200)-(W, 360) on the 1024 reference.
        CHECK(notice.y0 == doctest::Approx(h * 200.0 / 1024.0).epsilon(0.01));

        CHECK(out.RgbAt(1, notice.y0) == raster::Rgb8{0, 0, 0});
        CHECK(out.RgbAt(1, hint.y0) == raster::Rgb8{0, 0, 0});
        CHECK(out.RgbAt(1, notice.y0 - 2) == compose::kPlaceholderColor);
    }

    CHECK(compose::NoticeBox(1024, 1024).y0 == 200);
    CHECK(compose::NoticeHintBox(1024, 1024).y1 == 450);
    CHECK(compose::ScaleFontToCanvas(80, 1024, 1024) == 80);
    CHECK(compose::ScaleFontToCanvas(80, 512, 768) == 40);
    CHECK(compose::ScaleFontToCanvas(40, 64, 64) == compose::kMinOverlayFont);
}

TEST_CASE("GridStyle - zero images stay visibly flagged on small canvases")
{
    for (const auto& dims : {std::pair{300, 300}, std::pair{512, 768}, std::pair{1024, 1024}})
    {
        const int w = dims.first;
        const int h = dims.second;
        CAPTURE(w);
        CAPTURE(h);
        compose::MemeContext ctx;
        ctx.keywords = {"kickoff", "nachos"};
        ctx.config.width = w;
        ctx.config.height = h;
        ctx.config.tiles = 4;

        test::FixedFontProvider fonts;
        test::ScriptedRandom rng;
        compose::GridStyle grid;
        const auto r = grid.Render({}, ctx, grid.WriteCopy(ctx, rng), fonts);
        REQUIRE(r.image.width == w);
        REQUIRE(r.image.height == h);
        CHECK(r.tiles_used == 1);

        const LayoutBox top = compose::GridTopBand(w, h);
        const LayoutBox cta = compose::GridCtaBand(w, h);
        const LayoutBox notice = compose::NoticeBox(w, h);
        CHECK(top.y1 < notice.y0);
        CHECK(compose::NoticeHintBox(w, h).y1 < cta.y0);

        // Notice box pixels survive the bands drawn over the grid.
        int visible = 0;
        for (int y = notice.y0; y < notice.y1; ++y)
            if (r.image.RgbAt(1, y) == raster::Rgb8{0, 0, 0})
                ++visible;
        CHECK(visible == notice.Height());
        CHECK(r.image.RgbAt(1, h - 1) == raster::Rgb8{255, 213, 79});
    }
}

TEST_CASE("GridLabelBox - never inverted")
{
    for (int h : {60, 120, 300, 1024})
    {
        CAPTURE(h);
        for (const LayoutBox& tile : compose::GridTiles(4, h, h))
        {
            const LayoutBox label = compose::GridLabelBox(tile, 4, h, h);
            CHECK(label.y1 >= label.y0);
            CHECK(label.y0 >= tile.y0);
        }
    }

    // Reference layout: lower quadrant labels end 150 px above the bottom edge.
    const auto tiles = compose::GridTiles(4, 1024, 1024);
    const LayoutBox label = compose::GridLabelBox(tiles[3], 4, 1024, 1024);
    CHECK(label.y1 == 874);
    CHECK(label.y0 == 774);
    CHECK(label.x0 == 522);
}

TEST_CASE("ComposeGrid - tiles without images get the placeholder")
{
    test::FixedFontProvider fonts;
    std::vector<raster::RgbaImage> images = {raster::RgbaImage::Filled(7, 9, raster::Rgb8{255, 0, 0})};
    raster::RgbaImage out;
    CHECK(compose::ComposeGrid(images, compose::GridTiles(4, 200, 200), 200, 200, fonts, out));

    CHECK(out.RgbAt(50, 50) == raster::Rgb8{255, 0, 0});
    CHECK(out.RgbAt(150, 50) == compose::kPlaceholderColor);
    CHECK(out.RgbAt(50, 150) == compose::kPlaceholderColor);
}

TEST_CASE("ContainOnBlur - the whole source stays visible")
{
    // A tall image on a wide canvas: contained copy in the middle, blurred cover behind it.
    auto src = raster::RgbaImage::Filled(20, 200, raster::Rgb8{0, 255, 0});
    const auto out = compose::ContainOnBlur(src, 300, 100);
    REQUIRE(out.width == 300);
    REQUIRE(out.height == 100);

    // Foreground is 6x60 centered (fits 260x60, aspect preserved).
    CHECK(out.RgbAt(150, 50) == raster::Rgb8{0, 255, 0});
    // Background is the darkened cover: green, but dimmer.
    const auto bg = out.RgbAt(5, 5);
    CHECK(bg.g < 255);
    CHECK(bg.g > 150);
    CHECK(bg.r == 0);
}

TEST_CASE("ComposeClassicBackground")
{
    SUBCASE("no images: flat fallback")
    {
        const auto out = compose::ComposeClassicBackground({}, 64, 48);
        CHECK(out.width == 64);
        CHECK(out.RgbAt(10, 10) == compose::kPlaceholderColor);
    }

    SUBCASE("two images split the canvas into halves")
    {
        std::vector<raster::RgbaImage> images = {
            raster::RgbaImage::Filled(30, 30, raster::Rgb8{255, 0, 0}),
            raster::RgbaImage::Filled(30, 30, raster::Rgb8{0, 0, 255}),
        };
        const auto out = compose::ComposeClassicBackground(images, 201, 100);
        REQUIRE(out.width == 201);

        for (int y : {2, 50, 97})
        {
            CHECK(out.RgbAt(1, y).r > 150);
            CHECK(out.RgbAt(99, y).b == 0);
            CHECK(out.RgbAt(100, y).b > 150);
            CHECK(out.RgbAt(200, y).r == 0);
        }
        CHECK(out.RgbAt(50, 50) == raster::Rgb8{255, 0, 0});
        CHECK(out.RgbAt(150, 50) == raster::Rgb8{0, 0, 255});
    }
}
