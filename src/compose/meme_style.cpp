#include "compose/meme_style.h"

#include "compose/image_compositor.h"
#include "text/text_layout.h"
#include "text/text_painter.h"
#include "text/utf8.h"
#include "vibe/focus_bias.h"
#include "vibe/template_selector.h"

#include <algorithm>
#include <cctype>

namespace memeseed::compose
{
namespace
{
constexpr raster::Rgb8 kCtaFill{255, 213, 79};
constexpr raster::Rgb8 kCtaText{15, 20, 30};
constexpr const char* kBullet = " \xE2\x80\xA2 ";
constexpr const char* kDash = " \xE2\x80\x94 ";

// Grid overlay sizes at the 1024 reference canvas; scaled with ScaleToCanvas.
constexpr int kGridTopBandHeight = 120;
constexpr int kGridCtaBandHeight = 140;
constexpr int kGridTopFont = 72;
constexpr int kGridCtaFont = 60;
constexpr int kGridLabelFont = 54;
constexpr int kGridLabelPad = 10;
constexpr int kGridLabelHeight = 100;
constexpr int kGridLabelCtaClearance = 150;
constexpr std::size_t kGridKeywordsShown = 4;

// Classic layout.
constexpr int kClassicMargin = 24;
constexpr float kClassicRegionRatio = 0.28f;
constexpr int kClassicTopStart = 96;
constexpr int kClassicBottomStart = 92;
constexpr int kClassicCtaHeight = 84;
constexpr int kClassicCtaFont = 42;
constexpr int kClassicStrokeDivisor = 14;

static std::string Join(const std::vector<std::string>& parts, std::size_t max_parts, const char* sep, bool upper)
{
    std::string out;
    for (std::size_t i = 0; i < parts.size() && i < max_parts; ++i)
    {
        if (i > 0)
            out += sep;
        out += upper ? text::ToUpperAscii(parts[i]) : parts[i];
    }
    return out;
}

static std::vector<const Post*> PostsWithImages(const std::vector<Post>& posts)
{
    std::vector<const Post*> out;
    for (const auto& p : posts)
        if (!p.image_urls.empty())
            out.push_back(&p);
    return out;
}

static std::vector<const Post*> FocusFilter(const std::vector<const Post*>& candidates, const MemeContext& ctx)
{
    if (!ctx.config.focus_bias || ctx.focus_terms.empty())
        return candidates;
    return vibe::FilterByFocus(candidates, ctx.focus_terms);
}
} // namespace

std::string_view MemeStyleName(MemeStyleKind kind)
{
    switch (kind)
    {
        case MemeStyleKind::Grid: return "grid";
        case MemeStyleKind::Classic: return "classic";
    }
    return "grid";
}

bool ParseMemeStyle(std::string_view name, MemeStyleKind& out)
{
    std::string lower(name);
    for (char& c : lower)
        c = (char)std::tolower((unsigned char)c);
    if (lower == "grid")
    {
        out = MemeStyleKind::Grid;
        return true;
    }
    if (lower == "classic")
    {
        out = MemeStyleKind::Classic;
        return true;
    }
    return false;
}

LayoutBox GridTopBand(int width, int height)
{
    return LayoutBox{0, 0, width, ScaleToCanvas(kGridTopBandHeight, height)};
}

LayoutBox GridCtaBand(int width, int height)
{
    return LayoutBox{0, height - ScaleToCanvas(kGridCtaBandHeight, height), width, height};
}

LayoutBox GridLabelBox(const LayoutBox& tile, int tiles, int width, int height)
{
    const int pad_x = ScaleToCanvas(kGridLabelPad, width);
    const int pad_y = ScaleToCanvas(kGridLabelPad, height);

    // Labels sit near the tile bottom; split layouts keep them clear of the CTA band.
    int ly1 = tile.y1 - pad_y;
    if (tiles == 2 || tiles == 4)
        ly1 = std::min(ly1, height - ScaleToCanvas(kGridLabelCtaClearance, height));
    const int ly0 = std::max(tile.y0 + pad_y, ly1 - ScaleToCanvas(kGridLabelHeight, height));
    // A tile too short for a label yields an empty box rather than an inverted one.
    ly1 = std::max(ly1, ly0);
    return LayoutBox{tile.x0 + pad_x, ly0, tile.x1 - pad_x, ly1};
}

// ---------------------------------------------------------------------------------------------
// Grid

std::vector<std::string> GridStyle::PlanImages(const std::vector<Post>& posts,
                                               const MemeContext& ctx,
                                               IRandomSource& rng) const
{
    const std::size_t want = (std::size_t)NormalizeTiles(ctx.config.tiles);
    std::vector<const Post*> candidates = FocusFilter(PostsWithImages(posts), ctx);

    std::vector<std::string> urls;
    if (candidates.size() > want)
    {
        for (std::size_t i : SampleIndices(rng, candidates.size(), want))
            urls.push_back(candidates[i]->image_urls.front());
    }
    else
    {
        for (const Post* p : candidates)
            urls.push_back(p->image_urls.front());
    }
    return urls;
}

MemeCopy GridStyle::WriteCopy(const MemeContext& ctx, IRandomSource&) const
{
    MemeCopy copy;
    copy.headline = std::string(MoodWord(ctx.mood)) + kBullet + Join(ctx.keywords, kGridKeywordsShown, kBullet, true);
    copy.subline = ctx.config.offer + kDash + ctx.config.business;
    return copy;
}

StyleRender GridStyle::Render(const std::vector<raster::RgbaImage>& images,
                              const MemeContext& ctx,
                              const MemeCopy& copy,
                              text::IFontProvider& fonts) const
{
    const int w = ctx.config.width;
    const int h = ctx.config.height;

    StyleRender r;
    r.tiles_used = images.empty() ? 1 : NormalizeTiles(ctx.config.tiles);
    const std::vector<LayoutBox> tiles = GridTiles(r.tiles_used, w, h);

    bool stroked = ComposeGrid(images, tiles, w, h, fonts, r.image);

    text::TextBoxStyle band;
    band.padding = OverlayPadding(w, h);
    const text::IFontFace& top_face = fonts.FaceAt(ScaleFontToCanvas(kGridTopFont, w, h));
    stroked = text::DrawTextBox(r.image, GridTopBand(w, h), copy.headline, top_face, band) && stroked;

    text::TextBoxStyle cta = band;
    cta.text_fill = kCtaText;
    cta.box_fill = kCtaFill;
    const text::IFontFace& cta_face = fonts.FaceAt(ScaleFontToCanvas(kGridCtaFont, w, h));
    stroked = text::DrawTextBox(r.image, GridCtaBand(w, h), copy.subline, cta_face, cta) && stroked;

    const text::IFontFace& label_face = fonts.FaceAt(ScaleFontToCanvas(kGridLabelFont, w, h));
    for (std::size_t i = 0; i < tiles.size() && i < ctx.keywords.size(); ++i)
    {
        const LayoutBox label = GridLabelBox(tiles[i], r.tiles_used, w, h);
        if (!label.Valid())
            continue;
        stroked = text::DrawTextBox(r.image, label, text::ToUpperAscii(ctx.keywords[i]), label_face, band) && stroked;
    }

    r.stroke_fallback = !stroked;
    return r;
}

std::string GridStyle::Caption(const MemeContext& ctx, const MemeCopy&) const
{
    return "Mood: " + std::string(MoodWord(ctx.mood)) + ". Keywords: " + Join(ctx.keywords, kGridKeywordsShown, ", ", false) +
           ". " + ctx.config.offer + " at " + ctx.config.business + " tonight.";
}

// ---------------------------------------------------------------------------------------------
// Classic

std::vector<std::string> ClassicStyle::PlanImages(const std::vector<Post>& posts,
                                                  const MemeContext& ctx,
                                                  IRandomSource& rng) const
{
    const std::vector<const Post*> candidates = FocusFilter(PostsWithImages(posts), ctx);
    if (candidates.empty())
        return {};

    // Two backgrounds only ever come from the same post, so they belong together.
    const Post* src = candidates[rng.NextIndex(candidates.size())];
    const std::vector<std::string>& urls = src->image_urls;

    std::size_t want = 1;
    if (ctx.config.two_image_background && urls.size() >= 2 && rng.NextUnit() < 0.5)
        want = 2;

    std::vector<std::string> out;
    for (std::size_t i : SampleIndices(rng, urls.size(), want))
        out.push_back(urls[i]);
    return out;
}

MemeCopy ClassicStyle::WriteCopy(const MemeContext& ctx, IRandomSource& rng) const
{
    vibe::TemplateInputs in;
    in.mood = ctx.mood;
    in.keywords = ctx.keywords;
    in.event = ctx.event;
    in.topic = ctx.config.topic;
    in.business = ctx.config.business;
    in.offer = ctx.config.offer;

    const vibe::CaptionTemplate t = vibe::SelectTemplate(in, rng);
    return MemeCopy{t.headline, t.subline};
}

StyleRender ClassicStyle::Render(const std::vector<raster::RgbaImage>& images,
                                 const MemeContext& ctx,
                                 const MemeCopy& copy,
                                 text::IFontProvider& fonts) const
{
    const int w = ctx.config.width;
    const int h = ctx.config.height;

    StyleRender r;
    r.tiles_used = 1;
    r.image = ComposeClassicBackground(images, w, h);

    const int max_w = w - 2 * kClassicMargin;
    const int cta_h = ctx.config.show_cta ? ScaleToCanvas(kClassicCtaHeight, h) : 0;
    const int region_h = (int)((float)h * kClassicRegionRatio);

    const std::string top = text::ToUpperAscii(text::TrimAscii(copy.headline));
    const std::string bottom = text::ToUpperAscii(text::TrimAscii(copy.subline));

    text::TextStyle style;
    bool stroked = true;

    const text::FittedText top_fit = text::FitAndWrap(top, max_w, region_h, kClassicTopStart, text::kDefaultMinFontSize, fonts);
    {
        const text::IFontFace& face = fonts.FaceAt(top_fit.font_size);
        style.stroke_px = text::StrokeWidthFor(top_fit.font_size, kClassicStrokeDivisor);
        stroked = text::DrawCenteredLines(r.image, top_fit.lines, kClassicMargin, w, face, style) && stroked;
    }

    const text::FittedText bot_fit = text::FitAndWrap(bottom, max_w, region_h, kClassicBottomStart, text::kDefaultMinFontSize, fonts);
    {
        const int block_h = text::LineHeight(bot_fit.font_size) * (int)bot_fit.lines.size();
        const int y0 = std::max(h - cta_h - kClassicMargin - block_h, kClassicMargin + region_h);
        const text::IFontFace& face = fonts.FaceAt(bot_fit.font_size);
        style.stroke_px = text::StrokeWidthFor(bot_fit.font_size, kClassicStrokeDivisor);
        stroked = text::DrawCenteredLines(r.image, bot_fit.lines, y0, w, face, style) && stroked;
    }

    if (ctx.config.show_cta)
    {
        text::TextBoxStyle cta;
        cta.text_fill = kCtaText;
        cta.box_fill = kCtaFill;
        cta.padding = OverlayPadding(w, h);
        const std::string tag = text::TrimAscii(ctx.config.offer + " @ " + ctx.config.business);
        const text::IFontFace& cta_face = fonts.FaceAt(ScaleFontToCanvas(kClassicCtaFont, w, h));
        stroked = text::DrawTextBox(r.image, LayoutBox{0, h - cta_h, w, h}, tag, cta_face, cta) && stroked;
    }

    r.stroke_fallback = !stroked;
    return r;
}

std::string ClassicStyle::Caption(const MemeContext& ctx, const MemeCopy& copy) const
{
    if (copy.headline.empty() || copy.subline.empty())
        return GridStyle().Caption(ctx, copy);
    return copy.headline + kDash + copy.subline + ". " + ctx.config.offer + " at " + ctx.config.business + ".";
}

std::unique_ptr<IMemeStyle> MakeStyle(MemeStyleKind kind)
{
    if (kind == MemeStyleKind::Classic)
        return std::make_unique<ClassicStyle>();
    return std::make_unique<GridStyle>();
}
} // namespace memeseed::compose
