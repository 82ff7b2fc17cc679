#include "compose/image_compositor.h"

#include "raster/image_ops.h"
#include "text/text_painter.h"

#include <algorithm>
#include <cmath>

namespace memeseed::compose
{
int ScaleToCanvas(int reference_px, int extent)
{
    if (extent == kReferenceCanvas)
        return reference_px;
    return (int)std::lround((double)reference_px * (double)extent / (double)kReferenceCanvas);
}

int ScaleFontToCanvas(int reference_px, int width, int height)
{
    return std::max(kMinOverlayFont, ScaleToCanvas(reference_px, std::min(width, height)));
}

int OverlayPadding(int width, int height)
{
    return std::max(2, ScaleToCanvas(12, std::min(width, height)));
}

LayoutBox NoticeBox(int width, int height)
{
    return LayoutBox{0, ScaleToCanvas(200, height), width, ScaleToCanvas(360, height)};
}

LayoutBox NoticeHintBox(int width, int height)
{
    return LayoutBox{0, ScaleToCanvas(370, height), width, ScaleToCanvas(450, height)};
}

int NormalizeTiles(int tiles)
{
    if (tiles == 1 || tiles == 2 || tiles == 4)
        return tiles;
    return 4;
}

std::vector<LayoutBox> GridTiles(int tiles, int width, int height)
{
    const int half_w = width / 2;
    const int half_h = height / 2;
    switch (NormalizeTiles(tiles))
    {
        case 1:
            return {LayoutBox{0, 0, width, height}};
        case 2:
            return {LayoutBox{0, 0, half_w, height}, LayoutBox{half_w, 0, width, height}};
        default:
            break;
    }
    return {
        LayoutBox{0, 0, half_w, half_h},
        LayoutBox{half_w, 0, width, half_h},
        LayoutBox{0, half_h, half_w, height},
        LayoutBox{half_w, half_h, width, height},
    };
}

bool ComposeGrid(const std::vector<raster::RgbaImage>& images,
                 const std::vector<LayoutBox>& tiles,
                 int width,
                 int height,
                 text::IFontProvider& fonts,
                 raster::RgbaImage& out)
{
    out = raster::RgbaImage::Filled(width, height, kGridCanvasColor);

    for (size_t i = 0; i < tiles.size(); ++i)
    {
        const LayoutBox& box = tiles[i];
        if (!box.Valid())
            continue;
        if (i < images.size() && !images[i].Empty())
        {
            const raster::RgbaImage tile = raster::CoverResize(images[i], box.Width(), box.Height());
            raster::Paste(out, tile, box.x0, box.y0);
        }
        else
        {
            raster::FillRect(out, box, kPlaceholderColor);
        }
    }

    if (!images.empty())
        return true;

    text::TextBoxStyle style;
    style.padding = OverlayPadding(width, height);
    bool stroked = text::DrawTextBox(out,
                                     NoticeBox(width, height),
                                     "NO LIVE IMAGES FOUND",
                                     fonts.FaceAt(ScaleFontToCanvas(80, width, height)),
                                     style);
    stroked = text::DrawTextBox(out,
                                NoticeHintBox(width, height),
                                "Try: subreddit=pics or a different query",
                                fonts.FaceAt(ScaleFontToCanvas(40, width, height)),
                                style) && stroked;
    return stroked;
}

raster::RgbaImage ContainOnBlur(const raster::RgbaImage& src, int w, int h)
{
    if (src.Empty() || w <= 0 || h <= 0)
        return raster::RgbaImage::Filled(w, h, kPlaceholderColor);

    // Flatten any alpha first so both layers agree.
    raster::RgbaImage flat = raster::RgbaImage::Filled(src.width, src.height, raster::Rgb8{});
    raster::Paste(flat, src, 0, 0);

    raster::RgbaImage bg = raster::CoverResize(flat, w, h);
    raster::GaussianBlur(bg, kBackgroundBlurRadius);
    raster::Darken(bg, kBackgroundDarken);

    const raster::RgbaImage fg = raster::ContainResize(flat, std::max(1, w - kForegroundInset), std::max(1, h - kForegroundInset));
    raster::Paste(bg, fg, (w - fg.width) / 2, (h - fg.height) / 2);
    return bg;
}

raster::RgbaImage ComposeClassicBackground(const std::vector<raster::RgbaImage>& images, int width, int height)
{
    if (images.empty())
        return raster::RgbaImage::Filled(width, height, kPlaceholderColor);
    if (images.size() == 1)
        return ContainOnBlur(images[0], width, height);

    raster::RgbaImage base = raster::RgbaImage::Filled(width, height, kPlaceholderColor);
    const int w1 = width / 2;
    const int w2 = width - w1;
    raster::Paste(base, ContainOnBlur(images[0], w1, height), 0, 0);
    raster::Paste(base, ContainOnBlur(images[1], w2, height), w1, 0);
    return base;
}
} // namespace memeseed::compose
