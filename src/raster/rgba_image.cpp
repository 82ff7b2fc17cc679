#include "raster/rgba_image.h"

#include <algorithm>
#include <cstring>

namespace memeseed::raster
{
RgbaImage RgbaImage::Filled(int w, int h, const Rgb8& c)
{
    RgbaImage img;
    if (w <= 0 || h <= 0)
        return img;
    img.width = w;
    img.height = h;
    img.pixels.resize((size_t)w * (size_t)h * 4u);
    for (size_t i = 0; i < img.pixels.size(); i += 4)
    {
        img.pixels[i + 0] = c.r;
        img.pixels[i + 1] = c.g;
        img.pixels[i + 2] = c.b;
        img.pixels[i + 3] = 255;
    }
    return img;
}

RgbaImage RgbaImage::FromRgba(int w, int h, std::vector<std::uint8_t> rgba)
{
    RgbaImage img;
    if (w <= 0 || h <= 0 || rgba.size() != (size_t)w * (size_t)h * 4u)
        return img;
    img.width = w;
    img.height = h;
    img.pixels = std::move(rgba);
    return img;
}

namespace
{
static LayoutBox ClipTo(const LayoutBox& b, int w, int h)
{
    LayoutBox r;
    r.x0 = std::clamp(b.x0, 0, w);
    r.y0 = std::clamp(b.y0, 0, h);
    r.x1 = std::clamp(b.x1, 0, w);
    r.y1 = std::clamp(b.y1, 0, h);
    return r;
}
} // namespace

void FillRect(RgbaImage& img, const LayoutBox& box, const Rgb8& c, std::uint8_t alpha)
{
    if (img.Empty() || alpha == 0)
        return;
    const LayoutBox r = ClipTo(box, img.width, img.height);
    if (!r.Valid())
        return;
    for (int y = r.y0; y < r.y1; ++y)
    {
        std::uint8_t* row = img.At(r.x0, y);
        for (int x = r.x0; x < r.x1; ++x, row += 4)
            BlendOverOpaque(row, c, alpha);
    }
}

void Paste(RgbaImage& dst, const RgbaImage& src, int x, int y)
{
    if (dst.Empty() || src.Empty())
        return;
    const LayoutBox r = ClipTo(LayoutBox{x, y, x + src.width, y + src.height}, dst.width, dst.height);
    if (!r.Valid())
        return;

    for (int dy = r.y0; dy < r.y1; ++dy)
    {
        const std::uint8_t* s = src.At(r.x0 - x, dy - y);
        std::uint8_t* d = dst.At(r.x0, dy);
        for (int dx = r.x0; dx < r.x1; ++dx, s += 4, d += 4)
        {
            const std::uint8_t a = s[3];
            d[0] = Mul255(s[0], a);
            d[1] = Mul255(s[1], a);
            d[2] = Mul255(s[2], a);
            d[3] = 255;
        }
    }
}

RgbaImage Crop(const RgbaImage& src, const LayoutBox& box)
{
    RgbaImage out;
    if (src.Empty())
        return out;
    const LayoutBox r = ClipTo(box, src.width, src.height);
    if (!r.Valid())
        return out;

    out.width = r.Width();
    out.height = r.Height();
    out.pixels.resize((size_t)out.width * (size_t)out.height * 4u);
    const size_t row_bytes = (size_t)out.width * 4u;
    for (int y = 0; y < out.height; ++y)
        std::memcpy(out.At(0, y), src.At(r.x0, r.y0 + y), row_bytes);
    return out;
}

void BlendPixel(RgbaImage& img, int x, int y, const Rgb8& c, std::uint8_t coverage)
{
    if (x < 0 || y < 0 || x >= img.width || y >= img.height)
        return;
    BlendOverOpaque(img.At(x, y), c, coverage);
}

std::vector<std::uint8_t> ToRgb(const RgbaImage& img)
{
    std::vector<std::uint8_t> rgb;
    if (img.Empty())
        return rgb;
    rgb.resize((size_t)img.width * (size_t)img.height * 3u);
    const size_t n = (size_t)img.width * (size_t)img.height;
    for (size_t i = 0; i < n; ++i)
    {
        rgb[i * 3 + 0] = img.pixels[i * 4 + 0];
        rgb[i * 3 + 1] = img.pixels[i * 4 + 1];
        rgb[i * 3 + 2] = img.pixels[i * 4 + 2];
    }
    return rgb;
}
} // namespace memeseed::raster
