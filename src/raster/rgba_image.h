#pragma once

#include "core/post.h"
#include "raster/color_blend.h"

#include <cstdint>
#include <vector>

namespace memeseed::raster
{
// Owned RGBA8 bitmap, row-major, width * height * 4 bytes.
//
// Everything the compositor produces is opaque (alpha 255). Decoded sources may carry alpha; it is
// flattened onto black when they are pasted.
struct RgbaImage
{
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;

    bool Empty() const { return width <= 0 || height <= 0 || pixels.empty(); }

    std::uint8_t* At(int x, int y) { return pixels.data() + ((size_t)y * (size_t)width + (size_t)x) * 4u; }
    const std::uint8_t* At(int x, int y) const { return pixels.data() + ((size_t)y * (size_t)width + (size_t)x) * 4u; }

    Rgb8 RgbAt(int x, int y) const
    {
        const std::uint8_t* p = At(x, y);
        return Rgb8{p[0], p[1], p[2]};
    }

    static RgbaImage Filled(int w, int h, const Rgb8& c);

    // Takes ownership of an RGBA8 buffer. Returns an empty image if the size does not match.
    static RgbaImage FromRgba(int w, int h, std::vector<std::uint8_t> rgba);
};

// Fills `box` (clipped to the image) with `c` at the given opacity.
void FillRect(RgbaImage& img, const LayoutBox& box, const Rgb8& c, std::uint8_t alpha = 255);

// Copies `src` with its top-left at (x, y), clipped. Source alpha is composited over black.
void Paste(RgbaImage& dst, const RgbaImage& src, int x, int y);

// Sub-rectangle copy, clipped to the source.
RgbaImage Crop(const RgbaImage& src, const LayoutBox& box);

// Blends `c` into one pixel with 0..255 coverage. Out-of-range coordinates are ignored.
void BlendPixel(RgbaImage& img, int x, int y, const Rgb8& c, std::uint8_t coverage);

// Drops alpha: tightly packed RGB8, width * height * 3 bytes.
std::vector<std::uint8_t> ToRgb(const RgbaImage& img);
} // namespace memeseed::raster
