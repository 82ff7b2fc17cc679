#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace memeseed::text
{
// 8-bit coverage mask for one rendered line of text.
//
// Mask pixel (0, 0) sits at (x - pad, y - pad) where (x, y) is the top-left of the line box
// (pen start, top of ascent) and `pad` is the stroke width the mask was rendered with.
struct TextMask
{
    int width = 0;
    int height = 0;
    int pad = 0;
    std::vector<std::uint8_t> coverage; // row-major, width * height

    bool Empty() const { return width <= 0 || height <= 0; }
};

// A font at one pixel size.
class IFontFace
{
public:
    virtual ~IFontFace() = default;

    virtual int PixelSize() const = 0;

    // Pixels above / below the baseline (both >= 0).
    virtual int Ascent() const = 0;
    virtual int Descent() const = 0;

    // Advance width of the UTF-8 line, without stroke.
    virtual int MeasureWidth(std::string_view utf8) const = 0;

    // Renders the line. With stroke_px > 0 the mask is the outline border grown by stroke_px;
    // returns false when this face cannot stroke. stroke_px == 0 always succeeds.
    virtual bool RenderMask(std::string_view utf8, int stroke_px, TextMask& out) const = 0;

    // Human-readable description ("builtin 5x7 @ 24px", "/path/to/font.ttf @ 96px").
    virtual std::string Describe() const = 0;
};

// Hands out a face for any requested pixel size. Implementations never fail: they fall back to
// a built-in face when nothing better is available.
class IFontProvider
{
public:
    virtual ~IFontProvider() = default;
    virtual const IFontFace& FaceAt(int pixel_size) = 0;
};
} // namespace memeseed::text
