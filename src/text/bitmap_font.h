#pragma once

#include "text/font_face.h"

namespace memeseed::text
{
// Built-in 5x7 ASCII bitmap face, scaled by an integer factor. Always available; it is the last
// rung of the font ladder. Codepoints outside printable ASCII render as '?', except a few
// punctuation marks that map to close ASCII stand-ins.
//
// Cell: 6 x 8 source pixels (5x7 glyph + 1 px spacing), scale = max(1, pixel_size / 8).
class BitmapFace final : public IFontFace
{
public:
    explicit BitmapFace(int pixel_size);

    int PixelSize() const override { return m_pixel_size; }
    int Ascent() const override;
    int Descent() const override;
    int MeasureWidth(std::string_view utf8) const override;

    // Outline stroking is not supported; stroke_px > 0 returns false.
    bool RenderMask(std::string_view utf8, int stroke_px, TextMask& out) const override;

    std::string Describe() const override;

    int Scale() const { return m_scale; }

private:
    int m_pixel_size = 0;
    int m_scale = 1;
};

// Row bits of one glyph (7 rows, bit 4 = leftmost column). Non-printable input maps to '?'.
const std::uint8_t* BitmapGlyphRows(char32_t cp);
} // namespace memeseed::text
