#pragma once

#include "core/post.h"
#include "raster/rgba_image.h"
#include "text/font_face.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace memeseed::text
{
struct TextStyle
{
    raster::Rgb8 fill{255, 255, 255};
    raster::Rgb8 stroke{0, 0, 0};
    int stroke_px = 0;
};

// Draws one line with its line box (pen start, top of ascent) at (x, y).
// The outline is attempted first when stroke_px > 0; if the face cannot stroke, only the fill is
// drawn and false is returned.
bool DrawLine(raster::RgbaImage& img,
              const IFontFace& face,
              std::string_view line,
              int x,
              int y,
              const TextStyle& style);

// Horizontally centered lines starting at y0, one LineHeight apart. Stroke width is
// StrokeWidthFor(size, 14) unless `style.stroke_px` is already set.
// Returns false when any line fell back to plain fill.
bool DrawCenteredLines(raster::RgbaImage& img,
                       const std::vector<std::string>& lines,
                       int y0,
                       int width,
                       const IFontFace& face,
                       const TextStyle& style);

struct TextBoxStyle
{
    raster::Rgb8 text_fill{255, 255, 255};
    raster::Rgb8 box_fill{0, 0, 0};
    raster::Rgb8 stroke{0, 0, 0};
    int padding = 12;
    std::size_t max_lines = 3;
    float line_step = 1.15f;
    int stroke_divisor = 18;
};

// Solid box, then the text wrapped to (box width - 2 * padding), at most max_lines lines,
// left-aligned from (x0 + padding, y0 + padding). Lines are not clipped to the box.
// Returns false when any line fell back to plain fill.
bool DrawTextBox(raster::RgbaImage& img,
                 const LayoutBox& box,
                 std::string_view text,
                 const IFontFace& face,
                 const TextBoxStyle& style = {});
} // namespace memeseed::text
