#pragma once

#include "text/font_face.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace memeseed::text
{
constexpr float kLineHeightRatio = 1.10f;
constexpr int kFitStep = 4;
constexpr int kDefaultMinFontSize = 18;
// Unbreakable tokens wider than the box are cut to this many codepoints.
constexpr std::size_t kMaxTokenCodepoints = 40;

struct FittedText
{
    int font_size = 0;
    std::vector<std::string> lines;
};

// Line advance used by fitting and centered drawing: (int)(font_size * 1.10).
int LineHeight(int font_size);

// Stroke width for a font size: max(2, font_size / divisor).
int StrokeWidthFor(int font_size, int divisor);

// Greedy word wrap on whitespace using measured widths. A word that does not fit on a line of
// its own is emitted alone, cut to kMaxTokenCodepoints.
std::vector<std::string> WrapText(std::string_view text, const IFontFace& face, int max_width);

// Largest size in start_size, start_size - 4, ... >= min_size whose wrapped height
// (lines * LineHeight) fits max_height. Falls back to min_size with its lines when none fit.
// Blank text yields {min_size, {}}.
FittedText FitAndWrap(std::string_view text,
                      int max_width,
                      int max_height,
                      int start_size,
                      int min_size,
                      IFontProvider& fonts);

// Left x of each line centered in [0, width), measured with the stroke on both sides and never
// less than `min_x`.
std::vector<int> CenterOffsets(const std::vector<std::string>& lines,
                               const IFontFace& face,
                               int width,
                               int stroke_px,
                               int min_x = 10);
} // namespace memeseed::text
