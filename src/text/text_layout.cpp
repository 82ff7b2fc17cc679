#include "text/text_layout.h"

#include "text/utf8.h"

#include <algorithm>
#include <cctype>

namespace memeseed::text
{
namespace
{
static std::vector<std::string> SplitWords(std::string_view text)
{
    std::vector<std::string> words;
    size_t i = 0;
    while (i < text.size())
    {
        while (i < text.size() && std::isspace((unsigned char)text[i]))
            ++i;
        size_t j = i;
        while (j < text.size() && !std::isspace((unsigned char)text[j]))
            ++j;
        if (j > i)
            words.emplace_back(text.substr(i, j - i));
        i = j;
    }
    return words;
}
} // namespace

int LineHeight(int font_size)
{
    return (int)((float)font_size * kLineHeightRatio);
}

int StrokeWidthFor(int font_size, int divisor)
{
    if (divisor <= 0)
        return 2;
    return std::max(2, font_size / divisor);
}

std::vector<std::string> WrapText(std::string_view text, const IFontFace& face, int max_width)
{
    std::vector<std::string> lines;
    std::string cur;

    auto place_alone = [&](const std::string& word) {
        if (face.MeasureWidth(word) <= max_width)
            cur = word;
        else
            lines.push_back(Utf8Prefix(word, kMaxTokenCodepoints));
    };

    for (const auto& w : SplitWords(text))
    {
        if (cur.empty())
        {
            place_alone(w);
            continue;
        }
        const std::string trial = cur + " " + w;
        if (face.MeasureWidth(trial) <= max_width)
        {
            cur = trial;
            continue;
        }
        lines.push_back(std::move(cur));
        cur.clear();
        place_alone(w);
    }
    if (!cur.empty())
        lines.push_back(std::move(cur));
    return lines;
}

FittedText FitAndWrap(std::string_view text,
                      int max_width,
                      int max_height,
                      int start_size,
                      int min_size,
                      IFontProvider& fonts)
{
    FittedText out;
    min_size = std::max(1, min_size);
    const std::string trimmed = TrimAscii(text);
    if (trimmed.empty())
    {
        out.font_size = min_size;
        return out;
    }

    for (int size = start_size; size >= min_size; size -= kFitStep)
    {
        std::vector<std::string> lines = WrapText(trimmed, fonts.FaceAt(size), max_width);
        if (lines.empty())
            continue;
        if (LineHeight(size) * (int)lines.size() <= max_height)
        {
            out.font_size = size;
            out.lines = std::move(lines);
            return out;
        }
    }

    out.font_size = min_size;
    out.lines = WrapText(trimmed, fonts.FaceAt(min_size), max_width);
    return out;
}

std::vector<int> CenterOffsets(const std::vector<std::string>& lines,
                               const IFontFace& face,
                               int width,
                               int stroke_px,
                               int min_x)
{
    std::vector<int> xs;
    xs.reserve(lines.size());
    for (const auto& line : lines)
    {
        const int tw = face.MeasureWidth(line) + 2 * std::max(0, stroke_px);
        xs.push_back(std::max((width - tw) / 2, min_x));
    }
    return xs;
}
} // namespace memeseed::text
