#include "text/text_painter.h"

#include "text/text_layout.h"

namespace memeseed::text
{
namespace
{
static void BlendMask(raster::RgbaImage& img, const TextMask& mask, int x, int y, const raster::Rgb8& color)
{
    if (mask.Empty())
        return;
    const int ox = x - mask.pad;
    const int oy = y - mask.pad;
    for (int my = 0; my < mask.height; ++my)
    {
        const int py = oy + my;
        if (py < 0 || py >= img.height)
            continue;
        const std::uint8_t* row = &mask.coverage[(size_t)my * (size_t)mask.width];
        for (int mx = 0; mx < mask.width; ++mx)
        {
            if (row[mx] != 0)
                raster::BlendPixel(img, ox + mx, py, color, row[mx]);
        }
    }
}
} // namespace

bool DrawLine(raster::RgbaImage& img,
              const IFontFace& face,
              std::string_view line,
              int x,
              int y,
              const TextStyle& style)
{
    bool stroked = true;
    TextMask mask;
    if (style.stroke_px > 0)
    {
        if (face.RenderMask(line, style.stroke_px, mask))
            BlendMask(img, mask, x, y, style.stroke);
        else
            stroked = false;
    }

    if (face.RenderMask(line, 0, mask))
        BlendMask(img, mask, x, y, style.fill);
    return stroked;
}

bool DrawCenteredLines(raster::RgbaImage& img,
                       const std::vector<std::string>& lines,
                       int y0,
                       int width,
                       const IFontFace& face,
                       const TextStyle& style)
{
    if (lines.empty())
        return true;

    TextStyle s = style;
    if (s.stroke_px <= 0)
        s.stroke_px = StrokeWidthFor(face.PixelSize(), 14);

    const std::vector<int> xs = CenterOffsets(lines, face, width, s.stroke_px);
    const int line_h = LineHeight(face.PixelSize());
    bool stroked = true;
    int y = y0;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        // Offsets include the stroke on both sides; the pen starts one stroke width in.
        stroked = DrawLine(img, face, lines[i], xs[i] + s.stroke_px, y, s) && stroked;
        y += line_h;
    }
    return stroked;
}

bool DrawTextBox(raster::RgbaImage& img,
                 const LayoutBox& box,
                 std::string_view text,
                 const IFontFace& face,
                 const TextBoxStyle& style)
{
    raster::FillRect(img, box, style.box_fill);

    const std::vector<std::string> lines = WrapText(text, face, box.Width() - 2 * style.padding);

    TextStyle ts;
    ts.fill = style.text_fill;
    ts.stroke = style.stroke;
    ts.stroke_px = StrokeWidthFor(face.PixelSize(), style.stroke_divisor);

    const int step = (int)((float)face.PixelSize() * style.line_step);
    bool stroked = true;
    int y = box.y0 + style.padding;
    for (size_t i = 0; i < lines.size() && i < style.max_lines; ++i)
    {
        stroked = DrawLine(img, face, lines[i], box.x0 + style.padding, y, ts) && stroked;
        y += step;
    }
    return stroked;
}
} // namespace memeseed::text
