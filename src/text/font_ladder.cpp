#include "text/font_ladder.h"

#include "text/bitmap_font.h"
#include "text/utf8.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_GLYPH_H
#include FT_STROKER_H

#include <fontconfig/fontconfig.h>

#include <algorithm>
#include <filesystem>
#include <map>

namespace memeseed::text
{
namespace
{
// One FT_Face opened at one pixel size.
class FreeTypeFace final : public IFontFace
{
public:
    FreeTypeFace(FT_Library library, FT_Face face, std::string path, int pixel_size)
        : m_library(library)
        , m_face(face)
        , m_path(std::move(path))
        , m_pixel_size(pixel_size)
    {
    }

    ~FreeTypeFace() override
    {
        if (m_face)
            FT_Done_Face(m_face);
    }

    FreeTypeFace(const FreeTypeFace&) = delete;
    FreeTypeFace& operator=(const FreeTypeFace&) = delete;

    int PixelSize() const override { return m_pixel_size; }

    int Ascent() const override
    {
        return std::max(0, (int)((m_face->size->metrics.ascender + 63) >> 6));
    }

    int Descent() const override
    {
        return std::max(0, (int)((-m_face->size->metrics.descender + 63) >> 6));
    }

    int MeasureWidth(std::string_view utf8) const override
    {
        const std::vector<char32_t> cps = DecodeUtf8(utf8);
        FT_Pos pen = 0;
        FT_UInt prev = 0;
        for (char32_t cp : cps)
        {
            const FT_UInt idx = FT_Get_Char_Index(m_face, (FT_ULong)cp);
            pen += Kerning(prev, idx);
            if (FT_Load_Glyph(m_face, idx, FT_LOAD_DEFAULT) == 0)
                pen += m_face->glyph->advance.x;
            prev = idx;
        }
        return (int)((pen + 63) >> 6);
    }

    bool RenderMask(std::string_view utf8, int stroke_px, TextMask& out) const override
    {
        out = TextMask{};
        stroke_px = std::max(0, stroke_px);

        FT_Stroker stroker = nullptr;
        if (stroke_px > 0)
        {
            if (FT_Stroker_New(m_library, &stroker) != 0)
                return false;
            FT_Stroker_Set(stroker, (FT_Fixed)stroke_px * 64, FT_STROKER_LINECAP_ROUND, FT_STROKER_LINEJOIN_ROUND, 0);
        }

        out.pad = stroke_px;
        out.width = MeasureWidth(utf8) + 2 * stroke_px;
        out.height = Ascent() + Descent() + 2 * stroke_px;
        if (out.width <= 0 || out.height <= 0)
        {
            if (stroker)
                FT_Stroker_Done(stroker);
            out = TextMask{};
            return true;
        }
        out.coverage.assign((size_t)out.width * (size_t)out.height, 0);

        const int baseline = stroke_px + Ascent();
        FT_Pos pen = (FT_Pos)stroke_px * 64;
        FT_UInt prev = 0;
        bool ok = true;
        for (char32_t cp : DecodeUtf8(utf8))
        {
            const FT_UInt idx = FT_Get_Char_Index(m_face, (FT_ULong)cp);
            pen += Kerning(prev, idx);
            prev = idx;

            if (FT_Load_Glyph(m_face, idx, FT_LOAD_DEFAULT) != 0)
                continue;
            const FT_Pos advance = m_face->glyph->advance.x;

            FT_Glyph glyph = nullptr;
            if (FT_Get_Glyph(m_face->glyph, &glyph) != 0)
            {
                pen += advance;
                continue;
            }

            if (stroker)
            {
                // Bitmap-only glyphs cannot be stroked.
                if (glyph->format != FT_GLYPH_FORMAT_OUTLINE || FT_Glyph_StrokeBorder(&glyph, stroker, false, true) != 0)
                {
                    FT_Done_Glyph(glyph);
                    ok = false;
                    break;
                }
            }

            if (FT_Glyph_To_Bitmap(&glyph, FT_RENDER_MODE_NORMAL, nullptr, true) == 0)
            {
                const FT_BitmapGlyph bg = (FT_BitmapGlyph)glyph;
                Blit(bg->bitmap, (int)(pen >> 6) + bg->left, baseline - bg->top, out);
            }
            FT_Done_Glyph(glyph);
            pen += advance;
        }

        if (stroker)
            FT_Stroker_Done(stroker);
        if (!ok)
            out = TextMask{};
        return ok;
    }

    std::string Describe() const override
    {
        return m_path + " @ " + std::to_string(m_pixel_size) + "px";
    }

private:
    FT_Pos Kerning(FT_UInt prev, FT_UInt idx) const
    {
        if (!prev || !idx || !FT_HAS_KERNING(m_face))
            return 0;
        FT_Vector k{0, 0};
        if (FT_Get_Kerning(m_face, prev, idx, FT_KERNING_DEFAULT, &k) != 0)
            return 0;
        return k.x;
    }

    // Max-combines an 8-bit gray (or 1-bit mono) FreeType bitmap into the mask, clipped.
    static void Blit(const FT_Bitmap& bmp, int x0, int y0, TextMask& out)
    {
        for (unsigned int row = 0; row < bmp.rows; ++row)
        {
            const int y = y0 + (int)row;
            if (y < 0 || y >= out.height)
                continue;
            const unsigned char* src = bmp.buffer + (std::ptrdiff_t)row * bmp.pitch;
            for (unsigned int col = 0; col < bmp.width; ++col)
            {
                const int x = x0 + (int)col;
                if (x < 0 || x >= out.width)
                    continue;
                std::uint8_t v = 0;
                if (bmp.pixel_mode == FT_PIXEL_MODE_MONO)
                    v = (src[col >> 3] & (0x80 >> (col & 7))) ? 255 : 0;
                else
                    v = src[col];
                std::uint8_t& dst = out.coverage[(size_t)y * (size_t)out.width + (size_t)x];
                dst = std::max(dst, v);
            }
        }
    }

    FT_Library m_library = nullptr;
    FT_Face m_face = nullptr;
    std::string m_path;
    int m_pixel_size = 0;
};

static bool OpenScalable(FT_Library library, const std::string& path, FT_Face& out)
{
    out = nullptr;
    FT_Face face = nullptr;
    if (FT_New_Face(library, path.c_str(), 0, &face) != 0)
        return false;
    if (!FT_IS_SCALABLE(face))
    {
        FT_Done_Face(face);
        return false;
    }
    out = face;
    return true;
}

// fontconfig's best match for `pattern`, or empty.
static std::string FontconfigMatch(const std::string& pattern)
{
    if (pattern.empty() || !FcInit())
        return {};

    FcPattern* pat = FcNameParse((const FcChar8*)pattern.c_str());
    if (!pat)
        return {};
    FcConfigSubstitute(nullptr, pat, FcMatchPattern);
    FcDefaultSubstitute(pat);

    std::string path;
    FcResult result = FcResultNoMatch;
    FcPattern* match = FcFontMatch(nullptr, pat, &result);
    if (match)
    {
        FcChar8* file = nullptr;
        if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file)
            path = (const char*)file;
        FcPatternDestroy(match);
    }
    FcPatternDestroy(pat);
    return path;
}
} // namespace

std::string_view FontRungName(FontRung rung)
{
    switch (rung)
    {
        case FontRung::Candidate: return "candidate";
        case FontRung::Fontconfig: return "fontconfig";
        case FontRung::Builtin: return "builtin";
    }
    return "builtin";
}

std::vector<std::string> DefaultFontCandidates()
{
    return {
        "/System/Library/Fonts/Supplemental/Impact.ttf",
        "/System/Library/Fonts/Supplemental/Arial Bold.ttf",
        "/Library/Fonts/Impact.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
    };
}

struct FontLadder::Impl
{
    FontLadderOptions options;
    bool resolved = false;
    FontRung rung = FontRung::Builtin;
    std::string path;
    std::vector<std::string> rejections;

    FT_Library library = nullptr;
    std::map<int, std::unique_ptr<IFontFace>> faces;

    ~Impl()
    {
        faces.clear();
        if (library)
            FT_Done_FreeType(library);
    }
};

FontLadder::FontLadder(FontLadderOptions options)
    : m_impl(std::make_unique<Impl>())
{
    m_impl->options = std::move(options);
}

FontLadder::~FontLadder() = default;

void FontLadder::Resolve()
{
    Impl& s = *m_impl;
    if (s.resolved)
        return;
    s.resolved = true;

    if (FT_Init_FreeType(&s.library) != 0)
    {
        s.library = nullptr;
        s.rejections.push_back("freetype: init failed");
        return;
    }

    auto try_path = [&](const std::string& p, FontRung rung) -> bool {
        FT_Face probe = nullptr;
        if (!OpenScalable(s.library, p, probe))
        {
            s.rejections.push_back(std::string(FontRungName(rung)) + ": cannot open " + p);
            return false;
        }
        FT_Done_Face(probe);
        s.path = p;
        s.rung = rung;
        return true;
    };

    for (const auto& p : s.options.candidates)
    {
        std::error_code ec;
        if (p.empty() || !std::filesystem::exists(p, ec))
        {
            s.rejections.push_back("candidate: missing " + p);
            continue;
        }
        if (try_path(p, FontRung::Candidate))
            return;
    }

    if (!s.options.fontconfig_pattern.empty())
    {
        const std::string match = FontconfigMatch(s.options.fontconfig_pattern);
        if (match.empty())
            s.rejections.push_back("fontconfig: no match for '" + s.options.fontconfig_pattern + "'");
        else if (try_path(match, FontRung::Fontconfig))
            return;
    }

    s.rung = FontRung::Builtin;
    s.path.clear();
}

const IFontFace& FontLadder::FaceAt(int pixel_size)
{
    Resolve();
    Impl& s = *m_impl;
    pixel_size = std::max(1, pixel_size);

    auto it = s.faces.find(pixel_size);
    if (it != s.faces.end())
        return *it->second;

    std::unique_ptr<IFontFace> face;
    if (s.rung != FontRung::Builtin && s.library)
    {
        FT_Face ft = nullptr;
        if (OpenScalable(s.library, s.path, ft))
        {
            if (FT_Set_Pixel_Sizes(ft, 0, (FT_UInt)pixel_size) == 0)
                face = std::make_unique<FreeTypeFace>(s.library, ft, s.path, pixel_size);
            else
                FT_Done_Face(ft);
        }
    }
    if (!face)
        face = std::make_unique<BitmapFace>(pixel_size);

    const IFontFace& ref = *face;
    s.faces.emplace(pixel_size, std::move(face));
    return ref;
}

FontRung FontLadder::Rung()
{
    Resolve();
    return m_impl->rung;
}

const std::string& FontLadder::FontPath()
{
    Resolve();
    return m_impl->path;
}

const std::vector<std::string>& FontLadder::Rejections()
{
    Resolve();
    return m_impl->rejections;
}
} // namespace memeseed::text
