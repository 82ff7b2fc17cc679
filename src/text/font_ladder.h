#pragma once

#include "text/font_face.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace memeseed::text
{
// Which rung of the ladder supplied the faces.
enum class FontRung : std::uint8_t
{
    Candidate = 0, // one of the configured TTF/OTF paths
    Fontconfig,    // best system match for the fontconfig pattern
    Builtin,       // BitmapFace
};

std::string_view FontRungName(FontRung rung);

struct FontLadderOptions
{
    // Tried in order; the first file FreeType can open as a scalable face wins.
    std::vector<std::string> candidates;
    // fontconfig pattern tried next ("" skips this rung).
    std::string fontconfig_pattern = "sans-serif:bold";
};

// Bold display faces commonly present on macOS and Linux installs.
std::vector<std::string> DefaultFontCandidates();

// Best-effort font chooser: configured candidates, then fontconfig, then the built-in bitmap face.
// Resolution happens once, on first use, and never fails. Faces are cached per pixel size and live
// as long as the ladder. Not thread-safe; one ladder per render.
class FontLadder final : public IFontProvider
{
public:
    explicit FontLadder(FontLadderOptions options);
    ~FontLadder() override;

    FontLadder(const FontLadder&) = delete;
    FontLadder& operator=(const FontLadder&) = delete;

    const IFontFace& FaceAt(int pixel_size) override;

    FontRung Rung();

    // Font file in use; empty for the built-in rung.
    const std::string& FontPath();

    // One line per rejected rung ("missing: /path", "fontconfig: no match", ...).
    const std::vector<std::string>& Rejections();

private:
    void Resolve();

    struct Impl;
    std::unique_ptr<Impl> m_impl;
};
} // namespace memeseed::text
