#pragma once

#include "core/post.h"
#include "core/random_source.h"
#include "raster/rgba_image.h"
#include "text/font_face.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace memeseed::compose
{
enum class MemeStyleKind : std::uint8_t
{
    Grid = 0, // 1/2/4 cover-filled photo tiles, mood band, keyword labels, CTA band
    Classic,  // contain-on-blur background, top/bottom meme text
};

// "grid" / "classic"
std::string_view MemeStyleName(MemeStyleKind kind);

// Case-insensitive. Returns false for anything else.
bool ParseMemeStyle(std::string_view name, MemeStyleKind& out);

struct StyleConfig
{
    MemeStyleKind style = MemeStyleKind::Grid;
    int tiles = 4;                     // grid only; coerced into {1, 2, 4}
    bool focus_bias = false;
    bool two_image_background = true;  // classic only
    bool show_cta = false;             // classic only; the grid always shows its CTA band

    int width = 1024;
    int height = 1024;

    std::string business = "local pizza shop";
    std::string offer = "15% OFF";
    std::string topic = "super bowl";
};

// What a style gets to work with once the batch has been classified.
struct MemeContext
{
    MoodState mood = MoodState::Neutral;
    std::vector<std::string> keywords;
    std::vector<std::string> focus_terms; // empty unless focus bias is on
    std::optional<std::string> event;     // event of the first post
    StyleConfig config;
};

struct MemeCopy
{
    std::string headline;
    std::string subline;
};

struct StyleRender
{
    raster::RgbaImage image;
    int tiles_used = 1;
    bool stroke_fallback = false; // some outline could not be drawn and plain fill was used
};

// One meme style. Both implementations share the compositor and text layout primitives.
class IMemeStyle
{
public:
    virtual ~IMemeStyle() = default;

    virtual MemeStyleKind Kind() const = 0;

    // Background image URLs to fetch for this batch, in render order.
    virtual std::vector<std::string> PlanImages(const std::vector<Post>& posts,
                                                const MemeContext& ctx,
                                                IRandomSource& rng) const = 0;

    // Headline and subline shown on the canvas.
    virtual MemeCopy WriteCopy(const MemeContext& ctx, IRandomSource& rng) const = 0;

    // `images` are the decoded backgrounds (possibly fewer than planned, possibly none).
    virtual StyleRender Render(const std::vector<raster::RgbaImage>& images,
                               const MemeContext& ctx,
                               const MemeCopy& copy,
                               text::IFontProvider& fonts) const = 0;

    virtual std::string Caption(const MemeContext& ctx, const MemeCopy& copy) const = 0;
};

class GridStyle final : public IMemeStyle
{
public:
    MemeStyleKind Kind() const override { return MemeStyleKind::Grid; }
    std::vector<std::string> PlanImages(const std::vector<Post>& posts,
                                        const MemeContext& ctx,
                                        IRandomSource& rng) const override;
    MemeCopy WriteCopy(const MemeContext& ctx, IRandomSource& rng) const override;
    StyleRender Render(const std::vector<raster::RgbaImage>& images,
                       const MemeContext& ctx,
                       const MemeCopy& copy,
                       text::IFontProvider& fonts) const override;
    std::string Caption(const MemeContext& ctx, const MemeCopy& copy) const override;
};

class ClassicStyle final : public IMemeStyle
{
public:
    MemeStyleKind Kind() const override { return MemeStyleKind::Classic; }
    std::vector<std::string> PlanImages(const std::vector<Post>& posts,
                                        const MemeContext& ctx,
                                        IRandomSource& rng) const override;
    MemeCopy WriteCopy(const MemeContext& ctx, IRandomSource& rng) const override;
    StyleRender Render(const std::vector<raster::RgbaImage>& images,
                       const MemeContext& ctx,
                       const MemeCopy& copy,
                       text::IFontProvider& fonts) const override;
    std::string Caption(const MemeContext& ctx, const MemeCopy& copy) const override;
};

std::unique_ptr<IMemeStyle> MakeStyle(MemeStyleKind kind);

// Grid overlay geometry, scaled from the 1024 reference canvas. Exposed for tests.
LayoutBox GridTopBand(int width, int height);
LayoutBox GridCtaBand(int width, int height);
LayoutBox GridLabelBox(const LayoutBox& tile, int tiles, int width, int height);
} // namespace memeseed::compose
