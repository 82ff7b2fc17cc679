#include "compose/meme_composer.h"

#include "compose/image_compositor.h"

#include "io/image_loader.h"
#include "io/image_writer.h"
#include "vibe/focus_bias.h"

#include <optional>

namespace memeseed::compose
{
namespace
{
static std::vector<raster::RgbaImage> FetchBackgrounds(const std::vector<std::string>& urls,
                                                       ComposeServices& services,
                                                       std::vector<std::string>& errors)
{
    std::vector<raster::RgbaImage> images;
    if (urls.empty())
        return images;

    const std::vector<std::optional<io::ImageBytes>> bytes = io::FetchImages(urls, services.fetcher, services.fetch, services.cancel);
    for (std::size_t i = 0; i < urls.size(); ++i)
    {
        if (i >= bytes.size() || !bytes[i])
        {
            errors.push_back(urls[i] + ": unavailable");
            continue;
        }
        raster::RgbaImage img;
        std::string err;
        if (!image_loader::DecodeImage(*bytes[i], img, err))
        {
            errors.push_back(urls[i] + ": " + err);
            continue;
        }
        images.push_back(std::move(img));
    }
    return images;
}
} // namespace

bool Compose(std::vector<Post> posts,
             const StyleConfig& config,
             ComposeServices& services,
             RenderedMeme& out,
             std::string& err)
{
    out = RenderedMeme{};
    MemeMetadata& meta = out.metadata;

    vibe::ClassifyPosts(posts, services.scorer);
    meta.post_count = posts.size();
    meta.mean_polarity = vibe::MeanPolarity(posts);
    meta.mood = vibe::ClassifyMood(meta.mean_polarity, services.tuning.mood);

    MemeContext ctx;
    ctx.config = config;
    ctx.config.tiles = NormalizeTiles(config.tiles);
    ctx.mood = meta.mood;
    ctx.keywords = vibe::ExtractKeywords(posts, meta.mood, services.tuning.top_k, services.tuning.alignment);
    if (config.focus_bias)
    {
        ctx.focus_terms = vibe::PickFocusTerms(vibe::DefaultFocusPools(), services.rng);
        ctx.keywords = vibe::BiasKeywords(ctx.keywords, ctx.focus_terms, services.tuning.top_k);
    }
    if (!posts.empty())
        ctx.event = posts.front().event;

    const std::unique_ptr<IMemeStyle> style = MakeStyle(config.style);

    meta.image_urls_used = style->PlanImages(posts, ctx, services.rng);
    meta.images_requested = meta.image_urls_used.size();
    const std::vector<raster::RgbaImage> images = FetchBackgrounds(meta.image_urls_used, services, meta.image_errors);
    meta.images_used = images.size();

    const MemeCopy copy = style->WriteCopy(ctx, services.rng);
    StyleRender rendered = style->Render(images, ctx, copy, services.fonts);

    meta.keywords = ctx.keywords;
    meta.focus_terms = ctx.focus_terms;
    meta.style = style->Kind();
    meta.tiles_requested = ctx.config.tiles;
    meta.tiles_used = rendered.tiles_used;
    meta.headline = copy.headline;
    meta.subline = copy.subline;
    meta.caption = style->Caption(ctx, copy);
    meta.stroke_fallback = rendered.stroke_fallback;

    out.caption = meta.caption;
    out.image = std::move(rendered.image);

    if (!image_writer::EncodePng(out.image, out.png, err))
    {
        err = "PNG encode failed: " + err;
        return false;
    }
    return true;
}
} // namespace memeseed::compose
