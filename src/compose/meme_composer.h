#pragma once

#include "compose/meme_style.h"
#include "core/post.h"
#include "core/random_source.h"
#include "io/image_fetch.h"
#include "raster/rgba_image.h"
#include "text/font_face.h"
#include "vibe/keyword_extractor.h"
#include "vibe/vibe_classifier.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace memeseed::compose
{
// Classification knobs. The two threshold pairs are independent of each other.
struct ComposeTuning
{
    vibe::MoodThresholds mood;
    vibe::AlignmentThresholds alignment;
    std::size_t top_k = vibe::kDefaultTopK;
};

// Collaborators for one compose call. Nothing here is owned.
struct ComposeServices
{
    const vibe::ISentimentScorer& scorer;
    IRandomSource& rng;
    io::IImageFetcher& fetcher;
    text::IFontProvider& fonts;
    io::FetchOptions fetch = {};
    const std::atomic<bool>* cancel = nullptr;
    ComposeTuning tuning = {};
};

// What actually went into the meme.
struct MemeMetadata
{
    MoodState mood = MoodState::Neutral;
    float mean_polarity = 0.0f;
    std::size_t post_count = 0;
    std::vector<std::string> keywords;
    std::vector<std::string> focus_terms;

    MemeStyleKind style = MemeStyleKind::Grid;
    int tiles_requested = 4;
    int tiles_used = 1;
    std::vector<std::string> image_urls_used; // selected URLs, in render order
    std::size_t images_requested = 0;
    std::size_t images_used = 0;              // decoded successfully
    std::vector<std::string> image_errors;    // "url: reason" for each selected URL that was dropped

    std::string headline;
    std::string subline;
    std::string caption;
    bool stroke_fallback = false;
};

struct RenderedMeme
{
    raster::RgbaImage image;
    std::vector<std::uint8_t> png;
    std::string caption;
    MemeMetadata metadata;
};

// classify -> keywords -> focus bias -> image plan -> fetch/decode -> copy -> render -> PNG.
//
// Missing or broken images, empty batches and unfit text all degrade to placeholder output; the
// only failure is PNG encoding, reported through `err`.
bool Compose(std::vector<Post> posts,
             const StyleConfig& config,
             ComposeServices& services,
             RenderedMeme& out,
             std::string& err);
} // namespace memeseed::compose
