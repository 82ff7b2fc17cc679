#include "io/meme_metadata_json.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace memeseed::io
{
json MemeMetadataToJson(const compose::MemeMetadata& meta)
{
    json j;
    j["mood"] = std::string(MoodWord(meta.mood));
    j["moodState"] = std::string(MoodStateName(meta.mood));
    j["meanPolarity"] = meta.mean_polarity;
    j["postCount"] = meta.post_count;
    j["keywords"] = meta.keywords;
    j["focusTerms"] = meta.focus_terms;
    j["style"] = std::string(compose::MemeStyleName(meta.style));
    j["tilesRequested"] = meta.tiles_requested;
    j["tilesUsed"] = meta.tiles_used;
    j["imageUrlsUsed"] = meta.image_urls_used;
    j["imagesRequested"] = meta.images_requested;
    j["imagesUsed"] = meta.images_used;
    j["headline"] = meta.headline;
    j["subline"] = meta.subline;
    j["caption"] = meta.caption;
    j["strokeFallback"] = meta.stroke_fallback;
    return j;
}

bool MemeMetadataToJsonText(const compose::MemeMetadata& meta, std::string& out, std::string& err)
{
    err.clear();
    out.clear();
    try
    {
        // Business/offer text comes straight from argv; invalid UTF-8 becomes U+FFFD.
        out = MemeMetadataToJson(meta).dump(2, ' ', false, json::error_handler_t::replace);
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to serialize metadata: ") + e.what();
        return false;
    }
    return true;
}
} // namespace memeseed::io
