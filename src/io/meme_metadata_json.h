#pragma once

#include "compose/meme_composer.h"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace memeseed::io
{
// {mood, keywords, imagesUsed, imagesRequested, tilesRequested, tilesUsed, style, focusTerms,
//  imageUrlsUsed, headline, subline, caption, meanPolarity, postCount, strokeFallback}
// `mood` is the meme word (HYPE / SALTY / NEUTRAL); `moodState` carries the classifier label.
nlohmann::json MemeMetadataToJson(const compose::MemeMetadata& meta);

// Pretty-printed (2-space indent) JSON text. Invalid UTF-8 in any string is replaced with
// U+FFFD rather than rejected.
bool MemeMetadataToJsonText(const compose::MemeMetadata& meta, std::string& out, std::string& err);
} // namespace memeseed::io
