#pragma once

#include "compose/meme_composer.h"
#include "compose/meme_style.h"
#include "io/image_fetch.h"
#include "text/font_ladder.h"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace memeseed::app
{
struct AppConfig
{
    compose::StyleConfig style;
    compose::ComposeTuning tuning;
    text::FontLadderOptions fonts;
    io::FetchOptions fetch;
    long cache_ttl_seconds = 600;

    std::string lexicon_path; // optional VADER-format lexicon merged over the built-in one
    std::string subreddit = "nfl";
    int post_limit = 25;
    std::string user_agent = "memeseed/0.1 (meme generator)";

    AppConfig();
};

// Applies recognised keys from `j`. Unknown keys are ignored; a recognised key with the wrong type
// keeps its current value. Fails only when `j` is not an object or a value is out of range.
bool FromJson(const nlohmann::json& j, AppConfig& out, std::string& err);

// Loads `path` on top of the defaults. A missing file leaves `out` at defaults and succeeds
// (`found` reports whether the file existed); unreadable or malformed JSON fails.
bool LoadAppConfig(const std::string& path, AppConfig& out, bool& found, std::string& err);
} // namespace memeseed::app
