#include "app/config.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace memeseed::app
{
namespace
{
static void ReadInt(const json& j, const char* key, int& out)
{
    if (j.contains(key) && j[key].is_number_integer())
        out = j[key].get<int>();
}

static void ReadLong(const json& j, const char* key, long& out)
{
    if (j.contains(key) && j[key].is_number_integer())
        out = j[key].get<long>();
}

static void ReadFloat(const json& j, const char* key, float& out)
{
    if (j.contains(key) && j[key].is_number())
        out = j[key].get<float>();
}

static void ReadBool(const json& j, const char* key, bool& out)
{
    if (j.contains(key) && j[key].is_boolean())
        out = j[key].get<bool>();
}

static void ReadString(const json& j, const char* key, std::string& out)
{
    if (j.contains(key) && j[key].is_string())
        out = j[key].get<std::string>();
}

static bool StyleFromJson(const json& js, compose::StyleConfig& out, std::string& err)
{
    if (js.contains("style") && js["style"].is_string())
    {
        const std::string name = js["style"].get<std::string>();
        if (!compose::ParseMemeStyle(name, out.style))
        {
            err = "style.style must be \"grid\" or \"classic\", got \"" + name + "\"";
            return false;
        }
    }
    ReadInt(js, "tiles", out.tiles);
    ReadBool(js, "focus_bias", out.focus_bias);
    ReadBool(js, "two_image_background", out.two_image_background);
    ReadBool(js, "show_cta", out.show_cta);
    return true;
}
} // namespace

AppConfig::AppConfig()
{
    fonts.candidates = text::DefaultFontCandidates();
}

bool FromJson(const json& j, AppConfig& out, std::string& err)
{
    err.clear();
    if (!j.is_object())
    {
        err = "Config root must be a JSON object.";
        return false;
    }

    ReadInt(j, "width", out.style.width);
    ReadInt(j, "height", out.style.height);
    ReadString(j, "business", out.style.business);
    ReadString(j, "offer", out.style.offer);
    ReadString(j, "topic", out.style.topic);
    ReadString(j, "subreddit", out.subreddit);
    ReadInt(j, "post_limit", out.post_limit);
    ReadString(j, "user_agent", out.user_agent);
    ReadString(j, "lexicon_path", out.lexicon_path);

    if (j.contains("top_k") && j["top_k"].is_number_unsigned())
        out.tuning.top_k = j["top_k"].get<std::size_t>();

    if (j.contains("mood_thresholds") && j["mood_thresholds"].is_object())
    {
        const json& jm = j["mood_thresholds"];
        ReadFloat(jm, "positive_above", out.tuning.mood.positive_above);
        ReadFloat(jm, "negative_below", out.tuning.mood.negative_below);
    }
    if (j.contains("alignment_thresholds") && j["alignment_thresholds"].is_object())
    {
        const json& ja = j["alignment_thresholds"];
        ReadFloat(ja, "positive_at_least", out.tuning.alignment.positive_at_least);
        ReadFloat(ja, "negative_at_most", out.tuning.alignment.negative_at_most);
    }

    if (j.contains("font_candidates") && j["font_candidates"].is_array())
    {
        out.fonts.candidates.clear();
        for (const auto& c : j["font_candidates"])
            if (c.is_string())
                out.fonts.candidates.push_back(c.get<std::string>());
    }
    ReadString(j, "fontconfig_pattern", out.fonts.fontconfig_pattern);

    if (j.contains("fetch") && j["fetch"].is_object())
    {
        ReadInt(j["fetch"], "max_concurrency", out.fetch.max_concurrency);
        ReadLong(j["fetch"], "timeout_ms", out.fetch.timeout_ms);
    }
    if (j.contains("cache") && j["cache"].is_object())
        ReadLong(j["cache"], "ttl_seconds", out.cache_ttl_seconds);

    if (j.contains("style") && j["style"].is_object())
    {
        if (!StyleFromJson(j["style"], out.style, err))
            return false;
    }

    if (out.style.width <= 0 || out.style.height <= 0)
    {
        err = "width and height must be positive.";
        return false;
    }
    if (out.tuning.mood.negative_below > out.tuning.mood.positive_above)
    {
        err = "mood_thresholds.negative_below must not exceed positive_above.";
        return false;
    }
    if (out.fetch.max_concurrency < 1)
        out.fetch.max_concurrency = 1;
    if (out.cache_ttl_seconds < 0)
        out.cache_ttl_seconds = 0;
    return true;
}

bool LoadAppConfig(const std::string& path, AppConfig& out, bool& found, std::string& err)
{
    err.clear();
    found = false;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return true;
    found = true;

    std::ifstream f(path);
    if (!f)
    {
        err = "Failed to open config: " + path;
        return false;
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse config: ") + e.what();
        return false;
    }

    if (!FromJson(j, out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}
} // namespace memeseed::app
