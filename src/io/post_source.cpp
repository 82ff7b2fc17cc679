#include "io/post_source.h"

#include "io/http_client.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

using json = nlohmann::json;

namespace memeseed::io
{
namespace
{
// Largest byte count <= `limit` that does not cut a UTF-8 sequence in half.
static size_t Utf8BoundaryAtOrBefore(const std::string& s, size_t limit)
{
    if (limit >= s.size())
        return s.size();
    size_t n = limit;
    while (n > 0 && ((unsigned char)s[n] & 0xC0) == 0x80)
        --n;
    return n;
}

constexpr size_t kMaxPostTextBytes = 2000;
constexpr size_t kMinPostTextBytes = 6;
constexpr size_t kMaxPreviewSources = 4;

static std::string ToLowerAscii(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static std::string TrimAscii(const std::string& s)
{
    size_t b = 0;
    while (b < s.size() && std::isspace((unsigned char)s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace((unsigned char)s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

static bool EndsWith(const std::string& s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool LooksLikeImageUrl(const std::string& url)
{
    const std::string ul = ToLowerAscii(url);
    for (std::string_view ext : {".jpg", ".jpeg", ".png", ".webp"})
        if (EndsWith(ul, ext))
            return true;
    return ul.find("i.redd.it/") != std::string::npos || ul.find("preview.redd.it/") != std::string::npos;
}

static std::string StringOr(const json& j, const char* key)
{
    if (j.is_object() && j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return {};
}

static void AppendUtf8(std::uint32_t cp, std::string& out)
{
    if (cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu))
        cp = 0xFFFDu;
    if (cp <= 0x7Fu)
    {
        out.push_back((char)cp);
    }
    else if (cp <= 0x7FFu)
    {
        out.push_back((char)(0xC0u | ((cp >> 6) & 0x1Fu)));
        out.push_back((char)(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0xFFFFu)
    {
        out.push_back((char)(0xE0u | ((cp >> 12) & 0x0Fu)));
        out.push_back((char)(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back((char)(0x80u | (cp & 0x3Fu)));
    }
    else
    {
        out.push_back((char)(0xF0u | ((cp >> 18) & 0x07u)));
        out.push_back((char)(0x80u | ((cp >> 12) & 0x3Fu)));
        out.push_back((char)(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back((char)(0x80u | (cp & 0x3Fu)));
    }
}

// Ordered, deduplicating URL collector.
struct UrlList
{
    std::vector<std::string> urls;
    std::unordered_set<std::string> seen;

    void Add(const std::string& raw)
    {
        if (raw.empty())
            return;
        std::string u = HtmlUnescape(raw);
        if (seen.insert(u).second)
            urls.push_back(std::move(u));
    }
};

static void CollectImageUrls(const json& d, UrlList& list, int depth)
{
    if (!d.is_object())
        return;

    // Galleries.
    if (d.contains("is_gallery") && d["is_gallery"].is_boolean() && d["is_gallery"].get<bool>() &&
        d.contains("media_metadata") && d["media_metadata"].is_object())
    {
        for (const auto& item : d["media_metadata"].items())
        {
            const json& v = item.value();
            if (v.is_object() && v.contains("s"))
                list.Add(StringOr(v["s"], "u"));
        }
    }

    // Crossposts can carry media the parent lacks.
    if (depth == 0 && d.contains("crosspost_parent_list") && d["crosspost_parent_list"].is_array() &&
        !d["crosspost_parent_list"].empty())
    {
        UrlList nested;
        CollectImageUrls(d["crosspost_parent_list"][0], nested, depth + 1);
        for (const auto& u : nested.urls)
            if (LooksLikeImageUrl(u))
                list.Add(u);
    }

    // Preview sources.
    if (d.contains("preview") && d["preview"].is_object() && d["preview"].contains("images") &&
        d["preview"]["images"].is_array())
    {
        const json& imgs = d["preview"]["images"];
        for (size_t i = 0; i < imgs.size() && i < kMaxPreviewSources; ++i)
        {
            if (imgs[i].is_object() && imgs[i].contains("source"))
                list.Add(StringOr(imgs[i]["source"], "url"));
        }
    }

    // Direct link.
    std::string direct = StringOr(d, "url_overridden_by_dest");
    if (direct.empty())
        direct = StringOr(d, "url");
    if (!direct.empty())
    {
        const std::string u = HtmlUnescape(direct);
        if (LooksLikeImageUrl(u))
            list.Add(u);
    }
}

static std::string UrlEncode(const std::string& s)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back((char)c);
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 15]);
        }
    }
    return out;
}

static bool ReadTextFile(const std::string& path, std::string& out, std::string& err)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        err = "Failed to open: " + path;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}
} // namespace

std::string HtmlUnescape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size())
    {
        if (s[i] != '&')
        {
            out.push_back(s[i++]);
            continue;
        }
        const size_t semi = s.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 10)
        {
            out.push_back(s[i++]);
            continue;
        }

        const std::string_view ent = s.substr(i + 1, semi - i - 1);
        bool decoded = true;
        if (ent == "amp")
            out.push_back('&');
        else if (ent == "lt")
            out.push_back('<');
        else if (ent == "gt")
            out.push_back('>');
        else if (ent == "quot")
            out.push_back('"');
        else if (ent == "apos")
            out.push_back('\'');
        else if (ent == "nbsp")
            AppendUtf8(0xA0, out);
        else if (ent.size() >= 2 && ent[0] == '#')
        {
            const bool is_hex = ent[1] == 'x' || ent[1] == 'X';
            const std::string digits(ent.substr(is_hex ? 2 : 1));
            char* end = nullptr;
            const unsigned long cp = std::strtoul(digits.c_str(), &end, is_hex ? 16 : 10);
            if (digits.empty() || end != digits.c_str() + digits.size())
                decoded = false;
            else
                AppendUtf8((std::uint32_t)cp, out);
        }
        else
        {
            decoded = false;
        }

        if (decoded)
        {
            i = semi + 1;
        }
        else
        {
            out.push_back(s[i++]);
        }
    }
    return out;
}

std::vector<std::string> ExtractRedditImageUrls(const json& data)
{
    UrlList list;
    CollectImageUrls(data, list, 0);

    std::vector<std::string> cleaned;
    for (auto& u : list.urls)
        if (LooksLikeImageUrl(u))
            cleaned.push_back(std::move(u));
    return cleaned;
}

bool ParseRedditListing(const std::string& body, int limit, std::vector<Post>& out, std::string& err)
{
    err.clear();
    out.clear();

    json j;
    try
    {
        j = json::parse(body);
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse listing: ") + e.what();
        return false;
    }

    if (!j.is_object() || !j.contains("data") || !j["data"].is_object())
    {
        err = "Listing has no data object.";
        return false;
    }
    const json& listing = j["data"];
    if (!listing.contains("children") || !listing["children"].is_array())
        return true; // empty listing

    for (const auto& child : listing["children"])
    {
        if (limit > 0 && (int)out.size() >= limit)
            break;
        if (!child.is_object() || !child.contains("data") || !child["data"].is_object())
            continue;
        const json& d = child["data"];

        Post p;
        p.title = StringOr(d, "title");
        const std::string selftext = StringOr(d, "selftext");
        const std::string text = TrimAscii(p.title + "\n" + selftext);
        if (text.size() < kMinPostTextBytes)
            continue;

        // Body is whatever follows the title, capped with the title at the same total length.
        p.body = TrimAscii(selftext);
        if (p.title.size() + 1 + p.body.size() > kMaxPostTextBytes)
        {
            const size_t room = p.title.size() + 1 < kMaxPostTextBytes ? kMaxPostTextBytes - p.title.size() - 1 : 0;
            p.body.resize(Utf8BoundaryAtOrBefore(p.body, room));
        }

        p.id = StringOr(d, "name");
        if (p.id.empty())
            p.id = StringOr(d, "id");
        if (d.contains("created_utc") && d["created_utc"].is_number())
            p.created_at = (std::int64_t)std::llround(d["created_utc"].get<double>());
        p.image_urls = ExtractRedditImageUrls(d);
        out.push_back(std::move(p));
    }
    return true;
}

bool ParsePostsJson(const std::string& text, std::vector<Post>& out, std::string& err)
{
    err.clear();
    out.clear();

    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse posts: ") + e.what();
        return false;
    }

    // Accept a bare array or {"posts": [...]}.
    const json* arr = &j;
    if (j.is_object() && j.contains("posts"))
        arr = &j["posts"];
    if (!arr->is_array())
    {
        err = "Posts file must hold a JSON array.";
        return false;
    }

    for (const auto& e : *arr)
    {
        if (!e.is_object())
            continue;
        Post p;
        p.id = StringOr(e, "id");
        p.title = StringOr(e, "title");
        p.body = StringOr(e, "body");
        if (e.contains("created_at") && e["created_at"].is_number())
            p.created_at = (std::int64_t)std::llround(e["created_at"].get<double>());
        if (e.contains("image_urls") && e["image_urls"].is_array())
        {
            for (const auto& u : e["image_urls"])
                if (u.is_string() && !u.get<std::string>().empty())
                    p.image_urls.push_back(u.get<std::string>());
        }
        out.push_back(std::move(p));
    }
    return true;
}

RedditPostSource::RedditPostSource(long timeout_ms, std::string user_agent)
    : m_timeout_ms(timeout_ms)
    , m_user_agent(std::move(user_agent))
{
}

std::string RedditPostSource::BuildUrl(const PostQuery& query)
{
    const std::string sub = UrlEncode(query.subreddit.empty() ? std::string("nfl") : query.subreddit);
    const int limit = std::clamp(query.limit, 1, 100);
    if (!TrimAscii(query.query).empty())
    {
        return "https://www.reddit.com/r/" + sub + "/search.json?q=" + UrlEncode(query.query) +
               "&sort=new&restrict_sr=1&limit=" + std::to_string(limit);
    }
    return "https://www.reddit.com/r/" + sub + "/new.json?limit=" + std::to_string(limit);
}

bool RedditPostSource::Fetch(const PostQuery& query, std::vector<Post>& out, std::string& err)
{
    out.clear();

    http::RequestOptions req;
    req.headers["User-Agent"] = m_user_agent;
    req.timeout_ms = m_timeout_ms;
    // Listings change by the minute; the image cache is what matters.
    req.use_cache = false;

    const std::string url = BuildUrl(query);
    http::Response r = http::Get(url, req);
    if (!http::Ok(r))
    {
        err = "reddit: " + (r.err.empty() ? std::string("request failed") : r.err);
        return false;
    }

    const std::string body(r.body.begin(), r.body.end());
    if (!ParseRedditListing(body, query.limit, out, err))
    {
        err = "reddit: " + err;
        return false;
    }
    return true;
}

JsonFilePostSource::JsonFilePostSource(std::string path)
    : m_path(std::move(path))
{
}

bool JsonFilePostSource::Fetch(const PostQuery& query, std::vector<Post>& out, std::string& err)
{
    out.clear();
    std::string text;
    if (!ReadTextFile(m_path, text, err))
        return false;
    if (!ParsePostsJson(text, out, err))
    {
        err = m_path + ": " + err;
        return false;
    }
    if (query.limit > 0 && (int)out.size() > query.limit)
        out.resize((size_t)query.limit);
    return true;
}
} // namespace memeseed::io
