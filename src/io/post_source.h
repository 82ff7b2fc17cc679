#pragma once

#include "core/post.h"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace memeseed::io
{
struct PostQuery
{
    std::string subreddit = "nfl";
    std::string query; // empty: newest listing instead of search
    int limit = 25;
};

// Supplies the post batch. Returning false is the one hard failure of the pipeline: there is
// nothing to render. A successful empty batch is not an error.
class IPostSource
{
public:
    virtual ~IPostSource() = default;
    virtual bool Fetch(const PostQuery& query, std::vector<Post>& out, std::string& err) = 0;
};

// Reddit JSON listing over HTTPS: /r/<sub>/search.json when a query is set, else /r/<sub>/new.json.
class RedditPostSource final : public IPostSource
{
public:
    RedditPostSource(long timeout_ms, std::string user_agent);

    bool Fetch(const PostQuery& query, std::vector<Post>& out, std::string& err) override;

    // Request URL for a query (exposed for tests).
    static std::string BuildUrl(const PostQuery& query);

private:
    long m_timeout_ms = 10000;
    std::string m_user_agent;
};

// Reads a JSON array of posts: [{"id", "title", "body", "created_at", "image_urls": [...]}].
// Missing fields default; entries that are not objects are skipped.
class JsonFilePostSource final : public IPostSource
{
public:
    explicit JsonFilePostSource(std::string path);

    bool Fetch(const PostQuery& query, std::vector<Post>& out, std::string& err) override;

private:
    std::string m_path;
};

// Decodes the HTML entities Reddit puts in URLs and text (&amp; &lt; &gt; &quot; &#39; &#NN; &#xNN;).
std::string HtmlUnescape(std::string_view s);

// Image URLs of one listing child's "data" object: gallery media, first crosspost, up to four
// preview sources, then the direct link. Unescaped, deduplicated, and filtered to likely images.
std::vector<std::string> ExtractRedditImageUrls(const nlohmann::json& data);

// Parses a Reddit listing body. Posts whose trimmed title + selftext is shorter than 6
// characters are dropped; at most `limit` posts are returned (limit <= 0: no cap).
bool ParseRedditListing(const std::string& body, int limit, std::vector<Post>& out, std::string& err);

// Parses the JsonFilePostSource format from text.
bool ParsePostsJson(const std::string& text, std::vector<Post>& out, std::string& err);
} // namespace memeseed::io
