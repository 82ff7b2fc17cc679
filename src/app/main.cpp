#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "app/config.h"

#include "compose/meme_composer.h"
#include "compose/meme_style.h"

#include "core/paths.h"
#include "core/random_source.h"

#include "io/http_client.h"
#include "io/image_fetch.h"
#include "io/image_writer.h"
#include "io/meme_metadata_json.h"
#include "io/post_source.h"

#include "text/font_ladder.h"
#include "vibe/vibe_classifier.h"

// Raised by SIGINT; polled by in-flight fetches so Ctrl+C degrades to placeholders.
static std::atomic<bool> g_CancelRequested{false};

static void HandleInterruptSignal(int)
{
    g_CancelRequested.store(true);
}

static void PrintUsage(const char* argv0)
{
    std::fprintf(stderr,
                 "Usage: %s [--config <path>] [--posts <file.json> | --subreddit <name> --query <q>]\n"
                 "       [--style grid|classic] [--tiles 1|2|4] [--focus] [--no-two-image] [--cta]\n"
                 "       [--business <s>] [--offer <s>] [--seed <n>] [--out <file.png>]\n"
                 "       [--meta <file.json>] [--quiet]\n"
                 "\n"
                 "Reads a batch of posts, reads the room, and renders a meme PNG.\n"
                 "\n"
                 "Options:\n"
                 "  --config <path>     Config JSON (default: <config_dir>/config.json)\n"
                 "  --posts <file>      Read posts from a JSON array instead of Reddit\n"
                 "  --subreddit <name>  Reddit subreddit (default: nfl)\n"
                 "  --query <q>         Search query (default: the configured topic)\n"
                 "  --style <s>         grid (default) or classic\n"
                 "  --tiles N           Grid tiles: 1, 2 or 4 (default: 4)\n"
                 "  --focus             Bias keywords and images towards the focus terms\n"
                 "  --no-two-image      Classic: always use a single background photo\n"
                 "  --cta               Classic: draw the offer/business tag band\n"
                 "  --business <s>      Business name for the CTA and caption\n"
                 "  --offer <s>         Offer text for the CTA and caption\n"
                 "  --seed N            Random seed (default: nondeterministic)\n"
                 "  --out <file>        PNG output path, '-' for stdout (default: meme.png)\n"
                 "  --meta <file>       Write metadata JSON here (default: stdout)\n"
                 "  --quiet             Only print errors\n",
                 argv0);
}

static bool ParseInt(std::string_view s, long long& out)
{
    const std::string tmp(s);
    char* end = nullptr;
    out = std::strtoll(tmp.c_str(), &end, 10);
    return !tmp.empty() && end == tmp.c_str() + tmp.size();
}

int main(int argc, char** argv)
{
    std::string config_path;
    std::string posts_path;
    std::string out_path = "meme.png";
    std::string meta_path;
    bool quiet = false;
    bool have_seed = false;
    std::uint64_t seed = 0;

    // Overrides, applied after the config file.
    std::string subreddit;
    std::string query;
    std::string business;
    std::string offer;
    memeseed::compose::MemeStyleKind style_kind = memeseed::compose::MemeStyleKind::Grid;
    bool have_style = false;
    int tiles = 0;
    bool focus = false;
    bool no_two_image = false;
    bool cta = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::fprintf(stderr, "Missing value for %s\n", opt);
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--config")
        {
            config_path = std::string(need("--config"));
        }
        else if (a == "--posts")
        {
            posts_path = std::string(need("--posts"));
        }
        else if (a == "--subreddit")
        {
            subreddit = std::string(need("--subreddit"));
        }
        else if (a == "--query")
        {
            query = std::string(need("--query"));
        }
        else if (a == "--style")
        {
            if (!memeseed::compose::ParseMemeStyle(need("--style"), style_kind))
            {
                std::fprintf(stderr, "Invalid --style value (expected grid|classic)\n");
                return 2;
            }
            have_style = true;
        }
        else if (a == "--tiles")
        {
            long long v = 0;
            if (!ParseInt(need("--tiles"), v) || (v != 1 && v != 2 && v != 4))
            {
                std::fprintf(stderr, "Invalid --tiles value (expected 1|2|4)\n");
                return 2;
            }
            tiles = (int)v;
        }
        else if (a == "--focus")
        {
            focus = true;
        }
        else if (a == "--no-two-image")
        {
            no_two_image = true;
        }
        else if (a == "--cta")
        {
            cta = true;
        }
        else if (a == "--business")
        {
            business = std::string(need("--business"));
        }
        else if (a == "--offer")
        {
            offer = std::string(need("--offer"));
        }
        else if (a == "--seed")
        {
            long long v = 0;
            if (!ParseInt(need("--seed"), v))
            {
                std::fprintf(stderr, "Invalid --seed value\n");
                return 2;
            }
            seed = (std::uint64_t)v;
            have_seed = true;
        }
        else if (a == "--out")
        {
            out_path = std::string(need("--out"));
        }
        else if (a == "--meta")
        {
            meta_path = std::string(need("--meta"));
        }
        else if (a == "--quiet")
        {
            quiet = true;
        }
        else
        {
            std::fprintf(stderr, "Unknown arg: %.*s\n", (int)a.size(), a.data());
            PrintUsage(argv[0]);
            return 2;
        }
    }

    std::signal(SIGINT, HandleInterruptSignal);

    memeseed::app::AppConfig cfg;
    {
        const bool explicit_path = !config_path.empty();
        if (!explicit_path)
            config_path = GetMemeseedConfigPath();

        bool found = false;
        std::string err;
        if (!memeseed::app::LoadAppConfig(config_path, cfg, found, err))
        {
            std::fprintf(stderr, "[config] %s\n", err.c_str());
            return 1;
        }
        if (explicit_path && !found)
        {
            std::fprintf(stderr, "[config] not found: %s\n", config_path.c_str());
            return 1;
        }
        if (found && !quiet)
            std::fprintf(stderr, "[config] loaded %s\n", config_path.c_str());
    }

    if (!subreddit.empty())
        cfg.subreddit = subreddit;
    if (!business.empty())
        cfg.style.business = business;
    if (!offer.empty())
        cfg.style.offer = offer;
    if (!query.empty())
        cfg.style.topic = query;
    if (have_style)
        cfg.style.style = style_kind;
    if (tiles != 0)
        cfg.style.tiles = tiles;
    if (focus)
        cfg.style.focus_bias = true;
    if (no_two_image)
        cfg.style.two_image_background = false;
    if (cta)
        cfg.style.show_cta = true;

    http::ConfigureCache(std::chrono::seconds(cfg.cache_ttl_seconds));

    memeseed::vibe::LexiconScorer scorer;
    if (!cfg.lexicon_path.empty())
    {
        std::string err;
        if (!scorer.LoadLexiconFile(cfg.lexicon_path, err))
            std::fprintf(stderr, "[config] %s (using built-in lexicon)\n", err.c_str());
        else if (!quiet)
            std::fprintf(stderr, "[config] lexicon: %zu words\n", scorer.LexiconSize());
    }

    // Posts.
    std::vector<memeseed::Post> posts;
    {
        memeseed::io::PostQuery pq;
        pq.subreddit = cfg.subreddit;
        pq.query = cfg.style.topic;
        pq.limit = cfg.post_limit;

        std::string err;
        bool ok = false;
        if (!posts_path.empty())
        {
            memeseed::io::JsonFilePostSource source(posts_path);
            ok = source.Fetch(pq, posts, err);
        }
        else
        {
            memeseed::io::RedditPostSource source(cfg.fetch.timeout_ms, cfg.user_agent);
            ok = source.Fetch(pq, posts, err);
        }
        if (!ok)
        {
            std::fprintf(stderr, "[posts] %s\n", err.c_str());
            return 1;
        }
        if (!quiet)
            std::fprintf(stderr, "[posts] %zu posts\n", posts.size());
    }

    memeseed::text::FontLadder fonts(cfg.fonts);
    if (!quiet)
    {
        for (const auto& r : fonts.Rejections())
            std::fprintf(stderr, "[font] %s\n", r.c_str());
        const std::string_view rung = memeseed::text::FontRungName(fonts.Rung());
        std::fprintf(stderr, "[font] using %.*s %s\n", (int)rung.size(), rung.data(), fonts.FontPath().c_str());
    }

    if (!have_seed)
        seed = ((std::uint64_t)std::random_device{}() << 32) ^ (std::uint64_t)std::random_device{}();
    memeseed::StdRandomSource rng(seed);
    memeseed::io::HttpImageFetcher fetcher(cfg.user_agent);

    memeseed::compose::ComposeServices services{scorer, rng, fetcher, fonts};
    services.fetch = cfg.fetch;
    services.cancel = &g_CancelRequested;
    services.tuning = cfg.tuning;

    memeseed::compose::RenderedMeme meme;
    {
        std::string err;
        if (!memeseed::compose::Compose(std::move(posts), cfg.style, services, meme, err))
        {
            std::fprintf(stderr, "[render] %s\n", err.c_str());
            return 1;
        }
    }

    if (!quiet)
    {
        for (const auto& e : meme.metadata.image_errors)
            std::fprintf(stderr, "[render] skipped %s\n", e.c_str());
        if (g_CancelRequested.load())
            std::fprintf(stderr, "[render] interrupted; unfetched images left as placeholders\n");
        if (meme.metadata.stroke_fallback)
            std::fprintf(stderr, "[render] outline unsupported by font; plain fill used\n");
    }

    {
        std::string err;
        if (!image_writer::WriteFileBytes(out_path, meme.png, err))
        {
            std::fprintf(stderr, "[render] %s\n", err.c_str());
            return 1;
        }
    }

    std::string meta_text;
    {
        std::string err;
        if (!memeseed::io::MemeMetadataToJsonText(meme.metadata, meta_text, err))
        {
            std::fprintf(stderr, "[render] %s\n", err.c_str());
            return 1;
        }
        meta_text += "\n";
    }
    if (!meta_path.empty())
    {
        std::string err;
        if (!image_writer::WriteFileBytes(meta_path, std::vector<std::uint8_t>(meta_text.begin(), meta_text.end()), err))
        {
            std::fprintf(stderr, "[render] %s\n", err.c_str());
            return 1;
        }
        if (out_path != "-")
            std::printf("%s\n", meme.caption.c_str());
    }
    else if (out_path == "-")
    {
        // PNG owns stdout.
        std::fputs(meta_text.c_str(), stderr);
    }
    else
    {
        std::fputs(meta_text.c_str(), stdout);
    }
    return 0;
}
