#include "test.h"

#include "io/http_client.h"
#include "io/image_fetch.h"

#include <chrono>
#include <thread>

using namespace memeseed;

namespace
{
// Sleeps per fetch and records the peak number of concurrent calls.
class SlowFetcher final : public io::IImageFetcher
{
public:
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> calls{0};

    std::optional<io::ImageBytes> Fetch(const std::string& url,
                                        const io::FetchOptions&,
                                        const std::atomic<bool>*) override
    {
        ++calls;
        const int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now))
        {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --active;
        if (url.find("bad") != std::string::npos)
            return std::nullopt;
        return io::ImageBytes(url.begin(), url.end());
    }
};
} // namespace

TEST_CASE("FetchImages - results follow URL order, failures leave empty slots")
{
    SlowFetcher fetcher;
    const std::vector<std::string> urls = {"u0", "bad1", "u2", "u3", "bad4", "u5"};
    io::FetchOptions opts;
    opts.max_concurrency = 3;

    const auto out = io::FetchImages(urls, fetcher, opts);
    REQUIRE(out.size() == urls.size());
    for (std::size_t i = 0; i < urls.size(); ++i)
    {
        if (urls[i].find("bad") != std::string::npos)
        {
            CHECK_FALSE(out[i].has_value());
        }
        else
        {
            REQUIRE(out[i].has_value());
            CHECK(std::string(out[i]->begin(), out[i]->end()) == urls[i]);
        }
    }
    CHECK(fetcher.calls.load() == 6);
    CHECK(fetcher.peak.load() <= 3);
}

TEST_CASE("FetchImages - worker count never exceeds the URL count")
{
    SlowFetcher fetcher;
    io::FetchOptions opts;
    opts.max_concurrency = 16;
    const auto out = io::FetchImages({"a", "b"}, fetcher, opts);
    CHECK(out.size() == 2);
    CHECK(fetcher.peak.load() <= 2);

    CHECK(io::FetchImages({}, fetcher, opts).empty());
}

TEST_CASE("FetchImages - cancelled before start fetches nothing")
{
    test::MapImageFetcher fetcher;
    fetcher.bytes["a"] = {1, 2, 3};
    std::atomic<bool> cancel{true};

    const auto out = io::FetchImages({"a", "a"}, fetcher, io::FetchOptions{}, &cancel);
    REQUIRE(out.size() == 2);
    CHECK_FALSE(out[0].has_value());
    CHECK_FALSE(out[1].has_value());
    CHECK(fetcher.calls.load() == 0);
}

TEST_CASE("FetchImages - empty URLs are skipped")
{
    test::MapImageFetcher fetcher;
    fetcher.bytes["a"] = {9};
    const auto out = io::FetchImages({"", "a"}, fetcher, io::FetchOptions{});
    CHECK_FALSE(out[0].has_value());
    REQUIRE(out[1].has_value());
    CHECK((*out[1])[0] == 9);
    CHECK(fetcher.calls.load() == 1);
}

TEST_CASE("http cache bookkeeping")
{
    http::ConfigureCache(std::chrono::seconds(60), 8);
    http::ClearCache();
    CHECK(http::CachedEntryCount() == 0);

    http::Response r;
    CHECK_FALSE(http::Ok(r));
    r.status = 200;
    CHECK(http::Ok(r));
    r.err = "timeout";
    CHECK_FALSE(http::Ok(r));
}

TEST_CASE("ResponseCache - total body bytes stay within the budget")
{
    http::ResponseCache cache;
    cache.Configure(std::chrono::seconds(60), 16, 100);

    const std::vector<std::uint8_t> forty(40, 7);
    cache.Store("a", forty);
    cache.Store("b", forty);
    CHECK(cache.EntryCount() == 2);
    CHECK(cache.TotalBytes() == 80);

    // A third body would overflow the budget, so the oldest entry goes.
    cache.Store("c", forty);
    CHECK(cache.EntryCount() == 2);
    CHECK(cache.TotalBytes() == 80);
    std::vector<std::uint8_t> out;
    CHECK_FALSE(cache.Lookup("a", out));
    CHECK(cache.Lookup("b", out));
    CHECK(cache.Lookup("c", out));
    CHECK(out.size() == 40);

    // Replacing a key releases its old bytes first.
    cache.Store("c", std::vector<std::uint8_t>(60, 1));
    CHECK(cache.EntryCount() == 2);
    CHECK(cache.TotalBytes() == 100);

    // A body larger than the whole budget is never kept.
    cache.Store("huge", std::vector<std::uint8_t>(101, 0));
    CHECK_FALSE(cache.Lookup("huge", out));
    CHECK(cache.TotalBytes() <= 100);

    cache.Clear();
    CHECK(cache.EntryCount() == 0);
    CHECK(cache.TotalBytes() == 0);
}

TEST_CASE("ResponseCache - the entry limit still applies")
{
    http::ResponseCache cache;
    cache.Configure(std::chrono::seconds(60), 2, 1024);
    cache.Store("a", {1});
    cache.Store("b", {2});
    cache.Store("c", {3});
    std::vector<std::uint8_t> out;
    CHECK(cache.EntryCount() == 2);
    CHECK_FALSE(cache.Lookup("a", out));
    REQUIRE(cache.Lookup("c", out));
    CHECK(out[0] == 3);

    cache.Configure(std::chrono::seconds(0));
    CHECK(cache.EntryCount() == 0);
    cache.Store("d", {4});
    CHECK(cache.EntryCount() == 0);
}
