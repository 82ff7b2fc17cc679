#include "io/image_fetch.h"

#include "io/http_client.h"

#include <algorithm>
#include <cstdio>
#include <string>
#include <thread>

namespace memeseed::io
{
HttpImageFetcher::HttpImageFetcher(std::string user_agent)
    : m_user_agent(std::move(user_agent))
{
}

std::optional<ImageBytes> HttpImageFetcher::Fetch(const std::string& url,
                                                  const FetchOptions& options,
                                                  const std::atomic<bool>* cancel)
{
    http::RequestOptions req;
    req.headers["User-Agent"] = m_user_agent;
    req.timeout_ms = options.timeout_ms;
    req.connect_timeout_ms = std::min<long>(options.timeout_ms, 5000);
    req.cancel = cancel;

    http::Response r = http::Get(url, req);
    if (!http::Ok(r))
    {
        if (!r.cancelled)
        {
            const std::string why = r.err.empty() ? "HTTP " + std::to_string(r.status) : r.err;
            std::fprintf(stderr, "[fetch] %s: %s\n", url.c_str(), why.c_str());
        }
        return std::nullopt;
    }
    if (r.body.empty())
        return std::nullopt;
    return std::move(r.body);
}

std::vector<std::optional<ImageBytes>> FetchImages(const std::vector<std::string>& urls,
                                                   IImageFetcher& fetcher,
                                                   const FetchOptions& options,
                                                   const std::atomic<bool>* cancel)
{
    std::vector<std::optional<ImageBytes>> results(urls.size());
    if (urls.empty())
        return results;

    // Jobs are known up front, so workers just claim the next index.
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (;;)
        {
            if (cancel && cancel->load())
                return;
            const size_t i = next.fetch_add(1);
            if (i >= urls.size())
                return;
            if (urls[i].empty())
                continue;
            std::optional<ImageBytes> bytes = fetcher.Fetch(urls[i], options, cancel);
            if (cancel && cancel->load())
                return;
            results[i] = std::move(bytes);
        }
    };

    const size_t worker_count = std::min(urls.size(), (size_t)std::max(1, options.max_concurrency));
    if (worker_count == 1)
    {
        worker();
        return results;
    }

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back(worker);
    for (auto& t : workers)
    {
        if (t.joinable())
            t.join();
    }
    return results;
}
} // namespace memeseed::io
