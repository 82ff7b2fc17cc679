#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace memeseed::io
{
struct FetchOptions
{
    int max_concurrency = 4;
    long timeout_ms = 10000;
};

using ImageBytes = std::vector<std::uint8_t>;

// Background-image collaborator: raw bytes for a URL, or nullopt when unavailable.
// Implementations must return within `options.timeout_ms` and should give up early once `cancel`
// is raised. Called concurrently from FetchImages workers.
class IImageFetcher
{
public:
    virtual ~IImageFetcher() = default;
    virtual std::optional<ImageBytes> Fetch(const std::string& url,
                                            const FetchOptions& options,
                                            const std::atomic<bool>* cancel) = 0;
};

// libcurl-backed fetcher (goes through the shared http cache).
class HttpImageFetcher final : public IImageFetcher
{
public:
    explicit HttpImageFetcher(std::string user_agent = "memeseed/0.1");

    std::optional<ImageBytes> Fetch(const std::string& url,
                                    const FetchOptions& options,
                                    const std::atomic<bool>* cancel) override;

private:
    std::string m_user_agent;
};

// Fetches every URL with at most min(max_concurrency, urls.size()) workers.
// Result i belongs to urls[i]; a failed, slow or cancelled fetch leaves nullopt in its slot and
// never holds up the others. Once `cancel` is raised no new fetch starts.
std::vector<std::optional<ImageBytes>> FetchImages(const std::vector<std::string>& urls,
                                                   IImageFetcher& fetcher,
                                                   const FetchOptions& options,
                                                   const std::atomic<bool>* cancel = nullptr);
} // namespace memeseed::io
