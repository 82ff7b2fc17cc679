#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace http
{
struct Response
{
    long status = 0;
    std::vector<std::uint8_t> body;
    std::string err;
    bool from_cache = false; // true when served from the in-memory cache
    bool cancelled = false;  // true when the transfer was aborted via `cancel`
};

struct RequestOptions
{
    std::map<std::string, std::string> headers;
    long timeout_ms = 10000;
    long connect_timeout_ms = 5000;
    std::size_t max_body_bytes = 20u * 1024u * 1024u;
    bool use_cache = true;
    // Polled during the transfer; when it becomes true the request is aborted.
    const std::atomic<bool>* cancel = nullptr;
};

// Blocking GET (HTTPS supported via libcurl).
// - Follows redirects
// - Sets a memeseed User-Agent unless one is supplied in `headers`
// - Returns status code + raw body bytes
// Successful responses are kept in a process-wide in-memory cache for the configured TTL.
Response Get(const std::string& url, const RequestOptions& options = {});

inline bool Ok(const Response& r) { return r.err.empty() && r.status >= 200 && r.status < 300; }

constexpr std::size_t kDefaultCacheEntries = 256;
constexpr std::size_t kDefaultCacheBytes = 64u * 1024u * 1024u;

// Response bodies keyed by request, bounded by age, entry count and total body bytes.
// Entries older than the ttl are ignored and evicted; a new body evicts the oldest entries until
// both budgets have room, and a body larger than the byte budget is not kept. A zero ttl disables
// caching. Thread-safe.
class ResponseCache
{
public:
    bool Lookup(const std::string& key, std::vector<std::uint8_t>& out);
    void Store(const std::string& key, const std::vector<std::uint8_t>& body);

    void Configure(std::chrono::seconds ttl,
                   std::size_t max_entries = kDefaultCacheEntries,
                   std::size_t max_bytes = kDefaultCacheBytes);
    void Clear();

    std::size_t EntryCount();
    std::size_t TotalBytes();

private:
    struct Entry
    {
        std::chrono::steady_clock::time_point stored;
        std::uint64_t seq = 0;
        std::vector<std::uint8_t> body;
    };
    using EntryMap = std::unordered_map<std::string, Entry>;

    EntryMap::iterator EraseLocked(EntryMap::iterator it);

    std::mutex m_mu;
    EntryMap m_entries;
    std::chrono::seconds m_ttl{600};
    std::size_t m_max_entries = kDefaultCacheEntries;
    std::size_t m_max_bytes = kDefaultCacheBytes;
    std::size_t m_total_bytes = 0;
    std::uint64_t m_next_seq = 0;
};

// Policy of the process-wide cache used by Get().
void ConfigureCache(std::chrono::seconds ttl,
                    std::size_t max_entries = kDefaultCacheEntries,
                    std::size_t max_bytes = kDefaultCacheBytes);

void ClearCache();

std::size_t CachedEntryCount();
std::size_t CachedBytes();
} // namespace http
