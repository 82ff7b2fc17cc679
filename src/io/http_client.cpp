#include "io/http_client.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>

namespace http
{
namespace
{
using Clock = std::chrono::steady_clock;

struct BodySink
{
    std::vector<std::uint8_t>* out = nullptr;
    std::size_t max_bytes = 0;
    bool overflow = false;
};

static size_t WriteToVector(void* contents, size_t size, size_t nmemb, void* userp)
{
    const size_t n = size * nmemb;
    auto* sink = reinterpret_cast<BodySink*>(userp);
    if (sink->out->size() + n > sink->max_bytes)
    {
        sink->overflow = true;
        return 0; // aborts the transfer
    }
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(contents);
    sink->out->insert(sink->out->end(), p, p + n);
    return n;
}

static int CancelProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto* cancel = reinterpret_cast<const std::atomic<bool>*>(clientp);
    return (cancel && cancel->load()) ? 1 : 0;
}

static void EnsureCurlGlobalInit()
{
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

static std::string ToLowerAscii(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static bool IsCacheableGet(const std::map<std::string, std::string>& headers)
{
    // Avoid caching requests that look user/session-specific.
    for (const auto& kv : headers)
    {
        const std::string k = ToLowerAscii(kv.first);
        if (k == "authorization" || k == "cookie" || k == "proxy-authorization")
            return false;
    }
    return true;
}

static std::string CacheKeyFor(const std::string& url, const std::map<std::string, std::string>& headers)
{
    std::string key;
    key.reserve(url.size() + 128);
    key += url;
    key.push_back('\n');
    for (const auto& kv : headers)
    {
        key += ToLowerAscii(kv.first);
        key.push_back(':');
        key += kv.second;
        key.push_back('\n');
    }
    return key;
}

// Read-through cache shared by every request in the process.
static ResponseCache& Cache()
{
    static ResponseCache cache;
    return cache;
}

static bool HasHeader(const std::map<std::string, std::string>& headers, const char* name)
{
    for (const auto& kv : headers)
        if (ToLowerAscii(kv.first) == name)
            return true;
    return false;
}
} // namespace

Response Get(const std::string& url, const RequestOptions& options)
{
    Response r;

    const bool cacheable = options.use_cache && IsCacheableGet(options.headers);
    const std::string cache_key = cacheable ? CacheKeyFor(url, options.headers) : std::string();
    if (cacheable && Cache().Lookup(cache_key, r.body))
    {
        r.status = 200;
        r.from_cache = true;
        return r;
    }

    if (options.cancel && options.cancel->load())
    {
        r.cancelled = true;
        r.err = "cancelled";
        return r;
    }

    EnsureCurlGlobalInit();

    CURL* curl = curl_easy_init();
    if (!curl)
    {
        r.err = "curl_easy_init failed.";
        return r;
    }

    BodySink sink;
    sink.out = &r.body;
    sink.max_bytes = options.max_body_bytes;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, ""); // enable gzip/deflate/br when built with support
    if (!HasHeader(options.headers, "user-agent"))
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "memeseed/0.1");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToVector);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // required for timeouts on worker threads
    if (options.cancel)
    {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, CancelProgress);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, (void*)options.cancel);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    // Build header list.
    curl_slist* hdrs = nullptr;
    for (const auto& kv : options.headers)
    {
        std::string line = kv.first + ": " + kv.second;
        hdrs = curl_slist_append(hdrs, line.c_str());
    }
    if (hdrs)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);

    const CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK)
    {
        if (code == CURLE_ABORTED_BY_CALLBACK)
        {
            r.cancelled = true;
            r.err = "cancelled";
        }
        else if (sink.overflow)
        {
            r.err = "response exceeds size limit";
        }
        else
        {
            r.err = curl_easy_strerror(code);
        }
        r.body.clear();
        if (hdrs)
            curl_slist_free_all(hdrs);
        curl_easy_cleanup(curl);
        return r;
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    r.status = status;

    if (hdrs)
        curl_slist_free_all(hdrs);
    curl_easy_cleanup(curl);

    if (r.status < 200 || r.status >= 300)
    {
        std::ostringstream oss;
        oss << "HTTP " << r.status;
        r.err = oss.str();
    }
    else if (cacheable)
    {
        Cache().Store(cache_key, r.body);
    }

    return r;
}

bool ResponseCache::Lookup(const std::string& key, std::vector<std::uint8_t>& out)
{
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;
    if (m_ttl.count() <= 0 || Clock::now() - it->second.stored >= m_ttl)
    {
        EraseLocked(it);
        return false;
    }
    out = it->second.body;
    return true;
}

void ResponseCache::Store(const std::string& key, const std::vector<std::uint8_t>& body)
{
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_ttl.count() <= 0 || m_max_entries == 0 || body.size() > m_max_bytes)
        return;

    auto existing = m_entries.find(key);
    if (existing != m_entries.end())
        EraseLocked(existing);

    const auto now = Clock::now();
    for (auto it = m_entries.begin(); it != m_entries.end();)
    {
        if (now - it->second.stored >= m_ttl)
            it = EraseLocked(it);
        else
            ++it;
    }

    // Oldest first until both the entry and the byte budget have room.
    while (!m_entries.empty() && (m_entries.size() >= m_max_entries || m_total_bytes + body.size() > m_max_bytes))
    {
        auto oldest = std::min_element(m_entries.begin(), m_entries.end(), [](const auto& a, const auto& b) {
            return a.second.seq < b.second.seq;
        });
        EraseLocked(oldest);
    }

    m_entries.emplace(key, Entry{now, ++m_next_seq, body});
    m_total_bytes += body.size();
}

void ResponseCache::Configure(std::chrono::seconds ttl, std::size_t max_entries, std::size_t max_bytes)
{
    std::lock_guard<std::mutex> lock(m_mu);
    m_ttl = ttl;
    m_max_entries = max_entries;
    m_max_bytes = max_bytes;
    if (ttl.count() <= 0)
    {
        m_entries.clear();
        m_total_bytes = 0;
    }
}

void ResponseCache::Clear()
{
    std::lock_guard<std::mutex> lock(m_mu);
    m_entries.clear();
    m_total_bytes = 0;
}

std::size_t ResponseCache::EntryCount()
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_entries.size();
}

std::size_t ResponseCache::TotalBytes()
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_total_bytes;
}

ResponseCache::EntryMap::iterator ResponseCache::EraseLocked(EntryMap::iterator it)
{
    m_total_bytes -= it->second.body.size();
    return m_entries.erase(it);
}

void ConfigureCache(std::chrono::seconds ttl, std::size_t max_entries, std::size_t max_bytes)
{
    Cache().Configure(ttl, max_entries, max_bytes);
}

void ClearCache()
{
    Cache().Clear();
}

std::size_t CachedEntryCount()
{
    return Cache().EntryCount();
}

std::size_t CachedBytes()
{
    return Cache().TotalBytes();
}
} // namespace http
