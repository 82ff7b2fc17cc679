#include "core/random_source.h"

#include <algorithm>
#include <numeric>

namespace memeseed
{
double StdRandomSource::NextUnit()
{
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(m_engine);
}

std::size_t StdRandomSource::NextIndex(std::size_t n)
{
    if (n == 0)
        return 0;
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(m_engine);
}

std::vector<std::size_t> SampleIndices(IRandomSource& rng, std::size_t n, std::size_t k)
{
    k = std::min(k, n);
    std::vector<std::size_t> pool(n);
    std::iota(pool.begin(), pool.end(), (std::size_t)0);

    // Partial Fisher-Yates: the first k slots become the sample.
    std::vector<std::size_t> out;
    out.reserve(k);
    for (std::size_t i = 0; i < k; ++i)
    {
        const std::size_t j = i + rng.NextIndex(n - i);
        std::swap(pool[i], pool[j]);
        out.push_back(pool[i]);
    }
    return out;
}
} // namespace memeseed
