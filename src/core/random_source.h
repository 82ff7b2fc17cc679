#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace memeseed
{
// Injectable randomness for template and image selection.
//
// Every random decision in the pipeline goes through one of these, passed in explicitly by the
// caller. Tests substitute a scripted source to pin outcomes.
class IRandomSource
{
public:
    virtual ~IRandomSource() = default;

    // Uniform in [0, 1).
    virtual double NextUnit() = 0;

    // Uniform in [0, n). Returns 0 when n == 0.
    virtual std::size_t NextIndex(std::size_t n) = 0;
};

// std::mt19937_64-backed source. Seeded explicitly; no process-global state.
class StdRandomSource final : public IRandomSource
{
public:
    explicit StdRandomSource(std::uint64_t seed) : m_engine(seed) {}

    double NextUnit() override;
    std::size_t NextIndex(std::size_t n) override;

private:
    std::mt19937_64 m_engine;
};

// Draw `k` distinct indices from [0, n) (k clamped to n), in draw order.
std::vector<std::size_t> SampleIndices(IRandomSource& rng, std::size_t n, std::size_t k);
} // namespace memeseed
