#pragma once

#include <algorithm>
#include <cstdint>

namespace memeseed::raster
{
struct Rgb8
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

constexpr bool operator==(const Rgb8& a, const Rgb8& b)
{
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

// Shared blend helpers (deterministic integer math).
static inline std::uint8_t LerpU8(std::uint8_t a, std::uint8_t b, std::uint8_t t)
{
    // Round-to-nearest lerp in 8-bit space: (a*(255-t) + b*t)/255.
    const std::uint32_t v =
        (std::uint32_t)a * (255u - (std::uint32_t)t) +
        (std::uint32_t)b * (std::uint32_t)t;
    return (std::uint8_t)((v + 127u) / 255u);
}

static inline std::uint8_t Mul255(std::uint32_t x, std::uint32_t y)
{
    return (std::uint8_t)((x * y + 127u) / 255u);
}

static inline std::uint8_t ClampU8(int v)
{
    return (std::uint8_t)std::clamp(v, 0, 255);
}

// Source-over onto an opaque destination pixel (RGBA8, alpha left at 255).
static inline void BlendOverOpaque(std::uint8_t* dst, const Rgb8& src, std::uint8_t coverage)
{
    if (coverage == 0)
        return;
    if (coverage == 255)
    {
        dst[0] = src.r;
        dst[1] = src.g;
        dst[2] = src.b;
        dst[3] = 255;
        return;
    }
    dst[0] = LerpU8(dst[0], src.r, coverage);
    dst[1] = LerpU8(dst[1], src.g, coverage);
    dst[2] = LerpU8(dst[2], src.b, coverage);
    dst[3] = 255;
}
} // namespace memeseed::raster
