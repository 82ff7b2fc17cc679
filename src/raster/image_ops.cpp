#include "raster/image_ops.h"

#include <algorithm>
#include <cmath>

namespace memeseed::raster
{
namespace
{
// One axis of a separable resample: for each output sample, a run of source taps and weights.
struct Taps
{
    std::vector<int> first;
    std::vector<int> count;
    std::vector<float> weights; // count[i] entries per output sample, packed
    std::vector<int> offset;
};

static Taps BuildTaps(int src_n, int dst_n)
{
    Taps t;
    t.first.resize((size_t)dst_n);
    t.count.resize((size_t)dst_n);
    t.offset.resize((size_t)dst_n);

    const double scale = (double)src_n / (double)dst_n;
    for (int i = 0; i < dst_n; ++i)
    {
        t.offset[(size_t)i] = (int)t.weights.size();
        if (scale > 1.0)
        {
            // Area average over [i*scale, (i+1)*scale).
            const double a = (double)i * scale;
            const double b = a + scale;
            const int s0 = (int)std::floor(a);
            const int s1 = std::min(src_n, (int)std::ceil(b));
            double total = 0.0;
            for (int s = s0; s < s1; ++s)
            {
                const double cover = std::min(b, (double)s + 1.0) - std::max(a, (double)s);
                t.weights.push_back((float)cover);
                total += cover;
            }
            for (size_t k = (size_t)t.offset[(size_t)i]; k < t.weights.size(); ++k)
                t.weights[k] = (float)(t.weights[k] / total);
            t.first[(size_t)i] = s0;
            t.count[(size_t)i] = s1 - s0;
        }
        else
        {
            // Bilinear, sampling at pixel centers.
            double c = ((double)i + 0.5) * scale - 0.5;
            c = std::clamp(c, 0.0, (double)(src_n - 1));
            const int s0 = (int)std::floor(c);
            const int s1 = std::min(s0 + 1, src_n - 1);
            const float f = (float)(c - (double)s0);
            t.first[(size_t)i] = s0;
            if (s1 == s0)
            {
                t.count[(size_t)i] = 1;
                t.weights.push_back(1.0f);
            }
            else
            {
                t.count[(size_t)i] = 2;
                t.weights.push_back(1.0f - f);
                t.weights.push_back(f);
            }
        }
    }
    return t;
}

static std::uint8_t RoundU8(float v)
{
    return ClampU8((int)std::lround(v));
}

// Running-sum box blur of half-width r along one axis (edge pixels are clamped).
static void BoxBlurH(const RgbaImage& src, RgbaImage& dst, int r)
{
    const int w = src.width;
    const float inv = 1.0f / (float)(2 * r + 1);
    for (int y = 0; y < src.height; ++y)
    {
        for (int ch = 0; ch < 3; ++ch)
        {
            float acc = 0.0f;
            for (int k = -r; k <= r; ++k)
                acc += src.At(std::clamp(k, 0, w - 1), y)[ch];
            for (int x = 0; x < w; ++x)
            {
                dst.At(x, y)[ch] = RoundU8(acc * inv);
                const int add = std::min(x + r + 1, w - 1);
                const int sub = std::max(x - r, 0);
                acc += (float)src.At(add, y)[ch] - (float)src.At(sub, y)[ch];
            }
        }
        for (int x = 0; x < w; ++x)
            dst.At(x, y)[3] = src.At(x, y)[3];
    }
}

static void BoxBlurV(const RgbaImage& src, RgbaImage& dst, int r)
{
    const int h = src.height;
    const float inv = 1.0f / (float)(2 * r + 1);
    for (int x = 0; x < src.width; ++x)
    {
        for (int ch = 0; ch < 3; ++ch)
        {
            float acc = 0.0f;
            for (int k = -r; k <= r; ++k)
                acc += src.At(x, std::clamp(k, 0, h - 1))[ch];
            for (int y = 0; y < h; ++y)
            {
                dst.At(x, y)[ch] = RoundU8(acc * inv);
                const int add = std::min(y + r + 1, h - 1);
                const int sub = std::max(y - r, 0);
                acc += (float)src.At(x, add)[ch] - (float)src.At(x, sub)[ch];
            }
        }
        for (int y = 0; y < h; ++y)
            dst.At(x, y)[3] = src.At(x, y)[3];
    }
}

// Box half-widths whose three successive passes approximate a gaussian of `sigma`.
static void BoxesForGauss(float sigma, int out[3])
{
    const float n = 3.0f;
    const float w_ideal = std::sqrt((12.0f * sigma * sigma / n) + 1.0f);
    int wl = (int)std::floor(w_ideal);
    if (wl % 2 == 0)
        --wl;
    const int wu = wl + 2;
    const float m_ideal = (12.0f * sigma * sigma - n * (float)(wl * wl) - 4.0f * n * (float)wl - 3.0f * n) / (-4.0f * (float)wl - 4.0f);
    const int m = (int)std::lround(m_ideal);
    for (int i = 0; i < 3; ++i)
        out[i] = ((i < m ? wl : wu) - 1) / 2;
}
} // namespace

RgbaImage Resize(const RgbaImage& src, int w, int h)
{
    if (src.Empty() || w <= 0 || h <= 0)
        return {};
    if (src.width == w && src.height == h)
        return src;

    const Taps tx = BuildTaps(src.width, w);
    const Taps ty = BuildTaps(src.height, h);

    // Horizontal pass into float rows, then vertical pass.
    std::vector<float> mid((size_t)w * (size_t)src.height * 4u);
    for (int y = 0; y < src.height; ++y)
    {
        for (int x = 0; x < w; ++x)
        {
            float acc[4] = {0, 0, 0, 0};
            const int n = tx.count[(size_t)x];
            const int s0 = tx.first[(size_t)x];
            const float* wt = &tx.weights[(size_t)tx.offset[(size_t)x]];
            for (int k = 0; k < n; ++k)
            {
                const std::uint8_t* p = src.At(s0 + k, y);
                for (int ch = 0; ch < 4; ++ch)
                    acc[ch] += wt[k] * (float)p[ch];
            }
            float* m = &mid[((size_t)y * (size_t)w + (size_t)x) * 4u];
            for (int ch = 0; ch < 4; ++ch)
                m[ch] = acc[ch];
        }
    }

    RgbaImage out;
    out.width = w;
    out.height = h;
    out.pixels.resize((size_t)w * (size_t)h * 4u);
    for (int y = 0; y < h; ++y)
    {
        const int n = ty.count[(size_t)y];
        const int s0 = ty.first[(size_t)y];
        const float* wt = &ty.weights[(size_t)ty.offset[(size_t)y]];
        for (int x = 0; x < w; ++x)
        {
            float acc[4] = {0, 0, 0, 0};
            for (int k = 0; k < n; ++k)
            {
                const float* m = &mid[((size_t)(s0 + k) * (size_t)w + (size_t)x) * 4u];
                for (int ch = 0; ch < 4; ++ch)
                    acc[ch] += wt[k] * m[ch];
            }
            std::uint8_t* d = out.At(x, y);
            for (int ch = 0; ch < 4; ++ch)
                d[ch] = RoundU8(acc[ch]);
        }
    }
    return out;
}

RgbaImage CoverResize(const RgbaImage& src, int w, int h)
{
    if (src.Empty() || w <= 0 || h <= 0)
        return {};
    if (src.width == w && src.height == h)
        return src;

    const double scale = std::max((double)w / (double)src.width, (double)h / (double)src.height);
    const int nw = std::max(w, (int)std::ceil((double)src.width * scale - 1e-6));
    const int nh = std::max(h, (int)std::ceil((double)src.height * scale - 1e-6));
    const RgbaImage scaled = Resize(src, nw, nh);

    const int left = (nw - w) / 2;
    const int top = (nh - h) / 2;
    return Crop(scaled, LayoutBox{left, top, left + w, top + h});
}

RgbaImage ContainResize(const RgbaImage& src, int max_w, int max_h)
{
    if (src.Empty() || max_w <= 0 || max_h <= 0)
        return {};
    if (src.width <= max_w && src.height <= max_h)
        return src;

    const double scale = std::min((double)max_w / (double)src.width, (double)max_h / (double)src.height);
    const int nw = std::clamp((int)std::lround((double)src.width * scale), 1, max_w);
    const int nh = std::clamp((int)std::lround((double)src.height * scale), 1, max_h);
    return Resize(src, nw, nh);
}

void GaussianBlur(RgbaImage& img, float radius)
{
    if (img.Empty() || radius <= 0.0f)
        return;

    int boxes[3];
    BoxesForGauss(radius, boxes);

    RgbaImage tmp = img;
    for (int r : boxes)
    {
        if (r <= 0)
            continue;
        BoxBlurH(img, tmp, r);
        BoxBlurV(tmp, img, r);
    }
}

void Darken(RgbaImage& img, float amount)
{
    if (img.Empty() || amount <= 0.0f)
        return;
    const std::uint8_t t = ClampU8((int)std::lround(std::min(amount, 1.0f) * 255.0f));
    const Rgb8 black{};
    for (size_t i = 0; i < img.pixels.size(); i += 4)
    {
        std::uint8_t* p = &img.pixels[i];
        p[0] = LerpU8(p[0], black.r, t);
        p[1] = LerpU8(p[1], black.g, t);
        p[2] = LerpU8(p[2], black.b, t);
    }
}
} // namespace memeseed::raster
