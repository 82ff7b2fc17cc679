#pragma once

#include "raster/rgba_image.h"

namespace memeseed::raster
{
// Resamples to exactly (w, h): area average when shrinking an axis, bilinear when growing it.
RgbaImage Resize(const RgbaImage& src, int w, int h);

// Scales uniformly by max(w / src.w, h / src.h) and center-crops to exactly (w, h).
// Returns an unchanged copy when `src` is already (w, h).
RgbaImage CoverResize(const RgbaImage& src, int w, int h);

// Shrinks uniformly so the result fits inside (max_w, max_h); never enlarges.
// Aspect ratio is preserved and nothing is cropped.
RgbaImage ContainResize(const RgbaImage& src, int max_w, int max_h);

// Approximate gaussian blur with standard deviation `radius`, built from three box passes.
void GaussianBlur(RgbaImage& img, float radius);

// Blends every pixel towards black by `amount` (0 = unchanged, 1 = black).
void Darken(RgbaImage& img, float amount);
} // namespace memeseed::raster
