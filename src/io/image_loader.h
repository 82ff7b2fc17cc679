#pragma once

#include "raster/rgba_image.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace image_loader
{
// Decode an image from memory into an RGBA8 buffer using stb_image.
// `bytes` can contain PNG/JPG/GIF/BMP/etc.
bool LoadImageFromMemoryAsRgba32(const std::vector<std::uint8_t>& bytes,
                                 int& out_width,
                                 int& out_height,
                                 std::vector<unsigned char>& out_pixels,
                                 std::string& err);

// Same, straight into an image. Images larger than `max_pixels` are rejected.
bool DecodeImage(const std::vector<std::uint8_t>& bytes,
                 memeseed::raster::RgbaImage& out,
                 std::string& err,
                 std::size_t max_pixels = 40u * 1000u * 1000u);
} // namespace image_loader
