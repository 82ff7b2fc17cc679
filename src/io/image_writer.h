#pragma once

#include "raster/rgba_image.h"

#include <cstdint>
#include <string>
#include <vector>

namespace image_writer
{
// Encodes to PNG with LodePNG (lossless). RGB output unless `with_alpha`.
// `compression` is 0..9 (0 = stored blocks).
// Returns false on error and sets `err`.
bool EncodePng(const memeseed::raster::RgbaImage& img,
               std::vector<std::uint8_t>& out,
               std::string& err,
               bool with_alpha = false,
               int compression = 6);

// Writes bytes to `path` ("-" is stdout).
bool WriteFileBytes(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& err);

// EncodePng + WriteFileBytes.
bool WritePngFile(const std::string& path,
                  const memeseed::raster::RgbaImage& img,
                  std::string& err,
                  bool with_alpha = false);
} // namespace image_writer
