#include "io/image_loader.h"

#include <climits>
#include <cstring>

// stb_image implementation must live in exactly one translation unit.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

namespace image_loader
{
bool LoadImageFromMemoryAsRgba32(const std::vector<std::uint8_t>& bytes,
                                 int& out_width,
                                 int& out_height,
                                 std::vector<unsigned char>& out_pixels,
                                 std::string& err)
{
    err.clear();
    out_width = 0;
    out_height = 0;
    out_pixels.clear();

    if (bytes.empty())
    {
        err = "Empty image data.";
        return false;
    }
    if (bytes.size() > (size_t)INT_MAX)
    {
        err = "Image data too large.";
        return false;
    }

    int w = 0;
    int h = 0;
    int channels_in_file = 0;

    // Force 4 channels so we always get RGBA8.
    unsigned char* data = stbi_load_from_memory(bytes.data(), (int)bytes.size(), &w, &h, &channels_in_file, 4);
    if (!data)
    {
        err = std::string("Failed to decode image: ") + (stbi_failure_reason() ? stbi_failure_reason() : "unknown error");
        return false;
    }

    if (w <= 0 || h <= 0)
    {
        stbi_image_free(data);
        err = "Invalid image dimensions.";
        return false;
    }

    out_width = w;
    out_height = h;

    const size_t pixel_bytes = static_cast<size_t>(w) * static_cast<size_t>(h) * 4u;
    out_pixels.resize(pixel_bytes);
    std::memcpy(out_pixels.data(), data, pixel_bytes);

    stbi_image_free(data);
    return true;
}

bool DecodeImage(const std::vector<std::uint8_t>& bytes,
                 memeseed::raster::RgbaImage& out,
                 std::string& err,
                 std::size_t max_pixels)
{
    out = {};

    int w = 0;
    int h = 0;
    int channels = 0;
    if (!bytes.empty() && bytes.size() <= (size_t)INT_MAX &&
        stbi_info_from_memory(bytes.data(), (int)bytes.size(), &w, &h, &channels) &&
        (size_t)w * (size_t)h > max_pixels)
    {
        err = "Image too large (" + std::to_string(w) + "x" + std::to_string(h) + ").";
        return false;
    }

    std::vector<unsigned char> pixels;
    if (!LoadImageFromMemoryAsRgba32(bytes, w, h, pixels, err))
        return false;
    out = memeseed::raster::RgbaImage::FromRgba(w, h, std::move(pixels));
    return true;
}
} // namespace image_loader
