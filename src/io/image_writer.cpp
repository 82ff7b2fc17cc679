#include "io/image_writer.h"

// LodePNG (compiled via src/io/lodepng_unit.cpp).
#include <lodepng.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace image_writer
{
namespace
{
static void ConfigurePngCompression(LodePNGState& state, int compression)
{
    // lodepng doesn't expose a single "compression level" knob like zlib, so we approximate.
    const int lvl = std::clamp(compression, 0, 9);
    if (lvl <= 0)
    {
        state.encoder.zlibsettings.btype = 0;    // uncompressed blocks
        state.encoder.zlibsettings.use_lz77 = 0; // no LZ77
        return;
    }
    state.encoder.zlibsettings.btype = 2; // dynamic Huffman
    state.encoder.zlibsettings.use_lz77 = 1;
    state.encoder.zlibsettings.windowsize = (lvl >= 6) ? 32768u : 2048u;
    state.encoder.zlibsettings.minmatch = 3;
    state.encoder.zlibsettings.nicematch = (lvl >= 7) ? 258u : 128u;
    state.encoder.zlibsettings.lazymatching = 1;
}
} // namespace

bool EncodePng(const memeseed::raster::RgbaImage& img,
               std::vector<std::uint8_t>& out,
               std::string& err,
               bool with_alpha,
               int compression)
{
    err.clear();
    out.clear();
    if (img.Empty())
    {
        err = "Invalid image dimensions.";
        return false;
    }
    const size_t need = (size_t)img.width * (size_t)img.height * 4u;
    if (img.pixels.size() < need)
    {
        err = "Invalid RGBA buffer size.";
        return false;
    }

    std::vector<std::uint8_t> rgb;
    const std::uint8_t* raw = img.pixels.data();
    if (!with_alpha)
    {
        rgb = memeseed::raster::ToRgb(img);
        raw = rgb.data();
    }

    const LodePNGColorType ct = with_alpha ? LCT_RGBA : LCT_RGB;
    LodePNGState state;
    lodepng_state_init(&state);
    state.info_raw.colortype = ct;
    state.info_raw.bitdepth = 8;
    state.info_png.color.colortype = ct;
    state.info_png.color.bitdepth = 8;
    state.encoder.auto_convert = 0;
    ConfigurePngCompression(state, compression);

    unsigned char* buf = nullptr;
    size_t buf_size = 0;
    const unsigned enc_err = lodepng_encode(&buf, &buf_size, raw, (unsigned)img.width, (unsigned)img.height, &state);
    lodepng_state_cleanup(&state);
    if (enc_err != 0)
    {
        free(buf);
        err = std::string("lodepng_encode failed: ") + lodepng_error_text(enc_err);
        return false;
    }
    out.assign(buf, buf + buf_size);
    free(buf);
    return true;
}

bool WriteFileBytes(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& err)
{
    err.clear();
    if (path == "-")
    {
        if (!bytes.empty() && std::fwrite(bytes.data(), 1, bytes.size(), stdout) != bytes.size())
        {
            err = "Failed to write to stdout.";
            return false;
        }
        std::fflush(stdout);
        return true;
    }

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        err = "Failed to open for writing: " + path;
        return false;
    }
    if (!bytes.empty())
        f.write((const char*)bytes.data(), (std::streamsize)bytes.size());
    f.close();
    if (!f)
    {
        err = "Failed to write: " + path;
        return false;
    }
    return true;
}

bool WritePngFile(const std::string& path,
                  const memeseed::raster::RgbaImage& img,
                  std::string& err,
                  bool with_alpha)
{
    std::vector<std::uint8_t> png;
    if (!EncodePng(img, png, err, with_alpha))
        return false;
    return WriteFileBytes(path, png, err);
}
} // namespace image_writer
