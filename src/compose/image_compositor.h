#pragma once

#include "core/post.h"
#include "raster/rgba_image.h"
#include "text/font_face.h"

#include <vector>

namespace memeseed::compose
{
constexpr raster::Rgb8 kGridCanvasColor{10, 15, 30};
constexpr raster::Rgb8 kPlaceholderColor{30, 35, 60};

// Contain-on-blur parameters.
constexpr float kBackgroundBlurRadius = 18.0f;
constexpr float kBackgroundDarken = 0.18f;
constexpr int kForegroundInset = 40;

// Overlay geometry and font sizes are given on a 1024 x 1024 reference canvas and scaled to the
// actual canvas, so every band keeps its fractional position at any size.
constexpr int kReferenceCanvas = 1024;

// `reference_px` scaled from the reference canvas to an axis of `extent` pixels.
int ScaleToCanvas(int reference_px, int extent);

// Font size scaled by the shorter canvas side; never below kMinOverlayFont.
constexpr int kMinOverlayFont = 8;
int ScaleFontToCanvas(int reference_px, int width, int height);

// Text box padding (12 px at the reference size).
int OverlayPadding(int width, int height);

// Zero-image notice and hint boxes: (0, 200)-(W, 360) and (0, 370)-(W, 450) at the reference size.
LayoutBox NoticeBox(int width, int height);
LayoutBox NoticeHintBox(int width, int height);

// {1, 2, 4} pass through; anything else becomes 4.
int NormalizeTiles(int tiles);

// 1: whole canvas. 2: left/right halves. 4: quadrants (row-major).
std::vector<LayoutBox> GridTiles(int tiles, int width, int height);

// Tiles are cover-filled from `images` in order; tiles without an image get the placeholder color.
// With no images at all, a "NO LIVE IMAGES FOUND" notice and a hint line are drawn across the
// canvas, so the result is never blank. Returns false when the notice text fell back to plain
// fill.
bool ComposeGrid(const std::vector<raster::RgbaImage>& images,
                 const std::vector<LayoutBox>& tiles,
                 int width,
                 int height,
                 text::IFontProvider& fonts,
                 raster::RgbaImage& out);

// Blurred, darkened cover of `src` at (w, h) with an uncropped copy of `src` (shrunk to fit
// (w - 40, h - 40)) centered on top.
raster::RgbaImage ContainOnBlur(const raster::RgbaImage& src, int w, int h);

// Classic background. 0 images: flat placeholder color. 1: ContainOnBlur over the whole canvas.
// 2 or more: the first two, each ContainOnBlur'd into the left (width / 2) and right halves.
raster::RgbaImage ComposeClassicBackground(const std::vector<raster::RgbaImage>& images, int width, int height);
} // namespace memeseed::compose
