#pragma once

#include <array>
#include <ostream>
#include <string>
#include <vector>

#include "error.h"

namespace spanwall::core {

constexpr int k_image_channels = 4;
constexpr unsigned char k_opaque_alpha = 255;

using Rgba = std::array<unsigned char, 4>;

// Tightly packed 8-bit RGBA, rows top to bottom.
struct Image {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels;

    bool empty() const { return width <= 0 || height <= 0; }
    Rgba pixel(int x, int y) const;
};

// Half-open pixel box: [left, right) x [top, bottom).
struct PixelBox {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
};

enum class ResampleFilter { Box, Triangle, CubicBSpline, CatmullRom, Mitchell };

bool parse_resample_filter(const std::string& value, ResampleFilter& out, std::string& error);
const char* resample_filter_name(ResampleFilter filter);

bool decode_image(const std::string& path, Image& out, Error& error);
bool new_canvas(int width, int height, const Rgba& fill, Image& out, Error& error);
bool crop_image(const Image& source, const PixelBox& box, Image& out, Error& error);
bool resize_image(const Image& source, int width, int height, ResampleFilter filter, Image& out, Error& error);
// Sets every alpha byte to k_opaque_alpha.
void make_opaque(Image& image);
bool paste_into(Image& canvas, const Image& region, int x, int y, Error& error);
bool encode_png(const Image& image, const std::string& path, Error& error);
bool encode_png(const Image& image, std::ostream& out, Error& error);

} // namespace spanwall::core
