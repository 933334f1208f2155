#include "image_ops.h"

#include <cstddef>
#include <cstring>
#include <limits>
#include <utility>

#include "cli_parse.h"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize.h>

namespace spanwall::core {

namespace {

constexpr int k_alpha_channel_index = 3;

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a == 0 || b <= std::numeric_limits<size_t>::max() / a) {
        out = a * b;
        return true;
    }
    return false;
}

bool image_byte_count(int width, int height, size_t& out) {
    size_t pixel_count = 0;
    return width > 0 && height > 0
        && checked_mul_size_t(static_cast<size_t>(width), static_cast<size_t>(height), pixel_count)
        && checked_mul_size_t(pixel_count, k_image_channels, out);
}

size_t row_stride(const Image& image) {
    return static_cast<size_t>(image.width) * k_image_channels;
}

stbir_filter to_stbir_filter(ResampleFilter filter) {
    switch (filter) {
        case ResampleFilter::Box:
            return STBIR_FILTER_BOX;
        case ResampleFilter::Triangle:
            return STBIR_FILTER_TRIANGLE;
        case ResampleFilter::CubicBSpline:
            return STBIR_FILTER_CUBICBSPLINE;
        case ResampleFilter::CatmullRom:
            return STBIR_FILTER_CATMULLROM;
        case ResampleFilter::Mitchell:
            return STBIR_FILTER_MITCHELL;
    }
    return STBIR_FILTER_DEFAULT;
}

bool check_image(const Image& image, const char* what, Error& error) {
    size_t byte_count = 0;
    if (!image_byte_count(image.width, image.height, byte_count) || image.pixels.size() != byte_count) {
        return fail(error, ErrorKind::ImageIO, std::string("invalid ") + what + " image buffer");
    }
    return true;
}

} // namespace

Rgba Image::pixel(int x, int y) const {
    const size_t offset = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x))
                        * k_image_channels;
    return {pixels[offset], pixels[offset + 1], pixels[offset + 2], pixels[offset + 3]};
}

bool parse_resample_filter(const std::string& value, ResampleFilter& out, std::string& error) {
    std::string lower = to_lower_copy(value);
    if (lower == "box") {
        out = ResampleFilter::Box;
    } else if (lower == "triangle") {
        out = ResampleFilter::Triangle;
    } else if (lower == "cubicbspline") {
        out = ResampleFilter::CubicBSpline;
    } else if (lower == "catmullrom") {
        out = ResampleFilter::CatmullRom;
    } else if (lower == "mitchell") {
        out = ResampleFilter::Mitchell;
    } else {
        error = "invalid filter '" + value + "'";
        return false;
    }
    return true;
}

const char* resample_filter_name(ResampleFilter filter) {
    switch (filter) {
        case ResampleFilter::Box:
            return "box";
        case ResampleFilter::Triangle:
            return "triangle";
        case ResampleFilter::CubicBSpline:
            return "cubicbspline";
        case ResampleFilter::CatmullRom:
            return "catmullrom";
        case ResampleFilter::Mitchell:
            return "mitchell";
    }
    return "unknown";
}

bool decode_image(const std::string& path, Image& out, Error& error) {
    int w = 0;
    int h = 0;
    int channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, k_image_channels);
    if (!data) {
        const char* reason = stbi_failure_reason();
        return fail(error, ErrorKind::ImageIO,
                    "failed to load '" + path + "'" + (reason ? std::string(": ") + reason : std::string()));
    }

    size_t byte_count = 0;
    if (!image_byte_count(w, h, byte_count)) {
        stbi_image_free(data);
        return fail(error, ErrorKind::ImageIO, "image is too large: " + path);
    }

    Image image;
    image.width = w;
    image.height = h;
    image.pixels.assign(data, data + byte_count);
    stbi_image_free(data);

    out = std::move(image);
    return true;
}

bool new_canvas(int width, int height, const Rgba& fill, Image& out, Error& error) {
    size_t byte_count = 0;
    if (!image_byte_count(width, height, byte_count)) {
        return fail(error, ErrorKind::ImageIO,
                    "invalid canvas size " + std::to_string(width) + "x" + std::to_string(height));
    }

    Image canvas;
    canvas.width = width;
    canvas.height = height;
    canvas.pixels.resize(byte_count);
    for (size_t offset = 0; offset < byte_count; offset += k_image_channels) {
        std::memcpy(canvas.pixels.data() + offset, fill.data(), k_image_channels);
    }

    out = std::move(canvas);
    return true;
}

bool crop_image(const Image& source, const PixelBox& box, Image& out, Error& error) {
    if (!check_image(source, "source", error)) {
        return false;
    }
    if (box.left < 0 || box.top < 0 || box.width() <= 0 || box.height() <= 0
        || box.right > source.width || box.bottom > source.height) {
        return fail(error, ErrorKind::ImageIO,
                    "crop box (" + std::to_string(box.left) + "," + std::to_string(box.top) + ","
                        + std::to_string(box.right) + "," + std::to_string(box.bottom)
                        + ") is outside the " + std::to_string(source.width) + "x"
                        + std::to_string(source.height) + " image");
    }

    Image cropped;
    cropped.width = box.width();
    cropped.height = box.height();
    cropped.pixels.resize(row_stride(cropped) * static_cast<size_t>(cropped.height));

    const size_t src_stride = row_stride(source);
    const size_t dst_stride = row_stride(cropped);
    for (int row = 0; row < cropped.height; ++row) {
        const size_t src_offset = static_cast<size_t>(box.top + row) * src_stride
                                + static_cast<size_t>(box.left) * k_image_channels;
        std::memcpy(cropped.pixels.data() + static_cast<size_t>(row) * dst_stride,
                    source.pixels.data() + src_offset, dst_stride);
    }

    out = std::move(cropped);
    return true;
}

bool resize_image(const Image& source, int width, int height, ResampleFilter filter, Image& out, Error& error) {
    if (!check_image(source, "source", error)) {
        return false;
    }
    size_t byte_count = 0;
    if (!image_byte_count(width, height, byte_count)) {
        return fail(error, ErrorKind::ImageIO,
                    "invalid resize target " + std::to_string(width) + "x" + std::to_string(height));
    }

    if (width == source.width && height == source.height) {
        out = source;
        return true;
    }

    Image resized;
    resized.width = width;
    resized.height = height;
    resized.pixels.resize(byte_count);

    if (stbir_resize_uint8_generic(source.pixels.data(), source.width, source.height,
                                   static_cast<int>(row_stride(source)),
                                   resized.pixels.data(), resized.width, resized.height,
                                   static_cast<int>(row_stride(resized)),
                                   k_image_channels, k_alpha_channel_index, 0,
                                   STBIR_EDGE_CLAMP, to_stbir_filter(filter),
                                   STBIR_COLORSPACE_LINEAR, nullptr) == 0) {
        return fail(error, ErrorKind::ImageIO,
                    "failed to resize " + std::to_string(source.width) + "x" + std::to_string(source.height)
                        + " to " + std::to_string(width) + "x" + std::to_string(height));
    }

    out = std::move(resized);
    return true;
}

void make_opaque(Image& image) {
    for (size_t offset = k_alpha_channel_index; offset < image.pixels.size(); offset += k_image_channels) {
        image.pixels[offset] = k_opaque_alpha;
    }
}

bool paste_into(Image& canvas, const Image& region, int x, int y, Error& error) {
    if (!check_image(canvas, "canvas", error) || !check_image(region, "region", error)) {
        return false;
    }
    if (x < 0 || y < 0 || region.width > canvas.width - x || region.height > canvas.height - y) {
        return fail(error, ErrorKind::ImageIO,
                    "region " + std::to_string(region.width) + "x" + std::to_string(region.height)
                        + " at " + std::to_string(x) + "," + std::to_string(y)
                        + " does not fit the " + std::to_string(canvas.width) + "x"
                        + std::to_string(canvas.height) + " canvas");
    }

    const size_t canvas_stride = row_stride(canvas);
    const size_t region_stride = row_stride(region);
    for (int row = 0; row < region.height; ++row) {
        const size_t dst_offset = static_cast<size_t>(y + row) * canvas_stride
                                + static_cast<size_t>(x) * k_image_channels;
        std::memcpy(canvas.pixels.data() + dst_offset,
                    region.pixels.data() + static_cast<size_t>(row) * region_stride, region_stride);
    }
    return true;
}

bool encode_png(const Image& image, const std::string& path, Error& error) {
    if (!check_image(image, "output", error)) {
        return false;
    }
    if (stbi_write_png(path.c_str(), image.width, image.height, k_image_channels,
                       image.pixels.data(), static_cast<int>(row_stride(image))) == 0) {
        return fail(error, ErrorKind::ImageIO, "failed to write PNG: " + path);
    }
    return true;
}

bool encode_png(const Image& image, std::ostream& out, Error& error) {
    if (!check_image(image, "output", error)) {
        return false;
    }

    auto write_callback = [](void* context, void* data, int size) {
        auto* stream = static_cast<std::ostream*>(context);
        stream->write(static_cast<char*>(data), size);
    };

    if (stbi_write_png_to_func(write_callback, &out, image.width, image.height, k_image_channels,
                               image.pixels.data(), static_cast<int>(row_stride(image))) == 0
        || !out) {
        return fail(error, ErrorKind::ImageIO, "failed to write PNG to stream");
    }
    out.flush();
    return true;
}

} // namespace spanwall::core
