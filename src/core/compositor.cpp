#include "compositor.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace spanwall::core {

namespace {

int round_clamped(double value, int lo, int hi) {
    if (!std::isfinite(value)) {
        return lo;
    }
    const double rounded = std::round(value);
    if (rounded <= static_cast<double>(lo)) {
        return lo;
    }
    if (rounded >= static_cast<double>(hi)) {
        return hi;
    }
    return static_cast<int>(rounded);
}

} // namespace

const char* aspect_crop_description(AspectCrop branch) {
    switch (branch) {
        case AspectCrop::Horizontal:
            return "Cropping horizontally to match overall layout aspect.";
        case AspectCrop::Vertical:
            return "Cropping vertically to match overall layout aspect.";
        case AspectCrop::None:
            break;
    }
    return "Aspect ratio matches, no cropping needed.";
}

CropPlan plan_aspect_crop(int input_width, int input_height, double layout_aspect) {
    CropPlan plan;
    plan.box = {0, 0, input_width, input_height};

    const double input_aspect = static_cast<double>(input_width) / static_cast<double>(input_height);
    if (std::fabs(input_aspect - layout_aspect) <= k_aspect_tolerance * std::max(input_aspect, layout_aspect)) {
        return plan;
    }

    if (input_aspect > layout_aspect) {
        const int new_width = round_clamped(static_cast<double>(input_height) * layout_aspect, 1, input_width);
        const int left = (input_width - new_width) / 2;
        plan.branch = AspectCrop::Horizontal;
        plan.box = {left, 0, left + new_width, input_height};
    } else {
        const int new_height = round_clamped(static_cast<double>(input_width) / layout_aspect, 1, input_height);
        const int top = (input_height - new_height) / 2;
        plan.branch = AspectCrop::Vertical;
        plan.box = {0, top, input_width, top + new_height};
    }
    return plan;
}

PixelBox to_pixel_box(const NormalizedRect& rect, int width, int height) {
    PixelBox box;
    box.left = round_clamped(rect.left * width, 0, width);
    box.right = round_clamped(rect.right * width, 0, width);
    box.top = round_clamped(rect.top * height, 0, height);
    box.bottom = round_clamped(rect.bottom * height, 0, height);
    return box;
}

bool compose_wallpaper(const Image& source,
                       const Layout& layout,
                       const CompositeOptions& options,
                       Image& out,
                       CompositeReport& report,
                       Error& error) {
    if (source.empty()) {
        return fail(error, ErrorKind::ImageIO, "source image is empty");
    }

    CompositeReport result;
    result.input_width = source.width;
    result.input_height = source.height;
    if (!compute_monitor_slices(layout, result.slices, error)) {
        return false;
    }

    result.crop = plan_aspect_crop(source.width, source.height, layout.aspect());
    Image cropped;
    const Image* sampled = &source;
    if (result.crop.branch != AspectCrop::None) {
        if (!crop_image(source, result.crop.box, cropped, error)) {
            return false;
        }
        sampled = &cropped;
    }

    // The wallpaper is always opaque, whatever the sentinel or source alpha.
    Rgba fill = options.sentinel;
    fill[k_image_channels - 1] = k_opaque_alpha;
    Image canvas;
    if (!new_canvas(layout.total_output_width_px, layout.output_height_px, fill, canvas, error)) {
        return false;
    }

    result.source_boxes.reserve(result.slices.size());
    for (size_t i = 0; i < result.slices.size(); ++i) {
        const MonitorSlice& slice = result.slices[i];
        const PixelBox box = to_pixel_box(slice.sample, sampled->width, sampled->height);
        if (box.width() <= 0 || box.height() <= 0) {
            return fail(error, ErrorKind::ImageIO,
                        "source image is too small to sample monitor " + std::to_string(i + 1));
        }

        Image region;
        Image resized;
        if (!crop_image(*sampled, box, region, error)
            || !resize_image(region, slice.placement.width, slice.placement.height, options.filter, resized, error)) {
            error.message = "monitor " + std::to_string(i + 1) + ": " + error.message;
            return false;
        }
        make_opaque(resized);
        if (!paste_into(canvas, resized, slice.placement.x, slice.placement.y, error)) {
            error.message = "monitor " + std::to_string(i + 1) + ": " + error.message;
            return false;
        }
        result.source_boxes.push_back(box);
    }

    out = std::move(canvas);
    report = std::move(result);
    return true;
}

} // namespace spanwall::core
