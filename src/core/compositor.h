#pragma once

#include <vector>

#include "error.h"
#include "image_ops.h"
#include "monitor_layout.h"

namespace spanwall::core {

constexpr Rgba k_default_sentinel_color = {255, 0, 0, 255};
// Relative difference under which the source and layout aspect ratios are
// treated as equal and no crop is applied.
constexpr double k_aspect_tolerance = 1e-9;

enum class AspectCrop {
    None,
    // Source wider than the layout: keep full height, trim left and right.
    Horizontal,
    // Source taller than the layout: keep full width, trim top and bottom.
    Vertical,
};

struct CropPlan {
    AspectCrop branch = AspectCrop::None;
    PixelBox box;
};

struct CompositeOptions {
    ResampleFilter filter = ResampleFilter::CatmullRom;
    Rgba sentinel = k_default_sentinel_color;
};

struct CompositeReport {
    int input_width = 0;
    int input_height = 0;
    CropPlan crop;
    std::vector<MonitorSlice> slices;
    std::vector<PixelBox> source_boxes;
};

const char* aspect_crop_description(AspectCrop branch);

// Centered crop of an input_width x input_height image to layout_aspect.
CropPlan plan_aspect_crop(int input_width, int input_height, double layout_aspect);

// Maps a normalized rectangle onto a width x height image, rounding each edge.
PixelBox to_pixel_box(const NormalizedRect& rect, int width, int height);

bool compose_wallpaper(const Image& source,
                       const Layout& layout,
                       const CompositeOptions& options,
                       Image& out,
                       CompositeReport& report,
                       Error& error);

} // namespace spanwall::core
