#pragma once

#include <cstddef>
#include <vector>

#include "error.h"

namespace spanwall::core {

// Physical and logical description of one monitor, as configured.
struct MonitorSpec {
    int width_px = 0;
    int height_px = 0;
    double scaling = 1.0;
    double diagonal_in = 0.0;
    int aspect_w = 0;
    int aspect_h = 0;
    // Height of the monitor's bottom edge above the common baseline.
    double offset_bottom_in = 0.0;
};

// Values derived from a single MonitorSpec.
struct MonitorGeometry {
    double width_in = 0.0;
    double height_in = 0.0;
    int width_scaled_px = 0;
    int height_scaled_px = 0;
};

// Fractions of the overall physical layout. x grows to the right, y grows
// downwards (0 is the top edge of the tallest column, 1 is the baseline).
struct NormalizedRect {
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;
};

// Where a monitor's resampled content lands in the output canvas.
struct OutputPlacement {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

struct MonitorSlice {
    NormalizedRect sample;
    OutputPlacement placement;
};

struct Layout {
    std::vector<MonitorSpec> monitors;
    std::vector<MonitorGeometry> geometry;
    std::vector<double> gaps_in;
    double total_width_in = 0.0;
    double max_height_in = 0.0;
    int total_output_width_px = 0;
    int output_height_px = 0;

    double aspect() const { return total_width_in / max_height_in; }
};

bool validate_monitor_spec(const MonitorSpec& spec, size_t index, Error& error);

// Physical size from diagonal and aspect ratio, logical pixel footprint from
// native resolution and scaling. The footprint is rounded per axis.
bool compute_monitor_geometry(const MonitorSpec& spec, MonitorGeometry& out, Error& error);

// Monitors are ordered left to right and gaps.size() must be monitors.size() - 1.
bool compute_layout(const std::vector<MonitorSpec>& monitors,
                    const std::vector<double>& gaps,
                    Layout& out,
                    Error& error);

// The part of the physical layout one monitor covers when its left edge sits
// running_inch_x inches from the left edge of the layout.
bool compute_monitor_sample_region(const MonitorSpec& spec,
                                   const MonitorGeometry& geometry,
                                   const Layout& layout,
                                   double running_inch_x,
                                   NormalizedRect& out,
                                   Error& error);

// Walks the monitors left to right. Gaps advance the sampling offset only;
// output placements are packed edge to edge and bottom aligned.
bool compute_monitor_slices(const Layout& layout, std::vector<MonitorSlice>& out, Error& error);

} // namespace spanwall::core
