#include "monitor_layout.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace spanwall::core {

namespace {

std::string monitor_label(size_t index) {
    return "monitor " + std::to_string(index + 1);
}

bool checked_add_int(int a, int b, int& out) {
    if ((b > 0 && a > std::numeric_limits<int>::max() - b)
        || (b < 0 && a < std::numeric_limits<int>::min() - b)) {
        return false;
    }
    out = a + b;
    return true;
}

bool scaled_dimension(int native_px, double scaling, int& out) {
    const double scaled = std::round(static_cast<double>(native_px) / scaling);
    if (!std::isfinite(scaled) || scaled < 1.0
        || scaled > static_cast<double>(std::numeric_limits<int>::max())) {
        return false;
    }
    out = static_cast<int>(scaled);
    return true;
}

// Empty problem means the spec is usable.
std::string check_monitor_spec(const MonitorSpec& spec) {
    if (spec.width_px <= 0 || spec.height_px <= 0) {
        return "resolution must be positive";
    }
    if (!std::isfinite(spec.scaling) || spec.scaling <= 0.0) {
        return "scaling must be positive";
    }
    if (!std::isfinite(spec.diagonal_in) || spec.diagonal_in <= 0.0) {
        return "diagonal must be positive";
    }
    if (spec.aspect_w <= 0 || spec.aspect_h <= 0) {
        return "aspect ratio components must be positive";
    }
    if (!std::isfinite(spec.offset_bottom_in) || spec.offset_bottom_in < 0.0) {
        return "bottom offset must not be negative";
    }
    return {};
}

} // namespace

bool validate_monitor_spec(const MonitorSpec& spec, size_t index, Error& error) {
    const std::string problem = check_monitor_spec(spec);
    if (!problem.empty()) {
        return fail(error, ErrorKind::Config, monitor_label(index) + ": " + problem);
    }
    return true;
}

bool compute_monitor_geometry(const MonitorSpec& spec, MonitorGeometry& out, Error& error) {
    const std::string problem = check_monitor_spec(spec);
    if (!problem.empty()) {
        return fail(error, ErrorKind::Config, problem);
    }

    const double aspect_w = static_cast<double>(spec.aspect_w);
    const double aspect_h = static_cast<double>(spec.aspect_h);
    const double aspect_diagonal = std::sqrt(aspect_w * aspect_w + aspect_h * aspect_h);

    MonitorGeometry geometry;
    geometry.width_in = spec.diagonal_in * aspect_w / aspect_diagonal;
    geometry.height_in = spec.diagonal_in * aspect_h / aspect_diagonal;
    if (!scaled_dimension(spec.width_px, spec.scaling, geometry.width_scaled_px)
        || !scaled_dimension(spec.height_px, spec.scaling, geometry.height_scaled_px)) {
        return fail(error, ErrorKind::Config,
                    "scaled resolution out of range for " + std::to_string(spec.width_px) + "x"
                        + std::to_string(spec.height_px) + " at scaling "
                        + std::to_string(spec.scaling));
    }
    out = geometry;
    return true;
}

bool compute_layout(const std::vector<MonitorSpec>& monitors,
                    const std::vector<double>& gaps,
                    Layout& out,
                    Error& error) {
    if (monitors.empty()) {
        return fail(error, ErrorKind::Config, "no monitors configured");
    }
    if (gaps.size() != monitors.size() - 1) {
        return fail(error, ErrorKind::Config,
                    "gaps must have one less element than monitors (got "
                        + std::to_string(gaps.size()) + " gaps for "
                        + std::to_string(monitors.size()) + " monitors)");
    }
    for (size_t i = 0; i < gaps.size(); ++i) {
        if (!std::isfinite(gaps[i]) || gaps[i] < 0.0) {
            return fail(error, ErrorKind::Config,
                        "gap " + std::to_string(i + 1) + " must not be negative");
        }
    }

    Layout layout;
    layout.monitors = monitors;
    layout.gaps_in = gaps;
    layout.geometry.reserve(monitors.size());

    for (size_t i = 0; i < monitors.size(); ++i) {
        const MonitorSpec& spec = monitors[i];
        if (!validate_monitor_spec(spec, i, error)) {
            return false;
        }
        MonitorGeometry geometry;
        if (!compute_monitor_geometry(spec, geometry, error)) {
            error.message = monitor_label(i) + ": " + error.message;
            return false;
        }

        layout.total_width_in += geometry.width_in;
        layout.max_height_in = std::max(layout.max_height_in, geometry.height_in + spec.offset_bottom_in);
        if (!checked_add_int(layout.total_output_width_px, geometry.width_scaled_px,
                             layout.total_output_width_px)) {
            return fail(error, ErrorKind::Config, "total output width is too large");
        }
        layout.output_height_px = std::max(layout.output_height_px, geometry.height_scaled_px);
        layout.geometry.push_back(geometry);
    }

    for (double gap : gaps) {
        layout.total_width_in += gap;
    }

    if (!(layout.total_width_in > 0.0) || !(layout.max_height_in > 0.0)) {
        return fail(error, ErrorKind::Config, "degenerate layout: physical size must be positive");
    }

    out = std::move(layout);
    return true;
}

bool compute_monitor_sample_region(const MonitorSpec& spec,
                                   const MonitorGeometry& geometry,
                                   const Layout& layout,
                                   double running_inch_x,
                                   NormalizedRect& out,
                                   Error& error) {
    if (!(layout.total_width_in > 0.0) || !(layout.max_height_in > 0.0)) {
        return fail(error, ErrorKind::Config, "degenerate layout: physical size must be positive");
    }

    NormalizedRect rect;
    rect.left = running_inch_x / layout.total_width_in;
    rect.right = (running_inch_x + geometry.width_in) / layout.total_width_in;

    const double offset_frac = spec.offset_bottom_in / layout.max_height_in;
    const double height_frac = geometry.height_in / layout.max_height_in;
    rect.bottom = 1.0 - offset_frac;
    rect.top = rect.bottom - height_frac;

    out = rect;
    return true;
}

bool compute_monitor_slices(const Layout& layout, std::vector<MonitorSlice>& out, Error& error) {
    if (layout.geometry.size() != layout.monitors.size()
        || layout.gaps_in.size() + 1 != layout.monitors.size()) {
        return fail(error, ErrorKind::Config, "layout is inconsistent with its monitor list");
    }

    std::vector<MonitorSlice> slices;
    slices.reserve(layout.monitors.size());
    double running_inch_x = 0.0;
    int current_x = 0;

    for (size_t i = 0; i < layout.monitors.size(); ++i) {
        const MonitorGeometry& geometry = layout.geometry[i];
        MonitorSlice slice;
        if (!compute_monitor_sample_region(layout.monitors[i], geometry, layout, running_inch_x,
                                           slice.sample, error)) {
            return false;
        }
        slice.placement.x = current_x;
        slice.placement.y = layout.output_height_px - geometry.height_scaled_px;
        slice.placement.width = geometry.width_scaled_px;
        slice.placement.height = geometry.height_scaled_px;
        slices.push_back(slice);

        current_x += geometry.width_scaled_px;
        running_inch_x += geometry.width_in;
        if (i < layout.gaps_in.size()) {
            running_inch_x += layout.gaps_in[i];
        }
    }

    out = std::move(slices);
    return true;
}

} // namespace spanwall::core
