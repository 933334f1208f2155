// spanwall.cpp
// MIT License (c) 2026 Pedro
// Compile: see CMakeLists.txt (needs the stb headers)

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <fcntl.h>
#include <io.h>
#include <stdio.h>
#ifndef _O_BINARY
#define _O_BINARY 0x8000
#endif
#ifndef _fileno
#define _fileno fileno
#endif
#ifndef _setmode
#define _setmode setmode
#endif
#endif
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "core/compositor.h"
#include "core/error.h"
#include "core/image_ops.h"
#include "core/layout_config.h"
#include "core/monitor_layout.h"

namespace fs = std::filesystem;
using namespace spanwall::core;

#ifndef SPANWALL_GLOBAL_CONFIG
#define SPANWALL_GLOBAL_CONFIG "/usr/local/share/spanwall/spanwall.cfg"
#endif

namespace {

constexpr const char* k_global_layout_config_path = SPANWALL_GLOBAL_CONFIG;
constexpr const char* k_stdout_path = "-";

void print_usage(std::ostream& out) {
    out << "Usage: spanwall [OPTIONS] <input_image> <output_image>\n"
        << "\n"
        << "Slice one image into a spanned wallpaper for monitors of different size,\n"
        << "resolution, scaling and vertical offset. Writes a PNG (use - for stdout).\n"
        << "\n"
        << "Options:\n"
        << "  --config PATH     Monitor layout file (default: ~/" << k_user_layout_config_relpath
        << ", ./" << k_layout_config_filename << " next to the executable, " << k_global_layout_config_path
        << ", then the built-in layout)\n"
        << "  --filter NAME     Resampling filter: box, triangle, cubicbspline, catmullrom, mitchell\n"
        << "  --print-layout    Print the computed layout and exit without touching images\n"
        << "  --quiet           Only print errors\n"
        << "  --help, -h        Show this help message\n";
}

int report_error(const Error& error) {
    std::cerr << "Error (" << error_kind_name(error.kind) << "): " << error.message << "\n";
    return 1;
}

void print_layout(std::ostream& log, const Layout& layout) {
    log << "Setup dimensions in inches:\n"
        << "  width:  " << layout.total_width_in << "\n"
        << "  height: " << layout.max_height_in << "\n\n";
    log << "Output image dimensions (your input image should be at least this size to avoid blur):\n"
        << "  width:  " << layout.total_output_width_px << "\n"
        << "  height: " << layout.output_height_px << "\n\n";
}

void print_slices(std::ostream& log, const LayoutConfig& config, const Layout& layout,
                  const std::vector<MonitorSlice>& slices) {
    log << std::fixed << std::setprecision(4);
    for (size_t i = 0; i < slices.size(); ++i) {
        const MonitorGeometry& geometry = layout.geometry[i];
        const MonitorSlice& slice = slices[i];
        log << "monitor " << (i + 1);
        if (i < config.monitor_names.size() && !config.monitor_names[i].empty()) {
            log << " (" << config.monitor_names[i] << ")";
        }
        log << ": " << geometry.width_in << "x" << geometry.height_in << " in"
            << ", sample [" << slice.sample.left << "," << slice.sample.top
            << " - " << slice.sample.right << "," << slice.sample.bottom << "]"
            << ", place " << slice.placement.width << "x" << slice.placement.height
            << " at " << slice.placement.x << "," << slice.placement.y << "\n";
    }
    log << std::defaultfloat << std::setprecision(6);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::optional<ResampleFilter> filter_override;
    bool print_layout_only = false;
    bool quiet = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--filter" && i + 1 < argc) {
            std::string value = argv[++i];
            ResampleFilter parsed = ResampleFilter::CatmullRom;
            std::string error;
            if (!parse_resample_filter(value, parsed, error)) {
                std::cerr << "Invalid filter value: " << value << "\n";
                return 1;
            }
            filter_override = parsed;
        } else if (arg == "--print-layout") {
            print_layout_only = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == k_stdout_path || !arg.starts_with("--")) {
            positional.push_back(arg);
        } else {
            print_usage(std::cerr);
            return 1;
        }
    }

    if (positional.size() != 2 && !(print_layout_only && positional.empty())) {
        print_usage(std::cerr);
        return 1;
    }

    const bool png_to_stdout = !print_layout_only && positional[1] == k_stdout_path;
    std::ostream null_stream(nullptr);
    std::ostream& log = quiet ? null_stream : (png_to_stdout ? std::cerr : std::cout);

    std::error_code cwd_ec;
    fs::path cwd = fs::current_path(cwd_ec);
    fs::path exec_path(argv[0]);
    if (exec_path.is_relative() && !cwd.empty()) {
        exec_path = cwd / exec_path;
    }
    fs::path exec_dir = exec_path.parent_path();
    if (exec_dir.empty()) {
        exec_dir = cwd;
    }

    LayoutConfig config;
    std::string config_source;
    Error error;
    if (!resolve_layout_config(config_path, exec_dir, k_global_layout_config_path, config, config_source, error)) {
        return report_error(error);
    }
    if (filter_override) {
        config.composite.filter = *filter_override;
    }
    log << "Monitor layout: " << config_source << " (" << config.monitors.size() << " monitors)\n\n";

    // Validated before any image is opened.
    Layout layout;
    if (!compute_layout(config.monitors, config.gaps_in, layout, error)) {
        return report_error(error);
    }
    print_layout(log, layout);

    if (print_layout_only) {
        std::vector<MonitorSlice> slices;
        if (!compute_monitor_slices(layout, slices, error)) {
            return report_error(error);
        }
        print_slices(std::cout, config, layout, slices);
        return 0;
    }

    const std::string& input_path = positional[0];
    const std::string& output_path = positional[1];

    Image source;
    if (!decode_image(input_path, source, error)) {
        return report_error(error);
    }
    log << "Input image dimensions:\n"
        << "  width:  " << source.width << "\n"
        << "  height: " << source.height << "\n\n";
    if (source.width < layout.total_output_width_px || source.height < layout.output_height_px) {
        log << "Warning: input image is smaller than the output, the wallpaper will look blurry.\n\n";
    }

    Image output;
    CompositeReport report;
    if (!compose_wallpaper(source, layout, config.composite, output, report, error)) {
        return report_error(error);
    }
    log << aspect_crop_description(report.crop.branch) << "\n";

    if (png_to_stdout) {
#ifdef _WIN32
        if (_setmode(_fileno(stdout), _O_BINARY) == -1) {
            std::cerr << "Failed to set stdout to binary mode\n";
            return 1;
        }
#endif
        if (!encode_png(output, std::cout, error)) {
            return report_error(error);
        }
    } else if (!encode_png(output, output_path, error)) {
        return report_error(error);
    }

    log << "Saved ready-to-use wallpaper to: " << (png_to_stdout ? "stdout" : output_path) << "\n"
        << "Set the desktop background adjustment to 'Spanned' to use it.\n";
    return 0;
}
