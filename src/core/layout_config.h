#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "compositor.h"
#include "error.h"
#include "image_ops.h"
#include "monitor_layout.h"

namespace spanwall::core {

constexpr const char* k_layout_config_filename = "spanwall.cfg";
constexpr const char* k_user_layout_config_relpath = ".config/spanwall/spanwall.cfg";

struct LayoutConfig {
    // Left to right.
    std::vector<MonitorSpec> monitors;
    // Optional per-monitor names from "[monitor NAME]" headers, empty when unnamed.
    std::vector<std::string> monitor_names;
    std::vector<double> gaps_in;
    CompositeOptions composite;
};

// Three monitors: a 15.6" laptop panel, a 32" 4K and a 27" 1440p display.
LayoutConfig default_layout_config();

bool parse_layout_config(std::istream& input, LayoutConfig& out, Error& error);
bool load_layout_config_from_file(const std::filesystem::path& path, LayoutConfig& out, Error& error);
std::optional<std::filesystem::path> resolve_user_layout_config_path();

// An explicit path must exist. Otherwise the first existing file among the
// user config, <exec_dir>/spanwall.cfg and global_path is loaded, falling back
// to default_layout_config(). source names where the layout came from.
bool resolve_layout_config(const std::string& explicit_path,
                           const std::filesystem::path& exec_dir,
                           const std::filesystem::path& global_path,
                           LayoutConfig& out,
                           std::string& source,
                           Error& error);

} // namespace spanwall::core
