#include "layout_config.h"

#include <cstdlib>
#include <fstream>
#include <numeric>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>

#include "cli_parse.h"

namespace spanwall::core {

namespace {

struct MonitorSection {
    std::string name;
    size_t header_line = 0;
    MonitorSpec spec;
    bool has_resolution = false;
    bool has_diagonal = false;
    bool has_aspect = false;
};

enum class Section { None, Layout, Monitor };

bool finish_monitor(MonitorSection& section, LayoutConfig& out, Error& error) {
    const std::string where = " in monitor section at line " + std::to_string(section.header_line);
    if (!section.has_resolution) {
        return fail(error, ErrorKind::Config, "missing resolution" + where);
    }
    if (!section.has_diagonal) {
        return fail(error, ErrorKind::Config, "missing diagonal" + where);
    }
    if (!section.has_aspect) {
        const int divisor = std::gcd(section.spec.width_px, section.spec.height_px);
        section.spec.aspect_w = section.spec.width_px / divisor;
        section.spec.aspect_h = section.spec.height_px / divisor;
    }
    out.monitors.push_back(section.spec);
    out.monitor_names.push_back(section.name);
    return true;
}

} // namespace

LayoutConfig default_layout_config() {
    LayoutConfig config;
    config.monitors = {
        {1920, 1080, 1.25, 15.6, 16, 9, 0.1},
        {3840, 2160, 1.5, 32.0, 16, 9, 0.0},
        {2560, 1440, 1.25, 27.0, 16, 9, 0.75},
    };
    config.monitor_names = {"left", "center", "right"};
    config.gaps_in = {0.4, 0.5};
    return config;
}

bool parse_layout_config(std::istream& input, LayoutConfig& out, Error& error) {
    LayoutConfig parsed;
    std::unordered_set<std::string> seen_names;
    std::optional<MonitorSection> current_monitor;
    Section section = Section::None;
    bool seen_layout_section = false;
    std::string line;
    size_t line_number = 0;

    auto line_suffix = [&]() { return " at line " + std::to_string(line_number); };

    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current_monitor) {
                if (!finish_monitor(*current_monitor, parsed, error)) {
                    return false;
                }
                current_monitor.reset();
            }
            std::string header = trimmed.substr(1, trimmed.size() - 2);
            std::istringstream iss(header);
            std::string section_type;
            if (!(iss >> section_type)) {
                return fail(error, ErrorKind::Config, "empty section header" + line_suffix());
            }
            section_type = to_lower_copy(section_type);
            std::string name;
            iss >> name;
            std::string extra;
            if (iss >> extra) {
                return fail(error, ErrorKind::Config,
                            "unexpected token '" + extra + "' in section header" + line_suffix());
            }

            if (section_type == "layout") {
                if (!name.empty()) {
                    return fail(error, ErrorKind::Config, "layout section takes no name" + line_suffix());
                }
                if (seen_layout_section) {
                    return fail(error, ErrorKind::Config, "duplicate layout section" + line_suffix());
                }
                seen_layout_section = true;
                section = Section::Layout;
            } else if (section_type == "monitor") {
                if (!name.empty()) {
                    if (seen_names.find(name) != seen_names.end()) {
                        return fail(error, ErrorKind::Config,
                                    "duplicate monitor '" + name + "'" + line_suffix());
                    }
                    seen_names.insert(name);
                }
                MonitorSection monitor;
                monitor.name = name;
                monitor.header_line = line_number;
                current_monitor = monitor;
                section = Section::Monitor;
            } else {
                return fail(error, ErrorKind::Config,
                            "unsupported section '" + section_type + "'" + line_suffix());
            }
            continue;
        }

        if (section == Section::None) {
            return fail(error, ErrorKind::Config, "entry outside of a section" + line_suffix());
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            return fail(error, ErrorKind::Config, "invalid line '" + trimmed + "'" + line_suffix());
        }
        std::string key = trim_copy(trimmed.substr(0, equals));
        std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            return fail(error, ErrorKind::Config, "empty key" + line_suffix());
        }
        if (value.empty()) {
            return fail(error, ErrorKind::Config, "empty value for key '" + key + "'" + line_suffix());
        }

        std::string lower_key = to_lower_copy(key);
        if (section == Section::Layout) {
            if (lower_key == "gaps") {
                if (!parse_non_negative_double_list(value, parsed.gaps_in)) {
                    return fail(error, ErrorKind::Config, "invalid gaps '" + value + "'" + line_suffix());
                }
            } else if (lower_key == "filter") {
                std::string filter_error;
                if (!parse_resample_filter(value, parsed.composite.filter, filter_error)) {
                    return fail(error, ErrorKind::Config, filter_error + line_suffix());
                }
            } else if (lower_key == "sentinel_color") {
                if (!parse_color(value, parsed.composite.sentinel)) {
                    return fail(error, ErrorKind::Config,
                                "invalid sentinel_color '" + value + "'" + line_suffix());
                }
            } else {
                return fail(error, ErrorKind::Config, "unknown key '" + key + "'" + line_suffix());
            }
            continue;
        }

        MonitorSpec& spec = current_monitor->spec;
        if (lower_key == "resolution") {
            if (!parse_resolution(value, spec.width_px, spec.height_px)) {
                return fail(error, ErrorKind::Config, "invalid resolution '" + value + "'" + line_suffix());
            }
            current_monitor->has_resolution = true;
        } else if (lower_key == "scaling") {
            if (!parse_positive_double(value, spec.scaling)) {
                return fail(error, ErrorKind::Config, "invalid scaling '" + value + "'" + line_suffix());
            }
        } else if (lower_key == "diagonal") {
            if (!parse_positive_double(value, spec.diagonal_in)) {
                return fail(error, ErrorKind::Config, "invalid diagonal '" + value + "'" + line_suffix());
            }
            current_monitor->has_diagonal = true;
        } else if (lower_key == "aspect") {
            if (!parse_ratio(value, spec.aspect_w, spec.aspect_h)) {
                return fail(error, ErrorKind::Config, "invalid aspect '" + value + "'" + line_suffix());
            }
            current_monitor->has_aspect = true;
        } else if (lower_key == "offset_bottom") {
            if (!parse_non_negative_double(value, spec.offset_bottom_in)) {
                return fail(error, ErrorKind::Config,
                            "invalid offset_bottom '" + value + "'" + line_suffix());
            }
        } else {
            return fail(error, ErrorKind::Config, "unknown key '" + key + "'" + line_suffix());
        }
    }

    if (current_monitor && !finish_monitor(*current_monitor, parsed, error)) {
        return false;
    }
    if (parsed.monitors.empty()) {
        return fail(error, ErrorKind::Config, "no monitors defined");
    }

    out = std::move(parsed);
    return true;
}

bool load_layout_config_from_file(const std::filesystem::path& path, LayoutConfig& out, Error& error) {
    std::ifstream input(path);
    if (!input) {
        return fail(error, ErrorKind::Config, "failed to open '" + path.string() + "'");
    }
    return parse_layout_config(input, out, error);
}

std::optional<std::filesystem::path> resolve_user_layout_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return std::filesystem::path(home) / k_user_layout_config_relpath;
}

bool resolve_layout_config(const std::string& explicit_path,
                           const std::filesystem::path& exec_dir,
                           const std::filesystem::path& global_path,
                           LayoutConfig& out,
                           std::string& source,
                           Error& error) {
    namespace fs = std::filesystem;
    std::vector<fs::path> candidates;
    if (!explicit_path.empty()) {
        fs::path candidate(explicit_path);
        std::error_code ec;
        if (!fs::exists(candidate, ec) || ec) {
            return fail(error, ErrorKind::Config, "config file not found: " + explicit_path);
        }
        candidates.push_back(std::move(candidate));
    } else {
        if (std::optional<fs::path> user_config = resolve_user_layout_config_path()) {
            candidates.push_back(*user_config);
        }
        candidates.push_back(exec_dir / k_layout_config_filename);
        if (!global_path.empty()) {
            candidates.push_back(global_path);
        }
    }

    for (const fs::path& candidate : candidates) {
        std::error_code ec;
        const bool exists = fs::exists(candidate, ec);
        if (ec || !exists) {
            continue;
        }
        if (!load_layout_config_from_file(candidate, out, error)) {
            error.message = candidate.string() + ": " + error.message;
            return false;
        }
        source = candidate.string();
        return true;
    }

    out = default_layout_config();
    source = "built-in layout";
    return true;
}

} // namespace spanwall::core
