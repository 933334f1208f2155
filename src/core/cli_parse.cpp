#include "cli_parse.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <sstream>

namespace spanwall::core {

namespace {

constexpr int k_max_channel_value = 255;

bool parse_int_pair(const std::string& value, char separator, int& a, int& b) {
    if (value.empty()) {
        return false;
    }
    const size_t sep = value.find(separator);
    if (sep == std::string::npos || sep == 0 || sep + 1 >= value.size()) {
        return false;
    }
    if (value.find(separator, sep + 1) != std::string::npos) {
        return false;
    }
    return parse_positive_int(trim_copy(value.substr(0, sep)), a)
        && parse_positive_int(trim_copy(value.substr(sep + 1)), b);
}

} // namespace

std::string trim_copy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parse_int(const std::string& token, int& out) {
    if (token.empty()) {
        return false;
    }
    std::istringstream iss(token);
    int value = 0;
    char extra = '\0';
    if (!(iss >> value)) {
        return false;
    }
    if (iss >> extra) {
        return false;
    }
    out = value;
    return true;
}

bool parse_positive_int(const std::string& value, int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    if (parsed <= 0 || parsed > std::numeric_limits<int>::max()) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_double(const std::string& token, double& out) {
    if (token.empty()) {
        return false;
    }
    std::istringstream iss(token);
    double value = 0.0;
    char extra = '\0';
    if (!(iss >> value)) {
        return false;
    }
    if (iss >> extra) {
        return false;
    }
    if (!std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

bool parse_positive_double(const std::string& token, double& out) {
    double parsed = 0.0;
    if (!parse_double(token, parsed) || parsed <= 0.0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_non_negative_double(const std::string& token, double& out) {
    double parsed = 0.0;
    if (!parse_double(token, parsed) || parsed < 0.0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_resolution(const std::string& value, int& out_width, int& out_height) {
    return parse_int_pair(to_lower_copy(value), 'x', out_width, out_height);
}

bool parse_ratio(const std::string& value, int& out_w, int& out_h) {
    return parse_int_pair(value, ':', out_w, out_h);
}

bool parse_non_negative_double_list(const std::string& value, std::vector<double>& out) {
    std::vector<double> parsed;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        size_t end = (comma == std::string::npos) ? value.size() : comma;
        double item = 0.0;
        if (!parse_non_negative_double(trim_copy(value.substr(start, end - start)), item)) {
            return false;
        }
        parsed.push_back(item);
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    out = std::move(parsed);
    return true;
}

bool parse_color(const std::string& value, std::array<unsigned char, 4>& out) {
    constexpr int MAX_CHANNELS = 4;
    std::array<int, MAX_CHANNELS> parts = {0, 0, 0, k_max_channel_value};
    int part_count = 0;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        size_t end = (comma == std::string::npos) ? value.size() : comma;
        if (end == start || part_count >= MAX_CHANNELS) {
            return false;
        }

        std::string token = trim_copy(value.substr(start, end - start));
        int channel = 0;
        if (!parse_int(token, channel) || channel < 0 || channel > k_max_channel_value) {
            return false;
        }
        parts[part_count++] = channel;

        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    constexpr int MIN_REQUIRED_CHANNELS = 3;
    if (part_count != MIN_REQUIRED_CHANNELS && part_count != MAX_CHANNELS) {
        return false;
    }

    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<unsigned char>(parts[i]);
    }
    return true;
}

} // namespace spanwall::core
