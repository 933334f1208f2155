#pragma once

#include <array>
#include <string>
#include <vector>

namespace spanwall::core {

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

bool parse_int(const std::string& token, int& out);
bool parse_positive_int(const std::string& value, int& out);
bool parse_double(const std::string& token, double& out);
bool parse_positive_double(const std::string& token, double& out);
bool parse_non_negative_double(const std::string& token, double& out);

// "WxH", both positive.
bool parse_resolution(const std::string& value, int& out_width, int& out_height);
// "W:H", both positive.
bool parse_ratio(const std::string& value, int& out_w, int& out_h);
// Comma separated non-negative reals, whitespace around items allowed.
bool parse_non_negative_double_list(const std::string& value, std::vector<double>& out);
// "R,G,B" or "R,G,B,A", channels 0-255. Alpha defaults to opaque.
bool parse_color(const std::string& value, std::array<unsigned char, 4>& out);

} // namespace spanwall::core
