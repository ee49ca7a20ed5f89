#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mc {
namespace str {

// Trim whitespace
std::string trim(std::string_view s);
std::string trimLeft(std::string_view s);
std::string trimRight(std::string_view s);

// Case conversion
std::string toLower(std::string_view s);

// Split string by delimiter
std::vector<std::string> split(std::string_view s, char delimiter);

// Format a floating point value with a fixed number of decimals
std::string formatFixed(double value, int decimals);

// Parse number from string (whole string must be consumed)
bool parseInt(std::string_view s, int& out);
bool parseInt64(std::string_view s, long long& out);
bool parseDouble(std::string_view s, double& out);

} // namespace str
} // namespace mc
