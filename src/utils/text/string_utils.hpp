#pragma once

#include <string>
#include <vector>

namespace Conduit {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        is_alnum(const std::string& str);

// Splits on any of `delimiters`, trims each piece and drops empty ones.
std::vector<std::string> split_any(const std::string& str, const std::string& delimiters);

}  // namespace Text
}  // namespace Utils
}  // namespace Conduit
