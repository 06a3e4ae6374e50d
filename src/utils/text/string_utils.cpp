#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace Conduit {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool is_alnum(const std::string& str) {
    if (str.empty())
        return false;
    return std::all_of(
        str.begin(), str.end(), [](unsigned char c) { return std::isalnum(c) != 0; });
}

std::vector<std::string> split_any(const std::string& str, const std::string& delimiters) {
    std::vector<std::string> parts;
    size_t                   start = 0;
    while (start <= str.size()) {
        size_t      end   = str.find_first_of(delimiters, start);
        std::string piece = trim(str.substr(start, end == std::string::npos ? std::string::npos
                                                                              : end - start));
        if (!piece.empty())
            parts.push_back(piece);
        if (end == std::string::npos)
            break;
        start = end + 1;
    }
    return parts;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Conduit
