#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Robocache {
namespace Utils {
namespace Text {

namespace {
bool ichar_equals(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}
}  // namespace

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

bool icontains(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), ichar_equals);
    return it != haystack.end();
}

std::vector<std::string> split_list(const std::string& str, char delimiter) {
    std::vector<std::string> items;
    std::stringstream        ss(str);
    std::string              item;
    while (std::getline(ss, item, delimiter)) {
        item = trim(item);
        if (!item.empty())
            items.push_back(item);
    }
    return items;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Robocache
