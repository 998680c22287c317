#pragma once

#include <string>
#include <vector>

namespace Robocache {
namespace Utils {
namespace Text {

std::string              trim(const std::string& str);
std::string              to_lower(const std::string& str);
bool                     starts_with(const std::string& str, const std::string& prefix);
bool                     icontains(const std::string& haystack, const std::string& needle);
std::vector<std::string> split_list(const std::string& str, char delimiter = ',');

}  // namespace Text
}  // namespace Utils
}  // namespace Robocache
