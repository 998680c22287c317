#pragma once
#include <string>

namespace Robocache {
namespace Robots {

// Robots rules apply only to the scheme, host and port serving robots.txt.
// Keys have the form "scheme:host:port", lower-cased, with the scheme's
// default port filled in when the URL has none.
std::string derive_cache_key(const std::string& url);

}  // namespace Robots
}  // namespace Robocache
