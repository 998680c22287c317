#include "cache_key.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Robocache {
namespace Robots {

using Utils::Text::to_lower;

std::string derive_cache_key(const std::string& url) {
    Utils::UrlParsed parsed = Utils::Url::parse(url);
    return to_lower(parsed.scheme) + ":" + to_lower(parsed.host) + ":"
           + std::to_string(parsed.effective_port());
}

}  // namespace Robots
}  // namespace Robocache
