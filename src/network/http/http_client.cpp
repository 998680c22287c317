#include "http_client.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Robocache {
namespace Network {
namespace Http {

std::string Response::header(const std::string& name) const {
    auto it = headers.find(Utils::Text::to_lower(name));
    return (it != headers.end()) ? it->second : std::string();
}

}  // namespace Http
}  // namespace Network
}  // namespace Robocache
