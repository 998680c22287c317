#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "../core/types/constants.hpp"

namespace Robocache {
namespace Robots {

struct CacheTierConfig {
    size_t               capacity = 0;
    std::chrono::seconds ttl{0};
};

struct RobotsConfig {
    // HTTP 403 on robots.txt means "no rules" rather than "forbid all".
    bool                     allow_forbidden = true;
    std::vector<std::string> agent_names     = {Core::Constants::DEFAULT_AGENT_NAME};

    CacheTierConfig success_cache{Core::Constants::DEFAULT_SUCCESS_CACHE_CAPACITY,
                                  std::chrono::seconds(Core::Constants::DEFAULT_SUCCESS_CACHE_TTL_SEC)};
    CacheTierConfig error_cache{Core::Constants::DEFAULT_ERROR_CACHE_CAPACITY,
                                std::chrono::seconds(Core::Constants::DEFAULT_ERROR_CACHE_TTL_SEC)};
};

}  // namespace Robots
}  // namespace Robocache
