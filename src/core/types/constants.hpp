#pragma once
#include <chrono>
#include <cstddef>
#include <string_view>

namespace Robocache {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS = 2;  // IO Threads
    static constexpr const char* VERSION         = "0.1.0";

    static constexpr const char* USER_AGENT         = "Robocache/1.0";
    static constexpr const char* DEFAULT_AGENT_NAME = "robocache";
    static constexpr const char* ROBOTS_PATH        = "/robots.txt";

    static constexpr int CONNECT_TIMEOUT_MS = 5000;
    static constexpr int REQUEST_TIMEOUT_MS = 10000;

    // Cache tiers: confirmed policies live long, transient failures are retried sooner.
    static constexpr size_t DEFAULT_SUCCESS_CACHE_CAPACITY = 10000;
    static constexpr long   DEFAULT_SUCCESS_CACHE_TTL_SEC  = 6 * 60 * 60;
    static constexpr size_t DEFAULT_ERROR_CACHE_CAPACITY   = 10000;
    static constexpr long   DEFAULT_ERROR_CACHE_TTL_SEC    = 60 * 60;

    static constexpr size_t MAX_ROBOTS_TXT_BYTES = 500 * 1024;
};

inline int default_port(const std::string_view scheme) {
    if (scheme == "http")
        return 80;
    if (scheme == "https")
        return 443;
    if (scheme == "ftp")
        return 21;
    return -1;
}

}  // namespace Core
}  // namespace Robocache
