#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Robocache {
namespace Core {

struct Config {
    std::vector<std::string> urls;
    std::vector<std::string> agents = {Constants::DEFAULT_AGENT_NAME};
    std::string              user_agent      = Constants::USER_AGENT;
    bool                     allow_forbidden = true;

    size_t success_cache_capacity = Constants::DEFAULT_SUCCESS_CACHE_CAPACITY;
    long   success_cache_ttl      = Constants::DEFAULT_SUCCESS_CACHE_TTL_SEC;  // seconds
    size_t error_cache_capacity   = Constants::DEFAULT_ERROR_CACHE_CAPACITY;
    long   error_cache_ttl        = Constants::DEFAULT_ERROR_CACHE_TTL_SEC;  // seconds

    int         threads            = Constants::DEFAULT_THREADS;
    int         connect_timeout_ms = Constants::CONNECT_TIMEOUT_MS;
    int         request_timeout_ms = Constants::REQUEST_TIMEOUT_MS;
    bool        verbose            = false;
    std::string config_path;

    static Config parse(int argc, char* argv[]);
};

// Applies the keys present in a YAML file on top of `config`.
// Throws std::runtime_error when the file cannot be read or parsed.
void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Robocache
