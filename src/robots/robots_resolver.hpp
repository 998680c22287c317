#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <string>

#include "../network/http/http_client.hpp"
#include "robots_config.hpp"
#include "robots_fetcher.hpp"
#include "rule_set.hpp"
#include "rules_cache.hpp"

namespace Robocache {
namespace Robots {

/**
 * Public entry point: returns the robots rules for the origin of a URL.
 *
 * Rules are cached per origin (see derive_cache_key). On a miss robots.txt is
 * fetched through the given client; the outcome goes to the success tier when
 * it is a stable answer and to the error tier when it is transient. When the
 * fetch was redirected to another host the redirected origin is cached too.
 *
 * resolve() never fails: faults degrade to the permissive default policy.
 * Concurrent misses on the same origin may each fetch; the last write wins.
 */
class RobotsResolver {
public:
    explicit RobotsResolver(const RobotsConfig& config);
    RobotsResolver(const RobotsConfig& config, std::shared_ptr<RulesCache> cache);

    // from_cache() is false on the value returned right after a fetch.
    boost::asio::awaitable<RuleSet> resolve(HttpClient& client, const std::string& url);

    boost::asio::awaitable<bool> is_allowed(HttpClient& client, const std::string& url);

    RulesCache& cache() { return *cache_; }

private:
    RobotsFetcher               fetcher_;
    std::shared_ptr<RulesCache> cache_;
};

}  // namespace Robots
}  // namespace Robocache
