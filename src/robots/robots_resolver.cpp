#include "robots_resolver.hpp"
#include <stdexcept>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../utils/url/url.hpp"
#include "cache_key.hpp"

namespace Robocache {
namespace Robots {

using Core::Logger;
using Utils::Url;

RobotsResolver::RobotsResolver(const RobotsConfig& config)
    : RobotsResolver(config, std::make_shared<RulesCache>(config)) {
}

RobotsResolver::RobotsResolver(const RobotsConfig& config, std::shared_ptr<RulesCache> cache)
    : fetcher_(config), cache_(std::move(cache)) {
    if (!cache_)
        throw std::invalid_argument("RobotsResolver requires a rules cache");
}

boost::asio::awaitable<RuleSet> RobotsResolver::resolve(HttpClient& client, const std::string& url) {
    const std::string key = derive_cache_key(url);

    if (auto cached = cache_->lookup(key))
        co_return *cached;

    Logger::debug("Cache miss " + key + " for " + url);
    FetchOutcome outcome = co_await fetcher_.fetch(client, url);

    CacheTier tier   = outcome.cacheable ? CacheTier::Success : CacheTier::Error;
    RuleSet   stored = outcome.rules.with_from_cache(true);

    Logger::debug("Caching robots for " + url + " under key " + key + " in cache " + to_string(tier));
    cache_->store(key, stored, tier);

    if (outcome.redirect && !Url::same_host(*outcome.redirect, url)) {
        const std::string redirect_key = derive_cache_key(*outcome.redirect);
        Logger::debug("Caching robots for " + *outcome.redirect + " under key " + redirect_key
                      + " in cache " + to_string(tier));
        cache_->store(redirect_key, stored, tier);
    }

    co_return outcome.rules.with_from_cache(false);
}

boost::asio::awaitable<bool> RobotsResolver::is_allowed(HttpClient& client, const std::string& url) {
    auto parsed = Url::parse(url);
    if (parsed.host.empty() || parsed.path == Core::Constants::ROBOTS_PATH)
        co_return true;

    RuleSet rules = co_await resolve(client, url);
    if (!rules.is_allowed(url)) {
        Logger::info("Blocked by robots.txt: " + url);
        co_return false;
    }
    co_return true;
}

}  // namespace Robots
}  // namespace Robocache
