#include "rules_cache.hpp"

namespace Robocache {
namespace Robots {

const char* to_string(CacheTier tier) {
    return tier == CacheTier::Success ? "success" : "error";
}

RulesCache::RulesCache(const CacheTierConfig& success, const CacheTierConfig& error)
    : success_(success.capacity, success.ttl), error_(error.capacity, error.ttl) {
}

RulesCache::RulesCache(const RobotsConfig& config)
    : RulesCache(config.success_cache, config.error_cache) {
}

std::optional<RuleSet> RulesCache::lookup(const std::string& key, Tier::time_point now) {
    if (auto rules = error_.get(key, now))
        return rules;
    return success_.get(key, now);
}

void RulesCache::store(const std::string& key,
                       const RuleSet&     rules,
                       CacheTier          tier,
                       Tier::time_point   now) {
    this->tier(tier).put(key, rules, now);
}

}  // namespace Robots
}  // namespace Robocache
