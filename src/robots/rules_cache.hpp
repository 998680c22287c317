#pragma once
#include <optional>
#include <string>

#include "../cache/expiring_lru_cache.hpp"
#include "robots_config.hpp"
#include "rule_set.hpp"

namespace Robocache {
namespace Robots {

enum class CacheTier { Success, Error };

const char* to_string(CacheTier tier);

// Two independent tiers keyed by origin: confirmed policies and transient
// failures, each with its own capacity and TTL.
class RulesCache {
public:
    using Tier  = Cache::ExpiringLruCache<std::string, RuleSet>;
    using Clock = Tier::clock_type;

    RulesCache(const CacheTierConfig& success, const CacheTierConfig& error);
    explicit RulesCache(const RobotsConfig& config);

    // The error tier is consulted first: a recent failure short-circuits even
    // when a success entry for the same key is still live.
    std::optional<RuleSet> lookup(const std::string& key, Tier::time_point now = Clock::now());

    void store(const std::string& key,
               const RuleSet&     rules,
               CacheTier          tier,
               Tier::time_point   now = Clock::now());

    Tier& success_tier() { return success_; }
    Tier& error_tier() { return error_; }
    Tier& tier(CacheTier tier) { return tier == CacheTier::Success ? success_ : error_; }

private:
    Tier success_;
    Tier error_;
};

}  // namespace Robots
}  // namespace Robocache
